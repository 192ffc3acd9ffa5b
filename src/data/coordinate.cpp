#include <cctype>
#include <sstream>

#include "nostrcast/data/coordinate.hpp"
#include "nostrcast/util/encoding.hpp"

using namespace nostrcast::data;
using namespace std;

string Coordinate::normalize(const string& coordinate)
{
    size_t firstColon = coordinate.find(':');
    size_t secondColon = firstColon == string::npos
        ? string::npos
        : coordinate.find(':', firstColon + 1);

    if (secondColon == string::npos)
    {
        return util::toLower(coordinate);
    }

    // Only the pubkey segment is case-insensitive; the identifier after it may contain colons.
    string kindSegment = coordinate.substr(0, firstColon);
    string pubkeySegment = coordinate.substr(firstColon + 1, secondColon - firstColon - 1);
    string identifierSegment = coordinate.substr(secondColon + 1);

    return kindSegment + ":" + util::toLower(pubkeySegment) + ":" + identifierSegment;
};

optional<Coordinate> Coordinate::parse(const string& coordinate)
{
    size_t firstColon = coordinate.find(':');
    if (firstColon == string::npos || firstColon == 0)
    {
        return nullopt;
    }
    size_t secondColon = coordinate.find(':', firstColon + 1);
    if (secondColon == string::npos)
    {
        return nullopt;
    }

    string kindSegment = coordinate.substr(0, firstColon);
    for (char c : kindSegment)
    {
        if (!isdigit(static_cast<unsigned char>(c)))
        {
            return nullopt;
        }
    }

    string pubkeySegment = coordinate.substr(firstColon + 1, secondColon - firstColon - 1);
    if (!util::isHex(pubkeySegment, 64))
    {
        return nullopt;
    }

    Coordinate parsed;
    try
    {
        parsed.kind = stoi(kindSegment);
    }
    catch (const out_of_range&)
    {
        return nullopt;
    }
    parsed.pubkey = util::toLower(pubkeySegment);
    parsed.identifier = coordinate.substr(secondColon + 1);

    return parsed;
};

string Coordinate::make(int kind, const string& pubkey, const string& identifier)
{
    stringstream ss;
    ss << kind << ":" << util::toLower(pubkey) << ":" << identifier;
    return ss.str();
};

string Coordinate::toString() const
{
    return Coordinate::make(this->kind, this->pubkey, this->identifier);
};
