#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "nostrcast/util/encoding.hpp"

using namespace std;

namespace nostrcast
{
namespace util
{
static int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
};

string toHex(const uint8_t* data, size_t length)
{
    stringstream ss;
    for (size_t i = 0; i < length; i++)
    {
        ss << hex << setw(2) << setfill('0') << static_cast<int>(data[i]);
    }

    return ss.str();
};

string toHex(const vector<uint8_t>& data)
{
    return toHex(data.data(), data.size());
};

vector<uint8_t> fromHex(const string& hex)
{
    if (hex.length() % 2 != 0)
    {
        throw invalid_argument("fromHex: The hex string must have an even length.");
    }

    vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2)
    {
        int high = hexValue(hex[i]);
        int low = hexValue(hex[i + 1]);
        if (high < 0 || low < 0)
        {
            throw invalid_argument("fromHex: The string contains non-hex characters.");
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return bytes;
};

bool isHex(const string& value, size_t length)
{
    if (value.empty() || value.length() % 2 != 0)
    {
        return false;
    }
    if (length > 0 && value.length() != length)
    {
        return false;
    }

    for (char c : value)
    {
        if (hexValue(c) < 0)
        {
            return false;
        }
    }

    return true;
};

string toLower(string value)
{
    for (char& c : value)
    {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }

    return value;
};

string percentEncode(const string& value)
{
    stringstream ss;
    for (unsigned char c : value)
    {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            ss << c;
        }
        else
        {
            ss << '%' << uppercase << hex << setw(2) << setfill('0') << static_cast<int>(c)
                << nouppercase << dec;
        }
    }

    return ss.str();
};

string percentDecode(const string& value)
{
    string decoded;
    decoded.reserve(value.length());
    for (size_t i = 0; i < value.length(); i++)
    {
        char c = value[i];
        if (c == '%' && i + 2 < value.length())
        {
            int high = hexValue(value[i + 1]);
            int low = hexValue(value[i + 2]);
            if (high >= 0 && low >= 0)
            {
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(c == '+' ? ' ' : c);
    }

    return decoded;
};
} // namespace util
} // namespace nostrcast
