#include <algorithm>
#include <sstream>

#include "nostrcast/signer/connection_uri.hpp"
#include "nostrcast/signer/remote_signer_error.hpp"
#include "nostrcast/util/encoding.hpp"

using namespace nostrcast::signer;
using namespace nostrcast::util;
using namespace std;

static const string BUNKER_PREFIX = "bunker://";
static const string NOSTR_CONNECT_PREFIX = "nostrconnect://";

static bool hasPrefix(const string& value, const string& prefix)
{
    return value.compare(0, prefix.length(), prefix) == 0;
};

ConnectionUri ConnectionUri::parse(const string& uri)
{
    ConnectionUri parsed;
    size_t pubkeyStart;
    if (hasPrefix(uri, BUNKER_PREFIX))
    {
        parsed.scheme = Scheme::BUNKER;
        pubkeyStart = BUNKER_PREFIX.length();
    }
    else if (hasPrefix(uri, NOSTR_CONNECT_PREFIX))
    {
        parsed.scheme = Scheme::NOSTR_CONNECT;
        pubkeyStart = NOSTR_CONNECT_PREFIX.length();
    }
    else
    {
        throw RemoteSignerError(
            RemoteSignerErrorCode::INVALID_URI,
            "The connection URI must begin with 'bunker://' or 'nostrconnect://'.");
    }

    size_t queryStart = uri.find('?', pubkeyStart);
    string pubkey = uri.substr(pubkeyStart, queryStart == string::npos ? string::npos : queryStart - pubkeyStart);
    if (!isHex(pubkey, 64))
    {
        throw RemoteSignerError(
            RemoteSignerErrorCode::INVALID_URI,
            "The connection URI does not contain a valid public key.");
    }
    parsed.pubkey = toLower(pubkey);

    string query = queryStart == string::npos ? string() : uri.substr(queryStart + 1);
    stringstream queryStream(query);
    string param;
    while (getline(queryStream, param, '&'))
    {
        size_t splitIndex = param.find('=');
        if (splitIndex == string::npos)
        {
            continue;
        }

        string key = param.substr(0, splitIndex);
        string value = percentDecode(param.substr(splitIndex + 1));
        if (value.empty())
        {
            continue;
        }

        if (key == "relay")
        {
            if (find(parsed.relays.begin(), parsed.relays.end(), value) == parsed.relays.end())
            {
                parsed.relays.push_back(value);
            }
        }
        else if (key == "secret")
        {
            parsed.secret = value;
        }
        else
        {
            parsed.metadata[key] = value;
        }
    }

    if (parsed.relays.empty())
    {
        throw RemoteSignerError(
            RemoteSignerErrorCode::INVALID_URI,
            "The connection URI does not name a relay.");
    }

    return parsed;
};

string ConnectionUri::toString() const
{
    stringstream ss;
    ss << (this->scheme == Scheme::BUNKER ? BUNKER_PREFIX : NOSTR_CONNECT_PREFIX) << this->pubkey;

    char separator = '?';
    for (const string& relay : this->relays)
    {
        ss << separator << "relay=" << percentEncode(relay);
        separator = '&';
    }
    if (this->secret.has_value())
    {
        ss << separator << "secret=" << percentEncode(*this->secret);
        separator = '&';
    }
    for (const auto& [key, value] : this->metadata)
    {
        ss << separator << key << "=" << percentEncode(value);
        separator = '&';
    }

    return ss.str();
};
