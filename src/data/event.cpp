#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include "nostrcast/data/data.hpp"

using namespace nlohmann;
using namespace nostrcast::data;
using namespace std;

string Event::serialize()
{
    this->validate();

    // Generate the event ID from the serialized data.
    this->id = this->computeId();

    json j = *this;
    return j.dump();
};

Event Event::fromString(string jstr)
{
    json j = json::parse(jstr);
    return Event::fromJson(j);
};

Event Event::fromJson(json j)
{
    Event event = j.get<Event>();
    return event;
};

string Event::computeId() const
{
    // Create a JSON array of values used to generate the event ID.
    json arr = { 0, this->pubkey, this->createdAt, this->kind, this->tags, this->content };
    string serializedData = arr.dump();

    unsigned char hash[SHA256_DIGEST_LENGTH];
    EVP_Digest(serializedData.c_str(), serializedData.length(), hash, NULL, EVP_sha256(), NULL);

    stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
    {
        ss << hex << setw(2) << setfill('0') << (int)hash[i];
    }

    return ss.str();
};

optional<string> Event::tagValue(const string& name) const
{
    for (const auto& tag : this->tags)
    {
        if (tag.size() > 1 && tag[0] == name)
        {
            return tag[1];
        }
    }

    return nullopt;
};

vector<string> Event::tagValues(const string& name) const
{
    vector<string> values;
    for (const auto& tag : this->tags)
    {
        if (tag.size() > 1 && tag[0] == name)
        {
            values.push_back(tag[1]);
        }
    }

    return values;
};

void Event::validate()
{
    bool hasPubkey = this->pubkey.length() > 0;
    if (!hasPubkey)
    {
        throw invalid_argument("Event::validate: The pubkey of the event author is required.");
    }

    bool hasCreatedAt = this->createdAt > 0;
    if (!hasCreatedAt)
    {
        this->createdAt = time(nullptr);
    }

    bool hasKind = this->kind >= 0 && this->kind <= 65535;
    if (!hasKind)
    {
        throw invalid_argument("Event::validate: A valid event kind is required.");
    }
};

bool Event::operator==(const Event& other) const
{
    if (this->id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the left-side argument is undefined.");
    }
    if (other.id.empty())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the right-side argument is undefined.");
    }

    return this->id == other.id;
};

void adl_serializer<Event>::to_json(json& j, const Event& event)
{
    j = {
        { "id", event.id },
        { "pubkey", event.pubkey },
        { "created_at", event.createdAt },
        { "kind", event.kind },
        { "tags", event.tags },
        { "content", event.content },
        { "sig", event.sig },
    };
};

void adl_serializer<Event>::from_json(const json& j, Event& event)
{
    // Missing fields are left empty for the validator to report; mistyped fields throw.
    event.id = j.value("id", string());
    event.pubkey = j.value("pubkey", string());
    event.createdAt = j.value("created_at", static_cast<time_t>(0));
    event.kind = j.at("kind").get<int>();
    event.tags = j.value("tags", vector<vector<string>>());
    event.content = j.value("content", string());
    event.sig = j.value("sig", string());
};
