#include <cctype>
#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "nostrcast/data/coordinate.hpp"
#include "nostrcast/data/domain.hpp"
#include "nostrcast/util/encoding.hpp"

using namespace nlohmann;
using namespace nostrcast::data;
using namespace std;

static optional<string> optionalString(const json& j, const string& key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
    {
        return nullopt;
    }

    string value = it->get<string>();
    if (value.empty())
    {
        return nullopt;
    }

    return value;
};

#pragma region Profile

string Profile::displayNameOrName() const
{
    if (this->displayName.has_value())
    {
        return this->displayName.value();
    }
    if (this->name.has_value())
    {
        return this->name.value();
    }
    return "Unknown";
};

optional<Profile> Profile::fromEvent(const Event& event)
{
    json metadata = json::parse(event.content, nullptr, false);
    if (metadata.is_discarded() || !metadata.is_object())
    {
        return nullopt;
    }

    Profile profile;
    profile.pubkey = event.pubkey;
    profile.name = optionalString(metadata, "name");
    profile.displayName = optionalString(metadata, "display_name");
    if (!profile.displayName.has_value())
    {
        profile.displayName = optionalString(metadata, "displayName");
    }
    profile.about = optionalString(metadata, "about");
    profile.picture = optionalString(metadata, "picture");
    profile.nip05 = optionalString(metadata, "nip05");
    profile.lud16 = optionalString(metadata, "lud16");
    if (!profile.lud16.has_value())
    {
        profile.lud16 = optionalString(metadata, "lud06");
    }

    return profile;
};

bool Profile::operator==(const Profile& other) const
{
    return this->pubkey == other.pubkey
        && this->name == other.name
        && this->displayName == other.displayName
        && this->about == other.about
        && this->picture == other.picture
        && this->nip05 == other.nip05
        && this->lud16 == other.lud16;
};

#pragma endregion

#pragma region Lists

FollowList FollowList::fromEvent(const Event& event)
{
    FollowList followList;
    followList.pubkey = event.pubkey;
    followList.follows = event.tagValues("p");

    return followList;
};

RelayList RelayList::fromEvent(const Event& event)
{
    RelayList relayList;
    relayList.pubkey = event.pubkey;
    for (const string& relay : event.tagValues("r"))
    {
        if (relay.rfind("wss://", 0) == 0 || relay.rfind("ws://", 0) == 0)
        {
            relayList.relays.push_back(relay);
        }
    }

    return relayList;
};

#pragma endregion

#pragma region Stream Metadata

bool StreamMetadata::isLive() const
{
    return this->status == "live";
};

string StreamMetadata::coordinate() const
{
    return Coordinate::make(kind::LIVE_STREAM, this->authorPubkey, this->streamId);
};

optional<StreamMetadata> StreamMetadata::fromEvent(const Event& event)
{
    auto streamId = event.tagValue("d");
    if (!streamId.has_value())
    {
        return nullopt;
    }

    StreamMetadata stream;
    stream.streamId = streamId.value();
    stream.eventId = event.id;
    stream.authorPubkey = util::toLower(event.pubkey);
    stream.hostPubkey = event.tagValue("p").value_or(event.pubkey);
    stream.status = util::toLower(event.tagValue("status").value_or("unknown"));
    stream.imageUrl = event.tagValue("image");
    stream.createdAt = event.createdAt;

    auto title = event.tagValue("title");
    auto summary = event.tagValue("summary");
    bool hasTitle = title.has_value() && !title->empty();
    bool hasSummary = summary.has_value() && !summary->empty();
    if (hasTitle && hasSummary)
    {
        stream.title = title.value() + " - " + summary.value();
    }
    else if (hasTitle)
    {
        stream.title = title.value();
    }
    else if (hasSummary)
    {
        stream.title = summary.value();
    }
    else
    {
        stream.title = "(No title)";
    }

    auto streamingUrl = event.tagValue("streaming");
    if (!streamingUrl.has_value())
    {
        streamingUrl = event.tagValue("streaming_url");
    }
    // Ended streams drop their URL; keep a placeholder so the stream is still addressable.
    stream.streamingUrl = streamingUrl.value_or("ended://" + stream.streamId);

    for (const string& hashtag : event.tagValues("t"))
    {
        stream.hashtags.push_back(hashtag);
    }
    for (const string& hashtag : event.tagValues("g"))
    {
        stream.hashtags.push_back(hashtag);
    }

    auto participants = event.tagValue("current_participants");
    if (participants.has_value())
    {
        try
        {
            stream.viewerCount = stoi(participants.value());
        }
        catch (const logic_error&)
        {
            stream.viewerCount = 0;
        }
    }

    return stream;
};

#pragma endregion

#pragma region Activity Messages

bool ActivityMessage::isZap() const
{
    return this->bolt11.has_value();
};

optional<ActivityMessage> ActivityMessage::fromChatEvent(const Event& event)
{
    if (event.kind != kind::LIVE_CHAT)
    {
        return nullopt;
    }

    ActivityMessage message;
    message.id = event.id;
    message.senderPubkey = event.pubkey;
    message.content = event.content;
    message.createdAt = event.createdAt;
    message.coordinate = event.tagValue("a");

    return message;
};

optional<ActivityMessage> ActivityMessage::fromZapReceipt(const Event& event)
{
    auto bolt11 = event.tagValue("bolt11");
    auto description = event.tagValue("description");
    if (event.kind != kind::ZAP_RECEIPT || !bolt11.has_value() || !description.has_value())
    {
        return nullopt;
    }

    json zapRequest = json::parse(description.value(), nullptr, false);
    if (zapRequest.is_discarded() || !zapRequest.is_object())
    {
        return nullopt;
    }

    auto senderPubkey = optionalString(zapRequest, "pubkey");
    if (!senderPubkey.has_value())
    {
        return nullopt;
    }

    ActivityMessage message;
    message.id = event.id;
    message.senderPubkey = senderPubkey.value();
    message.content = zapRequest.value("content", string());
    message.createdAt = event.createdAt;
    message.bolt11 = bolt11;
    message.amountMillisats = parseBolt11AmountMillisats(bolt11.value());

    // Prefer the stream coordinate; fall back to the first referenced event.
    auto tags = zapRequest.find("tags");
    if (tags != zapRequest.end() && tags->is_array())
    {
        for (const json& tag : *tags)
        {
            if (!tag.is_array() || tag.size() < 2 || !tag[0].is_string() || !tag[1].is_string())
            {
                continue;
            }

            string tagName = tag[0].get<string>();
            if (tagName == "a")
            {
                message.coordinate = tag[1].get<string>();
                break;
            }
            if (tagName == "e" && !message.coordinate.has_value())
            {
                message.coordinate = tag[1].get<string>();
            }
        }
    }

    return message;
};

#pragma endregion

#pragma region Outbound Activity

Event ZapRequest::toEvent() const
{
    auto parsed = Coordinate::parse(this->coordinate);
    if (!parsed.has_value())
    {
        throw invalid_argument("Cannot zap malformed coordinate " + this->coordinate);
    }
    if (this->amountMillisats <= 0)
    {
        throw invalid_argument("A zap amount must be positive.");
    }
    if (this->relays.empty())
    {
        throw invalid_argument("A zap request must name at least one relay for its receipt.");
    }

    vector<string> relaysTag = { "relays" };
    relaysTag.insert(relaysTag.end(), this->relays.begin(), this->relays.end());

    Event event;
    event.kind = kind::ZAP_REQUEST;
    event.content = this->comment;
    event.tags = {
        relaysTag,
        { "amount", to_string(this->amountMillisats) },
        { "lnurl", this->lnurl },
        { "p", parsed->pubkey },
        { "a", parsed->toString() },
        { "k", to_string(parsed->kind) }
    };

    return event;
};

#pragma endregion

namespace nostrcast
{
namespace data
{
Event makeLiveChatEvent(const string& coordinate, const string& content)
{
    auto parsed = Coordinate::parse(coordinate);
    if (!parsed.has_value())
    {
        throw invalid_argument("Cannot send chat to malformed coordinate " + coordinate);
    }

    Event event;
    event.kind = kind::LIVE_CHAT;
    event.content = content;
    event.tags = {
        { "a", parsed->toString(), "", "root" },
        { "p", parsed->pubkey }
    };

    return event;
};

int64_t parseBolt11AmountMillisats(const string& invoice)
{
    string lowered = util::toLower(invoice);

    // The human-readable part ends at the last '1' and reads "ln" + currency + optional amount.
    size_t separator = lowered.rfind('1');
    if (lowered.rfind("ln", 0) != 0 || separator == string::npos || separator < 2)
    {
        return 0;
    }
    string hrp = lowered.substr(2, separator - 2);

    size_t amountStart = 0;
    while (amountStart < hrp.length() && isalpha(static_cast<unsigned char>(hrp[amountStart])))
    {
        amountStart++;
    }
    string amountPart = hrp.substr(amountStart);

    string digits;
    char multiplier = '\0';
    for (size_t i = 0; i < amountPart.length(); i++)
    {
        char c = amountPart[i];
        if (isdigit(static_cast<unsigned char>(c)))
        {
            digits.push_back(c);
            continue;
        }
        if (i + 1 != amountPart.length() || (c != 'm' && c != 'u' && c != 'n' && c != 'p'))
        {
            return 0;
        }
        multiplier = c;
    }

    if (digits.empty() || digits.length() > 15)
    {
        return 0;
    }

    int64_t amount = stoll(digits);

    // One bitcoin is 10^11 millisatoshis.
    int64_t factor;
    switch (multiplier)
    {
    case 'm':
        factor = 100000000LL;
        break;
    case 'u':
        factor = 100000LL;
        break;
    case 'n':
        factor = 100LL;
        break;
    case 'p':
        return amount / 10;
    default:
        factor = 100000000000LL;
        break;
    }

    if (amount > numeric_limits<int64_t>::max() / factor)
    {
        return 0;
    }

    return amount * factor;
};
} // namespace data
} // namespace nostrcast
