#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include "nostrcast/data/data.hpp"

namespace nostrcast
{
namespace data
{
/**
 * @brief User metadata published in kind 0 events.
 */
struct Profile
{
    std::string pubkey;
    std::optional<std::string> name;
    std::optional<std::string> displayName;
    std::optional<std::string> about;
    std::optional<std::string> picture;
    std::optional<std::string> nip05;
    std::optional<std::string> lud16; ///< Lightning address, or the LNURL if no address is set.

    /**
     * @brief The display name if set, else the name, else "Unknown".
     */
    std::string displayNameOrName() const;

    /**
     * @brief Parses a kind 0 event.
     * @returns Nothing if the content is not a JSON object.
     */
    static std::optional<Profile> fromEvent(const Event& event);

    bool operator==(const Profile& other) const;
};

/**
 * @brief The pubkeys a user follows, from a kind 3 event.
 */
struct FollowList
{
    std::string pubkey;
    std::vector<std::string> follows;

    static FollowList fromEvent(const Event& event);
};

/**
 * @brief A user's preferred relays, from a kind 10002 event.
 */
struct RelayList
{
    std::string pubkey;
    std::vector<std::string> relays; ///< Only `ws://` and `wss://` URLs are kept.

    static RelayList fromEvent(const Event& event);
};

/**
 * @brief A live stream announced by a kind 30311 event.
 */
struct StreamMetadata
{
    std::string streamId; ///< The `d` tag.
    std::string eventId;
    std::string title;
    std::string streamingUrl;
    std::optional<std::string> imageUrl;
    std::string hostPubkey; ///< From the `p` tag, used for profile display.
    std::string authorPubkey; ///< The event signer, used to address the stream's coordinate.
    std::string status;
    std::vector<std::string> hashtags;
    std::time_t createdAt = 0;
    int viewerCount = 0;

    bool isLive() const;

    /**
     * @brief The normalized `30311:<author>:<d>` coordinate chat and zaps refer to.
     */
    std::string coordinate() const;

    /**
     * @brief Parses a kind 30311 event.
     * @returns Nothing if the event has no `d` tag.
     */
    static std::optional<StreamMetadata> fromEvent(const Event& event);
};

/**
 * @brief A chat message or zap attached to a live activity.
 * @remark Chat messages (kind 1311) have an amount of zero.  Zap receipts (kind 9735) take
 * their sender, comment, and coordinate from the zap request embedded in the `description` tag.
 */
struct ActivityMessage
{
    std::string id;
    std::string senderPubkey;
    std::optional<std::string> senderName;
    std::string content;
    std::time_t createdAt = 0;
    std::optional<std::string> coordinate; ///< Raw `a` (or `e`) reference, not normalized.
    int64_t amountMillisats = 0;
    std::optional<std::string> bolt11;

    bool isZap() const;

    static std::optional<ActivityMessage> fromChatEvent(const Event& event);

    static std::optional<ActivityMessage> fromZapReceipt(const Event& event);
};

/**
 * @brief Builds an unsigned kind 1311 chat message for a live activity.
 * @remark The message is tagged as a root reply to the activity and mentions its author.
 * @throws `std::invalid_argument` if the coordinate does not parse.
 */
Event makeLiveChatEvent(const std::string& coordinate, const std::string& content);

/**
 * @brief A request to zap a live activity, sent to the recipient's LNURL callback as a signed
 * kind 9734 event.
 */
struct ZapRequest
{
    std::string coordinate; ///< The zapped activity.
    int64_t amountMillisats = 0;
    std::string lnurl; ///< The recipient's lightning address or LNURL.
    std::vector<std::string> relays; ///< Where the recipient's wallet should publish the receipt.
    std::string comment;

    /**
     * @brief Builds the unsigned event, addressed to the author of the activity.
     * @throws `std::invalid_argument` if the coordinate does not parse, the amount is not
     * positive, or no relays are given.
     */
    Event toEvent() const;
};

/**
 * @brief Reads the amount encoded in the human-readable part of a BOLT-11 invoice.
 * @returns The amount in millisatoshis, or 0 if the invoice has no parseable amount.
 */
int64_t parseBolt11AmountMillisats(const std::string& invoice);
} // namespace data
} // namespace nostrcast
