#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace nostrcast
{
namespace data
{
/**
 * @brief Event kinds handled by the client.
 */
namespace kind
{
constexpr int METADATA = 0;
constexpr int FOLLOW_LIST = 3;
constexpr int LIVE_CHAT = 1311;
constexpr int ZAP_REQUEST = 9734; // NIP-57
constexpr int ZAP_RECEIPT = 9735;
constexpr int RELAY_LIST = 10002;
constexpr int REMOTE_SIGNING = 24133; // NIP-46
constexpr int LIVE_STREAM = 30311;
} // namespace kind

/**
 * @brief A Nostr event.
 * @remark All data transmitted over the Nostr protocol is encoded in JSON blobs.  This struct
 * is common to every Nostr event kind.  The significance of each event is determined by the
 * `tags` and `content` fields.
*/
struct Event
{
    std::string id; ///< SHA-256 hash of the event data.
    std::string pubkey; ///< Public key of the event creator.
    std::time_t createdAt = 0; ///< Unix timestamp of the event creation.
    int kind = 0; ///< Event kind.
    std::vector<std::vector<std::string>> tags; ///< Arbitrary event metadata.
    std::string content; ///< Event content.
    std::string sig; ///< Event signature created with the private key of the event creator.

    /**
     * @brief Serializes the event to a JSON object.
     * @returns A stringified JSON object representing the event.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark The event ID is (re)generated from the event data as a side effect.
     */
    std::string serialize();

    /**
     * @brief Deserializes the event from a JSON string.
     * @param jsonString A stringified JSON object representing the event.
     * @returns An event instance created from the JSON string.
     * @throws `nlohmann::json::exception` if the string is not a JSON event object.
     */
    static Event fromString(std::string jsonString);

    /**
     * @brief Deserializes the event from a JSON object.
     * @param j A JSON object representing the event.
     * @returns An event instance created from the JSON object.
     * @remark Absent `id`, `pubkey`, `created_at`, and `sig` fields are left empty so that
     * validation can report them; an absent `kind` is an error.
     */
    static Event fromJson(nlohmann::json j);

    /**
     * @brief Computes the canonical ID of the event from its current data.
     * @returns The lowercase hex SHA-256 of `[0, pubkey, created_at, kind, tags, content]`.
     * @remark Unlike `serialize`, this does not modify the event.
     */
    std::string computeId() const;

    /**
     * @brief Finds the value of the first tag with the given name.
     * @returns The tag's second element, or nothing if no such tag has a value.
     */
    std::optional<std::string> tagValue(const std::string& name) const;

    /**
     * @brief Collects the values of every tag with the given name.
     */
    std::vector<std::string> tagValues(const std::string& name) const;

    /**
     * @brief Compares two events for equality.
     * @remark Two events are considered equal if they have the same ID, since the ID is uniquely
     * generated from the event data.  If the `id` field is empty for either event, the comparison
     * function will throw an exception.
     */
    bool operator==(const Event& other) const;

private:
    /**
     * @brief Validates the event.
     * @throws `std::invalid_argument` if the event object is invalid.
     * @remark The `createdAt` field defaults to the present if it is not already set.
     */
    void validate();
};

/**
 * @brief A set of filters for querying Nostr relays.
 * @remark At least one of `ids`, `authors`, `kinds`, or `tags` must be set for a valid filter.
 * `since`, `until`, and `limit` are only sent when they are greater than zero.
 */
struct Filters
{
    std::vector<std::string> ids; ///< Event IDs.
    std::vector<std::string> authors; ///< Event author pubkeys.
    std::vector<int> kinds; ///< Kind numbers.
    std::unordered_map<std::string, std::vector<std::string>> tags; ///< Tag names mapped to lists of tag values.
    std::time_t since = 0; ///< Unix timestamp.  Matching events must be newer than this.
    std::time_t until = 0; ///< Unix timestamp.  Matching events must be older than this.
    int limit = 0; ///< The maximum number of events the relay should return on the initial query.

    /**
     * @brief Serializes the filters to a REQ message.
     * @param subscriptionId A string up to 64 chars in length that is unique per relay connection.
     * @returns A stringified JSON array of the form `["REQ", subscriptionId, filter]`.
     * @throws `std::invalid_argument` if the filter object is invalid.
     * @remarks The Nostr client is responsible for managing subscription IDs.  Responses from the
     * relay will be organized by subscription ID.
     */
    std::string serialize(const std::string& subscriptionId) const;

private:
    /**
     * @brief Validates the filters.
     * @throws `std::invalid_argument` if the filter object is invalid.
     */
    void validate() const;
};
} // namespace data
} // namespace nostrcast

namespace nlohmann
{
template <>
struct adl_serializer<nostrcast::data::Event>
{
    static void to_json(json& j, const nostrcast::data::Event& event);
    static void from_json(const json& j, nostrcast::data::Event& event);
};

template <>
struct adl_serializer<nostrcast::data::Filters>
{
    static void to_json(json& j, const nostrcast::data::Filters& filters);
};
} // namespace nlohmann
