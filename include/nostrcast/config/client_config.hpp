#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <plog/Severity.h>

#include "nostrcast/service/activity_router.hpp"
#include "nostrcast/service/connection_pool.hpp"
#include "nostrcast/service/profile_cache.hpp"
#include "nostrcast/signer/remote_signer_client.hpp"

namespace nostrcast
{
namespace config
{
/**
 * @brief Settings for every component of a `NostrClient`.
 * @remark Each field defaults to the value used when a key is absent from the JSON form.
 */
struct ClientConfig
{
    std::vector<std::string> relays = {
        "wss://relay.snort.social",
        "wss://relay.tunestr.io",
        "wss://relay.damus.io",
        "wss://relay.primal.net",
        "wss://purplepag.es"
    };
    plog::Severity logSeverity = plog::info;
    service::PoolConfig pool;
    service::ProfileCacheConfig profileCache;
    signer::RemoteSignerConfig remoteSigner;
    service::ActivityConfig activity;
    std::chrono::seconds futureTolerance = std::chrono::minutes(5);

    /**
     * @brief Reads a configuration from a JSON object.
     * @remark Keys that are absent keep their defaults, and unknown keys are ignored.
     * @throws `nlohmann::json::exception` if a known key has the wrong type.
     * @throws `std::invalid_argument` if `logSeverity` is not a plog severity name, or a value is
     * out of range.
     */
    static ClientConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Reads a configuration from a JSON file.
     * @throws `std::runtime_error` if the file cannot be opened.
     * @throws `nlohmann::json::exception` if the file is not valid JSON.
     */
    static ClientConfig fromFile(const std::string& path);
};
} // namespace config
} // namespace nostrcast
