#include <fstream>
#include <stdexcept>

#include "nostrcast/config/client_config.hpp"

using namespace nlohmann;
using namespace nostrcast::config;
using namespace std;

namespace
{
template <typename Duration>
void readDuration(const json& section, const char* key, Duration& target)
{
    if (!section.contains(key))
    {
        return;
    }

    int64_t value = section.at(key).get<int64_t>();
    if (value < 0)
    {
        throw invalid_argument(string("Configuration value '") + key + "' must not be negative.");
    }
    target = Duration(value);
};

template <typename Number>
void readPositive(const json& section, const char* key, Number& target)
{
    if (!section.contains(key))
    {
        return;
    }

    int64_t value = section.at(key).get<int64_t>();
    if (value <= 0)
    {
        throw invalid_argument(string("Configuration value '") + key + "' must be positive.");
    }
    target = static_cast<Number>(value);
};

const json& section(const json& j, const char* key)
{
    static const json empty = json::object();
    if (!j.contains(key))
    {
        return empty;
    }

    const json& value = j.at(key);
    // Throws `json::type_error` unless the section is an object.
    value.get_ref<const json::object_t&>();
    return value;
};
} // namespace

ClientConfig ClientConfig::fromJson(const json& j)
{
    ClientConfig config;

    if (j.contains("relays"))
    {
        config.relays = j.at("relays").get<vector<string>>();
    }

    if (j.contains("logSeverity"))
    {
        string severityName = j.at("logSeverity").get<string>();
        plog::Severity severity = plog::severityFromString(severityName.c_str());
        if (severity == plog::none && severityName != "none" && severityName != "NONE")
        {
            throw invalid_argument("Unknown log severity '" + severityName + "'.");
        }
        config.logSeverity = severity;
    }

    const json& pool = section(j, "pool");
    readDuration(pool, "healthCheckIntervalMs", config.pool.healthCheckInterval);
    readDuration(pool, "silenceThresholdMs", config.pool.silenceThreshold);
    readDuration(pool, "initialBackoffMs", config.pool.initialBackoff);
    readDuration(pool, "maxBackoffMs", config.pool.maxBackoff);

    const json& profileCache = section(j, "profileCache");
    readPositive(profileCache, "capacity", config.profileCache.capacity);
    readDuration(profileCache, "ttlSeconds", config.profileCache.ttl);
    readDuration(profileCache, "pendingWindowMs", config.profileCache.pendingWindow);
    readPositive(profileCache, "maxRequestsPerWindow", config.profileCache.maxRequestsPerWindow);
    readDuration(profileCache, "rateWindowMs", config.profileCache.rateWindow);
    readPositive(profileCache, "batchSize", config.profileCache.batchSize);
    readDuration(profileCache, "interChunkDelayMs", config.profileCache.interChunkDelay);

    const json& remoteSigner = section(j, "remoteSigner");
    readDuration(remoteSigner, "requestTimeoutMs", config.remoteSigner.requestTimeout);
    readDuration(remoteSigner, "handshakeTimeoutMs", config.remoteSigner.handshakeTimeout);

    const json& activity = section(j, "activity");
    readDuration(activity, "heartbeatIntervalMs", config.activity.heartbeatInterval);
    readDuration(activity, "silenceThresholdMs", config.activity.silenceThreshold);
    readDuration(activity, "initialBackoffMs", config.activity.initialBackoff);
    readDuration(activity, "maxBackoffMs", config.activity.maxBackoff);
    readPositive(activity, "historyLimit", config.activity.historyLimit);

    const json& validation = section(j, "validation");
    readDuration(validation, "futureToleranceSeconds", config.futureTolerance);

    if (config.pool.maxBackoff < config.pool.initialBackoff
        || config.activity.maxBackoff < config.activity.initialBackoff)
    {
        throw invalid_argument("The maximum backoff must not be less than the initial backoff.");
    }

    return config;
};

ClientConfig ClientConfig::fromFile(const string& path)
{
    ifstream file(path);
    if (!file.is_open())
    {
        throw runtime_error("Could not open configuration file " + path);
    }

    json j = json::parse(file);
    return ClientConfig::fromJson(j);
};
