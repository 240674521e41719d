#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "Logger.hh"
#include "RateLimiter.hh"
#include "TaskRegistry.hh"
#include "WorkerRuntime.hh"

using namespace std;
using json = nlohmann::json;

struct BulkLimits
{
    size_t maxItems = 500; // largest accepted target/number/user list
    int parseLimit = 10000; // ceiling for get_participants
};

struct LoggingConfig
{
    string file = "msgdesk_log.jsonl";
    LogLevel level = LogLevel::Info; // console threshold
    bool truncate = true;
};

struct StatusServerConfig
{
    bool enabled = false;
    int port = 8080;
};

struct AppConfig
{
    RuntimeConfig runtime;
    RateLimitConfig rateLimit{chrono::milliseconds(2000), chrono::milliseconds(0), chrono::milliseconds(500)};
    RetryPolicy retry;
    BulkLimits bulk;
    RetentionPolicy registry{1000, chrono::seconds(0)};
    size_t maxQueuedEvents = 65536;
    LoggingConfig logging;
    StatusServerConfig statusServer;
    string profilesFile = "profiles.json";
};

// Reads and validates a JSON config file; missing keys keep their defaults.
// Throws runtime_error if the file cannot be read or parsed, ValidationError on bad values.
AppConfig loadConfig(const string &path);

AppConfig configFromJSON(const json &j);

void validateConfig(const AppConfig &config);

json configToJSON(const AppConfig &config);
