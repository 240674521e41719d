#include "config.hh"
#include "TaskErrors.hh"

#include <fstream>

namespace
{
    // Negative durations are caught by validateConfig, not silently clamped
    chrono::milliseconds millis(const json &section, const char *key, chrono::milliseconds fallback)
    {
        return chrono::milliseconds(section.value(key, static_cast<long long>(fallback.count())));
    }

    void requireNonNegative(long long value, const string &key)
    {
        if (value < 0)
            throw ValidationError("config: " + key + " must not be negative");
    }
}

AppConfig configFromJSON(const json &j)
{
    if (!j.is_object())
        throw ValidationError("config: top level must be an object");

    AppConfig cfg;

    try
    {
        if (j.contains("runtime"))
        {
            const json &r = j["runtime"];
            long long maxConcurrent = r.value("max_concurrent", static_cast<long long>(cfg.runtime.maxConcurrent));
            requireNonNegative(maxConcurrent, "runtime.max_concurrent");
            cfg.runtime.maxConcurrent = static_cast<size_t>(maxConcurrent);
            cfg.runtime.drainGrace = millis(r, "drain_grace_ms", cfg.runtime.drainGrace);
        }

        if (j.contains("rate_limit"))
        {
            const json &r = j["rate_limit"];
            cfg.rateLimit.minDelay = millis(r, "min_delay_ms", cfg.rateLimit.minDelay);
            cfg.rateLimit.maxDelay = millis(r, "max_delay_ms", cfg.rateLimit.maxDelay);
            cfg.rateLimit.jitter = millis(r, "jitter_ms", cfg.rateLimit.jitter);
        }

        if (j.contains("retry"))
        {
            const json &r = j["retry"];
            cfg.retry.maxAttempts = r.value("max_attempts", cfg.retry.maxAttempts);
            cfg.retry.backoff = millis(r, "backoff_ms", cfg.retry.backoff);
        }

        if (j.contains("bulk"))
        {
            const json &b = j["bulk"];
            long long maxItems = b.value("max_items", static_cast<long long>(cfg.bulk.maxItems));
            requireNonNegative(maxItems, "bulk.max_items");
            cfg.bulk.maxItems = static_cast<size_t>(maxItems);
            cfg.bulk.parseLimit = b.value("parse_limit", cfg.bulk.parseLimit);
        }

        if (j.contains("registry"))
        {
            const json &r = j["registry"];
            long long maxJobs = r.value("max_terminal_jobs", static_cast<long long>(cfg.registry.maxTerminalJobs));
            long long maxAge = r.value("max_terminal_age_s", static_cast<long long>(cfg.registry.maxTerminalAge.count()));
            requireNonNegative(maxJobs, "registry.max_terminal_jobs");
            requireNonNegative(maxAge, "registry.max_terminal_age_s");
            cfg.registry.maxTerminalJobs = static_cast<size_t>(maxJobs);
            cfg.registry.maxTerminalAge = chrono::seconds(maxAge);
        }

        if (j.contains("events"))
        {
            long long maxQueued = j["events"].value("max_queued", static_cast<long long>(cfg.maxQueuedEvents));
            requireNonNegative(maxQueued, "events.max_queued");
            cfg.maxQueuedEvents = static_cast<size_t>(maxQueued);
        }

        if (j.contains("logging"))
        {
            const json &l = j["logging"];
            cfg.logging.file = l.value("file", cfg.logging.file);
            cfg.logging.truncate = l.value("truncate", cfg.logging.truncate);

            if (l.contains("level"))
            {
                string name = l["level"].get<string>();
                auto level = Logger::logLevelFromString(name);
                if (!level)
                    throw ValidationError("config: unknown logging.level '" + name + "'");

                cfg.logging.level = *level;
            }
        }

        if (j.contains("status_server"))
        {
            const json &s = j["status_server"];
            cfg.statusServer.enabled = s.value("enabled", cfg.statusServer.enabled);
            cfg.statusServer.port = s.value("port", cfg.statusServer.port);
        }

        cfg.profilesFile = j.value("profiles_file", cfg.profilesFile);
    }
    catch (const json::exception &e)
    {
        // Wrong value types, e.g. a string where a number belongs
        throw ValidationError(string("config: ") + e.what());
    }

    validateConfig(cfg);
    return cfg;
}

void validateConfig(const AppConfig &cfg)
{
    requireNonNegative(cfg.runtime.drainGrace.count(), "runtime.drain_grace_ms");
    requireNonNegative(cfg.rateLimit.minDelay.count(), "rate_limit.min_delay_ms");
    requireNonNegative(cfg.rateLimit.maxDelay.count(), "rate_limit.max_delay_ms");
    requireNonNegative(cfg.rateLimit.jitter.count(), "rate_limit.jitter_ms");
    requireNonNegative(cfg.retry.backoff.count(), "retry.backoff_ms");

    if (cfg.retry.maxAttempts < 1)
        throw ValidationError("config: retry.max_attempts must be at least 1");

    if (cfg.bulk.maxItems == 0)
        throw ValidationError("config: bulk.max_items must be positive");

    if (cfg.bulk.parseLimit <= 0)
        throw ValidationError("config: bulk.parse_limit must be positive");

    if (cfg.statusServer.port <= 0 || cfg.statusServer.port > 65535)
        throw ValidationError("config: status_server.port out of range");

    if (cfg.logging.file.empty())
        throw ValidationError("config: logging.file must not be empty");
}

AppConfig loadConfig(const string &path)
{
    ifstream in(path);
    if (!in.is_open())
        throw runtime_error("Cannot open config file: " + path);

    json j;
    try
    {
        in >> j;
    }
    catch (const json::parse_error &e)
    {
        throw runtime_error("Cannot parse config file " + path + ": " + e.what());
    }

    return configFromJSON(j);
}

json configToJSON(const AppConfig &cfg)
{
    return {
        {"runtime", {{"max_concurrent", cfg.runtime.maxConcurrent}, {"drain_grace_ms", cfg.runtime.drainGrace.count()}}},
        {"rate_limit", {{"min_delay_ms", cfg.rateLimit.minDelay.count()}, {"max_delay_ms", cfg.rateLimit.maxDelay.count()}, {"jitter_ms", cfg.rateLimit.jitter.count()}}},
        {"retry", {{"max_attempts", cfg.retry.maxAttempts}, {"backoff_ms", cfg.retry.backoff.count()}}},
        {"bulk", {{"max_items", cfg.bulk.maxItems}, {"parse_limit", cfg.bulk.parseLimit}}},
        {"registry", {{"max_terminal_jobs", cfg.registry.maxTerminalJobs}, {"max_terminal_age_s", cfg.registry.maxTerminalAge.count()}}},
        {"events", {{"max_queued", cfg.maxQueuedEvents}}},
        {"logging", {{"file", cfg.logging.file}, {"level", Logger::logLevelToString(cfg.logging.level)}, {"truncate", cfg.logging.truncate}}},
        {"status_server", {{"enabled", cfg.statusServer.enabled}, {"port", cfg.statusServer.port}}},
        {"profiles_file", cfg.profilesFile}};
}
