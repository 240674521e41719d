#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <utility>

#include <asio.hpp>

#include "JobContext.hh"

using namespace std;

struct RateLimitConfig
{
    chrono::milliseconds minDelay{0};
    chrono::milliseconds maxDelay{0}; // 0 = no cap
    chrono::milliseconds jitter{0};
};

/*
Spaces out operations of the same kind on the same session.
Each caller reserves the next slot up front, so concurrent callers queue up
behind each other instead of all waking at once:

    delay = max(0, minDelay - (now - lastSlot)) + uniform[0, jitter]

With maxDelay > 0 the delay is capped at max(maxDelay, required minimum), so the cap
never breaks the minimum spacing.
*/
class RateLimiter
{
public:
    using Clock = chrono::steady_clock;

    explicit RateLimiter(RateLimitConfig config = {}, unsigned seed = random_device{}());

    // Claim the next slot; the override replaces the delay bounds for this call only
    Clock::time_point reserve(const string &session, const string &operation,
                              const optional<RateLimitConfig> &override = nullopt);

    // Record the moment the operation actually went ahead
    void commit(const string &session, const string &operation);

    // Reserve, sleep (cancellable) until the slot, then commit. A cancelled wait gives its slot back
    asio::awaitable<void> waitTurn(JobContext &ctx, const string &session, const string &operation,
                                   optional<RateLimitConfig> override = nullopt);

    optional<Clock::time_point> lastSlot(const string &session, const string &operation) const;

    const RateLimitConfig &config() const noexcept { return cfg; }

private:
    struct Reservation
    {
        Clock::time_point slot;
        optional<Clock::time_point> previous;
    };

    Reservation claim(const string &session, const string &operation, const optional<RateLimitConfig> &override);
    void release(const string &session, const string &operation, const Reservation &reservation);

    chrono::milliseconds sampleJitter(chrono::milliseconds bound);

    RateLimitConfig cfg;
    mutable mutex mtx;
    mt19937 rng;
    map<pair<string, string>, Clock::time_point> last;
};
