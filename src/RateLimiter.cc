#include "RateLimiter.hh"

RateLimiter::RateLimiter(RateLimitConfig config, unsigned seed) : cfg(config), rng(seed) {}

chrono::milliseconds RateLimiter::sampleJitter(chrono::milliseconds bound)
{
    if (bound.count() <= 0)
        return chrono::milliseconds(0);

    uniform_int_distribution<long long> dist(0, bound.count());
    return chrono::milliseconds(dist(rng));
}

RateLimiter::Clock::time_point RateLimiter::reserve(const string &session, const string &operation,
                                                    const optional<RateLimitConfig> &override)
{
    return claim(session, operation, override).slot;
}

RateLimiter::Reservation RateLimiter::claim(const string &session, const string &operation,
                                            const optional<RateLimitConfig> &override)
{
    const RateLimitConfig &bounds = override ? *override : cfg;

    lock_guard<mutex> lock(mtx);

    auto now = Clock::now();
    auto key = make_pair(session, operation);

    Clock::duration required = Clock::duration::zero();
    optional<Clock::time_point> previous;
    auto it = last.find(key);

    if (it != last.end())
    {
        previous = it->second;

        // Negative when the last slot is still ahead of us
        Clock::duration elapsed = now - it->second;
        if (elapsed < bounds.minDelay)
            required = bounds.minDelay - elapsed;
    }

    Clock::duration delay = required + sampleJitter(bounds.jitter);

    if (bounds.maxDelay.count() > 0)
        delay = min(delay, max<Clock::duration>(bounds.maxDelay, required));

    auto slot = now + delay;
    last[key] = slot;
    return Reservation{slot, previous};
}

void RateLimiter::release(const string &session, const string &operation, const Reservation &reservation)
{
    lock_guard<mutex> lock(mtx);

    auto key = make_pair(session, operation);
    auto it = last.find(key);

    // A later caller already queued behind this slot; keep their spacing
    if (it == last.end() || it->second != reservation.slot)
        return;

    if (reservation.previous)
        it->second = *reservation.previous;
    else
        last.erase(it);
}

void RateLimiter::commit(const string &session, const string &operation)
{
    lock_guard<mutex> lock(mtx);

    auto now = Clock::now();
    auto &slot = last[make_pair(session, operation)];

    if (now > slot)
        slot = now;
}

asio::awaitable<void> RateLimiter::waitTurn(JobContext &ctx, const string &session, const string &operation,
                                            optional<RateLimitConfig> override)
{
    Reservation reservation = claim(session, operation, override);
    auto wait = chrono::duration_cast<chrono::milliseconds>(reservation.slot - Clock::now());

    if (wait.count() > 0)
        Logger::log(LogLevel::Debug, "job#" + to_string(ctx.id()), operation + " throttled on " + session, wait.count());

    try
    {
        co_await ctx.sleepUntil(reservation.slot);
    }
    catch (const CancelledError &)
    {
        // Nothing went out, so the slot goes back
        release(session, operation, reservation);
        throw;
    }

    commit(session, operation);
}

optional<RateLimiter::Clock::time_point> RateLimiter::lastSlot(const string &session, const string &operation) const
{
    lock_guard<mutex> lock(mtx);

    auto it = last.find(make_pair(session, operation));
    if (it == last.end())
        return nullopt;

    return it->second;
}
