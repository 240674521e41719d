#pragma once

#include <atomic>
#include <deque>
#include <memory>

#include <asio.hpp>

using namespace std;

class AsyncSemaphore;

// Move-only permit; going out of scope gives the permit back
class SemaphorePermit
{
public:
    SemaphorePermit() = default;
    explicit SemaphorePermit(AsyncSemaphore *owner) : owner(owner) {}

    SemaphorePermit(SemaphorePermit &&other) noexcept : owner(other.owner) { other.owner = nullptr; }
    SemaphorePermit &operator=(SemaphorePermit &&other) noexcept;

    SemaphorePermit(const SemaphorePermit &) = delete;
    SemaphorePermit &operator=(const SemaphorePermit &) = delete;

    ~SemaphorePermit() { release(); }

    void release();

private:
    AsyncSemaphore *owner = nullptr;
};

/*
FIFO gate for coroutines on the runtime thread.
- permits == 0 means unbounded, acquire() never suspends but usage is still counted
- waiters park on a timer that never expires; release() cancels the front timer
  and hands its permit over directly, so a late arrival cannot overtake a waiter
- acquire()/release() must be called on the runtime thread; the counters may be read anywhere
*/
class AsyncSemaphore
{
public:
    explicit AsyncSemaphore(size_t permits = 1) : permits(permits) {}

    AsyncSemaphore(const AsyncSemaphore &) = delete;
    AsyncSemaphore &operator=(const AsyncSemaphore &) = delete;

    asio::awaitable<SemaphorePermit> acquire();

    size_t capacity() const noexcept { return permits; }
    size_t inUse() const noexcept { return used.load(); }
    size_t peakInUse() const noexcept { return peak.load(); }

    // Drop parked waiters without waking them; used once the runtime has stopped
    void close();

private:
    friend class SemaphorePermit;
    void release();
    void grant();

    const size_t permits;
    atomic<size_t> used{0};
    atomic<size_t> peak{0};
    bool closed = false;

    deque<shared_ptr<asio::steady_timer>> waiters;
};
