#include "AsyncSemaphore.hh"

SemaphorePermit &SemaphorePermit::operator=(SemaphorePermit &&other) noexcept
{
    if (this != &other)
    {
        release();
        owner = other.owner;
        other.owner = nullptr;
    }

    return *this;
}

void SemaphorePermit::release()
{
    if (owner)
    {
        owner->release();
        owner = nullptr;
    }
}

void AsyncSemaphore::grant()
{
    size_t now = ++used;
    size_t seen = peak.load();

    while (now > seen && !peak.compare_exchange_weak(seen, now))
    {
    }
}

asio::awaitable<SemaphorePermit> AsyncSemaphore::acquire()
{
    if (permits == 0 || (used.load() < permits && waiters.empty()))
    {
        grant();
        co_return SemaphorePermit(this);
    }

    auto executor = co_await asio::this_coro::executor;
    auto timer = make_shared<asio::steady_timer>(executor, asio::steady_timer::time_point::max());

    waiters.push_back(timer);

    asio::error_code ec;
    co_await timer->async_wait(asio::redirect_error(asio::use_awaitable, ec));

    // Woken by release(): the permit was transferred, used stays as it was
    co_return SemaphorePermit(this);
}

void AsyncSemaphore::release()
{
    if (!closed && !waiters.empty())
    {
        auto next = std::move(waiters.front());
        waiters.pop_front();
        next->cancel();
        return;
    }

    if (used.load() > 0)
        --used;
}

void AsyncSemaphore::close()
{
    closed = true;
    waiters.clear();
}
