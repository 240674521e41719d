#include "JobContext.hh"

JobContext::JobContext(shared_ptr<JobRecord> record, asio::any_io_executor executor, RetryPolicy retry,
                       shared_ptr<JobContext> parent)
    : job(std::move(record)), exec(std::move(executor)), retry(retry), parent(std::move(parent))
{
    if (this->retry.maxAttempts < 1)
        this->retry.maxAttempts = 1;
}

bool JobContext::cancelRequested() const
{
    return job->cancelRequested() || (parent && parent->cancelRequested());
}

void JobContext::checkpoint() const
{
    if (job->cancelRequested())
        throw CancelledError("cancel requested");

    if (parent && parent->cancelRequested())
        throw CancelledError("parent job cancelled");
}

void JobContext::setProgress(uint64_t done, optional<uint64_t> total)
{
    job->advance(done, total);
}

asio::awaitable<void> JobContext::sleepFor(chrono::milliseconds duration)
{
    co_await sleepUntil(chrono::steady_clock::now() + duration);
}

asio::awaitable<void> JobContext::sleepUntil(chrono::steady_clock::time_point deadline)
{
    checkpoint();

    if (deadline <= chrono::steady_clock::now())
        co_return;

    asio::steady_timer timer(exec, deadline);
    activeTimer = &timer;

    asio::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

    activeTimer = nullptr;
    checkpoint();
}

void JobContext::interrupt()
{
    if (activeTimer)
        activeTimer->cancel();

    for (auto &weak : children)
    {
        if (auto child = weak.lock())
            child->interrupt();
    }
}

void JobContext::installInterruptHook()
{
    weak_ptr<JobContext> self = weak_from_this();
    asio::any_io_executor ex = exec;

    job->setInterruptHook([self, ex]
                          { asio::post(ex, [self]
                                       {
                                           if (auto ctx = self.lock())
                                               ctx->interrupt(); }); });
}

shared_ptr<JobContext> JobContext::childContext(shared_ptr<JobRecord> child)
{
    // Forget children that already finished
    children.erase(remove_if(children.begin(), children.end(), [](const weak_ptr<JobContext> &w)
                             { return w.expired(); }),
                   children.end());

    auto ctx = make_shared<JobContext>(std::move(child), exec, retry, shared_from_this());
    children.push_back(ctx);
    ctx->installInterruptHook();
    return ctx;
}
