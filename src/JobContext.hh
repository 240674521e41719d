#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include <asio.hpp>

#include "Job.hh"
#include "Logger.hh"

using namespace std;

struct RetryPolicy
{
    int maxAttempts = 3;
    chrono::milliseconds backoff{200}; // doubled after every failed attempt
};

/*
What a work unit sees of its own job while it runs on the runtime thread.
- checkpoint() is the only place cancellation is observed
- sleeps are cancellable: a cancel request interrupts the timer and the
  checkpoint after it throws CancelledError
- child contexts belong to per-item jobs of a bulk operation; a cancelled
  parent cancels every child at its next checkpoint
*/
class JobContext : public enable_shared_from_this<JobContext>
{
public:
    JobContext(shared_ptr<JobRecord> record, asio::any_io_executor executor, RetryPolicy retry = {},
               shared_ptr<JobContext> parent = nullptr);

    JobId id() const noexcept { return job->id(); }
    const shared_ptr<JobRecord> &record() const noexcept { return job; }
    const RetryPolicy &retryPolicy() const noexcept { return retry; }
    asio::any_io_executor executor() const { return exec; }

    bool cancelRequested() const;

    // Throws CancelledError once this job (or its parent) was asked to cancel
    void checkpoint() const;

    void setProgress(uint64_t done, optional<uint64_t> total = nullopt);

    asio::awaitable<void> sleepFor(chrono::milliseconds duration);
    asio::awaitable<void> sleepUntil(chrono::steady_clock::time_point deadline);

    // Wake whatever this job (and its children) is sleeping on; runtime thread only
    void interrupt();

    // Route cancel requests on the record to interrupt() on the runtime thread
    void installInterruptHook();

    shared_ptr<JobContext> childContext(shared_ptr<JobRecord> child);

    // Run one protocol call, retrying TransientProtocolError with exponential backoff.
    // Anything that is not a TaskError is reported as FatalProtocolError.
    template <typename F>
    auto withRetry(const string &what, F call) -> decltype(call())
    {
        using Result = typename decltype(call())::value_type;

        for (int attempt = 1;; ++attempt)
        {
            checkpoint();
            string failure;

            try
            {
                if constexpr (is_void_v<Result>)
                {
                    co_await call();
                    co_return;
                }
                else
                {
                    co_return co_await call();
                }
            }
            catch (const TransientProtocolError &e)
            {
                if (attempt >= retry.maxAttempts)
                    throw;

                failure = e.what();
            }
            catch (const TaskError &)
            {
                throw;
            }
            catch (const exception &e)
            {
                throw FatalProtocolError(what + ": " + e.what());
            }

            auto delay = retry.backoff * (1LL << min(attempt - 1, 10));
            Logger::log(LogLevel::Warn, "job#" + to_string(id()), what + " retrying: " + failure, delay.count(), attempt);

            co_await sleepFor(chrono::duration_cast<chrono::milliseconds>(delay));
        }
    }

private:
    shared_ptr<JobRecord> job;
    asio::any_io_executor exec;
    RetryPolicy retry;
    shared_ptr<JobContext> parent;

    // Runtime thread only
    asio::steady_timer *activeTimer = nullptr;
    vector<weak_ptr<JobContext>> children;
};
