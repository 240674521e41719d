#include "WorkerRuntime.hh"
#include "Logger.hh"

#include <future>

namespace
{
    string describe(exception_ptr ep)
    {
        try
        {
            rethrow_exception(ep);
        }
        catch (const exception &e)
        {
            return e.what();
        }
        catch (...)
        {
            return "unknown exception";
        }
    }

    // Keeps the callable (and a lambda's captures) alive in the coroutine frame
    asio::awaitable<void> runOwned(Finalizer work)
    {
        co_await work();
    }
}

WorkerRuntime::WorkerRuntime(RuntimeConfig config) : cfg(config), slots(config.maxConcurrent) {}

WorkerRuntime::~WorkerRuntime()
{
    if (isRuntimeThread())
    {
        Logger::log(LogLevel::Critical, "runtime", "destroyed from its own thread");
        return;
    }

    try
    {
        drain();
    }
    catch (const exception &e)
    {
        Logger::log(LogLevel::Error, "runtime", string("drain during destruction failed: ") + e.what());
    }
}

void WorkerRuntime::start()
{
    lock_guard<mutex> lock(drainMutex);

    if (running || drained)
        return;

    workGuard.emplace(asio::make_work_guard(io));
    running = true;

    worker = thread([this]()
                    {
        workerId = this_thread::get_id();

        // A handler that throws must not take the runtime down with it
        while (true)
        {
            try
            {
                io.run();
                break;
            }
            catch (const exception &e)
            {
                Logger::log(LogLevel::Critical, "runtime", string("handler escaped: ") + e.what());
            }
        } });

    {
        lock_guard<mutex> flightLock(flightMutex);
        accepting = true;
    }

    Logger::log(LogLevel::Info, "runtime", "started (max concurrent " +
                                               (cfg.maxConcurrent == 0 ? string("unbounded") : to_string(cfg.maxConcurrent)) + ")");
}

bool WorkerRuntime::submit(shared_ptr<JobRecord> job, WorkUnit work, RetryPolicy retry)
{
    if (!job || !work)
        return false;

    JobId id = job->id();

    {
        lock_guard<mutex> lock(flightMutex);

        if (!accepting)
            return false;

        flight.emplace(id, job);
    }

    // co_spawn posts; jobs start in submission order
    asio::co_spawn(io, runJob(std::move(job), std::move(work), retry),
                   [this, id](exception_ptr ep)
                   {
                       if (ep)
                           Logger::log(LogLevel::Critical, "job#" + to_string(id), "escaped the job boundary: " + describe(ep));

                       finished(id);
                   });

    return true;
}

void WorkerRuntime::finished(JobId id)
{
    {
        lock_guard<mutex> lock(flightMutex);
        flight.erase(id);
    }

    flightCv.notify_all();
}

asio::awaitable<void> WorkerRuntime::runJob(shared_ptr<JobRecord> job, WorkUnit work, RetryPolicy retry)
{
    const string tag = "job#" + to_string(job->id());

    // Cancelled while queued: never enters Running
    if (job->state() != JobState::Pending)
        co_return;

    SemaphorePermit permit = co_await slots.acquire();

    if (!job->markRunning())
        co_return;

    auto ctx = make_shared<JobContext>(job, io.get_executor(), retry);
    ctx->installInterruptHook();

    auto started = chrono::steady_clock::now();
    Logger::log(LogLevel::Debug, tag, "running " + jobKindToString(job->kind()));

    json value;
    bool succeeded = false;
    optional<string> cancelled;
    optional<JobError> failure;

    try
    {
        value = co_await work(ctx);
        succeeded = true;
    }
    catch (const CancelledError &e)
    {
        cancelled = e.what();
    }
    catch (const TaskError &e)
    {
        failure = JobError{e.kind(), e.what()};
    }
    catch (const exception &e)
    {
        failure = JobError{ErrorKind::InternalInvariant, string("unhandled exception: ") + e.what()};
    }
    catch (...)
    {
        failure = JobError{ErrorKind::InternalInvariant, "unhandled non-standard exception"};
    }

    auto latency = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - started).count();

    if (succeeded)
    {
        job->complete(std::move(value));
        Logger::log(LogLevel::Info, tag, jobStateToString(job->state()), latency);
    }
    else if (cancelled)
    {
        job->finishCancelled(*cancelled);
        Logger::log(LogLevel::Info, tag, "cancelled: " + *cancelled, latency);
    }
    else
    {
        LogLevel level = failure->kind == ErrorKind::InternalInvariant ? LogLevel::Critical : LogLevel::Error;
        Logger::log(level, tag, string("failed (") + errorKindToString(failure->kind) + "): " + failure->message, latency);
        job->fail(std::move(*failure));
    }
}

void WorkerRuntime::spawn(const string &label, Finalizer work)
{
    if (!work || !running)
        return;

    asio::co_spawn(io, runOwned(std::move(work)), [label](exception_ptr ep)
                   {
        if (ep)
            Logger::log(LogLevel::Error, label, "background task failed: " + describe(ep)); });
}

void WorkerRuntime::drain(Finalizer finalizer)
{
    if (isRuntimeThread())
        throw InvariantError("drain() called from the runtime thread");

    lock_guard<mutex> drainLock(drainMutex);

    if (drained)
        return;

    {
        lock_guard<mutex> lock(flightMutex);
        accepting = false;
    }

    if (!running)
    {
        drained = true;
        return;
    }

    auto deadline = chrono::steady_clock::now() + cfg.drainGrace;

    vector<shared_ptr<JobRecord>> pending;
    {
        lock_guard<mutex> lock(flightMutex);
        for (auto &[id, job] : flight)
            pending.push_back(job);
    }

    Logger::log(LogLevel::Info, "runtime", "draining " + to_string(pending.size()) + " jobs");

    for (auto &job : pending)
        job->requestCancel();

    {
        unique_lock<mutex> lock(flightMutex);
        flightCv.wait_until(lock, deadline, [this]
                            { return flight.empty(); });
    }

    if (finalizer)
    {
        auto done = make_shared<promise<void>>();
        future<void> finished = done->get_future();

        asio::co_spawn(io, runOwned(std::move(finalizer)), [done](exception_ptr ep)
                       {
            // Shutdown always completes: finalizer faults are only logged
            if (ep)
                Logger::log(LogLevel::Error, "runtime", "finalizer failed: " + describe(ep));

            done->set_value(); });

        if (finished.wait_for(cfg.drainGrace) == future_status::timeout)
            Logger::log(LogLevel::Warn, "runtime", "finalizer did not finish within the grace period");
    }

    vector<shared_ptr<JobRecord>> stragglers;
    {
        lock_guard<mutex> lock(flightMutex);
        for (auto &[id, job] : flight)
            stragglers.push_back(job);
    }

    for (auto &job : stragglers)
    {
        if (job->forceCancel("runtime shut down"))
            Logger::log(LogLevel::Warn, "job#" + to_string(job->id()), "force-cancelled at shutdown");
    }

    workGuard.reset();
    io.stop();

    if (worker.joinable())
        worker.join();

    workerId = thread::id();
    slots.close();

    running = false;
    drained = true;

    Logger::log(LogLevel::Info, "runtime", "stopped");
}
