#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <asio.hpp>

#include "AsyncSemaphore.hh"
#include "Job.hh"
#include "JobContext.hh"

using namespace std;

struct RuntimeConfig
{
    size_t maxConcurrent = 0;                 // 0 = unbounded
    chrono::milliseconds drainGrace{2000};    // how long drain() waits for jobs to wind down
};

using WorkUnit = function<asio::awaitable<json>(shared_ptr<JobContext>)>;
using Finalizer = function<asio::awaitable<void>()>;

/*
One dedicated thread running an asio::io_context. Every network-facing
coroutine runs here; nothing on this thread blocks.
- submit() never blocks and keeps arrival order for the start of work
- every exception leaving a work unit is caught at the job boundary and
  becomes the job's outcome, the io_context keeps running
- drain() is the only way down: cancel, wait, finalize, force-cancel, join
*/
class WorkerRuntime
{
public:
    explicit WorkerRuntime(RuntimeConfig config = {});
    ~WorkerRuntime();

    WorkerRuntime(const WorkerRuntime &) = delete;
    WorkerRuntime &operator=(const WorkerRuntime &) = delete;

    void start();

    // False when the runtime is not (or no longer) accepting work
    bool submit(shared_ptr<JobRecord> job, WorkUnit work, RetryPolicy retry = {});

    // Untracked background coroutine; faults are logged
    void spawn(const string &label, Finalizer work);

    // Idempotent; throws InvariantError when called from the runtime thread
    void drain(Finalizer finalizer = nullptr);

    bool isAccepting() const noexcept { return accepting.load(); }
    bool isRunning() const noexcept { return running.load(); }
    bool isRuntimeThread() const noexcept { return this_thread::get_id() == workerId.load(); }

    asio::any_io_executor executor() { return io.get_executor(); }
    const RuntimeConfig &config() const noexcept { return cfg; }

private:
    asio::awaitable<void> runJob(shared_ptr<JobRecord> job, WorkUnit work, RetryPolicy retry);
    void finished(JobId id);

    RuntimeConfig cfg;

    // Declared before io: permits held by coroutine frames are released
    // while the io_context destroys them
    AsyncSemaphore slots;

    asio::io_context io;
    optional<asio::executor_work_guard<asio::io_context::executor_type>> workGuard;
    thread worker;
    atomic<thread::id> workerId{};

    atomic<bool> accepting{false};
    atomic<bool> running{false};
    bool drained = false;
    mutex drainMutex;

    mutable mutex flightMutex;
    condition_variable flightCv;
    map<JobId, shared_ptr<JobRecord>> flight;
};
