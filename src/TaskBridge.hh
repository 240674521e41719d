#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "EventQueue.hh"
#include "Job.hh"
#include "JobContext.hh"
#include "TaskRegistry.hh"
#include "WorkerRuntime.hh"

using namespace std;

class ProgressTracker;

// Everything needed to create and run one job
struct JobSpec
{
    JobKind kind = JobKind::SendMessage;
    string label;
    string session;
    optional<JobId> parentId;
    optional<RetryPolicy> retry; // falls back to the bridge default
    WorkUnit work;
};

using JobListener = function<void(const JobEvent &)>;

/*
The one channel between the caller's thread and the runtime.
- dispatch/poll/cancel never block and never suspend
- awaitResult blocks only its caller and never on the runtime thread
- job events queue up here and reach listeners on the thread calling pumpEvents()
Lock order: registry -> job record -> event queue. Listeners run with no lock held.
*/
class TaskBridge
{
public:
    TaskBridge(WorkerRuntime &runtime, TaskRegistry &registry, size_t maxQueuedEvents = 65536, RetryPolicy defaultRetry = {});

    TaskBridge(const TaskBridge &) = delete;
    TaskBridge &operator=(const TaskBridge &) = delete;

    // Throws ValidationError if the spec has no work or the runtime is shut down
    JobHandle dispatch(JobSpec spec);

    optional<JobSnapshot> poll(JobId id) const;

    // nullopt on timeout (the job keeps running); throws out_of_range for an unknown id
    optional<JobSnapshot> awaitResult(JobId id, chrono::milliseconds timeout) const;

    // true if the job changed state
    bool cancel(JobId id);

    // Per-item job of a bulk operation, run inline by the parent's work unit
    shared_ptr<JobRecord> createChild(const JobContext &parent, JobKind kind, const string &label);

    size_t subscribe(JobListener listener);
    void unsubscribe(size_t token);

    // Deliver queued events to listeners on the calling thread; returns how many
    size_t pumpEvents(size_t maxEvents = 0);

    // Take queued events without delivering them
    vector<JobEvent> drainEvents(size_t maxEvents = 0);

    size_t queuedEvents() const { return events.size(); }
    size_t droppedEvents() const { return events.dropped(); }

    // Terminal transitions are counted by the tracker when one is attached
    void attachTracker(ProgressTracker *tracker);

    // Drain the runtime, then cancel anything (children included) still live
    void shutdown(Finalizer finalizer = nullptr);

    bool isAccepting() const noexcept { return runtime.isAccepting(); }

    WorkerRuntime &workerRuntime() noexcept { return runtime; }
    TaskRegistry &taskRegistry() noexcept { return registry; }
    const RetryPolicy &defaultRetryPolicy() const noexcept { return defaultRetry; }

private:
    void onEvent(const JobEvent &event);
    EventSink makeSink();

    WorkerRuntime &runtime;
    TaskRegistry &registry;
    RetryPolicy defaultRetry;

    EventQueue<JobEvent> events;

    mutable mutex listenerMutex;
    map<size_t, JobListener> listeners;
    size_t nextToken = 1;

    atomic<ProgressTracker *> tracker{nullptr};
};
