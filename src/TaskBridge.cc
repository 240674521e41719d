#include "TaskBridge.hh"
#include "Logger.hh"
#include "ProgressTracker.hh"

#include <stdexcept>

TaskBridge::TaskBridge(WorkerRuntime &runtime, TaskRegistry &registry, size_t maxQueuedEvents, RetryPolicy defaultRetry)
    : runtime(runtime), registry(registry), defaultRetry(defaultRetry), events(maxQueuedEvents) {}

EventSink TaskBridge::makeSink()
{
    return [this](const JobEvent &event)
    { onEvent(event); };
}

// Runs under the job record's lock: no registry access from here
void TaskBridge::onEvent(const JobEvent &event)
{
    if (!events.push(event))
    {
        size_t dropped = events.dropped();

        if (dropped == 1 || dropped % 1000 == 0)
            Logger::log(LogLevel::Warn, "bridge", "event queue full, " + to_string(dropped) + " oldest events dropped");
    }

    if (event.type == JobEvent::Type::Transition && isTerminal(event.to))
    {
        if (ProgressTracker *t = tracker.load())
            t->markJobDoneWithCategory(jobKindToString(event.kind), event.elapsedMs, event.to);
    }
}

JobHandle TaskBridge::dispatch(JobSpec spec)
{
    if (!spec.work)
        throw ValidationError("job has no work to run");

    if (!runtime.isAccepting())
        throw ValidationError("runtime is shut down");

    auto job = registry.create(spec.kind, spec.label, spec.session, spec.parentId, makeSink());
    JobHandle handle{job->id(), job->kind()};

    if (!runtime.submit(job, std::move(spec.work), spec.retry.value_or(defaultRetry)))
    {
        // Lost the race with shutdown
        job->forceCancel("runtime shut down");
        throw ValidationError("runtime is shut down");
    }

    Logger::log(LogLevel::Debug, "job#" + to_string(handle.id), "dispatched " + jobKindToString(handle.kind) + " " + spec.label);
    return handle;
}

optional<JobSnapshot> TaskBridge::poll(JobId id) const
{
    return registry.get(id);
}

optional<JobSnapshot> TaskBridge::awaitResult(JobId id, chrono::milliseconds timeout) const
{
    if (runtime.isRuntimeThread())
        throw InvariantError("awaitResult would block the runtime thread");

    auto job = registry.find(id);
    if (!job)
        throw out_of_range("unknown job id " + to_string(id));

    if (!job->waitTerminal(timeout))
        return nullopt;

    return job->snapshot();
}

bool TaskBridge::cancel(JobId id)
{
    auto job = registry.find(id);
    if (!job)
        return false;

    bool changed = job->requestCancel();

    if (changed)
        Logger::log(LogLevel::Info, "job#" + to_string(id), "cancel requested -> " + jobStateToString(job->state()));

    return changed;
}

shared_ptr<JobRecord> TaskBridge::createChild(const JobContext &parent, JobKind kind, const string &label)
{
    return registry.create(kind, label, parent.record()->session(), parent.id(), makeSink());
}

size_t TaskBridge::subscribe(JobListener listener)
{
    lock_guard<mutex> lock(listenerMutex);

    size_t token = nextToken++;
    listeners.emplace(token, std::move(listener));
    return token;
}

void TaskBridge::unsubscribe(size_t token)
{
    lock_guard<mutex> lock(listenerMutex);
    listeners.erase(token);
}

size_t TaskBridge::pumpEvents(size_t maxEvents)
{
    vector<JobEvent> batch = events.drain(maxEvents);
    if (batch.empty())
        return 0;

    vector<JobListener> targets;
    {
        lock_guard<mutex> lock(listenerMutex);
        for (auto &[token, listener] : listeners)
            targets.push_back(listener);
    }

    for (const JobEvent &event : batch)
    {
        for (auto &listener : targets)
        {
            try
            {
                listener(event);
            }
            catch (const exception &e)
            {
                Logger::log(LogLevel::Error, "bridge", string("listener threw: ") + e.what());
            }
        }
    }

    return batch.size();
}

vector<JobEvent> TaskBridge::drainEvents(size_t maxEvents)
{
    return events.drain(maxEvents);
}

void TaskBridge::attachTracker(ProgressTracker *t)
{
    tracker = t;
}

void TaskBridge::shutdown(Finalizer finalizer)
{
    runtime.drain(std::move(finalizer));

    for (auto &job : registry.active())
    {
        if (job->forceCancel("runtime shut down"))
            Logger::log(LogLevel::Warn, "job#" + to_string(job->id()), "left behind at shutdown, cancelled");
    }
}
