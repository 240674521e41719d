#include "Job.hh"
#include "Logger.hh"

namespace
{
    long long epochMs(chrono::system_clock::time_point tp)
    {
        return chrono::duration_cast<chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    const JobKind allKinds[] = {JobKind::SessionCreate, JobKind::SessionAuthorize, JobKind::SendMessage, JobKind::BulkSend,
                                JobKind::ParseUsers, JobKind::VerifyPhone, JobKind::Invite, JobKind::AutoRespondToggle};

    const JobState allStates[] = {JobState::Pending, JobState::Running, JobState::Cancelling,
                                  JobState::Cancelled, JobState::Completed, JobState::Failed};
}

string jobKindToString(JobKind kind)
{
    switch (kind)
    {
    case JobKind::SessionCreate:
        return "session-create";

    case JobKind::SessionAuthorize:
        return "session-authorize";

    case JobKind::SendMessage:
        return "send-message";

    case JobKind::BulkSend:
        return "bulk-send";

    case JobKind::ParseUsers:
        return "parse-users";

    case JobKind::VerifyPhone:
        return "verify-phone";

    case JobKind::Invite:
        return "invite";

    case JobKind::AutoRespondToggle:
        return "auto-respond-toggle";
    }

    return "unknown";
}

optional<JobKind> jobKindFromString(const string &name)
{
    for (JobKind kind : allKinds)
    {
        if (jobKindToString(kind) == name)
            return kind;
    }

    return nullopt;
}

string jobStateToString(JobState state)
{
    switch (state)
    {
    case JobState::Pending:
        return "pending";

    case JobState::Running:
        return "running";

    case JobState::Cancelling:
        return "cancelling";

    case JobState::Cancelled:
        return "cancelled";

    case JobState::Completed:
        return "completed";

    case JobState::Failed:
        return "failed";
    }

    return "unknown";
}

optional<JobState> jobStateFromString(const string &name)
{
    for (JobState state : allStates)
    {
        if (jobStateToString(state) == name)
            return state;
    }

    return nullopt;
}

bool isTerminal(JobState state)
{
    return state == JobState::Cancelled || state == JobState::Completed || state == JobState::Failed;
}

bool canTransition(JobState from, JobState to)
{
    switch (from)
    {
    case JobState::Pending:
        return to == JobState::Running || to == JobState::Cancelled;

    case JobState::Running:
        return to == JobState::Cancelling || to == JobState::Completed ||
               to == JobState::Failed || to == JobState::Cancelled;

    case JobState::Cancelling:
        return to == JobState::Cancelled;

    default:
        return false; // terminal
    }
}

long long JobSnapshot::durationMs() const
{
    if (!startedAt)
        return 0;

    auto end = endedAt.value_or(chrono::system_clock::now());
    return chrono::duration_cast<chrono::milliseconds>(end - *startedAt).count();
}

json JobSnapshot::toJSON() const
{
    json j = {
        {"id", id},
        {"kind", jobKindToString(kind)},
        {"state", jobStateToString(state)},
        {"label", label},
        {"session", session},
        {"progress", {{"done", progress.done}}},
        {"created_at_ms", epochMs(createdAt)},
        {"duration_ms", durationMs()}};

    if (progress.total)
        j["progress"]["total"] = *progress.total;

    if (parentId)
        j["parent_id"] = *parentId;

    if (startedAt)
        j["started_at_ms"] = epochMs(*startedAt);

    if (endedAt)
        j["ended_at_ms"] = epochMs(*endedAt);

    if (result)
        j["result"] = *result;

    if (error)
        j["error"] = {{"kind", errorKindToString(error->kind)}, {"message", error->message}};

    if (state == JobState::Cancelled && !cancelReason.empty())
        j["cancel_reason"] = cancelReason;

    return j;
}

JobRecord::JobRecord(JobId id, JobKind kind, string label, string session, optional<JobId> parentId, EventSink sink)
    : jobId(id),
      jobKind(kind),
      jobLabel(std::move(label)),
      sessionName(std::move(session)),
      parent(parentId),
      sink(std::move(sink)),
      createdAt(chrono::system_clock::now())
{
    lock_guard<mutex> lock(mtx);
    emitLocked(JobEvent::Type::Created, JobState::Pending, JobState::Pending);
}

JobState JobRecord::state() const
{
    lock_guard<mutex> lock(mtx);
    return current;
}

optional<chrono::system_clock::time_point> JobRecord::finishedAt() const
{
    lock_guard<mutex> lock(mtx);
    return endedAt;
}

JobSnapshot JobRecord::snapshot() const
{
    lock_guard<mutex> lock(mtx);

    JobSnapshot snap;
    snap.id = jobId;
    snap.kind = jobKind;
    snap.state = current;
    snap.label = jobLabel;
    snap.session = sessionName;
    snap.parentId = parent;
    snap.progress = progress;
    snap.result = result;
    snap.error = error;
    snap.cancelReason = cancelReason;
    snap.createdAt = createdAt;
    snap.startedAt = startedAt;
    snap.endedAt = endedAt;
    return snap;
}

bool JobRecord::transitionLocked(JobState to)
{
    // Re-entry into or out of a terminal state is a no-op
    if (isTerminal(current))
        return false;

    if (!canTransition(current, to))
    {
        Logger::log(LogLevel::Critical, "job#" + to_string(jobId),
                    "illegal transition " + jobStateToString(current) + " -> " + jobStateToString(to));
        return false;
    }

    JobState from = current;
    current = to;

    auto now = chrono::system_clock::now();

    if (to == JobState::Running)
        startedAt = now;

    if (isTerminal(to))
    {
        endedAt = now;
        interruptHook = nullptr;
    }

    emitLocked(JobEvent::Type::Transition, from, to);

    if (isTerminal(to))
        terminalCv.notify_all();

    return true;
}

void JobRecord::emitLocked(JobEvent::Type type, JobState from, JobState to)
{
    if (!sink)
        return;

    JobEvent event;
    event.type = type;
    event.jobId = jobId;
    event.kind = jobKind;
    event.from = from;
    event.to = to;
    event.progress = progress;
    event.at = chrono::system_clock::now();

    if (isTerminal(to) && startedAt && endedAt)
        event.elapsedMs = chrono::duration_cast<chrono::milliseconds>(*endedAt - *startedAt).count();

    sink(event);
}

bool JobRecord::markRunning()
{
    lock_guard<mutex> lock(mtx);

    if (current != JobState::Pending)
        return false;

    return transitionLocked(JobState::Running);
}

bool JobRecord::requestCancel()
{
    function<void()> hook;

    {
        lock_guard<mutex> lock(mtx);

        if (isTerminal(current) || current == JobState::Cancelling)
            return false;

        cancelFlag = true;

        if (current == JobState::Pending)
        {
            cancelReason = "cancelled before start";
            return transitionLocked(JobState::Cancelled);
        }

        if (!transitionLocked(JobState::Cancelling))
            return false;

        hook = interruptHook;
    }

    // Outside the lock: the hook posts to the runtime
    if (hook)
        hook();

    return true;
}

bool JobRecord::complete(json value)
{
    lock_guard<mutex> lock(mtx);

    // Cancellation requested after the last checkpoint still wins
    if (current == JobState::Cancelling)
        return transitionLocked(JobState::Cancelled);

    if (!isTerminal(current) && canTransition(current, JobState::Completed))
        result = std::move(value);

    return transitionLocked(JobState::Completed);
}

bool JobRecord::fail(JobError err)
{
    lock_guard<mutex> lock(mtx);

    if (current == JobState::Cancelling)
        return transitionLocked(JobState::Cancelled);

    if (!isTerminal(current) && canTransition(current, JobState::Failed))
        error = std::move(err);

    return transitionLocked(JobState::Failed);
}

bool JobRecord::finishCancelled(const string &reason)
{
    lock_guard<mutex> lock(mtx);

    if (current == JobState::Pending)
    {
        Logger::log(LogLevel::Critical, "job#" + to_string(jobId), "finishCancelled on a job that never started");
        return false;
    }

    cancelFlag = true;
    if (cancelReason.empty())
        cancelReason = reason;

    return transitionLocked(JobState::Cancelled);
}

bool JobRecord::forceCancel(const string &reason)
{
    lock_guard<mutex> lock(mtx);

    if (isTerminal(current))
        return false;

    cancelFlag = true;
    if (cancelReason.empty())
        cancelReason = reason;

    return transitionLocked(JobState::Cancelled);
}

void JobRecord::advance(uint64_t done, optional<uint64_t> total)
{
    lock_guard<mutex> lock(mtx);

    if (isTerminal(current))
        return;

    bool changed = false;

    if (done > progress.done)
    {
        progress.done = done;
        changed = true;
    }

    if (total && progress.total != total)
    {
        progress.total = total;
        changed = true;
    }

    if (changed)
        emitLocked(JobEvent::Type::Progress, current, current);
}

bool JobRecord::waitTerminal(chrono::milliseconds timeout) const
{
    unique_lock<mutex> lock(mtx);

    return terminalCv.wait_for(lock, timeout, [this]
                               { return isTerminal(current); });
}

void JobRecord::setInterruptHook(function<void()> hook)
{
    lock_guard<mutex> lock(mtx);

    if (!isTerminal(current))
        interruptHook = std::move(hook);
}
