#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "TaskErrors.hh"

using namespace std;
using json = nlohmann::json;

enum class JobKind
{
    SessionCreate,
    SessionAuthorize,
    SendMessage,
    BulkSend,
    ParseUsers,
    VerifyPhone,
    Invite,
    AutoRespondToggle
};

enum class JobState
{
    Pending,
    Running,
    Cancelling,
    Cancelled,
    Completed,
    Failed
};

using JobId = uint64_t;

string jobKindToString(JobKind kind);
optional<JobKind> jobKindFromString(const string &name);
string jobStateToString(JobState state);
optional<JobState> jobStateFromString(const string &name);

bool isTerminal(JobState state);

// Edges of the job state machine; terminal states have none
bool canTransition(JobState from, JobState to);

struct JobProgress
{
    uint64_t done = 0;
    optional<uint64_t> total;
};

struct JobError
{
    ErrorKind kind = ErrorKind::InternalInvariant;
    string message;
};

struct JobHandle
{
    JobId id = 0;
    JobKind kind = JobKind::SendMessage;
};

// Immutable copy of a job, safe to hand to any thread
struct JobSnapshot
{
    JobId id = 0;
    JobKind kind = JobKind::SendMessage;
    JobState state = JobState::Pending;
    string label;
    string session;
    optional<JobId> parentId;

    JobProgress progress;
    optional<json> result;    // Completed only
    optional<JobError> error; // Failed only
    string cancelReason;      // Cancelled only

    chrono::system_clock::time_point createdAt;
    optional<chrono::system_clock::time_point> startedAt;
    optional<chrono::system_clock::time_point> endedAt;

    bool isTerminal() const { return ::isTerminal(state); }

    // Running time, or time since start for jobs still running
    long long durationMs() const;

    json toJSON() const;
};

struct JobEvent
{
    enum class Type
    {
        Created,
        Transition,
        Progress
    };

    Type type = Type::Transition;
    JobId jobId = 0;
    JobKind kind = JobKind::SendMessage;
    JobState from = JobState::Pending;
    JobState to = JobState::Pending;
    JobProgress progress;
    long long elapsedMs = 0; // start to end, set on terminal transitions
    chrono::system_clock::time_point at;
};

using EventSink = function<void(const JobEvent &)>;

/*
Live state of one job. Owned by the registry through shared_ptr and shared with
the runtime while the job runs; every accessor takes the record's own lock.
Events go to the sink while the lock is held, so per-job ordering is the order
of the transitions themselves.
*/
class JobRecord
{
public:
    JobRecord(JobId id, JobKind kind, string label, string session, optional<JobId> parentId = nullopt, EventSink sink = nullptr);

    JobRecord(const JobRecord &) = delete;
    JobRecord &operator=(const JobRecord &) = delete;

    JobId id() const noexcept { return jobId; }
    JobKind kind() const noexcept { return jobKind; }
    const string &session() const noexcept { return sessionName; }

    JobState state() const;
    JobSnapshot snapshot() const;

    // Set exactly when the job reaches a terminal state
    optional<chrono::system_clock::time_point> finishedAt() const;

    bool cancelRequested() const noexcept { return cancelFlag.load(); }

    // Pending -> Running
    bool markRunning();

    // Pending -> Cancelled, Running -> Cancelling; returns true if the state changed
    bool requestCancel();

    // Running -> Completed (Cancelling -> Cancelled)
    bool complete(json result);

    // Running -> Failed (Cancelling -> Cancelled)
    bool fail(JobError error);

    // Running or Cancelling -> Cancelled
    bool finishCancelled(const string &reason);

    // Any non-terminal state -> Cancelled; used for stragglers at shutdown
    bool forceCancel(const string &reason);

    // done never decreases
    void advance(uint64_t done, optional<uint64_t> total = nullopt);

    // Blocks the caller until terminal or timeout; true if terminal
    bool waitTerminal(chrono::milliseconds timeout) const;

    // Called (outside the lock) when cancellation is requested while running
    void setInterruptHook(function<void()> hook);

private:
    bool transitionLocked(JobState to);
    void emitLocked(JobEvent::Type type, JobState from, JobState to);

    const JobId jobId;
    const JobKind jobKind;
    const string jobLabel;
    const string sessionName;
    const optional<JobId> parent;
    EventSink sink;

    mutable mutex mtx;
    mutable condition_variable terminalCv;

    JobState current = JobState::Pending;
    atomic<bool> cancelFlag{false};
    JobProgress progress;
    optional<json> result;
    optional<JobError> error;
    string cancelReason;

    chrono::system_clock::time_point createdAt;
    optional<chrono::system_clock::time_point> startedAt;
    optional<chrono::system_clock::time_point> endedAt;

    function<void()> interruptHook;
};
