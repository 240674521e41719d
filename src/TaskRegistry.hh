#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "Job.hh"

using namespace std;

struct RetentionPolicy
{
    // Keep at most this many terminal jobs (0 = unlimited)
    size_t maxTerminalJobs = 0;
    // Drop terminal jobs that ended longer ago than this (0 = never)
    chrono::seconds maxTerminalAge{0};
};

/*
In-memory index of every job by id.
- ids come from a monotonic counter and are never reused
- reads hand out snapshots, never references to live state
- retention only ever evicts terminal jobs, oldest first
*/
class TaskRegistry
{
public:
    explicit TaskRegistry(RetentionPolicy policy = {});

    // Allocate an id, build the record and register it
    shared_ptr<JobRecord> create(JobKind kind, const string &label, const string &session,
                                 optional<JobId> parentId = nullopt, EventSink sink = nullptr);

    // Throws InvariantError if the id is already registered
    void registerJob(shared_ptr<JobRecord> job);

    shared_ptr<JobRecord> find(JobId id) const;
    optional<JobSnapshot> get(JobId id) const;

    vector<JobSnapshot> list(optional<JobKind> kind = nullopt, optional<JobState> state = nullopt) const;

    // Records not yet terminal
    vector<shared_ptr<JobRecord>> active() const;

    // Remove one terminal job; false if unknown or still live
    bool purge(JobId id);

    // Remove every terminal job
    size_t purgeTerminal();

    // Apply the retention policy now; returns the number evicted
    size_t enforceRetention();

    size_t size() const;

private:
    size_t enforceRetentionLocked();

    RetentionPolicy policy;
    mutable mutex mtx;
    map<JobId, shared_ptr<JobRecord>> jobs; // ordered by id = creation order
    atomic<JobId> nextId{1};
};
