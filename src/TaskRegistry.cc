#include "TaskRegistry.hh"
#include "Logger.hh"

TaskRegistry::TaskRegistry(RetentionPolicy policy) : policy(policy) {}

shared_ptr<JobRecord> TaskRegistry::create(JobKind kind, const string &label, const string &session,
                                           optional<JobId> parentId, EventSink sink)
{
    JobId id = nextId.fetch_add(1);
    auto job = make_shared<JobRecord>(id, kind, label, session, parentId, std::move(sink));
    registerJob(job);
    return job;
}

void TaskRegistry::registerJob(shared_ptr<JobRecord> job)
{
    if (!job)
        throw InvariantError("cannot register a null job");

    lock_guard<mutex> lock(mtx);

    JobId id = job->id();
    if (jobs.count(id))
    {
        Logger::log(LogLevel::Critical, "registry", "duplicate job id " + to_string(id));
        throw InvariantError("duplicate job id " + to_string(id));
    }

    jobs.emplace(id, std::move(job));

    // Externally built records must not collide with ids handed out later
    JobId expected = nextId.load();
    while (id >= expected && !nextId.compare_exchange_weak(expected, id + 1))
    {
    }

    enforceRetentionLocked();
}

shared_ptr<JobRecord> TaskRegistry::find(JobId id) const
{
    lock_guard<mutex> lock(mtx);

    auto it = jobs.find(id);
    return it == jobs.end() ? nullptr : it->second;
}

optional<JobSnapshot> TaskRegistry::get(JobId id) const
{
    auto job = find(id);
    if (!job)
        return nullopt;

    return job->snapshot();
}

vector<JobSnapshot> TaskRegistry::list(optional<JobKind> kind, optional<JobState> state) const
{
    vector<JobSnapshot> out;

    lock_guard<mutex> lock(mtx);
    out.reserve(jobs.size());

    for (const auto &[id, job] : jobs)
    {
        if (kind && job->kind() != *kind)
            continue;

        JobSnapshot snap = job->snapshot();
        if (state && snap.state != *state)
            continue;

        out.push_back(std::move(snap));
    }

    return out;
}

vector<shared_ptr<JobRecord>> TaskRegistry::active() const
{
    vector<shared_ptr<JobRecord>> out;

    lock_guard<mutex> lock(mtx);
    for (const auto &[id, job] : jobs)
    {
        if (!isTerminal(job->state()))
            out.push_back(job);
    }

    return out;
}

bool TaskRegistry::purge(JobId id)
{
    lock_guard<mutex> lock(mtx);

    auto it = jobs.find(id);
    if (it == jobs.end() || !isTerminal(it->second->state()))
        return false;

    jobs.erase(it);
    return true;
}

size_t TaskRegistry::purgeTerminal()
{
    lock_guard<mutex> lock(mtx);
    size_t removed = 0;

    for (auto it = jobs.begin(); it != jobs.end();)
    {
        if (isTerminal(it->second->state()))
        {
            it = jobs.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }

    if (removed > 0)
        Logger::log(LogLevel::Debug, "registry", "purged " + to_string(removed) + " finished jobs");

    return removed;
}

size_t TaskRegistry::enforceRetention()
{
    lock_guard<mutex> lock(mtx);
    return enforceRetentionLocked();
}

size_t TaskRegistry::enforceRetentionLocked()
{
    if (policy.maxTerminalJobs == 0 && policy.maxTerminalAge.count() == 0)
        return 0;

    auto now = chrono::system_clock::now();
    using Iter = map<JobId, shared_ptr<JobRecord>>::iterator;

    // Both lists are in id order, i.e. oldest first
    vector<Iter> expired;
    vector<Iter> retained;

    for (auto it = jobs.begin(); it != jobs.end(); ++it)
    {
        auto ended = it->second->finishedAt();
        if (!ended)
            continue;

        if (policy.maxTerminalAge.count() > 0 && now - *ended > policy.maxTerminalAge)
            expired.push_back(it);
        else
            retained.push_back(it);
    }

    size_t excess = 0;
    if (policy.maxTerminalJobs > 0 && retained.size() > policy.maxTerminalJobs)
        excess = retained.size() - policy.maxTerminalJobs;

    for (size_t i = 0; i < excess; ++i)
        expired.push_back(retained[i]);

    size_t evicted = expired.size();
    for (Iter it : expired)
        jobs.erase(it);

    if (evicted > 0)
        Logger::log(LogLevel::Debug, "registry", "retention evicted " + to_string(evicted) + " jobs");

    return evicted;
}

size_t TaskRegistry::size() const
{
    lock_guard<mutex> lock(mtx);
    return jobs.size();
}
