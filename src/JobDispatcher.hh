#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "JobResult.hh"
#include "RateLimiter.hh"
#include "SessionManager.hh"
#include "TaskBridge.hh"
#include "config.hh"

/*
Public operation surface. Every operation validates its input on the
caller's thread (ValidationError, no job created) and returns a handle at
once; the work itself runs as a job on the runtime. Expected failures only
ever show up as the job's error, never as an exception from here.
*/
class JobDispatcher
{
public:
    JobDispatcher(TaskBridge &bridge, SessionManager &sessions, RateLimiter &limiter, BulkLimits limits = {});

    JobDispatcher(const JobDispatcher &) = delete;
    JobDispatcher &operator=(const JobDispatcher &) = delete;

    JobHandle createSession(const SessionCredentials &credentials);
    JobHandle authorizeSession(const string &session, const string &code, optional<string> password = nullopt);

    JobHandle sendMessage(const string &session, const string &target, const string &text);
    JobHandle bulkSend(const string &session, const vector<string> &targets, const string &text,
                       optional<RateLimitConfig> delayCfg = nullopt);

    JobHandle getParticipants(const string &session, const string &chat, int limit);
    JobHandle verifyPhone(const string &session, const vector<string> &numbers);
    JobHandle inviteUsers(const string &session, const string &chat, const vector<string> &users);

    JobHandle toggleAutoRespond(const string &session, bool enabled, const string &replyTemplate);

    bool cancelJob(JobId id);
    optional<JobSnapshot> getJobStatus(JobId id) const;
    optional<JobSnapshot> awaitResult(JobId id, chrono::milliseconds timeout) const;
    vector<JobSnapshot> listJobs(optional<JobKind> kind = nullopt, optional<JobState> state = nullopt) const;
    bool purgeJob(JobId id);
    size_t purgeFinished();

    json listSessions() const;

    // Cancel everything, disconnect every session, stop the runtime
    void shutdown();

    SessionManager &sessionManager() noexcept { return sessions; }
    TaskBridge &taskBridge() noexcept { return bridge; }

private:
    using ItemWork = function<asio::awaitable<json>(shared_ptr<JobContext>, const string &)>;

    shared_ptr<Session> requireSession(const string &name) const;
    void validateList(const vector<string> &items, const string &what) const;
    JobHandle submit(JobKind kind, const string &label, const string &session, WorkUnit work);

    // One child job per item, run one after another; an item failure never stops the loop
    asio::awaitable<BulkSummary> runBulk(shared_ptr<JobContext> ctx, JobKind childKind, string verb,
                                         vector<string> items, ItemWork work);

    asio::awaitable<json> runCreateSession(shared_ptr<JobContext> ctx, shared_ptr<Session> session);
    asio::awaitable<json> runAuthorize(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string code, optional<string> password);
    asio::awaitable<json> runSendMessage(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string target, string text,
                                         optional<RateLimitConfig> delayCfg);
    asio::awaitable<json> runBulkSend(shared_ptr<JobContext> ctx, shared_ptr<Session> session, vector<string> targets, string text,
                                      optional<RateLimitConfig> delayCfg);
    asio::awaitable<json> runGetParticipants(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string chat, int limit);
    asio::awaitable<json> runVerifyPhone(shared_ptr<JobContext> ctx, shared_ptr<Session> session, vector<string> numbers);
    asio::awaitable<json> runInvite(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string chat, vector<string> users);
    asio::awaitable<json> runToggleAutoRespond(shared_ptr<JobContext> ctx, shared_ptr<Session> session, bool enabled, string replyTemplate);

    asio::awaitable<void> disconnectAll();

    // Message handler installed by auto-respond; runs on the runtime thread
    void onIncoming(const string &sessionName, const IncomingMessage &message);

    TaskBridge &bridge;
    SessionManager &sessions;
    RateLimiter &limiter;
    BulkLimits limits;
};
