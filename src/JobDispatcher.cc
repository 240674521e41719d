#include "JobDispatcher.hh"
#include "JobBuilder.hh"
#include "Logger.hh"

namespace
{
    void requireAuthenticated(const Session &session)
    {
        if (session.status() != SessionStatus::Authenticated)
            throw FatalProtocolError("session '" + session.name() + "' is not authenticated (" +
                                     sessionStatusToString(session.status()) + ")");
    }

    void requireNonEmpty(const string &value, const string &what)
    {
        if (value.empty())
            throw ValidationError(what + " must not be empty");
    }

    void validateDelay(const RateLimitConfig &cfg)
    {
        if (cfg.minDelay.count() < 0 || cfg.maxDelay.count() < 0 || cfg.jitter.count() < 0)
            throw ValidationError("delay settings must not be negative");
    }
}

JobDispatcher::JobDispatcher(TaskBridge &bridge, SessionManager &sessions, RateLimiter &limiter, BulkLimits limits)
    : bridge(bridge), sessions(sessions), limiter(limiter), limits(limits) {}

shared_ptr<Session> JobDispatcher::requireSession(const string &name) const
{
    requireNonEmpty(name, "session name");

    auto session = sessions.find(name);
    if (!session)
        throw ValidationError("unknown session '" + name + "'");

    return session;
}

void JobDispatcher::validateList(const vector<string> &items, const string &what) const
{
    if (items.empty())
        throw ValidationError(what + " list must not be empty");

    if (items.size() > limits.maxItems)
        throw ValidationError(what + " list has " + to_string(items.size()) + " entries, the limit is " + to_string(limits.maxItems));

    for (const auto &item : items)
        requireNonEmpty(item, what);
}

JobHandle JobDispatcher::submit(JobKind kind, const string &label, const string &session, WorkUnit work)
{
    return JobBuilder(kind)
        .withLabel(label)
        .withSession(session)
        .withWork(std::move(work))
        .dispatchTo(bridge);
}

// ---------------------------------------------------------------------------
// Facade operations (caller's thread)
// ---------------------------------------------------------------------------

JobHandle JobDispatcher::createSession(const SessionCredentials &credentials)
{
    requireNonEmpty(credentials.name, "session name");
    requireNonEmpty(credentials.phone, "phone");
    requireNonEmpty(credentials.apiHash, "api hash");

    if (credentials.apiId <= 0)
        throw ValidationError("api id must be positive");

    if (!bridge.isAccepting())
        throw ValidationError("runtime is shut down");

    auto session = sessions.create(credentials);

    return submit(JobKind::SessionCreate, "create session " + credentials.name, credentials.name,
                  [this, session](shared_ptr<JobContext> ctx)
                  { return runCreateSession(std::move(ctx), session); });
}

JobHandle JobDispatcher::authorizeSession(const string &name, const string &code, optional<string> password)
{
    auto session = requireSession(name);
    requireNonEmpty(code, "login code");

    return submit(JobKind::SessionAuthorize, "authorize " + name, name,
                  [this, session, code, password](shared_ptr<JobContext> ctx)
                  { return runAuthorize(std::move(ctx), session, code, password); });
}

JobHandle JobDispatcher::sendMessage(const string &name, const string &target, const string &text)
{
    auto session = requireSession(name);
    requireNonEmpty(target, "target");
    requireNonEmpty(text, "message text");

    return submit(JobKind::SendMessage, "send to " + target, name,
                  [this, session, target, text](shared_ptr<JobContext> ctx)
                  { return runSendMessage(std::move(ctx), session, target, text, nullopt); });
}

JobHandle JobDispatcher::bulkSend(const string &name, const vector<string> &targets, const string &text,
                                  optional<RateLimitConfig> delayCfg)
{
    auto session = requireSession(name);
    validateList(targets, "target");
    requireNonEmpty(text, "message text");

    if (delayCfg)
        validateDelay(*delayCfg);

    return submit(JobKind::BulkSend, "bulk send to " + to_string(targets.size()) + " targets", name,
                  [this, session, targets, text, delayCfg](shared_ptr<JobContext> ctx)
                  { return runBulkSend(std::move(ctx), session, targets, text, delayCfg); });
}

JobHandle JobDispatcher::getParticipants(const string &name, const string &chat, int limit)
{
    auto session = requireSession(name);
    requireNonEmpty(chat, "chat");

    if (limit <= 0)
        throw ValidationError("limit must be positive");

    if (limit > limits.parseLimit)
    {
        Logger::log(LogLevel::Warn, "dispatcher", "parse limit " + to_string(limit) + " clamped to " + to_string(limits.parseLimit));
        limit = limits.parseLimit;
    }

    return submit(JobKind::ParseUsers, "parse users of " + chat, name,
                  [this, session, chat, limit](shared_ptr<JobContext> ctx)
                  { return runGetParticipants(std::move(ctx), session, chat, limit); });
}

JobHandle JobDispatcher::verifyPhone(const string &name, const vector<string> &numbers)
{
    auto session = requireSession(name);
    validateList(numbers, "phone number");

    return submit(JobKind::VerifyPhone, "verify " + to_string(numbers.size()) + " phone numbers", name,
                  [this, session, numbers](shared_ptr<JobContext> ctx)
                  { return runVerifyPhone(std::move(ctx), session, numbers); });
}

JobHandle JobDispatcher::inviteUsers(const string &name, const string &chat, const vector<string> &users)
{
    auto session = requireSession(name);
    requireNonEmpty(chat, "chat");
    validateList(users, "user");

    return submit(JobKind::Invite, "invite " + to_string(users.size()) + " users to " + chat, name,
                  [this, session, chat, users](shared_ptr<JobContext> ctx)
                  { return runInvite(std::move(ctx), session, chat, users); });
}

JobHandle JobDispatcher::toggleAutoRespond(const string &name, bool enabled, const string &replyTemplate)
{
    auto session = requireSession(name);

    if (enabled)
        requireNonEmpty(replyTemplate, "reply template");

    return submit(JobKind::AutoRespondToggle, string(enabled ? "enable" : "disable") + " auto-respond", name,
                  [this, session, enabled, replyTemplate](shared_ptr<JobContext> ctx)
                  { return runToggleAutoRespond(std::move(ctx), session, enabled, replyTemplate); });
}

bool JobDispatcher::cancelJob(JobId id)
{
    return bridge.cancel(id);
}

optional<JobSnapshot> JobDispatcher::getJobStatus(JobId id) const
{
    return bridge.poll(id);
}

optional<JobSnapshot> JobDispatcher::awaitResult(JobId id, chrono::milliseconds timeout) const
{
    return bridge.awaitResult(id, timeout);
}

vector<JobSnapshot> JobDispatcher::listJobs(optional<JobKind> kind, optional<JobState> state) const
{
    return bridge.taskRegistry().list(kind, state);
}

bool JobDispatcher::purgeJob(JobId id)
{
    return bridge.taskRegistry().purge(id);
}

size_t JobDispatcher::purgeFinished()
{
    return bridge.taskRegistry().purgeTerminal();
}

json JobDispatcher::listSessions() const
{
    return sessions.list();
}

void JobDispatcher::shutdown()
{
    Logger::log(LogLevel::Info, "dispatcher", "shutting down");

    bridge.shutdown([this]()
                    { return disconnectAll(); });
}

// ---------------------------------------------------------------------------
// Work units (runtime thread)
// ---------------------------------------------------------------------------

asio::awaitable<json> JobDispatcher::runCreateSession(shared_ptr<JobContext> ctx, shared_ptr<Session> session)
{
    SemaphorePermit permit = co_await session->mutationGate().acquire();
    auto client = session->client();

    try
    {
        co_await ctx->withRetry("connect", [&]
                                { return client->connect(); });
    }
    catch (const CancelledError &)
    {
        throw;
    }
    catch (const TaskError &)
    {
        session->setStatus(SessionStatus::Error);
        throw;
    }

    bool authorized = co_await ctx->withRetry("is_authorized", [&]
                                              { return client->isAuthorized(); });

    if (authorized)
    {
        session->setStatus(SessionStatus::Authenticated);
        co_return json{{"session", session->name()}, {"status", sessionStatusToString(SessionStatus::Authenticated)}};
    }

    const string phone = session->credentials().phone;
    co_await ctx->withRetry("send_code_request", [&]
                            { return client->sendCodeRequest(phone); });

    session->setStatus(SessionStatus::AwaitingCode);
    co_return json{{"session", session->name()}, {"status", sessionStatusToString(SessionStatus::AwaitingCode)}};
}

asio::awaitable<json> JobDispatcher::runAuthorize(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string code,
                                                  optional<string> password)
{
    SemaphorePermit permit = co_await session->mutationGate().acquire();
    auto client = session->client();

    SignInStatus result = co_await ctx->withRetry("sign_in", [&]
                                                  { return client->signIn(code, password); });

    SessionStatus status = result == SignInStatus::Authorized ? SessionStatus::Authenticated : SessionStatus::AwaitingPassword;
    session->setStatus(status);

    co_return json{{"session", session->name()}, {"status", sessionStatusToString(status)}};
}

asio::awaitable<json> JobDispatcher::runSendMessage(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string target,
                                                    string text, optional<RateLimitConfig> delayCfg)
{
    requireAuthenticated(*session);
    auto client = session->client();

    co_await limiter.waitTurn(*ctx, session->name(), "send_message", delayCfg);
    co_await ctx->withRetry("send_message", [&]
                            { return client->sendMessage(target, text); });

    ctx->setProgress(1, 1);
    co_return json{{"target", target}, {"sent", true}};
}

asio::awaitable<BulkSummary> JobDispatcher::runBulk(shared_ptr<JobContext> ctx, JobKind childKind, string verb,
                                                    vector<string> items, ItemWork work)
{
    BulkSummary summary;
    summary.total = items.size();
    ctx->setProgress(0, items.size());

    // Every item is visible (and individually cancellable) before the first one runs
    vector<shared_ptr<JobRecord>> children;
    for (const auto &item : items)
        children.push_back(bridge.createChild(*ctx, childKind, verb + " " + item));

    size_t next = 0;

    try
    {
        for (; next < items.size(); ++next)
        {
            ctx->checkpoint();

            const string &item = items[next];
            auto &child = children[next];

            // Cancelled while still pending: the work never goes out
            if (child->markRunning())
            {
                auto childCtx = ctx->childContext(child);

                try
                {
                    json value = co_await work(childCtx, item);
                    child->complete(std::move(value));
                }
                catch (const CancelledError &e)
                {
                    child->finishCancelled(e.what());
                }
                catch (const TaskError &e)
                {
                    child->fail(JobError{e.kind(), e.what()});
                }
                catch (const exception &e)
                {
                    child->fail(JobError{ErrorKind::InternalInvariant, string("unhandled exception: ") + e.what()});
                }
            }

            JobSnapshot snap = child->snapshot();

            ItemOutcome outcome;
            outcome.index = next;
            outcome.item = item;
            outcome.jobId = snap.id;
            outcome.outcome = snap.state;

            if (snap.error)
            {
                outcome.errorKind = snap.error->kind;
                outcome.message = snap.error->message;
                Logger::log(LogLevel::Warn, "job#" + to_string(ctx->id()), verb + " " + item + " failed: " + snap.error->message);
            }
            else if (snap.state == JobState::Cancelled)
            {
                outcome.message = snap.cancelReason;
            }

            if (snap.result)
                outcome.value = *snap.result;

            summary.add(std::move(outcome));
            ctx->setProgress(next + 1, items.size());
        }
    }
    catch (...)
    {
        // The bulk stopped early: items that never started end with it
        for (size_t i = next; i < children.size(); ++i)
            children[i]->forceCancel("bulk job stopped");

        throw;
    }

    co_return summary;
}

asio::awaitable<json> JobDispatcher::runBulkSend(shared_ptr<JobContext> ctx, shared_ptr<Session> session, vector<string> targets,
                                                 string text, optional<RateLimitConfig> delayCfg)
{
    requireAuthenticated(*session);
    auto client = session->client();
    const string name = session->name();

    BulkSummary summary = co_await runBulk(ctx, JobKind::SendMessage, "send to", std::move(targets),
                                           [this, client, name, text, delayCfg](shared_ptr<JobContext> item, const string &target) -> asio::awaitable<json>
                                           {
                                               co_await limiter.waitTurn(*item, name, "send_message", delayCfg);
                                               co_await item->withRetry("send_message", [&]
                                                                        { return client->sendMessage(target, text); });
                                               co_return json{{"sent", true}};
                                           });

    co_return summary.toJSON();
}

asio::awaitable<json> JobDispatcher::runGetParticipants(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string chat, int limit)
{
    requireAuthenticated(*session);
    auto client = session->client();

    co_await limiter.waitTurn(*ctx, session->name(), "get_participants");

    vector<UserInfo> users = co_await ctx->withRetry("get_participants", [&]
                                                     { return client->getParticipants(chat, limit); });

    ctx->setProgress(users.size(), users.size());

    co_return json{{"chat", chat}, {"count", users.size()}, {"users", users}};
}

asio::awaitable<json> JobDispatcher::runVerifyPhone(shared_ptr<JobContext> ctx, shared_ptr<Session> session, vector<string> numbers)
{
    requireAuthenticated(*session);
    auto client = session->client();
    const string name = session->name();

    BulkSummary summary = co_await runBulk(ctx, JobKind::VerifyPhone, "check", std::move(numbers),
                                           [this, client, name](shared_ptr<JobContext> item, const string &phone) -> asio::awaitable<json>
                                           {
                                               co_await limiter.waitTurn(*item, name, "check_phone");
                                               bool registered = co_await item->withRetry("check_phone", [&]
                                                                                          { return client->checkPhone(phone); });
                                               co_return json{{"registered", registered}};
                                           });

    json registered = json::array();
    json unregistered = json::array();

    for (const auto &item : summary.items)
    {
        if (item.outcome != JobState::Completed)
            continue;

        if (item.value.value("registered", false))
            registered.push_back(item.item);
        else
            unregistered.push_back(item.item);
    }

    json result = summary.toJSON();
    result["registered"] = registered;
    result["unregistered"] = unregistered;
    co_return result;
}

asio::awaitable<json> JobDispatcher::runInvite(shared_ptr<JobContext> ctx, shared_ptr<Session> session, string chat, vector<string> users)
{
    requireAuthenticated(*session);
    auto client = session->client();
    const string name = session->name();

    BulkSummary summary = co_await runBulk(ctx, JobKind::Invite, "invite", std::move(users),
                                           [this, client, name, chat](shared_ptr<JobContext> item, const string &user) -> asio::awaitable<json>
                                           {
                                               co_await limiter.waitTurn(*item, name, "invite");
                                               co_await item->withRetry("invite_to_chat", [&]
                                                                        { return client->inviteToChat(chat, user); });
                                               co_return json{{"invited", true}};
                                           });

    json result = summary.toJSON();
    result["chat"] = chat;
    co_return result;
}

asio::awaitable<json> JobDispatcher::runToggleAutoRespond(shared_ptr<JobContext> ctx, shared_ptr<Session> session, bool enabled,
                                                          string replyTemplate)
{
    SemaphorePermit permit = co_await session->mutationGate().acquire();
    ctx->checkpoint();
    requireAuthenticated(*session);

    if (enabled)
    {
        session->setAutoRespond({true, replyTemplate});
        session->client()->setMessageHandler([this, name = session->name()](const IncomingMessage &message)
                                             { onIncoming(name, message); });
    }
    else
    {
        session->client()->setMessageHandler(nullptr);
        session->setAutoRespond({});
    }

    Logger::log(LogLevel::Info, "session:" + session->name(), enabled ? "auto-respond on" : "auto-respond off");
    co_return json{{"session", session->name()}, {"enabled", enabled}};
}

void JobDispatcher::onIncoming(const string &sessionName, const IncomingMessage &message)
{
    // Only direct messages get an automatic reply
    if (!message.isPrivate)
        return;

    auto session = sessions.find(sessionName);
    if (!session)
        return;

    AutoRespondSettings settings = session->autoRespond();
    if (!settings.enabled || settings.replyTemplate.empty())
        return;

    string target = message.chat.empty() ? to_string(message.senderId) : message.chat;
    string text = settings.replyTemplate;

    try
    {
        JobHandle handle = submit(JobKind::SendMessage, "auto-reply to " + target, sessionName,
                                  [this, session, target, text](shared_ptr<JobContext> ctx)
                                  { return runSendMessage(std::move(ctx), session, target, text, nullopt); });

        Logger::log(LogLevel::Debug, "session:" + sessionName, "auto-reply queued as job#" + to_string(handle.id));
    }
    catch (const ValidationError &e)
    {
        // Runtime is going down
        Logger::log(LogLevel::Warn, "session:" + sessionName, string("auto-reply dropped: ") + e.what());
    }
}

asio::awaitable<void> JobDispatcher::disconnectAll()
{
    for (auto &session : sessions.all())
    {
        try
        {
            SemaphorePermit permit = co_await session->mutationGate().acquire();

            session->client()->setMessageHandler(nullptr);
            co_await session->client()->disconnect();
            session->setStatus(SessionStatus::Disconnected);
        }
        catch (const exception &e)
        {
            Logger::log(LogLevel::Warn, "session:" + session->name(), string("disconnect failed: ") + e.what());
        }
    }
}
