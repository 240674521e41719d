#include "SessionManager.hh"
#include "Logger.hh"
#include "TaskErrors.hh"

string sessionStatusToString(SessionStatus status)
{
    switch (status)
    {
    case SessionStatus::Unauthenticated:
        return "unauthenticated";

    case SessionStatus::AwaitingCode:
        return "awaiting_code";

    case SessionStatus::AwaitingPassword:
        return "awaiting_password";

    case SessionStatus::Authenticated:
        return "authenticated";

    case SessionStatus::Disconnected:
        return "disconnected";

    case SessionStatus::Error:
        return "error";
    }

    return "unknown";
}

Session::Session(SessionCredentials credentials, shared_ptr<ProtocolClient> client)
    : creds(std::move(credentials)), protocolClient(std::move(client)) {}

AutoRespondSettings Session::autoRespond() const
{
    lock_guard<mutex> lock(settingsMutex);
    return autoRespondSettings;
}

void Session::setAutoRespond(AutoRespondSettings settings)
{
    lock_guard<mutex> lock(settingsMutex);
    autoRespondSettings = std::move(settings);
}

json Session::toJSON() const
{
    AutoRespondSettings settings = autoRespond();

    return {
        {"name", creds.name},
        {"phone", creds.phone},
        {"status", sessionStatusToString(status())},
        {"auto_respond", settings.enabled}};
}

bool sameAccount(const SessionCredentials &a, const SessionCredentials &b)
{
    return a.phone == b.phone && a.apiId == b.apiId && a.apiHash == b.apiHash;
}

SessionManager::SessionManager(ClientFactory factory) : factory(std::move(factory)) {}

shared_ptr<Session> SessionManager::create(const SessionCredentials &credentials)
{
    if (!factory)
        throw InvariantError("session manager has no client factory");

    lock_guard<mutex> lock(mtx);

    auto it = sessions.find(credentials.name);
    if (it != sessions.end())
    {
        const shared_ptr<Session> &existing = it->second;

        if (existing->status() == SessionStatus::Authenticated)
            throw ValidationError("session '" + credentials.name + "' is already authenticated");

        if (!sameAccount(existing->credentials(), credentials))
            throw ValidationError("session '" + credentials.name + "' exists with different credentials");

        // Same client, same gate: a second connect queues behind the first
        Logger::log(LogLevel::Info, "session:" + credentials.name, "slot reused");
        return existing;
    }

    auto client = factory(credentials);
    if (!client)
        throw FatalProtocolError("client factory returned no client for '" + credentials.name + "'");

    return installLocked(credentials, std::move(client));
}

shared_ptr<Session> SessionManager::adopt(const SessionCredentials &credentials, shared_ptr<ProtocolClient> client)
{
    if (!client)
        throw ValidationError("cannot adopt a null client");

    lock_guard<mutex> lock(mtx);

    if (sessions.count(credentials.name) > 0)
        throw ValidationError("session '" + credentials.name + "' already has a client");

    return installLocked(credentials, std::move(client));
}

shared_ptr<Session> SessionManager::installLocked(const SessionCredentials &credentials, shared_ptr<ProtocolClient> client)
{
    auto session = make_shared<Session>(credentials, std::move(client));
    sessions[credentials.name] = session;

    Logger::log(LogLevel::Info, "session:" + credentials.name, "slot created");
    return session;
}

shared_ptr<Session> SessionManager::find(const string &name) const
{
    lock_guard<mutex> lock(mtx);

    auto it = sessions.find(name);
    return it == sessions.end() ? nullptr : it->second;
}

vector<shared_ptr<Session>> SessionManager::all() const
{
    lock_guard<mutex> lock(mtx);

    vector<shared_ptr<Session>> out;
    for (auto &[name, session] : sessions)
        out.push_back(session);

    return out;
}

json SessionManager::list() const
{
    json out = json::array();

    for (auto &session : all())
        out.push_back(session->toJSON());

    return out;
}

bool SessionManager::remove(const string &name)
{
    lock_guard<mutex> lock(mtx);
    return sessions.erase(name) > 0;
}

size_t SessionManager::size() const
{
    lock_guard<mutex> lock(mtx);
    return sessions.size();
}
