#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "AsyncSemaphore.hh"
#include "ProtocolClient.hh"

using namespace std;

enum class SessionStatus
{
    Unauthenticated,
    AwaitingCode,
    AwaitingPassword,
    Authenticated,
    Disconnected,
    Error
};

string sessionStatusToString(SessionStatus status);

// Same phone and api credentials
bool sameAccount(const SessionCredentials &a, const SessionCredentials &b);

struct AutoRespondSettings
{
    bool enabled = false;
    string replyTemplate;
};

/*
One named slot: the protocol client, its status and the gate that keeps
connect/sign-in/disconnect/auto-respond changes one at a time.
The client and the gate are only touched on the runtime thread;
status and settings may be read from anywhere.
*/
class Session
{
public:
    Session(SessionCredentials credentials, shared_ptr<ProtocolClient> client);

    const string &name() const noexcept { return creds.name; }
    const SessionCredentials &credentials() const noexcept { return creds; }
    const shared_ptr<ProtocolClient> &client() const noexcept { return protocolClient; }

    SessionStatus status() const noexcept { return currentStatus.load(); }
    void setStatus(SessionStatus status) noexcept { currentStatus = status; }

    AsyncSemaphore &mutationGate() noexcept { return gate; }

    AutoRespondSettings autoRespond() const;
    void setAutoRespond(AutoRespondSettings settings);

    json toJSON() const;

private:
    const SessionCredentials creds;
    const shared_ptr<ProtocolClient> protocolClient;
    atomic<SessionStatus> currentStatus{SessionStatus::Unauthenticated};
    AsyncSemaphore gate{1};

    mutable mutex settingsMutex;
    AutoRespondSettings autoRespondSettings;
};

class SessionManager
{
public:
    explicit SessionManager(ClientFactory factory);

    // Builds a client for a new slot. An existing slot with the same account is returned as is
    // so its gate keeps serializing; an authenticated one or a different account is refused
    shared_ptr<Session> create(const SessionCredentials &credentials);

    // Take over an already-loaded client handle; the name must be free
    shared_ptr<Session> adopt(const SessionCredentials &credentials, shared_ptr<ProtocolClient> client);

    shared_ptr<Session> find(const string &name) const;
    vector<shared_ptr<Session>> all() const;
    json list() const;

    bool remove(const string &name);
    size_t size() const;

private:
    // Caller holds mtx
    shared_ptr<Session> installLocked(const SessionCredentials &credentials, shared_ptr<ProtocolClient> client);

    ClientFactory factory;
    mutable mutex mtx;
    map<string, shared_ptr<Session>> sessions;
};
