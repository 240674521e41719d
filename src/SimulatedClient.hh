#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <asio.hpp>

#include "ProtocolClient.hh"

using namespace std;

// Knobs for the in-process client
struct SimulatedBehavior
{
    chrono::milliseconds latency{5};

    bool startAuthorized = false;
    bool passwordRequired = false;
    string validCode = "12345";
    string password = "secret";

    bool failConnect = false;

    set<string> registeredPhones;
    set<string> fatalTargets; // sendMessage / inviteToChat to these fail permanently

    // op name -> how many upcoming calls fail with a transient error
    map<string, int> transientFailures;

    vector<UserInfo> participants;
};

/*
ProtocolClient that never touches the network: every call waits on a timer
for the configured latency and then answers from SimulatedBehavior.
Calls are recorded with their start time, so tests can check spacing and overlap.
*/
class SimulatedClient : public ProtocolClient
{
public:
    struct Call
    {
        string op;
        string argument;
        chrono::steady_clock::time_point at;
    };

    SimulatedClient(asio::any_io_executor executor, SimulatedBehavior behavior = {});

    asio::awaitable<void> connect() override;
    asio::awaitable<bool> isAuthorized() override;
    asio::awaitable<void> sendCodeRequest(const string &phone) override;
    asio::awaitable<SignInStatus> signIn(const string &code, optional<string> password) override;
    asio::awaitable<void> sendMessage(const string &target, const string &text) override;
    asio::awaitable<vector<UserInfo>> getParticipants(const string &chat, int limit) override;
    asio::awaitable<bool> checkPhone(const string &phone) override;
    asio::awaitable<void> inviteToChat(const string &chat, const string &user) override;
    asio::awaitable<void> disconnect() override;

    void setMessageHandler(MessageHandler handler) override;

    // Simulate a message arriving from the server (any thread)
    void deliverIncoming(IncomingMessage message);

    vector<Call> calls() const;
    size_t callCount(const string &op) const;
    vector<string> sentTo() const;

    bool connected() const;
    bool hasMessageHandler() const;

    // Adjust behaviour between calls (e.g. arm a failure mid-test)
    void failNext(const string &op, int times);
    void addFatalTarget(const string &target);

private:
    asio::awaitable<void> simulate(const string &op, const string &argument);
    void requireConnected(const string &op) const;

    asio::any_io_executor exec;

    mutable mutex mtx;
    SimulatedBehavior behavior;
    vector<Call> history;
    vector<string> delivered;
    bool isConnected = false;
    bool authorized = false;
    bool codeSent = false;
    MessageHandler handler;
};
