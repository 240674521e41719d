#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

struct UserInfo
{
    int64_t id = 0;
    string username;
    string firstName;
    string lastName;
    string phone;
};

inline void to_json(json &j, const UserInfo &user)
{
    j = json{{"id", user.id},
             {"username", user.username},
             {"first_name", user.firstName},
             {"last_name", user.lastName},
             {"phone", user.phone}};
}

struct IncomingMessage
{
    int64_t senderId = 0;
    string chat;
    string text;
    bool isPrivate = false;
};

enum class SignInStatus
{
    Authorized,
    PasswordRequired
};

struct SessionCredentials
{
    string name;
    int64_t apiId = 0;
    string apiHash;
    string phone;
};

using MessageHandler = function<void(const IncomingMessage &)>;

/*
Capability interface of the messaging-protocol client.
All calls are coroutines on the runtime thread. Failures are reported as
TransientProtocolError (worth retrying), FatalProtocolError, or any other
exception, which the task layer treats as fatal.
*/
class ProtocolClient
{
public:
    virtual ~ProtocolClient() = default;

    virtual asio::awaitable<void> connect() = 0;
    virtual asio::awaitable<bool> isAuthorized() = 0;
    virtual asio::awaitable<void> sendCodeRequest(const string &phone) = 0;
    virtual asio::awaitable<SignInStatus> signIn(const string &code, optional<string> password) = 0;
    virtual asio::awaitable<void> sendMessage(const string &target, const string &text) = 0;
    virtual asio::awaitable<vector<UserInfo>> getParticipants(const string &chat, int limit) = 0;
    virtual asio::awaitable<bool> checkPhone(const string &phone) = 0;
    virtual asio::awaitable<void> inviteToChat(const string &chat, const string &user) = 0;
    virtual asio::awaitable<void> disconnect() = 0;

    // nullptr removes the handler; the handler is called on the runtime thread
    virtual void setMessageHandler(MessageHandler handler) = 0;
};

using ClientFactory = function<shared_ptr<ProtocolClient>(const SessionCredentials &)>;
