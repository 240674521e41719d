#include "SimulatedClient.hh"
#include "TaskErrors.hh"

#include <algorithm>

SimulatedClient::SimulatedClient(asio::any_io_executor executor, SimulatedBehavior behavior)
    : exec(std::move(executor)), behavior(std::move(behavior))
{
    authorized = this->behavior.startAuthorized;
}

asio::awaitable<void> SimulatedClient::simulate(const string &op, const string &argument)
{
    chrono::milliseconds latency;

    {
        lock_guard<mutex> lock(mtx);
        history.push_back({op, argument, chrono::steady_clock::now()});
        latency = behavior.latency;
    }

    if (latency.count() > 0)
    {
        asio::steady_timer timer(exec, latency);
        co_await timer.async_wait(asio::use_awaitable);
    }

    lock_guard<mutex> lock(mtx);

    auto it = behavior.transientFailures.find(op);
    if (it != behavior.transientFailures.end() && it->second > 0)
    {
        --it->second;
        throw TransientProtocolError(op + ": flood wait");
    }
}

void SimulatedClient::requireConnected(const string &op) const
{
    lock_guard<mutex> lock(mtx);

    if (!isConnected)
        throw FatalProtocolError(op + ": not connected");
}

asio::awaitable<void> SimulatedClient::connect()
{
    co_await simulate("connect", "");

    lock_guard<mutex> lock(mtx);

    if (behavior.failConnect)
        throw FatalProtocolError("connect: server unreachable");

    isConnected = true;
}

asio::awaitable<bool> SimulatedClient::isAuthorized()
{
    requireConnected("is_authorized");
    co_await simulate("is_authorized", "");

    lock_guard<mutex> lock(mtx);
    co_return authorized;
}

asio::awaitable<void> SimulatedClient::sendCodeRequest(const string &phone)
{
    requireConnected("send_code_request");
    co_await simulate("send_code_request", phone);

    lock_guard<mutex> lock(mtx);
    codeSent = true;
}

asio::awaitable<SignInStatus> SimulatedClient::signIn(const string &code, optional<string> password)
{
    requireConnected("sign_in");
    co_await simulate("sign_in", code);

    lock_guard<mutex> lock(mtx);

    if (!codeSent)
        throw FatalProtocolError("sign_in: no login code was requested");

    if (code != behavior.validCode)
        throw FatalProtocolError("sign_in: invalid code");

    if (behavior.passwordRequired)
    {
        if (!password)
            co_return SignInStatus::PasswordRequired;

        if (*password != behavior.password)
            throw FatalProtocolError("sign_in: invalid password");
    }

    authorized = true;
    co_return SignInStatus::Authorized;
}

asio::awaitable<void> SimulatedClient::sendMessage(const string &target, const string &text)
{
    requireConnected("send_message");
    co_await simulate("send_message", target);

    lock_guard<mutex> lock(mtx);

    if (behavior.fatalTargets.count(target))
        throw FatalProtocolError("send_message: peer '" + target + "' is invalid");

    delivered.push_back(target);
}

asio::awaitable<vector<UserInfo>> SimulatedClient::getParticipants(const string &chat, int limit)
{
    requireConnected("get_participants");
    co_await simulate("get_participants", chat);

    lock_guard<mutex> lock(mtx);

    size_t count = min(behavior.participants.size(), static_cast<size_t>(max(limit, 0)));
    co_return vector<UserInfo>(behavior.participants.begin(), behavior.participants.begin() + count);
}

asio::awaitable<bool> SimulatedClient::checkPhone(const string &phone)
{
    requireConnected("check_phone");
    co_await simulate("check_phone", phone);

    lock_guard<mutex> lock(mtx);
    co_return behavior.registeredPhones.count(phone) > 0;
}

asio::awaitable<void> SimulatedClient::inviteToChat(const string &chat, const string &user)
{
    requireConnected("invite_to_chat");
    co_await simulate("invite_to_chat", user);

    lock_guard<mutex> lock(mtx);

    if (behavior.fatalTargets.count(user))
        throw FatalProtocolError("invite_to_chat: user '" + user + "' cannot be invited to " + chat);
}

asio::awaitable<void> SimulatedClient::disconnect()
{
    co_await simulate("disconnect", "");

    lock_guard<mutex> lock(mtx);
    isConnected = false;
}

void SimulatedClient::setMessageHandler(MessageHandler h)
{
    lock_guard<mutex> lock(mtx);
    handler = std::move(h);
}

void SimulatedClient::deliverIncoming(IncomingMessage message)
{
    asio::post(exec, [this, message = std::move(message)]()
               {
        MessageHandler current;
        {
            lock_guard<mutex> lock(mtx);
            current = handler;
        }

        if (current)
            current(message); });
}

vector<SimulatedClient::Call> SimulatedClient::calls() const
{
    lock_guard<mutex> lock(mtx);
    return history;
}

size_t SimulatedClient::callCount(const string &op) const
{
    lock_guard<mutex> lock(mtx);

    return count_if(history.begin(), history.end(), [&op](const Call &c)
                    { return c.op == op; });
}

vector<string> SimulatedClient::sentTo() const
{
    lock_guard<mutex> lock(mtx);
    return delivered;
}

bool SimulatedClient::connected() const
{
    lock_guard<mutex> lock(mtx);
    return isConnected;
}

bool SimulatedClient::hasMessageHandler() const
{
    lock_guard<mutex> lock(mtx);
    return static_cast<bool>(handler);
}

void SimulatedClient::failNext(const string &op, int times)
{
    lock_guard<mutex> lock(mtx);
    behavior.transientFailures[op] = times;
}

void SimulatedClient::addFatalTarget(const string &target)
{
    lock_guard<mutex> lock(mtx);
    behavior.fatalTargets.insert(target);
}
