#include <gtest/gtest.h>
#include "../src/JobBuilder.hh"
#include "../src/ProgressTracker.hh"
#include "../src/TaskBridge.hh"

#include <future>
#include <set>

using namespace std::chrono_literals;

namespace
{
    asio::awaitable<void> pause(chrono::milliseconds d)
    {
        asio::steady_timer timer(co_await asio::this_coro::executor, d);
        co_await timer.async_wait(asio::use_awaitable);
    }

    JobSpec spec(JobKind kind, WorkUnit work, const string &session = "s1")
    {
        JobSpec s;
        s.kind = kind;
        s.label = jobKindToString(kind);
        s.session = session;
        s.work = std::move(work);
        return s;
    }

    WorkUnit after(chrono::milliseconds delay, json value = json::object())
    {
        return [delay, value](shared_ptr<JobContext>) -> asio::awaitable<json>
        {
            co_await pause(delay);
            co_return value;
        };
    }

    WorkUnit sleepy()
    {
        return [](shared_ptr<JobContext> ctx) -> asio::awaitable<json>
        {
            co_await ctx->sleepFor(10s);
            co_return json::object();
        };
    }

    struct BridgeFixture : public ::testing::Test
    {
        TaskRegistry registry;
        WorkerRuntime runtime{RuntimeConfig{0, 500ms}};
        TaskBridge bridge{runtime, registry};

        void SetUp() override { runtime.start(); }
        void TearDown() override { bridge.shutdown(); }
    };
}

TEST_F(BridgeFixture, DispatchWithoutWorkIsRejected)
{
    JobSpec empty;
    empty.kind = JobKind::SendMessage;

    EXPECT_THROW(bridge.dispatch(empty), ValidationError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(BridgeFixture, DispatchReturnsAtOnceAndPollSeesTheJob)
{
    auto start = chrono::steady_clock::now();
    JobHandle handle = bridge.dispatch(spec(JobKind::SendMessage, after(200ms, json{{"sent", 1}})));
    EXPECT_LT(chrono::steady_clock::now() - start, 100ms);

    auto snap = bridge.poll(handle.id);
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, JobKind::SendMessage);
    EXPECT_FALSE(snap->isTerminal());

    EXPECT_FALSE(bridge.poll(handle.id + 1000).has_value());
}

TEST_F(BridgeFixture, AwaitResultTimesOutThenDelivers)
{
    JobHandle handle = bridge.dispatch(spec(JobKind::ParseUsers, after(150ms, json{{"count", 3}})));

    EXPECT_FALSE(bridge.awaitResult(handle.id, 10ms).has_value());

    // The job kept running through the timeout
    auto done = bridge.awaitResult(handle.id, 2s);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->state, JobState::Completed);
    EXPECT_EQ((*done->result)["count"], 3);
}

TEST_F(BridgeFixture, AwaitResultOnUnknownIdThrows)
{
    EXPECT_THROW(bridge.awaitResult(424242, 10ms), out_of_range);
}

TEST_F(BridgeFixture, CancelRunningJobInterruptsItsSleep)
{
    JobHandle handle = bridge.dispatch(spec(JobKind::BulkSend, sleepy()));

    while (bridge.poll(handle.id)->state == JobState::Pending)
        this_thread::sleep_for(1ms);

    auto start = chrono::steady_clock::now();
    EXPECT_TRUE(bridge.cancel(handle.id));

    auto done = bridge.awaitResult(handle.id, 2s);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->state, JobState::Cancelled);
    EXPECT_LT(chrono::steady_clock::now() - start, 1s);

    EXPECT_FALSE(bridge.cancel(handle.id));
    EXPECT_FALSE(bridge.cancel(999999));
}

TEST_F(BridgeFixture, CancelPendingJobNeverRuns)
{
    // One slot, held by the first job
    TaskRegistry localRegistry;
    WorkerRuntime narrow(RuntimeConfig{1, 500ms});
    TaskBridge local(narrow, localRegistry);
    narrow.start();

    atomic<bool> secondRan{false};

    JobHandle first = local.dispatch(spec(JobKind::SendMessage, sleepy()));
    JobHandle second = local.dispatch(spec(JobKind::SendMessage, [&secondRan](shared_ptr<JobContext>) -> asio::awaitable<json>
                                           {
        secondRan = true;
        co_return json::object(); }));

    while (local.poll(first.id)->state == JobState::Pending)
        this_thread::sleep_for(1ms);

    EXPECT_TRUE(local.cancel(second.id));
    EXPECT_EQ(local.poll(second.id)->state, JobState::Cancelled);
    EXPECT_EQ(local.poll(second.id)->cancelReason, "cancelled before start");

    local.cancel(first.id);
    ASSERT_TRUE(local.awaitResult(first.id, 2s).has_value());

    local.shutdown();
    EXPECT_FALSE(secondRan.load());
}

TEST_F(BridgeFixture, EventsArriveInOrderOnThePumpingThread)
{
    mutex mtx;
    vector<pair<JobEvent::Type, JobState>> seen;
    set<thread::id> threads;

    size_t token = bridge.subscribe([&](const JobEvent &e)
                                    {
        lock_guard<mutex> lock(mtx);
        seen.emplace_back(e.type, e.to);
        threads.insert(this_thread::get_id()); });

    JobHandle handle = bridge.dispatch(spec(JobKind::SendMessage, after(5ms)));
    ASSERT_TRUE(bridge.awaitResult(handle.id, 2s).has_value());

    EXPECT_EQ(bridge.pumpEvents(), 3u);

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].first, JobEvent::Type::Created);
    EXPECT_EQ(seen[1].second, JobState::Running);
    EXPECT_EQ(seen[2].second, JobState::Completed);
    EXPECT_EQ(threads, set<thread::id>{this_thread::get_id()});

    bridge.unsubscribe(token);
    bridge.dispatch(spec(JobKind::SendMessage, after(1ms)));
    this_thread::sleep_for(50ms);
    bridge.pumpEvents();
    EXPECT_EQ(seen.size(), 3u);
}

TEST_F(BridgeFixture, ThrowingListenerDoesNotStopOthers)
{
    int calls = 0;
    bridge.subscribe([](const JobEvent &)
                     { throw runtime_error("listener bug"); });
    bridge.subscribe([&calls](const JobEvent &)
                     { ++calls; });

    JobHandle handle = bridge.dispatch(spec(JobKind::VerifyPhone, after(1ms)));
    ASSERT_TRUE(bridge.awaitResult(handle.id, 2s).has_value());

    bridge.pumpEvents();
    EXPECT_EQ(calls, 3);
}

TEST_F(BridgeFixture, FullEventQueueDropsOldest)
{
    TaskRegistry localRegistry;
    WorkerRuntime localRuntime;
    TaskBridge local(localRuntime, localRegistry, 2);
    localRuntime.start();

    JobHandle handle = local.dispatch(spec(JobKind::SendMessage, after(1ms)));
    ASSERT_TRUE(local.awaitResult(handle.id, 2s).has_value());

    EXPECT_EQ(local.queuedEvents(), 2u);
    EXPECT_EQ(local.droppedEvents(), 1u);

    auto events = local.drainEvents();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events.back().to, JobState::Completed);

    local.shutdown();
}

TEST_F(BridgeFixture, TerminalJobsFeedTheTracker)
{
    ProgressTracker tracker;
    bridge.attachTracker(&tracker);

    JobHandle ok = bridge.dispatch(spec(JobKind::Invite, after(1ms)));
    JobHandle bad = bridge.dispatch(spec(JobKind::Invite, [](shared_ptr<JobContext>) -> asio::awaitable<json>
                                         {
        co_await pause(1ms);
        throw FatalProtocolError("privacy restricted"); }));

    ASSERT_TRUE(bridge.awaitResult(ok.id, 2s).has_value());
    ASSERT_TRUE(bridge.awaitResult(bad.id, 2s).has_value());

    EXPECT_EQ(tracker.totalDone(), 2);
    EXPECT_EQ(tracker.countFor("invite", JobState::Completed), 1);
    EXPECT_EQ(tracker.countFor("invite", JobState::Failed), 1);

    bridge.attachTracker(nullptr);
}

TEST_F(BridgeFixture, ChildJobsPointAtTheirParent)
{
    promise<JobId> childId;
    auto answer = childId.get_future();

    JobHandle parent = bridge.dispatch(spec(JobKind::BulkSend, [this, &childId](shared_ptr<JobContext> ctx) -> asio::awaitable<json>
                                            {
        auto child = bridge.createChild(*ctx, JobKind::SendMessage, "item 0");
        child->markRunning();
        child->complete(json::object());
        childId.set_value(child->id());
        co_return json::object(); }));

    ASSERT_TRUE(bridge.awaitResult(parent.id, 2s).has_value());
    ASSERT_EQ(answer.wait_for(1s), future_status::ready);

    auto child = bridge.poll(answer.get());
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->parentId, parent.id);
    EXPECT_EQ(child->session, "s1");
    EXPECT_EQ(child->state, JobState::Completed);
}

TEST_F(BridgeFixture, ShutdownCancelsLiveJobsAndRefusesNewOnes)
{
    JobHandle handle = bridge.dispatch(spec(JobKind::BulkSend, sleepy()));

    while (bridge.poll(handle.id)->state == JobState::Pending)
        this_thread::sleep_for(1ms);

    bridge.shutdown();

    EXPECT_EQ(bridge.poll(handle.id)->state, JobState::Cancelled);
    EXPECT_FALSE(bridge.isAccepting());
    EXPECT_THROW(bridge.dispatch(spec(JobKind::SendMessage, after(1ms))), ValidationError);
    EXPECT_TRUE(registry.active().empty());
}

TEST_F(BridgeFixture, AwaitResultFromRuntimeThreadIsRefused)
{
    JobHandle target = bridge.dispatch(spec(JobKind::SendMessage, after(100ms)));

    promise<bool> refused;
    auto answer = refused.get_future();

    runtime.spawn("await-inside", [this, &refused, target]() -> asio::awaitable<void>
                  {
        try
        {
            bridge.awaitResult(target.id, 10ms);
            refused.set_value(false);
        }
        catch (const InvariantError &)
        {
            refused.set_value(true);
        }
        co_return; });

    ASSERT_EQ(answer.wait_for(2s), future_status::ready);
    EXPECT_TRUE(answer.get());
}

TEST_F(BridgeFixture, BuilderRetryOverridesTheDefault)
{
    atomic<int> calls{0};

    JobHandle handle = JobBuilder(JobKind::SendMessage)
                           .withLabel("single shot")
                           .withSession("s1")
                           .withRetry(RetryPolicy{1, 1ms})
                           .withWork([&calls](shared_ptr<JobContext> ctx) -> asio::awaitable<json>
                                     {
                                         co_await ctx->withRetry("busy", [&calls]() -> asio::awaitable<void>
                                                                 {
                                             ++calls;
                                             throw TransientProtocolError("flood wait");
                                             co_return; });
                                         co_return json::object(); })
                           .dispatchTo(bridge);

    auto done = bridge.awaitResult(handle.id, 2s);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->state, JobState::Failed);
    EXPECT_EQ(done->label, "single shot");
    EXPECT_EQ(calls.load(), 1);
}
