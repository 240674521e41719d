#include <gtest/gtest.h>
#include "../src/TaskRegistry.hh"
#include "../src/WorkerRuntime.hh"

#include <future>

using namespace std::chrono_literals;

namespace
{
    asio::awaitable<void> pause(chrono::milliseconds d)
    {
        asio::steady_timer timer(co_await asio::this_coro::executor, d);
        co_await timer.async_wait(asio::use_awaitable);
    }

    WorkUnit returning(json value, chrono::milliseconds delay = 0ms)
    {
        return [value, delay](shared_ptr<JobContext>) -> asio::awaitable<json>
        {
            co_await pause(delay);
            co_return value;
        };
    }

    // Sleeps in small cancellable steps, the way a bulk loop would
    WorkUnit looping(atomic<int> &steps)
    {
        return [&steps](shared_ptr<JobContext> ctx) -> asio::awaitable<json>
        {
            for (int i = 0; i < 1000; ++i)
            {
                co_await ctx->sleepFor(10ms);
                steps++;
            }
            co_return json::object();
        };
    }
}

TEST(WorkerRuntimeTest, RunsJobToCompletion)
{
    TaskRegistry registry;
    WorkerRuntime runtime;
    runtime.start();

    auto job = registry.create(JobKind::SendMessage, "send", "s1");
    ASSERT_TRUE(runtime.submit(job, returning(json{{"ok", true}}, 20ms)));

    ASSERT_TRUE(job->waitTerminal(2s));
    EXPECT_EQ(job->state(), JobState::Completed);
    EXPECT_TRUE((*job->snapshot().result)["ok"].get<bool>());

    runtime.drain();
}

TEST(WorkerRuntimeTest, FaultInOneJobLeavesOthersAlone)
{
    TaskRegistry registry;
    WorkerRuntime runtime;
    runtime.start();

    auto bad = registry.create(JobKind::SendMessage, "bad", "s1");
    auto invariant = registry.create(JobKind::SendMessage, "invariant", "s1");
    auto good = registry.create(JobKind::SendMessage, "good", "s1");

    runtime.submit(bad, [](shared_ptr<JobContext>) -> asio::awaitable<json>
                   {
        co_await pause(5ms);
        throw std::logic_error("boom"); });

    runtime.submit(invariant, [](shared_ptr<JobContext>) -> asio::awaitable<json>
                   {
        co_await pause(5ms);
        throw InvariantError("broken"); });

    runtime.submit(good, returning(json{{"n", 1}}, 30ms));

    ASSERT_TRUE(bad->waitTerminal(2s));
    ASSERT_TRUE(invariant->waitTerminal(2s));
    ASSERT_TRUE(good->waitTerminal(2s));

    EXPECT_EQ(bad->state(), JobState::Failed);
    EXPECT_EQ(bad->snapshot().error->kind, ErrorKind::InternalInvariant);
    EXPECT_NE(bad->snapshot().error->message.find("boom"), string::npos);

    EXPECT_EQ(invariant->state(), JobState::Failed);
    EXPECT_EQ(good->state(), JobState::Completed);
    EXPECT_TRUE(runtime.isRunning());

    runtime.drain();
}

TEST(WorkerRuntimeTest, CancelRunningJobAtNextCheckpoint)
{
    TaskRegistry registry;
    WorkerRuntime runtime;
    runtime.start();

    atomic<int> steps{0};
    auto job = registry.create(JobKind::BulkSend, "loop", "s1");
    runtime.submit(job, looping(steps));

    while (job->state() == JobState::Pending)
        this_thread::sleep_for(1ms);

    this_thread::sleep_for(50ms);
    EXPECT_TRUE(job->requestCancel());

    ASSERT_TRUE(job->waitTerminal(1s));
    EXPECT_EQ(job->state(), JobState::Cancelled);

    int seen = steps.load();
    this_thread::sleep_for(50ms);
    EXPECT_EQ(steps.load(), seen);
    EXPECT_LT(seen, 1000);

    runtime.drain();
}

TEST(WorkerRuntimeTest, ConcurrencyCeilingIsHonoured)
{
    TaskRegistry registry;
    WorkerRuntime runtime(RuntimeConfig{2, 1s});
    runtime.start();

    atomic<int> current{0};
    atomic<int> peak{0};

    vector<shared_ptr<JobRecord>> jobs;
    for (int i = 0; i < 6; ++i)
    {
        auto job = registry.create(JobKind::ParseUsers, "p" + to_string(i), "s1");
        jobs.push_back(job);

        runtime.submit(job, [&](shared_ptr<JobContext>) -> asio::awaitable<json>
                       {
            int now = ++current;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }

            co_await pause(20ms);
            --current;
            co_return json::object(); });
    }

    for (auto &job : jobs)
        ASSERT_TRUE(job->waitTerminal(2s));

    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);

    runtime.drain();
}

TEST(WorkerRuntimeTest, DrainForceCancelsStragglers)
{
    TaskRegistry registry;
    WorkerRuntime runtime(RuntimeConfig{0, 100ms});
    runtime.start();

    // Ignores cancellation entirely: no checkpoint, one long wait
    auto stubborn = registry.create(JobKind::SendMessage, "stubborn", "s1");
    runtime.submit(stubborn, returning(json::object(), 5s));

    while (stubborn->state() == JobState::Pending)
        this_thread::sleep_for(1ms);

    bool finalized = false;
    auto start = chrono::steady_clock::now();

    runtime.drain([&finalized]() -> asio::awaitable<void>
                  {
        finalized = true;
        co_return; });

    EXPECT_LT(chrono::steady_clock::now() - start, 2s);
    EXPECT_TRUE(finalized);
    EXPECT_EQ(stubborn->state(), JobState::Cancelled);
    EXPECT_EQ(stubborn->snapshot().cancelReason, "runtime shut down");

    EXPECT_FALSE(runtime.isAccepting());
    EXPECT_FALSE(runtime.submit(registry.create(JobKind::SendMessage, "late", "s1"), returning(json::object())));

    // Second drain is a no-op
    runtime.drain();
}

TEST(WorkerRuntimeTest, FinalizerFaultDoesNotBlockShutdown)
{
    WorkerRuntime runtime(RuntimeConfig{0, 200ms});
    runtime.start();

    runtime.drain([]() -> asio::awaitable<void>
                  {
        co_await pause(1ms);
        throw std::runtime_error("disconnect failed"); });

    EXPECT_FALSE(runtime.isRunning());
}

TEST(WorkerRuntimeTest, RetryRecoversFromTransientErrors)
{
    TaskRegistry registry;
    WorkerRuntime runtime;
    runtime.start();

    atomic<int> calls{0};
    auto job = registry.create(JobKind::SendMessage, "flaky", "s1");

    runtime.submit(job, [&calls](shared_ptr<JobContext> ctx) -> asio::awaitable<json>
                   {
        int value = co_await ctx->withRetry("flaky_call", [&calls]() -> asio::awaitable<int>
                                            {
            if (++calls < 3)
                throw TransientProtocolError("flood wait");
            co_return 7; });

        co_return json{{"value", value}}; },
                   RetryPolicy{3, 5ms});

    ASSERT_TRUE(job->waitTerminal(2s));
    EXPECT_EQ(job->state(), JobState::Completed);
    EXPECT_EQ(calls.load(), 3);

    runtime.drain();
}

TEST(WorkerRuntimeTest, RetryGivesUpAtTheBoundAndNeverRetriesFatal)
{
    TaskRegistry registry;
    WorkerRuntime runtime;
    runtime.start();

    atomic<int> transientCalls{0};
    atomic<int> fatalCalls{0};

    auto transient = registry.create(JobKind::SendMessage, "transient", "s1");
    auto fatal = registry.create(JobKind::SendMessage, "fatal", "s1");

    runtime.submit(transient, [&transientCalls](shared_ptr<JobContext> ctx) -> asio::awaitable<json>
                   {
        co_await ctx->withRetry("always_busy", [&transientCalls]() -> asio::awaitable<void>
                                {
            ++transientCalls;
            throw TransientProtocolError("flood wait");
            co_return; });
        co_return json::object(); },
                   RetryPolicy{2, 1ms});

    runtime.submit(fatal, [&fatalCalls](shared_ptr<JobContext> ctx) -> asio::awaitable<json>
                   {
        co_await ctx->withRetry("banned", [&fatalCalls]() -> asio::awaitable<void>
                                {
            ++fatalCalls;
            throw FatalProtocolError("banned");
            co_return; });
        co_return json::object(); },
                   RetryPolicy{5, 1ms});

    ASSERT_TRUE(transient->waitTerminal(2s));
    ASSERT_TRUE(fatal->waitTerminal(2s));

    EXPECT_EQ(transient->state(), JobState::Failed);
    EXPECT_EQ(transient->snapshot().error->kind, ErrorKind::TransientProtocol);
    EXPECT_EQ(transientCalls.load(), 2);

    EXPECT_EQ(fatal->state(), JobState::Failed);
    EXPECT_EQ(fatal->snapshot().error->kind, ErrorKind::FatalProtocol);
    EXPECT_EQ(fatalCalls.load(), 1);

    runtime.drain();
}

TEST(WorkerRuntimeTest, DrainFromRuntimeThreadIsRefused)
{
    WorkerRuntime runtime;
    runtime.start();

    promise<bool> refused;
    auto answer = refused.get_future();

    runtime.spawn("self-drain", [&runtime, &refused]() -> asio::awaitable<void>
                  {
        try
        {
            runtime.drain();
            refused.set_value(false);
        }
        catch (const InvariantError &)
        {
            refused.set_value(true);
        }
        co_return; });

    ASSERT_EQ(answer.wait_for(2s), future_status::ready);
    EXPECT_TRUE(answer.get());

    runtime.drain();
}
