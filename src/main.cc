#include <format>
#include <iostream>

#include "JobDispatcher.hh"
#include "ProfileStore.hh"
#include "ProgressTracker.hh"
#include "SimulatedClient.hh"
#include "config.hh"
#include "log_utils.h"

namespace
{
    // Keep the event pump going while waiting, the way a UI loop would
    JobSnapshot waitFor(JobDispatcher &dispatcher, TaskBridge &bridge, JobHandle handle)
    {
        while (true)
        {
            auto snap = dispatcher.awaitResult(handle.id, chrono::milliseconds(100));
            bridge.pumpEvents();

            if (snap)
                return *snap;
        }
    }

    void report(const string &step, const JobSnapshot &snap)
    {
        SAFE_COUT("\n [" << step << "] job#" << snap.id << " " << jobStateToString(snap.state) << " in " << snap.durationMs() << "ms");

        if (snap.result)
            SAFE_COUT(snap.result->dump(2));

        if (snap.error)
            SAFE_COUT("   error (" << errorKindToString(snap.error->kind) << "): " << snap.error->message);
    }

    SimulatedBehavior demoBehavior()
    {
        SimulatedBehavior behavior;
        behavior.latency = chrono::milliseconds(20);
        behavior.registeredPhones = {"+15550001", "+15550003"};
        behavior.fatalTargets = {"@banned_user"};
        behavior.transientFailures["send_message"] = 1; // first send hits a flood wait

        for (int i = 1; i <= 5; ++i)
            behavior.participants.push_back({1000 + i, "user" + to_string(i), "First" + to_string(i), "Last" + to_string(i), ""});

        return behavior;
    }
}

int main(int argc, char **argv)
{
    // Start measuring the total running time of the entire program
    auto overallStart = chrono::steady_clock::now();

    // ======== Step 1: Configuration and logging ========
    AppConfig config;

    try
    {
        if (argc > 1)
            config = loadConfig(argv[1]);
    }
    catch (const exception &e)
    {
        SAFE_CERR("[config] " << e.what());
        return 1;
    }

    Logger &log = Logger::instance();

    try
    {
        log.start(config.logging.file, config.logging.truncate);
    }
    catch (const exception &e)
    {
        SAFE_CERR("[logger] " << e.what());
        return 1;
    }

    Logger::setConsoleLevel(config.logging.level);
    log.dualSafeLog("==== msgdesk started ====");
    Logger::log(LogLevel::Debug, "config", configToJSON(config).dump());

    // ======== Step 2: Wire the components ========
    ProgressTracker tracker;
    tracker.setHighlightLatency(5000);

    TaskRegistry registry(config.registry);
    WorkerRuntime runtime(config.runtime);
    runtime.start();

    TaskBridge bridge(runtime, registry, config.maxQueuedEvents, config.retry);
    bridge.attachTracker(&tracker);

    RateLimiter limiter(config.rateLimit);

    vector<shared_ptr<SimulatedClient>> clients;
    SessionManager sessions([&](const SessionCredentials &)
                            {
        auto client = make_shared<SimulatedClient>(runtime.executor(), demoBehavior());
        clients.push_back(client);
        return client; });

    JobDispatcher dispatcher(bridge, sessions, limiter, config.bulk);
    ProfileStore profiles(config.profilesFile);

    if (config.statusServer.enabled)
    {
        tracker.setJobsProvider([&registry]()
                                {
            json jobs = json::array();
            for (const auto &snap : registry.list())
                jobs.push_back(snap.toJSON());
            return jobs; });

        tracker.startHTTPServer(config.statusServer.port);
    }

    bridge.subscribe([](const JobEvent &event)
                     {
        if (event.type == JobEvent::Type::Transition)
            Logger::log(LogLevel::Debug, "job#" + to_string(event.jobId), jobStateToString(event.from) + " -> " + jobStateToString(event.to), event.elapsedMs); });

    // ======== Step 3: Scripted session ========
    SessionCredentials creds{"demo", 12345, "0123456789abcdef", "+15550000"};

    json profile = {{"session", creds.name}, {"phone", creds.phone}, {"api_id", creds.apiId}};
    if (!profiles.createProfile(creds.name, profile))
        profiles.updateProfile(creds.name, profile);

    try
    {
        report("create session", waitFor(dispatcher, bridge, dispatcher.createSession(creds)));
        report("authorize", waitFor(dispatcher, bridge, dispatcher.authorizeSession(creds.name, "12345")));
        report("parse users", waitFor(dispatcher, bridge, dispatcher.getParticipants(creds.name, "@demo_chat", 100)));

        vector<string> targets = {"@alice", "@bob", "@banned_user", "@carol"};
        report("bulk send", waitFor(dispatcher, bridge, dispatcher.bulkSend(creds.name, targets, "Hello from msgdesk")));

        report("verify phones", waitFor(dispatcher, bridge, dispatcher.verifyPhone(creds.name, {"+15550001", "+15550002", "+15550003"})));
        report("invite", waitFor(dispatcher, bridge, dispatcher.inviteUsers(creds.name, "@demo_chat", {"user1", "user2"})));
        report("auto-respond", waitFor(dispatcher, bridge, dispatcher.toggleAutoRespond(creds.name, true, "Thanks, I'll get back to you.")));

        // An incoming private message triggers a tracked auto-reply job
        if (!clients.empty())
            clients.back()->deliverIncoming({4242, "@dave", "hi there", true});

        // A job cancelled while it waits for its rate-limit slot
        JobHandle slow = dispatcher.sendMessage(creds.name, "@erin", "this one gets cancelled");
        dispatcher.cancelJob(slow.id);
        report("cancelled send", waitFor(dispatcher, bridge, slow));
    }
    catch (const ValidationError &e)
    {
        log.dualSafeLog(string("Rejected: ") + e.what());
    }

    // ======== Step 4: Summaries ========
    bridge.pumpEvents();

    json jobs = json::array();
    for (const auto &snap : dispatcher.listJobs())
        jobs.push_back(snap.toJSON());

    SAFE_COUT("\n Jobs:\n" << jobs.dump(2));
    SAFE_COUT("\n Sessions:\n" << dispatcher.listSessions().dump(2));
    SAFE_COUT("\n Metrics:\n" << tracker.exportJSON());

    // ======== Step 5: Shutdown ========
    dispatcher.shutdown();
    bridge.pumpEvents();
    tracker.finish();
    tracker.stopHTTPServer();

    auto totalMs = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - overallStart).count();
    log.dualSafeLog("==== msgdesk finished at " + format("{:%Y-%m-%d %H:%M:%S}", chrono::system_clock::now()) +
                    " (" + to_string(totalMs) + "ms) ====");

    log.stop();
    return 0;
}
