#pragma once

#include <atomic>
#include <chrono>
#include <climits>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "Job.hh"
#include "Logger.hh"

namespace httplib
{
    class Server;
}

using json = nlohmann::json;

// Manage statistics by job kind
struct CategoryMetric
{
    vector<long long> latencies;       // Latency History
    map<JobState, int> outcomeCount;   // count by terminal state
    int count = 0;                     // Count finished jobs
    long long minLatency = LLONG_MAX;
    long long maxLatency = 0;

    void add(long long latencyMs, JobState outcome)
    {
        latencies.push_back(latencyMs);
        outcomeCount[outcome]++;
        count++;

        if (latencyMs < minLatency)
            minLatency = latencyMs;

        if (latencyMs > maxLatency)
            maxLatency = latencyMs;
    }
};

/*
✅ Count finished jobs per kind and outcome
✅ Calculate latency statistics (min/max/average)
✅ Export data to JSON or Prometheus
✅ Serve /metrics and /jobs over HTTP on a background thread
*/
class ProgressTracker
{
public:
    using JobsProvider = function<json()>;

    ProgressTracker();
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker &) = delete;
    ProgressTracker &operator=(const ProgressTracker &) = delete;

    // Called once per terminal job
    void markJobDoneWithCategory(const string &category, long long latencyMs, JobState outcome);

    void setHighlightLatency(long long thresholdMs);
    void setEnableColor(bool enable);

    int totalDone() const { return done.load(); }
    int countFor(const string &category, JobState outcome) const;

    json exportSummaryJSON() const;
    string exportJSON() const;
    string exportPrometheus() const;

    // /jobs answers with whatever the provider returns
    void setJobsProvider(JobsProvider provider);

    // Returns false if the port could not be bound
    bool startHTTPServer(int port = 8080);
    void stopHTTPServer();
    bool isServing() const { return serving.load(); }

    // Print the per-kind summary
    void finish() const;

private:
    string colorText(const string &text, const string &colorCode) const;

    atomic<int> done{0};
    chrono::steady_clock::time_point startTime;

    // If latency > threshold then mark special
    atomic<long long> highlightThreshold{-1};
    atomic<bool> enableColor{false};

    mutable mutex metricsMutex;
    map<string, CategoryMetric> categoryMetrics;

    const vector<long long> latencyBuckets = {50, 100, 250, 500, 1000, 5000};

    mutable mutex providerMutex;
    JobsProvider jobsProvider;

    unique_ptr<httplib::Server> server;
    thread serverThread;
    atomic<bool> serving{false};
};
