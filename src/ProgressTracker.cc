#include <httplib.h>
#include "ProgressTracker.hh"

#include <numeric>
#include <sstream>

ProgressTracker::ProgressTracker() : startTime(chrono::steady_clock::now()) {}

ProgressTracker::~ProgressTracker()
{
    stopHTTPServer();
}

void ProgressTracker::setHighlightLatency(long long thresholdMs)
{
    highlightThreshold = thresholdMs;
}

void ProgressTracker::setEnableColor(bool enable)
{
    enableColor = enable;
}

string ProgressTracker::colorText(const string &text, const string &colorCode) const
{
    return enableColor ? ("\033[" + colorCode + "m" + text + "\033[0m") : text;
}

/*
This function keeps per-kind data on finished jobs:

- latency of each job,
- number of jobs by terminal state,
- min/max latency,
- total number of finished jobs.
*/
void ProgressTracker::markJobDoneWithCategory(const string &category, long long latencyMs, JobState outcome)
{
    {
        lock_guard<mutex> lock(metricsMutex);
        categoryMetrics[category].add(latencyMs, outcome);
    }

    done++;

    long long threshold = highlightThreshold.load();
    if (threshold > 0 && latencyMs > threshold)
    {
        Logger::log(LogLevel::Warn, "tracker", colorText("high latency " + category + " job: " + to_string(latencyMs) + "ms", "31"), latencyMs);
    }
}

int ProgressTracker::countFor(const string &category, JobState outcome) const
{
    lock_guard<mutex> lock(metricsMutex);

    auto it = categoryMetrics.find(category);
    if (it == categoryMetrics.end())
        return 0;

    auto found = it->second.outcomeCount.find(outcome);
    return found == it->second.outcomeCount.end() ? 0 : found->second;
}

json ProgressTracker::exportSummaryJSON() const
{
    int totalTime = static_cast<int>(chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - startTime).count());

    json j;
    j["total_done"] = done.load();
    j["uptime_ms"] = totalTime;

    json categoriesJson = json::object();
    json outcomesJson = json::object();

    lock_guard<mutex> lock(metricsMutex);

    for (const auto &[category, metric] : categoryMetrics)
    {
        long long sum = accumulate(metric.latencies.begin(), metric.latencies.end(), 0LL);
        double avg = metric.latencies.empty() ? 0.0 : static_cast<double>(sum) / metric.latencies.size();

        json outcomes = json::object();
        for (const auto &[state, count] : metric.outcomeCount)
        {
            outcomes[jobStateToString(state)] = count;
            outcomesJson[jobStateToString(state)] = outcomesJson.value(jobStateToString(state), 0) + count;
        }

        categoriesJson[category] = {
            {"count", metric.count},
            {"average_latency_ms", avg},
            {"min_latency_ms", metric.count == 0 ? 0 : metric.minLatency},
            {"max_latency_ms", metric.maxLatency},
            {"outcomes", outcomes}};
    }

    j["categories"] = categoriesJson;
    j["outcomes"] = outcomesJson;
    return j;
}

string ProgressTracker::exportJSON() const
{
    return exportSummaryJSON().dump(4); // pretty print
}

string ProgressTracker::exportPrometheus() const
{
    stringstream ss;

    ss << "# HELP msgdesk_job_latency_ms Histogram of job latency in ms by job kind\n";
    ss << "# TYPE msgdesk_job_latency_ms histogram\n";

    lock_guard<mutex> lock(metricsMutex);

    for (const auto &[category, metric] : categoryMetrics)
    {
        // count latency falling into each bucket
        map<long long, int> bucketCounts;
        long long latencySum = 0;

        for (long long l : metric.latencies)
        {
            latencySum += l;

            for (long long b : latencyBuckets)
            {
                if (l <= b)
                    bucketCounts[b]++;
            }
        }

        for (long long b : latencyBuckets)
        {
            ss << "msgdesk_job_latency_ms_bucket{kind=\"" << category << "\",le=\"" << b << "\"} "
               << bucketCounts[b] << "\n";
        }

        // +Inf bucket
        ss << "msgdesk_job_latency_ms_bucket{kind=\"" << category << "\",le=\"+Inf\"} " << metric.count << "\n";
        ss << "msgdesk_job_latency_ms_sum{kind=\"" << category << "\"} " << latencySum << "\n";
        ss << "msgdesk_job_latency_ms_count{kind=\"" << category << "\"} " << metric.count << "\n";
    }

    ss << "# HELP msgdesk_jobs_total Finished jobs by kind and outcome\n";
    ss << "# TYPE msgdesk_jobs_total counter\n";

    for (const auto &[category, metric] : categoryMetrics)
    {
        for (const auto &[state, count] : metric.outcomeCount)
            ss << "msgdesk_jobs_total{kind=\"" << category << "\",outcome=\"" << jobStateToString(state) << "\"} " << count << "\n";
    }

    ss << "msgdesk_jobs_done " << done.load() << "\n";

    return ss.str();
}

void ProgressTracker::setJobsProvider(JobsProvider provider)
{
    lock_guard<mutex> lock(providerMutex);
    jobsProvider = std::move(provider);
}

bool ProgressTracker::startHTTPServer(int port)
{
    if (server)
        return serving.load(); // server is already running, avoid restarting

    server = make_unique<httplib::Server>();

    // Endpoint /metrics returns Prometheus format string
    server->Get("/metrics", [this](const httplib::Request &, httplib::Response &res)
                { res.set_content(exportPrometheus(), "text/plain; version=0.0.4"); });

    server->Get("/summary", [this](const httplib::Request &, httplib::Response &res)
                { res.set_content(exportJSON(), "application/json"); });

    server->Get("/jobs", [this](const httplib::Request &, httplib::Response &res)
                {
        JobsProvider provider;
        {
            lock_guard<mutex> lock(providerMutex);
            provider = jobsProvider;
        }

        json body = provider ? provider() : json::array();
        res.set_content(body.dump(), "application/json"); });

    if (!server->bind_to_port("0.0.0.0", port))
    {
        Logger::log(LogLevel::Error, "tracker", "cannot bind status server to port " + to_string(port));
        server.reset();
        return false;
    }

    serving = true;

    // Run the server on a separate thread, not main block
    serverThread = thread([this, port]()
                          {
        Logger::log(LogLevel::Info, "tracker", "HTTP server started on port " + to_string(port));
        server->listen_after_bind();
        serving = false; });

    return true;
}

void ProgressTracker::stopHTTPServer()
{
    if (!server)
        return;

    server->stop();

    if (serverThread.joinable())
        serverThread.join();

    server.reset();
    serving = false;
}

void ProgressTracker::finish() const
{
    json summary = exportSummaryJSON();

    Logger::dualSafeLog("");
    Logger::dualSafeLog(colorText("         Jobs finished: " + to_string(summary["total_done"].get<int>()), "36"));

    for (const auto &[category, data] : summary["categories"].items())
    {
        Logger::dualSafeLog("  " + category + ": " + to_string(data["count"].get<int>()) +
                            " jobs, avg " + to_string(static_cast<long long>(data["average_latency_ms"].get<double>())) + "ms");
    }

    Logger::dualSafeLog("");
}
