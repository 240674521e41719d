#include "Logger.hh"
#include "log_utils.h"

#include <nlohmann/json.hpp>

#include <cctype>
#include <format>
#include <iomanip> // put_time
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace
{
    tm localTime(chrono::system_clock::time_point tp)
    {
        time_t t = chrono::system_clock::to_time_t(tp);
        tm tm_struct;

#if defined(_WIN32) || defined(_WIN64)
        localtime_s(&tm_struct, &t);
#else
        localtime_r(&t, &tm_struct);
#endif

        return tm_struct;
    }

    string formatTime(chrono::system_clock::time_point tp)
    {
        tm tm_struct = localTime(tp);
        ostringstream oss;
        oss << put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }
}

Logger &Logger::instance()
{
    static Logger logger;
    return logger;
}

void Logger::start(const string &filename, bool truncate)
{
    if (running)
        stop();

    {
        lock_guard<mutex> lock(logMutex);
        // truncate = true overwrites the file (ios::trunc), otherwise append (ios::app)
        ios_base::openmode mode = truncate ? (ios::out | ios::trunc) : (ios::out | ios::app);

        logFile.open(filename, mode);

        if (!logFile.is_open())
            throw runtime_error("Cannot open log file: " + filename);
    }

    {
        lock_guard<mutex> lock(queueMutex);
        stopFlag = false;
        isReady = false;
    }

    worker = thread(&Logger::workerThread);

    // Wait until the worker signals it is ready, so nothing logged right
    // after start() can race the thread startup
    {
        unique_lock<mutex> lock(queueMutex);
        cv.wait(lock, []
                { return isReady; });
        running = true;
    }

    dualSafeLog("=== Logger started at " + format("{:%Y-%m-%d %H:%M:%S}", chrono::system_clock::now()));
}

void Logger::stop()
{
    {
        lock_guard<mutex> lock(queueMutex);
        stopFlag = true;
        running = false;
    }

    cv.notify_all();

    if (worker.joinable())
        worker.join();

    lock_guard<mutex> lock(logMutex);
    if (logFile.is_open())
    {
        logFile.flush();
        logFile.close();
    }
}

Logger::~Logger()
{
    stop();
}

bool Logger::isRunning()
{
    return running.load();
}

string Logger::timestamps()
{
    return "[" + formatTime(chrono::system_clock::now()) + "]";
}

void Logger::log(LogLevel level, const string &event, const string &status, long long latency, int attempt)
{
    levelCounts[static_cast<int>(level)]++;

    LogMessage msg{event,
                   status,
                   latency,
                   attempt,
                   level,
                   this_thread::get_id(),
                   chrono::system_clock::now()};

    if (static_cast<int>(level) >= minConsoleLevel.load())
        writeConsole(msg);

    {
        lock_guard<mutex> lock(queueMutex);

        // Checked under the queue lock so nothing is queued after the worker exits
        if (!running || stopFlag)
            return;

        messageQueue.push(std::move(msg));
        ++unwritten;
    }

    // flush() may be waiting on the same condition variable
    cv.notify_all();
}

void Logger::dualSafeLog(const string &message)
{
    string full = timestamps() + "  ===  " + message;

    SAFE_COUT(full);

    lock_guard<mutex> fileLock(logMutex);

    if (!logFile.is_open())
        return;

    logFile << full << endl;
}

// Push buffered log data to disk
void Logger::flush()
{
    // Wait until the worker has drained everything queued so far
    {
        unique_lock<mutex> lock(queueMutex);
        cv.wait_for(lock, chrono::seconds(2), []
                    { return unwritten == 0 || stopFlag; });
    }

    scoped_lock lock(logMutex);
    if (logFile.is_open())
        logFile.flush();
}

void Logger::setConsoleLevel(LogLevel level)
{
    minConsoleLevel = static_cast<int>(level);
}

LogLevel Logger::consoleLevel()
{
    return static_cast<LogLevel>(minConsoleLevel.load());
}

int Logger::levelCount(LogLevel level)
{
    return levelCounts[static_cast<int>(level)].load();
}

int Logger::threadIndexOf(thread::id id)
{
    lock_guard<mutex> mapLock(threadMapMutex);
    auto it = threadIdMap.find(id);

    if (it != threadIdMap.end())
        return it->second;

    int index = threadCounter++;
    threadIdMap[id] = index;
    return index;
}

string Logger::formatJSON(const LogMessage &msg)
{
    json line = {
        {"timestamp", formatTime(msg.timestamp)},
        {"thread_id", "thread#" + to_string(threadIndexOf(msg.threadId))},
        {"level", logLevelToString(msg.level)},
        {"event", msg.event},
        {"status", msg.status},
        {"latency_ms", msg.latency},
        {"attempt", msg.attempt}};

    // dump() escapes quotes and control characters; replace keeps invalid UTF-8 from throwing
    return line.dump(-1, ' ', false, json::error_handler_t::replace);
}

void Logger::writeConsole(const LogMessage &msg)
{
    ostringstream line;
    line << "[" << formatTime(msg.timestamp) << "]  "
         << "[" << logLevelToString(msg.level) << "]  "
         << "[" << msg.event << "]  "
         << "[" << msg.status << "]";

    if (msg.latency > 0)
        line << "  latency = " << msg.latency << "ms";

    if (msg.attempt > 0)
        line << "  attempt = " << msg.attempt;

    if (msg.level >= LogLevel::Error)
    {
        SAFE_CERR(line.str());
    }
    else
    {
        SAFE_COUT(line.str());
    }
}

void Logger::workerThread()
{
    // Signal readiness before start() returns
    {
        lock_guard<mutex> lock(queueMutex);
        isReady = true;
    }
    cv.notify_all();

    while (true)
    {
        unique_lock<mutex> lock(queueMutex);

        cv.wait(lock, []
                { return !messageQueue.empty() || stopFlag; });

        // Stop only once everything queued has been written
        if (stopFlag && messageQueue.empty())
            break;

        LogMessage msg = std::move(messageQueue.front());
        messageQueue.pop();
        lock.unlock(); // release early so producers are not held up by file I/O

        string line = formatJSON(msg);

        {
            lock_guard<mutex> fileLock(logMutex);

            if (logFile.is_open())
                logFile << line << '\n';
        }

        bool drained = false;
        {
            lock_guard<mutex> countLock(queueMutex);
            drained = (--unwritten == 0);
        }

        if (drained)
            cv.notify_all();
    }
}

string Logger::logLevelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";

    case LogLevel::Info:
        return "INFO";

    case LogLevel::Warn:
        return "WARN";

    case LogLevel::Error:
        return "ERROR";

    case LogLevel::Critical:
        return "CRITICAL";
    }

    return "UNKNOWN";
}

optional<LogLevel> Logger::logLevelFromString(const string &name)
{
    string upper;
    for (char c : name)
        upper += static_cast<char>(toupper(static_cast<unsigned char>(c)));

    for (LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Critical})
    {
        if (logLevelToString(level) == upper)
            return level;
    }

    if (upper == "WARNING")
        return LogLevel::Warn;

    return nullopt;
}
