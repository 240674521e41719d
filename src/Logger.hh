#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>

using namespace std;

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error,
    Critical
};

struct LogMessage
{
    string event, status;
    long long latency;
    int attempt;
    LogLevel level;
    thread::id threadId;
    chrono::system_clock::time_point timestamp;
};

/*
Process-wide asynchronous logger.
- log() only enqueues; a background thread formats and writes JSON lines to the log file
- console output (level >= console threshold) goes through g_logMutex
- before start() (or after stop()) messages go straight to the console
*/
class Logger
{
public:
    static Logger &instance();

    void start(const string &filename, bool truncate = true);
    void stop();

    static bool isRunning();

    static void log(LogLevel level, const string &event, const string &status, long long latency = 0, int attempt = 0);

    // Write a free-form line to both console and log file
    static void dualSafeLog(const string &message);

    static void flush();

    static void setConsoleLevel(LogLevel level);
    static LogLevel consoleLevel();

    static string timestamps();
    static string logLevelToString(LogLevel level);
    static optional<LogLevel> logLevelFromString(const string &name);

    // Messages accepted per level since process start (read by metrics and tests)
    static int levelCount(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    static void workerThread();
    static string formatJSON(const LogMessage &msg);
    static void writeConsole(const LogMessage &msg);
    static int threadIndexOf(thread::id id);

    inline static queue<LogMessage> messageQueue; // intermediate buffer
    inline static size_t unwritten = 0;           // queued or being written
    inline static mutex queueMutex;
    inline static condition_variable cv;
    inline static bool stopFlag = false;
    inline static bool isReady = false;
    inline static atomic<bool> running{false};

    inline static thread worker;

    // Only the worker thread and dualSafeLog touch the file
    inline static ofstream logFile;
    inline static mutex logMutex;

    inline static atomic<int> minConsoleLevel{static_cast<int>(LogLevel::Info)};
    inline static atomic<int> levelCounts[5] = {};

    // Mapping thread::id -> small index, "thread#1" is easier to read than a raw id
    inline static unordered_map<thread::id, int> threadIdMap;
    inline static int threadCounter = 1;
    inline static mutex threadMapMutex;
};
