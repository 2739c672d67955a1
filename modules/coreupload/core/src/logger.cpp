#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <thread>

/**
 * @brief Tag prefixed to each log line.
 */
static std::string g_instanceTag = "liteupload";

/**
 * @brief Mutex for protecting the logger state and the output sink.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 */
static std::atomic<LogLevel> g_log_level(LogLevel::INFO);

static std::function<void(const std::string&)> g_log_callback;

/**
 * @brief Global async logging state
 */
static std::atomic<bool> g_async_logging_enabled(false);
static std::queue<std::string> g_log_queue;
static std::mutex g_log_queue_mutex;
static std::condition_variable g_log_queue_cv;
static std::atomic<bool> g_log_thread_running(false);
static std::unique_ptr<std::thread> g_log_thread;

static const char* level_label(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::NONE:    break;
    }
    return "-";
}

static std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// Called with g_logMutex held.
static void write_line(const std::string& line) {
    if (g_log_callback) {
        g_log_callback(line);
    } else {
        std::cerr << line << std::endl;
    }
}

void setInstanceTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_instanceTag = tag;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel log_level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return LogLevel::INFO;
}

/**
 * @brief Background thread worker for async logging. Drains the queue before exiting.
 */
static void async_log_worker() {
    std::unique_lock<std::mutex> lock(g_log_queue_mutex);
    while (true) {
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });
        if (g_log_queue.empty() && !g_log_thread_running) {
            break;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();
        {
            std::lock_guard<std::mutex> out_lock(g_logMutex);
            write_line(msg);
        }
        lock.lock();
    }
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_log_queue_mutex);
    if (g_async_logging_enabled) return;

    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

void disable_async_logging() {
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        if (!g_async_logging_enabled) return;
        g_async_logging_enabled = false;
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void nativeLog(LogLevel level, const std::string& message) {
    std::string tag;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        tag = g_instanceTag;
    }
    std::string log_message = timestamp_now() + " [" + tag + "] " + level_label(level) + ": " + message;

    {
        std::unique_lock<std::mutex> qlock(g_log_queue_mutex);
        if (g_async_logging_enabled) {
            g_log_queue.push(std::move(log_message));
            qlock.unlock();
            g_log_queue_cv.notify_one();
            return;
        }
    }

    std::lock_guard<std::mutex> lock(g_logMutex);
    write_line(log_message);
}
