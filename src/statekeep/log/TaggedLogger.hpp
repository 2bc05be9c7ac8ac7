#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace SK {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

[[nodiscard]] auto logLevelName(LogLevel level) -> std::string_view;
[[nodiscard]] auto parseLogLevel(std::string_view text, LogLevel& out) -> bool;

class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    // Receives every message at or above the minimum level, synchronously on the
    // logging thread, whether or not stderr output is enabled.
    using Observer = std::function<void(LogMessage const&)>;

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(LogLevel level, const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setStderrEnabled(bool enabled) -> void;
    auto setMinimumLevel(LogLevel level) -> void;
    auto minimumLevel() const -> LogLevel;
    auto setObserver(Observer observer) -> Observer;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       loggingEnabled;
    std::atomic<bool>       stderrEnabled;
    std::atomic<int>        minLevel;
    std::set<std::string>   skipTags{};
    std::set<std::string>   enabledTags{};

    Observer           observer;
    mutable std::mutex observerMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        configureFromEnvironment() -> void;
    auto        dispatch(LogMessage&& msg) -> void;
    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(LogLevel level, const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
        return;
    if (static_cast<int>(level) < minLevel.load(std::memory_order_relaxed))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .level      = level,
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};
    this->dispatch(std::move(logMessage));
}

#define sk_log(level, message, ...) ::SK::logger().log_impl(level, message, std::source_location::current(), ##__VA_ARGS__)
#define sk_debug(message, ...) sk_log(::SK::LogLevel::Debug, message, ##__VA_ARGS__)
#define sk_info(message, ...) sk_log(::SK::LogLevel::Info, message, ##__VA_ARGS__)
#define sk_warn(message, ...) sk_log(::SK::LogLevel::Warn, message, ##__VA_ARGS__)
#define sk_error(message, ...) sk_log(::SK::LogLevel::Error, message, ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace SK
