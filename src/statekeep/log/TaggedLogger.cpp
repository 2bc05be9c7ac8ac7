#include "log/TaggedLogger.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SK {

namespace {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

auto lowercase(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return out;
}

auto parse_truthy(char const* value) -> bool {
    if (value == nullptr)
        return false;
    auto normalized = lowercase(value);
    return !(normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no");
}

auto split_tags(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item  = text.substr(0, comma);
        if (!item.empty())
            tags.emplace(item);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}

} // namespace

auto logLevelName(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

auto parseLogLevel(std::string_view text, LogLevel& out) -> bool {
    auto normalized = lowercase(text);
    if (normalized == "debug") {
        out = LogLevel::Debug;
    } else if (normalized == "info") {
        out = LogLevel::Info;
    } else if (normalized == "warn" || normalized == "warning") {
        out = LogLevel::Warn;
    } else if (normalized == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : running(true),
      loggingEnabled(true),
      stderrEnabled(false),
      minLevel(static_cast<int>(LogLevel::Info)),
      nextThreadNumber(0) {
    this->configureFromEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::configureFromEnvironment() -> void {
    if (auto const* flag = std::getenv("STATEKEEP_LOG"))
        this->stderrEnabled = parse_truthy(flag);
    if (auto const* level = std::getenv("STATEKEEP_LOG_LEVEL")) {
        LogLevel parsed = LogLevel::Info;
        if (parseLogLevel(level, parsed))
            this->minLevel = static_cast<int>(parsed);
    }
    if (auto const* tags = std::getenv("STATEKEEP_LOG_TAGS"))
        this->enabledTags = split_tags(tags);
    if (auto const* tags = std::getenv("STATEKEEP_LOG_SKIP_TAGS"))
        this->skipTags = split_tags(tags);
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setStderrEnabled(bool enabled) -> void {
    stderrEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setMinimumLevel(LogLevel level) -> void {
    minLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

auto TaggedLogger::minimumLevel() const -> LogLevel {
    return static_cast<LogLevel>(minLevel.load(std::memory_order_relaxed));
}

auto TaggedLogger::setObserver(Observer next) -> Observer {
    std::lock_guard<std::mutex> lock(observerMutex);
    auto                        previous = std::move(this->observer);
    this->observer                       = std::move(next);
    return previous;
}

auto TaggedLogger::dispatch(LogMessage&& msg) -> void {
    {
        std::lock_guard<std::mutex> lock(observerMutex);
        if (this->observer)
            this->observer(msg);
    }

    if (!stderrEnabled.load(std::memory_order_relaxed))
        return;

    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->messageQueue.push(std::move(msg));
    this->cv.notify_one();
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
        }
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    if (this->enabledTags.size()) {
        bool matched = false;
        for (auto const& tag : msg.tags)
            if (this->enabledTags.contains(tag))
                matched = true;
        if (!matched)
            return;
    }
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return;
    const auto now      = msg.timestamp;
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm    nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[' << logLevelName(msg.level) << "] ";
    if (!msg.tags.empty())
        oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';

    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    } else {
        std::string name = "Thread " + std::to_string(nextThreadNumber++);
        threadNames[id]  = name;
        return name;
    }
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace SK
