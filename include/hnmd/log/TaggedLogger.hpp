#pragma once
#ifdef HN_LOG_DEBUG
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace HN {

/**
 * TaggedLogger: asynchronous stderr logger keyed by free-form tags.
 *
 * Messages are queued by the calling thread and written by a single worker so
 * that logging from loader or subscription tasks never blocks on stderr.
 *
 * Environment (read once at construction):
 *  - HNMD_LOG_ENABLED / HNMD_LOG: any value other than "0" enables output
 *  - HNMD_LOG_ENABLE_TAGS: comma list; when set, every tag of a message must be listed
 *  - HNMD_LOG_SKIP_TAGS: comma list of tags to drop in addition to the defaults
 *  - HNMD_LOG_CLEAR_DEFAULT_SKIPS: clears the default skip list
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto loggingEnabled() const -> bool;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::thread             workerThread;
    bool                    running = true;
    std::atomic<bool>       enabled{false};
    std::set<std::string>   skipTags{"INFO", "Task", "TaskPool"};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber{0};

    auto        applyEnvironment() -> void;
    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
    }
    this->cv.notify_one();
}

#define hn_log(message, ...) ::HN::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace HN

#else
#define hn_log(message, ...) ((void)0)
#endif // HN_LOG_DEBUG
