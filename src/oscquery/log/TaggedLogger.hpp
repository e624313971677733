#ifdef OQ_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace OQ {

/**
 * Asynchronous tagged logger.
 *
 * Callers on the coordinator, notifier and transport threads only append to
 * a pending batch; one writer thread swaps the batch out, filters it by tag
 * and writes the lines to stderr. Threads are named through set_thread_name
 * so lines read "[Coordinator]" or "[WebSocket]" instead of raw ids.
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
    auto isLoggingEnabled() const -> bool;

    // Messages carrying any skipped tag are dropped. When the enabled set is
    // non-empty, every tag of a message must be in it.
    auto setSkipTags(std::set<std::string> tags) -> void;
    auto setEnabledTags(std::set<std::string> tags) -> void;
    auto accepts(std::set<std::string> const& tags) const -> bool;

    // Blocks until everything logged before the call has been written.
    auto flush() -> void;

    auto processedCount() const -> std::uint64_t { return processed_.load(); }

    // "2024-05-01 12:00:00.042 [Tag][Other] [Thread] [dir/File.cpp:17] text\n"
    static auto formatLine(LogMessage const& msg) -> std::string;

    static std::mutex coutMutex;

private:
    auto writerLoop() -> void;
    auto threadNameFor(std::thread::id id) -> std::string;
    auto enqueue(LogMessage msg) -> void;

    mutable std::mutex      batchMutex_;
    std::condition_variable wakeCv_;
    std::condition_variable drainedCv_;
    std::vector<LogMessage> pending_;
    std::uint64_t           enqueued_ = 0;
    std::uint64_t           drained_  = 0;
    bool                    stopping_ = false;
    std::thread             writer_;

    std::atomic<bool>          enabled_{false};
    std::atomic<std::uint64_t> processed_{0};

    mutable std::mutex    tagsMutex_;
    std::set<std::string> skipTags_{"Trace"};
    std::set<std::string> enabledTags_;

    std::mutex                                       namesMutex_;
    std::unordered_map<std::thread::id, std::string> threadNames_;
    int                                              nextThreadNumber_ = 0;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabled_.load(std::memory_order_relaxed))
        return;
    this->enqueue(LogMessage{.timestamp  = std::chrono::system_clock::now(),
                             .tags       = {std::string(std::forward<Tags>(tags))...},
                             .message    = message,
                             .threadName = threadNameFor(std::this_thread::get_id()),
                             .location   = location});
}

#define oq_log(message, ...) ::OQ::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace OQ

#else
#define oq_log(message, ...) ((void)0)
#endif // OQ_LOG_DEBUG
