#ifdef OQ_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace OQ {

namespace {

// Parent directory plus file name, e.g. "server/HttpService.cpp".
auto shortSourcePath(const char* file) -> std::string {
    std::filesystem::path path{file};
    if (!path.has_parent_path())
        return path.filename().string();
    return (path.parent_path().filename() / path.filename()).string();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    writer_ = std::thread([this] { this->writerLoop(); });
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(batchMutex_);
        stopping_ = true;
    }
    wakeCv_.notify_one();
    if (writer_.joinable())
        writer_.join();
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(namesMutex_);
    threadNames_[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    enabled_.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return enabled_.load(std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(tagsMutex_);
    skipTags_ = std::move(tags);
}

auto TaggedLogger::setEnabledTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(tagsMutex_);
    enabledTags_ = std::move(tags);
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    std::lock_guard<std::mutex> lock(tagsMutex_);
    for (auto const& tag : tags) {
        if (skipTags_.contains(tag))
            return false;
        if (!enabledTags_.empty() && !enabledTags_.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::enqueue(LogMessage msg) -> void {
    {
        std::lock_guard<std::mutex> lock(batchMutex_);
        pending_.push_back(std::move(msg));
        ++enqueued_;
    }
    wakeCv_.notify_one();
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(batchMutex_);
    auto const                   target = enqueued_;
    drainedCv_.wait(lock, [this, target] { return drained_ >= target || stopping_; });
}

auto TaggedLogger::writerLoop() -> void {
    std::vector<LogMessage> batch;
    std::unique_lock<std::mutex> lock(batchMutex_);
    while (true) {
        wakeCv_.wait(lock, [this] { return !pending_.empty() || stopping_; });
        if (pending_.empty() && stopping_)
            break;

        batch.swap(pending_);
        lock.unlock();
        std::string lines;
        for (auto const& msg : batch) {
            if (this->accepts(msg.tags))
                lines += formatLine(msg);
        }
        if (!lines.empty()) {
            std::lock_guard<std::mutex> out(coutMutex);
            std::cerr << lines << std::flush;
        }
        auto const count = batch.size();
        batch.clear();
        lock.lock();

        drained_ += count;
        processed_.fetch_add(count);
        drainedCv_.notify_all();
    }
    drainedCv_.notify_all();
}

auto TaggedLogger::formatLine(LogMessage const& msg) -> std::string {
    auto const  millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    auto const  time   = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm     local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    oss << '[';
    bool first = true;
    for (auto const& tag : msg.tags) {
        if (!first)
            oss << "][";
        oss << tag;
        first = false;
    }
    oss << "] [" << msg.threadName << "] [" << shortSourcePath(msg.location.file_name()) << ':' << msg.location.line()
        << "] " << msg.message << '\n';
    return oss.str();
}

auto TaggedLogger::threadNameFor(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(namesMutex_);
    auto [it, inserted] = threadNames_.try_emplace(id);
    if (inserted)
        it->second = "Thread " + std::to_string(nextThreadNumber_++);
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace OQ
#endif // OQ_LOG_DEBUG
