#pragma once
#include "core/Error.hpp"
#include "notify/ChangeEvent.hpp"
#include "path/TransparentString.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include <parallel_hashmap/phmap.h>

namespace OQ {

using ClientId = std::uint64_t;

/**
 * Fans change events out to subscribed clients.
 *
 * notify() only enqueues. A dedicated dispatch thread matches each event
 * against the subscription table and calls Subscriber::deliver. PATH_CHANGED
 * goes to clients listening on the path or one of its ancestors;
 * PATH_ADDED and PATH_REMOVED go to every connected client. Each client
 * receives an event at most once.
 */
class ChangeNotifier {
public:
    ChangeNotifier();
    ~ChangeNotifier();

    ChangeNotifier(ChangeNotifier const&)            = delete;
    ChangeNotifier& operator=(ChangeNotifier const&) = delete;

    auto addClient(std::shared_ptr<Subscriber> subscriber) -> ClientId;
    auto removeClient(ClientId client) -> void;

    [[nodiscard]] auto listen(ClientId client, std::string_view path) -> Expected<void>;
    [[nodiscard]] auto unlisten(ClientId client, std::string_view path) -> Expected<void>;

    auto notify(ChangeEvent event) -> void;

    [[nodiscard]] auto subscriberCount(std::string_view path) const -> std::size_t;
    [[nodiscard]] auto clientCount() const -> std::size_t;
    [[nodiscard]] auto failedDeliveries() const -> std::uint64_t { return failedDeliveries_.load(); }

    // Blocks until every queued event has been dispatched.
    auto flush() -> void;

    // Dispatches what is queued, then stops the thread. Later notify() calls are dropped.
    auto shutdown() -> void;

private:
    using PathSet = phmap::flat_hash_set<std::string, TransparentStringHash, std::equal_to<>>;

    struct Client {
        std::shared_ptr<Subscriber> subscriber;
        PathSet                     paths;
    };

    auto dispatchLoop() -> void;
    auto dispatch(ChangeEvent const& event) -> void;
    auto removeClientUnlocked(ClientId client) -> void;

    mutable std::mutex                     tableMutex_;
    phmap::flat_hash_map<ClientId, Client> clients_;
    phmap::flat_hash_map<std::string, phmap::flat_hash_set<ClientId>, TransparentStringHash, std::equal_to<>> listeners_;
    ClientId nextClient_ = 1;

    std::mutex              queueMutex_;
    std::condition_variable queueCv_;
    std::condition_variable drainedCv_;
    std::deque<ChangeEvent> queue_;
    bool                    dispatching_ = false;
    bool                    stopping_    = false;
    std::thread             worker_;

    std::atomic<std::uint64_t> failedDeliveries_{0};
};

} // namespace OQ
