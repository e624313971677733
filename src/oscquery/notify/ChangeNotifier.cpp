#include "ChangeNotifier.hpp"
#include "log/TaggedLogger.hpp"
#include "path/Path.hpp"

#include <vector>

namespace OQ {

ChangeNotifier::ChangeNotifier() {
    worker_ = std::thread([this] { dispatchLoop(); });
}

ChangeNotifier::~ChangeNotifier() {
    shutdown();
}

auto ChangeNotifier::addClient(std::shared_ptr<Subscriber> subscriber) -> ClientId {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto const                  id = nextClient_++;
    clients_.emplace(id, Client{std::move(subscriber), {}});
    oq_log("client " + std::to_string(id) + " connected", "Notifier");
    return id;
}

auto ChangeNotifier::removeClient(ClientId client) -> void {
    std::lock_guard<std::mutex> lock(tableMutex_);
    removeClientUnlocked(client);
}

auto ChangeNotifier::removeClientUnlocked(ClientId client) -> void {
    auto it = clients_.find(client);
    if (it == clients_.end())
        return;
    for (auto const& path : it->second.paths) {
        auto listenerIt = listeners_.find(path);
        if (listenerIt == listeners_.end())
            continue;
        listenerIt->second.erase(client);
        if (listenerIt->second.empty())
            listeners_.erase(listenerIt);
    }
    clients_.erase(it);
    oq_log("client " + std::to_string(client) + " removed", "Notifier");
}

auto ChangeNotifier::listen(ClientId client, std::string_view path) -> Expected<void> {
    if (auto checked = checkAddress(path); !checked)
        return std::unexpected(checked.error());
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto                        it = clients_.find(client);
    if (it == clients_.end())
        return std::unexpected(Error{Error::Code::NotFound, "unknown client " + std::to_string(client)});
    it->second.paths.emplace(path);
    auto listenerIt = listeners_.find(path);
    if (listenerIt == listeners_.end())
        listenerIt = listeners_.emplace(std::string{path}, phmap::flat_hash_set<ClientId>{}).first;
    listenerIt->second.insert(client);
    oq_log("client " + std::to_string(client) + " LISTEN " + std::string{path}, "Notifier");
    return {};
}

auto ChangeNotifier::unlisten(ClientId client, std::string_view path) -> Expected<void> {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto                        it = clients_.find(client);
    if (it == clients_.end())
        return std::unexpected(Error{Error::Code::NotFound, "unknown client " + std::to_string(client)});
    auto pathIt = it->second.paths.find(path);
    if (pathIt == it->second.paths.end())
        return {};
    it->second.paths.erase(pathIt);
    auto listenerIt = listeners_.find(path);
    if (listenerIt != listeners_.end()) {
        listenerIt->second.erase(client);
        if (listenerIt->second.empty())
            listeners_.erase(listenerIt);
    }
    oq_log("client " + std::to_string(client) + " IGNORE " + std::string{path}, "Notifier");
    return {};
}

auto ChangeNotifier::notify(ChangeEvent event) -> void {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (stopping_)
        return;
    queue_.push_back(std::move(event));
    queueCv_.notify_one();
}

auto ChangeNotifier::subscriberCount(std::string_view path) const -> std::size_t {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto                        it = listeners_.find(path);
    return it == listeners_.end() ? 0 : it->second.size();
}

auto ChangeNotifier::clientCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return clients_.size();
}

auto ChangeNotifier::flush() -> void {
    std::unique_lock<std::mutex> lock(queueMutex_);
    drainedCv_.wait(lock, [this] { return queue_.empty() && !dispatching_; });
}

auto ChangeNotifier::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stopping_)
            return;
        stopping_ = true;
        queueCv_.notify_all();
    }
    if (worker_.joinable())
        worker_.join();
    drainedCv_.notify_all();
}

auto ChangeNotifier::dispatchLoop() -> void {
#ifdef OQ_LOG_DEBUG
    set_thread_name("Notifier");
#endif
    std::unique_lock<std::mutex> lock(queueMutex_);
    while (true) {
        queueCv_.wait(lock, [this] { return !queue_.empty() || stopping_; });
        if (queue_.empty() && stopping_)
            break;
        auto event = std::move(queue_.front());
        queue_.pop_front();
        dispatching_ = true;
        lock.unlock();
        dispatch(event);
        lock.lock();
        dispatching_ = false;
        if (queue_.empty())
            drainedCv_.notify_all();
    }
    drainedCv_.notify_all();
}

auto ChangeNotifier::dispatch(ChangeEvent const& event) -> void {
    std::vector<std::pair<ClientId, std::shared_ptr<Subscriber>>> recipients;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        if (event.kind == ChangeEvent::Kind::PathChanged) {
            phmap::flat_hash_set<ClientId> seen;
            std::string_view                prefix = event.path;
            while (true) {
                if (auto it = listeners_.find(prefix); it != listeners_.end()) {
                    for (auto client : it->second) {
                        if (!seen.insert(client).second)
                            continue;
                        if (auto clientIt = clients_.find(client); clientIt != clients_.end())
                            recipients.emplace_back(client, clientIt->second.subscriber);
                    }
                }
                if (prefix == "/")
                    break;
                prefix = parentOf(prefix);
            }
        } else {
            for (auto const& [id, client] : clients_)
                recipients.emplace_back(id, client.subscriber);
        }
    }

    for (auto const& [client, subscriber] : recipients) {
        if (subscriber && subscriber->deliver(event))
            continue;
        ++failedDeliveries_;
        oq_log("delivery of " + std::string{eventKindToString(event.kind)} + " " + event.path + " to client "
                   + std::to_string(client) + " failed, dropping client",
               "Notifier");
        removeClient(client);
    }
}

} // namespace OQ
