#pragma once
#include "coordinator/Edit.hpp"
#include "core/Error.hpp"
#include "core/Tree.hpp"
#include "notify/ChangeEvent.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace OQ {

class ChangeNotifier;

/**
 * Marks the current thread as running inside a transport receive callback.
 *
 * While a scope is alive, MutationCoordinator::apply refuses to block and
 * returns Reentrancy; callbacks must use post().
 */
class TransportScope {
public:
    TransportScope();
    ~TransportScope();

    TransportScope(TransportScope const&)            = delete;
    TransportScope& operator=(TransportScope const&) = delete;

    [[nodiscard]] static auto active() -> bool;
};

/**
 * Single writer for the Tree.
 *
 * Every structural or content edit is queued on one FIFO and applied by a
 * dedicated executor thread, which holds the exclusive side of the tree lock
 * only while an edit runs. Readers go through read() under the shared side.
 *
 * After a committed change the executor renders the affected node's
 * attribute view and enqueues events on the ChangeNotifier before the
 * submitter's future is satisfied.
 */
class MutationCoordinator {
public:
    using AttributeRenderer = std::function<nlohmann::json(Node const&)>;

    explicit MutationCoordinator(ChangeNotifier* notifier = nullptr, AttributeRenderer renderer = {});
    ~MutationCoordinator();

    MutationCoordinator(MutationCoordinator const&)            = delete;
    MutationCoordinator& operator=(MutationCoordinator const&) = delete;

    [[nodiscard]] auto submit(Edit edit) -> std::future<Expected<EditResult>>;

    // Fire-and-forget; failures are logged and counted.
    auto post(Edit edit) -> void;

    // Blocking submit for host code. Rejected on the executor thread and inside a TransportScope.
    [[nodiscard]] auto apply(Edit edit) -> Expected<EditResult>;

    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(std::forward<Fn>(fn)(std::declval<Tree const&>())) {
        std::shared_lock<std::shared_mutex> lock(treeMutex_);
        return std::forward<Fn>(fn)(std::as_const(*tree_));
    }

    // Stops accepting edits, drains the queue and joins the executor.
    auto shutdown() -> void;

    [[nodiscard]] auto isExecutorThread() const -> bool;
    [[nodiscard]] auto appliedCount() const -> std::uint64_t { return applied_.load(); }
    [[nodiscard]] auto failedPostCount() const -> std::uint64_t { return failedPosts_.load(); }

private:
    struct Job {
        Edit                                              edit;
        std::optional<std::promise<Expected<EditResult>>> promise;
    };

    auto enqueue(Job job) -> std::optional<Job>;
    auto run() -> void;
    auto execute(Edit const& edit, std::vector<ChangeEvent>& events) -> Expected<EditResult>;
    auto executeSingle(SingleEdit const& edit, std::vector<ChangeEvent>& events) -> Expected<EditResult>;
    auto renderChanged(std::string const& path, std::vector<ChangeEvent>& events) -> void;

    std::unique_ptr<Tree>     tree_;
    mutable std::shared_mutex treeMutex_;

    ChangeNotifier*   notifier_;
    AttributeRenderer renderer_;

    std::mutex              queueMutex_;
    std::condition_variable queueCv_;
    std::deque<Job>         queue_;
    bool                    accepting_ = true;
    std::thread             worker_;
    std::thread::id         workerId_;

    std::atomic<std::uint64_t> applied_{0};
    std::atomic<std::uint64_t> failedPosts_{0};
};

} // namespace OQ
