#include "MutationCoordinator.hpp"
#include "log/TaggedLogger.hpp"
#include "notify/ChangeNotifier.hpp"

namespace OQ {

namespace {

thread_local int transportScopeDepth = 0;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto readyFuture(Expected<EditResult> result) -> std::future<Expected<EditResult>> {
    std::promise<Expected<EditResult>> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

TransportScope::TransportScope() {
    ++transportScopeDepth;
}

TransportScope::~TransportScope() {
    --transportScopeDepth;
}

auto TransportScope::active() -> bool {
    return transportScopeDepth > 0;
}

auto editPath(SingleEdit const& edit) -> std::string const& {
    return std::visit([](auto const& e) -> std::string const& { return e.path; }, edit);
}

auto describeEdit(Edit const& edit) -> std::string {
    return std::visit(Overloaded{
                          [](InsertEdit const& e) { return "insert " + e.path; },
                          [](RemoveEdit const& e) { return "remove " + e.path; },
                          [](SetValueEdit const& e) { return "set " + e.path; },
                          [](BatchEdit const& e) { return "batch of " + std::to_string(e.edits.size()); },
                      },
                      edit);
}

MutationCoordinator::MutationCoordinator(ChangeNotifier* notifier, AttributeRenderer renderer)
    : tree_(std::make_unique<Tree>()), notifier_(notifier), renderer_(std::move(renderer)) {
    worker_   = std::thread([this] { run(); });
    workerId_ = worker_.get_id();
}

MutationCoordinator::~MutationCoordinator() {
    shutdown();
}

auto MutationCoordinator::enqueue(Job job) -> std::optional<Job> {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (!accepting_)
        return std::optional<Job>{std::move(job)};
    queue_.push_back(std::move(job));
    queueCv_.notify_one();
    return std::nullopt;
}

auto MutationCoordinator::submit(Edit edit) -> std::future<Expected<EditResult>> {
    std::promise<Expected<EditResult>> promise;
    auto                               future = promise.get_future();
    if (enqueue(Job{std::move(edit), std::move(promise)}))
        return readyFuture(std::unexpected(Error{Error::Code::ShuttingDown, "coordinator is shutting down"}));
    return future;
}

auto MutationCoordinator::post(Edit edit) -> void {
    auto description = describeEdit(edit);
    if (enqueue(Job{std::move(edit), std::nullopt})) {
        ++failedPosts_;
        oq_log("dropped " + description + ": coordinator is shutting down", "Coordinator", "Error");
    }
}

auto MutationCoordinator::apply(Edit edit) -> Expected<EditResult> {
    if (isExecutorThread())
        return std::unexpected(Error{Error::Code::Reentrancy, "apply called on the coordinator executor thread"});
    if (TransportScope::active())
        return std::unexpected(Error{Error::Code::Reentrancy, "apply called inside a transport or observer callback; use post"});
    return submit(std::move(edit)).get();
}

auto MutationCoordinator::isExecutorThread() const -> bool {
    return std::this_thread::get_id() == workerId_;
}

auto MutationCoordinator::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!accepting_)
            return;
        accepting_ = false;
        queueCv_.notify_all();
    }
    if (worker_.joinable() && !isExecutorThread())
        worker_.join();
}

auto MutationCoordinator::run() -> void {
#ifdef OQ_LOG_DEBUG
    set_thread_name("Coordinator");
#endif
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this] { return !queue_.empty() || !accepting_; });
            if (queue_.empty())
                return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        std::vector<ChangeEvent> events;
        Expected<EditResult>     result = [&] {
            std::unique_lock<std::shared_mutex> writeLock(treeMutex_);
            return execute(job.edit, events);
        }();

        if (notifier_) {
            for (auto& event : events)
                notifier_->notify(std::move(event));
        }

        if (result) {
            ++applied_;
        } else {
            oq_log(describeEdit(job.edit) + " rejected: " + describeError(result.error()), "Coordinator");
            if (!job.promise)
                ++failedPosts_;
        }
        if (job.promise)
            job.promise->set_value(std::move(result));
    }
}

auto MutationCoordinator::execute(Edit const& edit, std::vector<ChangeEvent>& events) -> Expected<EditResult> {
    return std::visit(Overloaded{
                          [&](BatchEdit const& batch) -> Expected<EditResult> {
                              EditResult combined;
                              combined.memberErrors.reserve(batch.edits.size());
                              for (auto const& member : batch.edits) {
                                  auto result = executeSingle(member, events);
                                  if (!result) {
                                      oq_log("batch member " + editPath(member) + " rejected: " + describeError(result.error()),
                                             "Coordinator");
                                      combined.memberErrors.emplace_back(result.error());
                                      continue;
                                  }
                                  combined.memberErrors.emplace_back(std::nullopt);
                                  combined.changed = combined.changed || result->changed;
                                  combined.added.insert(combined.added.end(), result->added.begin(), result->added.end());
                                  combined.removed.insert(combined.removed.end(), result->removed.begin(), result->removed.end());
                              }
                              return combined;
                          },
                          [&](auto const& single) -> Expected<EditResult> { return executeSingle(SingleEdit{single}, events); },
                      },
                      edit);
}

auto MutationCoordinator::executeSingle(SingleEdit const& edit, std::vector<ChangeEvent>& events) -> Expected<EditResult> {
    return std::visit(
        Overloaded{
            [&](InsertEdit const& e) -> Expected<EditResult> {
                auto outcome = tree_->insert(e.path, e.attributes);
                if (!outcome)
                    return std::unexpected(outcome.error());
                EditResult result;
                result.added   = std::move(outcome->added);
                result.changed = !result.added.empty() || outcome->replaced;
                for (auto const& path : result.added)
                    events.push_back(ChangeEvent::added(path));
                if (outcome->replaced)
                    renderChanged(e.path, events);
                return result;
            },
            [&](RemoveEdit const& e) -> Expected<EditResult> {
                auto removed = tree_->remove(e.path);
                if (!removed)
                    return std::unexpected(removed.error());
                EditResult result;
                result.removed = std::move(*removed);
                result.changed = true;
                for (auto const& path : result.removed)
                    events.push_back(ChangeEvent::removed(path));
                return result;
            },
            [&](SetValueEdit const& e) -> Expected<EditResult> {
                auto outcome = tree_->setValue(e.path, e.values);
                if (!outcome)
                    return std::unexpected(outcome.error());
                EditResult result;
                result.changed = outcome->changed;
                result.stored  = std::move(outcome->stored);
                if (result.changed)
                    renderChanged(e.path, events);
                return result;
            },
        },
        edit);
}

auto MutationCoordinator::renderChanged(std::string const& path, std::vector<ChangeEvent>& events) -> void {
    if (!notifier_)
        return;
    auto const* node = tree_->resolve(path);
    if (!node)
        return;
    events.push_back(ChangeEvent::changed(node->fullPath, renderer_ ? renderer_(*node) : nlohmann::json::object()));
}

} // namespace OQ
