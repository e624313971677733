#pragma once

#include "coordinator/Edit.hpp"
#include "core/Error.hpp"
#include "core/NodeAttributes.hpp"
#include "notify/ChangeEvent.hpp"
#include "notify/ChangeNotifier.hpp"
#include "query/QueryParam.hpp"
#include "server/HostInfo.hpp"
#include "type/OscValue.hpp"

#include <oscquery/server/OscQueryOptions.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace OQ {

class HttpService;
class MutationCoordinator;
class OscUdpService;
class QueryResolver;
class ServiceAdvertiser;
class WebSocketService;

/**
 * Owns the namespace and every transport.
 *
 * Nodes may be declared before start(); the tree lives as long as the
 * server object. start() binds OSC/UDP, WebSocket and HTTP (in that order,
 * so HOST_INFO reports the bound ports) and then hands the service records
 * to the advertiser, if one was supplied. stop() tears the transports down
 * and keeps the tree.
 *
 * The blocking calls (addNode, removeNode, setValue, apply) must not be made
 * from a transport callback or an observe() callback; use post() there.
 */
class OscQueryServer {
public:
    using Observer = std::function<void(ChangeEvent const&)>;

    explicit OscQueryServer(OscQueryOptions options, ServiceAdvertiser* advertiser = nullptr);
    ~OscQueryServer();

    OscQueryServer(OscQueryServer const&)            = delete;
    OscQueryServer& operator=(OscQueryServer const&) = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;
    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto addNode(std::string path, NodeAttributes attributes) -> Expected<EditResult>;
    [[nodiscard]] auto removeNode(std::string path) -> Expected<EditResult>;
    [[nodiscard]] auto setValue(std::string path, OscValues values) -> Expected<EditResult>;
    [[nodiscard]] auto apply(Edit edit) -> Expected<EditResult>;
    auto post(Edit edit) -> void;

    // Sends the node's current value to every --osc-send target and to WebSocket clients listening on it.
    [[nodiscard]] auto trigger(std::string_view path) -> Expected<std::size_t>;

    // In-process subscriber; the callback runs on the notifier thread.
    [[nodiscard]] auto observe(std::string_view path, Observer observer) -> Expected<ClientId>;
    auto unobserve(ClientId client) -> void;

    [[nodiscard]] auto query(std::string_view path, std::optional<QueryParam> param = std::nullopt) const
            -> Expected<nlohmann::json>;
    [[nodiscard]] auto hostInfo() const -> HostInfo;

    [[nodiscard]] auto httpPort() const -> std::uint16_t;
    [[nodiscard]] auto oscPort() const -> std::uint16_t;
    [[nodiscard]] auto wsPort() const -> std::uint16_t;

    // Blocks until queued notifications have been delivered.
    auto flushNotifications() -> void;

    [[nodiscard]] auto options() const -> OscQueryOptions const& { return options_; }

private:
    auto makeHostInfo() const -> HostInfo;

    OscQueryOptions    options_;
    ServiceAdvertiser* advertiser_;

    std::unique_ptr<ChangeNotifier>      notifier_;
    std::unique_ptr<MutationCoordinator> coordinator_;
    std::unique_ptr<QueryResolver>       resolver_;

    mutable std::mutex                lifecycleMutex_;
    std::unique_ptr<OscUdpService>    osc_;
    std::unique_ptr<WebSocketService> ws_;
    std::unique_ptr<HttpService>      http_;
    bool                              advertised_ = false;
};

// Runs a server with `options` until RequestOscQueryStop(); `declare` seeds the namespace before start.
int RunOscQueryServer(OscQueryOptions const& options, std::function<void(OscQueryServer&)> const& declare = {});

void RequestOscQueryStop();
void ResetOscQueryStopFlag();

} // namespace OQ
