#pragma once

#include "core/Error.hpp"
#include "notify/ChangeNotifier.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

#include <libwebsockets.h>

namespace OQ {

class MutationCoordinator;

// A control command received on a text frame.
struct WsCommand {
    enum class Kind {
        Listen,
        Ignore,
    };
    Kind        kind = Kind::Listen;
    std::string path;
};

/**
 * WebSocket control channel over libwebsockets.
 *
 * One service thread owns the lws context and every connection. Each
 * connection registers a Subscriber with the ChangeNotifier; events are
 * queued on a bounded per-connection outbox and written when lws reports the
 * socket writable. Other threads only touch the outbox and wake the service
 * loop with lws_cancel_service.
 *
 * Text frames carry LISTEN / IGNORE / UNLISTEN commands. Binary frames carry
 * OSC packets and are posted to the coordinator like UDP input.
 */
class WebSocketService {
public:
    struct Options {
        std::string host               = "0.0.0.0";
        int         port               = 5679; // 0 binds an ephemeral port
        std::size_t max_pending_events = 256;
        // Fragments are reassembled up to this size; a larger message closes the connection.
        std::size_t max_message_bytes = 65536;
    };

    WebSocketService(ChangeNotifier& notifier, MutationCoordinator& coordinator, Options options);
    ~WebSocketService();

    WebSocketService(WebSocketService const&)            = delete;
    WebSocketService& operator=(WebSocketService const&) = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;

    [[nodiscard]] auto is_running() const -> bool { return running_.load(); }
    [[nodiscard]] auto port() const -> std::uint16_t { return bound_port_; }
    [[nodiscard]] auto sessionCount() const -> std::size_t;

    // Sends an encoded OSC packet as a binary frame to connections listening on exactly `path`.
    auto relay(std::string_view path, std::span<std::byte const> packet) -> std::size_t;

    // Accepts {"COMMAND":"LISTEN","DATA":"/p"} or "LISTEN /p"; UNLISTEN is an alias of IGNORE.
    [[nodiscard]] static auto parseCommand(std::string_view text) -> Expected<WsCommand>;

    // libwebsockets protocol callback; the service is recovered from the context user pointer.
    static auto callback(lws* wsi, lws_callback_reasons reason, void* user, void* in, std::size_t len) -> int;

private:
    class Session;

    auto serviceLoop() -> void;
    auto wake() -> void;

    auto onEstablished(lws* wsi) -> void;
    auto onReceive(lws* wsi, char const* data, std::size_t len) -> int;
    auto onWritable(lws* wsi) -> int;
    auto onClosed(lws* wsi) -> void;
    auto onWakeup() -> void;

    auto handleText(Session& session, std::string_view text) -> void;
    auto handleBinary(std::span<std::byte const> data) -> void;

    ChangeNotifier&      notifier_;
    MutationCoordinator& coordinator_;
    Options              options_;

    lws_context*      context_ = nullptr;
    std::thread       thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
    std::uint16_t     bound_port_ = 0;

    // Owned by the service thread; relay() and sessionCount() read under sessionsMutex_.
    mutable std::mutex                                 sessionsMutex_;
    std::unordered_map<lws*, std::shared_ptr<Session>> sessions_;
};

} // namespace OQ
