#include "WebSocketService.hpp"
#include "coordinator/MutationCoordinator.hpp"
#include "log/TaggedLogger.hpp"
#include "osc/OscCodec.hpp"
#include "path/Path.hpp"
#include "server/InboundOsc.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

namespace OQ {

namespace {

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto upper(std::string_view text) -> std::string {
    std::string out{text};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

auto commandFromKeyword(std::string_view keyword, std::string_view path) -> Expected<WsCommand> {
    auto const name = upper(keyword);
    WsCommand  command;
    if (name == "LISTEN")
        command.kind = WsCommand::Kind::Listen;
    else if (name == "IGNORE" || name == "UNLISTEN")
        command.kind = WsCommand::Kind::Ignore;
    else
        return std::unexpected(Error{Error::Code::MalformedInput, "unknown command '" + std::string{keyword} + "'"});
    if (auto checked = checkAddress(path); !checked)
        return std::unexpected(checked.error());
    command.path = std::string{path};
    return command;
}

lws_protocols const protocols[] = {
        {"oscquery", &WebSocketService::callback, 0, 4096, 0, nullptr, 0},
        {nullptr, nullptr, 0, 0, 0, nullptr, 0},
};

} // namespace

struct WsFrame {
    bool        binary = false;
    std::string payload;
};

class WebSocketService::Session final : public Subscriber {
public:
    Session(std::size_t limit, std::function<void()> wake) : limit_(limit), wake_(std::move(wake)) {}

    auto deliver(ChangeEvent const& event) -> bool override {
        return this->push(WsFrame{false, toJson(event).dump()});
    }

    // Fails once the outbox is full; the connection is then closed on the next writable callback.
    auto push(WsFrame frame) -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || dropped_)
            return false;
        if (outbox_.size() >= limit_) {
            dropped_ = true;
            outbox_.clear();
        } else {
            outbox_.push_back(std::move(frame));
        }
        if (wake_)
            wake_();
        return !dropped_;
    }

    auto pop() -> std::optional<WsFrame> {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outbox_.empty())
            return std::nullopt;
        auto frame = std::move(outbox_.front());
        outbox_.pop_front();
        return frame;
    }

    [[nodiscard]] auto wantsWrite() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_ || !outbox_.empty();
    }

    [[nodiscard]] auto dropped() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    auto close() -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        outbox_.clear();
        wake_ = nullptr;
    }

    auto addPath(std::string const& path) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        paths_.insert(path);
    }

    auto removePath(std::string const& path) -> void {
        std::lock_guard<std::mutex> lock(mutex_);
        paths_.erase(path);
    }

    [[nodiscard]] auto listensOn(std::string_view path) const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return paths_.find(path) != paths_.end();
    }

    ClientId    client = 0;
    std::string inbound;

private:
    mutable std::mutex                  mutex_;
    std::deque<WsFrame>                 outbox_;
    std::set<std::string, std::less<>>  paths_;
    std::size_t                         limit_;
    std::function<void()>               wake_;
    bool                                closed_  = false;
    bool                                dropped_ = false;
};

WebSocketService::WebSocketService(ChangeNotifier& notifier, MutationCoordinator& coordinator, Options options)
    : notifier_(notifier), coordinator_(coordinator), options_(std::move(options)) {}

WebSocketService::~WebSocketService() {
    this->stop();
}

auto WebSocketService::parseCommand(std::string_view text) -> Expected<WsCommand> {
    text = trim(text);
    if (text.empty())
        return std::unexpected(Error{Error::Code::MalformedInput, "empty command"});

    if (text.front() == '{') {
        auto json = nlohmann::json::parse(text, nullptr, false);
        if (json.is_discarded() || !json.is_object())
            return std::unexpected(Error{Error::Code::MalformedInput, "command is not a JSON object"});
        auto command = json.find("COMMAND");
        auto data    = json.find("DATA");
        if (command == json.end() || !command->is_string() || data == json.end() || !data->is_string())
            return std::unexpected(Error{Error::Code::MalformedInput, "command needs string COMMAND and DATA"});
        return commandFromKeyword(command->get<std::string>(), data->get<std::string>());
    }

    auto const space = text.find_first_of(" \t");
    if (space == std::string_view::npos)
        return std::unexpected(Error{Error::Code::MalformedInput, "command needs a path"});
    return commandFromKeyword(text.substr(0, space), trim(text.substr(space + 1)));
}

auto WebSocketService::start() -> Expected<void> {
    if (context_)
        return std::unexpected(Error{Error::Code::Conflict, "WebSocket service already running"});

    lws_set_log_level(LLL_ERR | LLL_WARN, nullptr);

    lws_context_creation_info info;
    std::memset(&info, 0, sizeof info);
    info.port      = options_.port < 0 ? 0 : options_.port;
    info.iface     = options_.host == "0.0.0.0" ? nullptr : options_.host.c_str();
    info.protocols = protocols;
    info.user      = this;
    info.gid       = -1;
    info.uid       = -1;

    context_ = lws_create_context(&info);
    if (!context_) {
        return std::unexpected(Error{Error::Code::UnknownError,
                                     "Failed to create WebSocket context on " + options_.host + ":"
                                         + std::to_string(options_.port)});
    }

    auto const listen = lws_get_vhost_listen_port(lws_get_vhost_by_name(context_, "default"));
    bound_port_       = static_cast<std::uint16_t>(listen > 0 ? listen : options_.port);

    stopping_.store(false);
    running_.store(true);
    thread_ = std::thread([this]() { this->serviceLoop(); });

    oq_log("WebSocket service listening on " + options_.host + ":" + std::to_string(bound_port_), "WebSocket");
    return {};
}

auto WebSocketService::stop() -> void {
    if (!context_)
        return;
    stopping_.store(true);
    this->wake();
    if (thread_.joinable())
        thread_.join();

    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (auto const& [wsi, session] : sessions_)
            session->close();
    }
    // Fires LWS_CALLBACK_CLOSED for every open connection.
    lws_context_destroy(context_);
    context_ = nullptr;

    std::vector<std::shared_ptr<Session>> leftover;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        for (auto& [wsi, session] : sessions_)
            leftover.push_back(std::move(session));
        sessions_.clear();
    }
    for (auto const& session : leftover)
        notifier_.removeClient(session->client);

    bound_port_ = 0;
    running_.store(false);
    oq_log("WebSocket service stopped", "WebSocket");
}

auto WebSocketService::sessionCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

auto WebSocketService::relay(std::string_view path, std::span<std::byte const> packet) -> std::size_t {
    std::string payload(reinterpret_cast<char const*>(packet.data()), packet.size());
    std::size_t sent = 0;
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    for (auto const& [wsi, session] : sessions_) {
        if (!session->listensOn(path))
            continue;
        if (session->push(WsFrame{true, payload}))
            ++sent;
    }
    return sent;
}

auto WebSocketService::wake() -> void {
    if (context_)
        lws_cancel_service(context_);
}

auto WebSocketService::serviceLoop() -> void {
#ifdef OQ_LOG_DEBUG
    set_thread_name("WebSocket");
#endif
    while (!stopping_.load()) {
        if (lws_service(context_, 0) < 0)
            break;
    }
}

auto WebSocketService::callback(lws* wsi, lws_callback_reasons reason, void*, void* in, std::size_t len) -> int {
    auto* context = lws_get_context(wsi);
    auto* self    = context ? static_cast<WebSocketService*>(lws_context_user(context)) : nullptr;
    if (!self)
        return 0;

    switch (reason) {
        case LWS_CALLBACK_ESTABLISHED:
            self->onEstablished(wsi);
            break;
        case LWS_CALLBACK_RECEIVE:
            return self->onReceive(wsi, static_cast<char const*>(in), len);
        case LWS_CALLBACK_SERVER_WRITEABLE:
            return self->onWritable(wsi);
        case LWS_CALLBACK_CLOSED:
            self->onClosed(wsi);
            break;
        case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
            self->onWakeup();
            break;
        default:
            break;
    }
    return 0;
}

auto WebSocketService::onEstablished(lws* wsi) -> void {
    auto session    = std::make_shared<Session>(options_.max_pending_events, [this]() { this->wake(); });
    session->client = notifier_.addClient(session);
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions_[wsi] = session;
    }
    oq_log("WebSocket client " + std::to_string(session->client) + " connected", "WebSocket");
}

auto WebSocketService::onReceive(lws* wsi, char const* data, std::size_t len) -> int {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        if (auto it = sessions_.find(wsi); it != sessions_.end())
            session = it->second;
    }
    if (!session)
        return 0;

    if (len > options_.max_message_bytes - std::min(session->inbound.size(), options_.max_message_bytes)) {
        oq_log("client " + std::to_string(session->client) + " message exceeds "
                   + std::to_string(options_.max_message_bytes) + " bytes, closing",
               "WebSocket");
        session->inbound.clear();
        session->inbound.shrink_to_fit();
        return -1;
    }
    session->inbound.append(data, len);
    if (!lws_is_final_fragment(wsi) || lws_remaining_packet_payload(wsi) > 0)
        return 0;

    auto message = std::move(session->inbound);
    session->inbound.clear();
    if (lws_frame_is_binary(wsi)) {
        this->handleBinary(std::as_bytes(std::span{message.data(), message.size()}));
    } else {
        this->handleText(*session, message);
    }
    return 0;
}

auto WebSocketService::handleText(Session& session, std::string_view text) -> void {
    auto command = parseCommand(text);
    if (!command) {
        oq_log("client " + std::to_string(session.client) + ": " + describeError(command.error()), "WebSocket");
        return;
    }
    if (command->kind == WsCommand::Kind::Listen) {
        if (auto listened = notifier_.listen(session.client, command->path); !listened) {
            oq_log("LISTEN " + command->path + ": " + describeError(listened.error()), "WebSocket");
            return;
        }
        session.addPath(command->path);
    } else {
        if (auto ignored = notifier_.unlisten(session.client, command->path); !ignored) {
            oq_log("IGNORE " + command->path + ": " + describeError(ignored.error()), "WebSocket");
            return;
        }
        session.removePath(command->path);
    }
}

auto WebSocketService::handleBinary(std::span<std::byte const> data) -> void {
    auto packet = decodePacket(data);
    if (!packet) {
        oq_log("binary frame: " + describeError(packet.error()), "WebSocket");
        return;
    }
    TransportScope scope;
    coordinator_.post(editFromPacket(std::move(*packet)));
}

auto WebSocketService::onWritable(lws* wsi) -> int {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        if (auto it = sessions_.find(wsi); it != sessions_.end())
            session = it->second;
    }
    if (!session)
        return 0;
    if (session->dropped()) {
        oq_log("client " + std::to_string(session->client) + " outbox overflow, closing", "WebSocket");
        return -1;
    }

    auto frame = session->pop();
    if (!frame)
        return 0;

    std::vector<unsigned char> buf(LWS_PRE + frame->payload.size());
    std::memcpy(&buf[LWS_PRE], frame->payload.data(), frame->payload.size());
    auto const n = lws_write(wsi, &buf[LWS_PRE], frame->payload.size(), frame->binary ? LWS_WRITE_BINARY : LWS_WRITE_TEXT);
    if (n < static_cast<int>(frame->payload.size()))
        return -1;

    if (session->wantsWrite())
        lws_callback_on_writable(wsi);
    return 0;
}

auto WebSocketService::onClosed(lws* wsi) -> void {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        if (auto it = sessions_.find(wsi); it != sessions_.end()) {
            session = std::move(it->second);
            sessions_.erase(it);
        }
    }
    if (!session)
        return;
    session->close();
    notifier_.removeClient(session->client);
    oq_log("WebSocket client " + std::to_string(session->client) + " disconnected", "WebSocket");
}

auto WebSocketService::onWakeup() -> void {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    for (auto const& [wsi, session] : sessions_) {
        if (session->wantsWrite())
            lws_callback_on_writable(wsi);
    }
}

} // namespace OQ
