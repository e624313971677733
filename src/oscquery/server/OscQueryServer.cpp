#include <oscquery/server/OscQueryServer.hpp>

#include "coordinator/MutationCoordinator.hpp"
#include "log/TaggedLogger.hpp"
#include "osc/OscCodec.hpp"
#include "query/QueryResolver.hpp"
#include "server/HttpService.hpp"
#include "server/OscUdpService.hpp"
#include "server/ServiceAdvertiser.hpp"
#include "server/WebSocketService.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <thread>

namespace OQ {

static std::atomic<bool> g_should_stop{false};

namespace {

struct CallbackSubscriber final : Subscriber {
    explicit CallbackSubscriber(OscQueryServer::Observer fn) : observer(std::move(fn)) {}

    // Observers run on the notifier thread: apply() is refused there and a
    // throwing observer stays subscribed.
    auto deliver(ChangeEvent const& event) -> bool override {
        TransportScope scope;
        try {
            observer(event);
        } catch (std::exception const& e) {
            oq_log("observer of " + event.path + " threw: " + e.what(), "Server", "Error");
        }
        return true;
    }

    OscQueryServer::Observer observer;
};

} // namespace

OscQueryServer::OscQueryServer(OscQueryOptions options, ServiceAdvertiser* advertiser)
    : options_(std::move(options)), advertiser_(advertiser) {
    notifier_    = std::make_unique<ChangeNotifier>();
    auto depth   = options_.contents_depth;
    coordinator_ = std::make_unique<MutationCoordinator>(
            notifier_.get(), [depth](Node const& node) { return QueryResolver::renderNode(node, depth); });
    resolver_ = std::make_unique<QueryResolver>(*coordinator_, this->makeHostInfo(), options_.contents_depth);
}

OscQueryServer::~OscQueryServer() {
    this->stop();
    coordinator_->shutdown();
    notifier_->shutdown();
}

auto OscQueryServer::makeHostInfo() const -> HostInfo {
    HostInfo info;
    info.name    = options_.name;
    info.oscIp   = options_.host;
    info.oscPort = osc_ ? osc_->port() : static_cast<std::uint16_t>(options_.osc_port);
    info.wsIp    = options_.host;
    info.wsPort  = ws_ ? ws_->port() : static_cast<std::uint16_t>(options_.ws_port);
    return info;
}

auto OscQueryServer::start() -> Expected<void> {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (http_)
        return std::unexpected(Error{Error::Code::Conflict, "server already running"});

    auto fail = [this](Error error) -> Expected<void> {
        oq_log("start failed: " + describeError(error), "Server");
        http_.reset();
        ws_.reset();
        osc_.reset();
        return std::unexpected(std::move(error));
    };

    osc_ = std::make_unique<OscUdpService>(*coordinator_, OscUdpService::Options{options_.osc_port, options_.osc_send});
    if (auto started = osc_->start(); !started)
        return fail(started.error());

    ws_ = std::make_unique<WebSocketService>(
            *notifier_, *coordinator_, WebSocketService::Options{options_.host, options_.ws_port, options_.max_pending_events,
                                                              options_.max_ws_message_bytes});
    if (auto started = ws_->start(); !started)
        return fail(started.error());

    resolver_->setHostInfo(this->makeHostInfo());

    http_ = std::make_unique<HttpService>(*resolver_, HttpService::Options{options_.host, options_.http_port});
    if (auto started = http_->start(); !started)
        return fail(started.error());

    if (advertiser_) {
        auto advertised = advertiser_->advertise(serviceRecordsFor(resolver_->hostInfo(), http_->port()));
        if (advertised) {
            advertised_ = true;
        } else {
            oq_log("service advertisement failed: " + describeError(advertised.error()), "Server");
        }
    }

    oq_log("OSCQuery server '" + options_.name + "' up: http " + std::to_string(http_->port()) + ", osc "
                   + std::to_string(osc_->port()) + ", ws " + std::to_string(ws_->port()),
           "Server");
    return {};
}

auto OscQueryServer::stop() -> void {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!http_ && !ws_ && !osc_)
        return;
    if (advertiser_ && advertised_) {
        advertiser_->withdraw();
        advertised_ = false;
    }
    if (http_) {
        http_->stop();
        http_.reset();
    }
    if (ws_) {
        ws_->stop();
        ws_.reset();
    }
    if (osc_) {
        osc_->stop();
        osc_.reset();
    }
    oq_log("OSCQuery server '" + options_.name + "' stopped", "Server");
}

auto OscQueryServer::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return http_ && http_->is_running();
}

auto OscQueryServer::addNode(std::string path, NodeAttributes attributes) -> Expected<EditResult> {
    return coordinator_->apply(InsertEdit{std::move(path), std::move(attributes)});
}

auto OscQueryServer::removeNode(std::string path) -> Expected<EditResult> {
    return coordinator_->apply(RemoveEdit{std::move(path)});
}

auto OscQueryServer::setValue(std::string path, OscValues values) -> Expected<EditResult> {
    return coordinator_->apply(SetValueEdit{std::move(path), std::move(values)});
}

auto OscQueryServer::apply(Edit edit) -> Expected<EditResult> {
    return coordinator_->apply(std::move(edit));
}

auto OscQueryServer::post(Edit edit) -> void {
    coordinator_->post(std::move(edit));
}

auto OscQueryServer::trigger(std::string_view path) -> Expected<std::size_t> {
    auto message = coordinator_->read([path](Tree const& tree) -> Expected<OscMessage> {
        auto const* node = tree.resolve(path);
        if (!node)
            return std::unexpected(Error{Error::Code::NotFound, "no node at " + std::string{path}});
        if (node->attributes.value.empty())
            return std::unexpected(Error{Error::Code::UnsupportedParam, std::string{path} + " carries no value"});
        if (!isReadable(node->attributes.access))
            return std::unexpected(Error{Error::Code::Access, std::string{path} + " is not readable"});
        return OscMessage{node->fullPath, node->attributes.value};
    });
    if (!message)
        return std::unexpected(message.error());

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    std::size_t                 reached = 0;
    if (osc_) {
        auto sent = osc_->send(*message);
        if (!sent)
            return std::unexpected(sent.error());
        reached += *sent;
    }
    if (ws_) {
        auto encoded = encodeMessage(*message);
        if (!encoded)
            return std::unexpected(encoded.error());
        reached += ws_->relay(message->path, *encoded);
    }
    oq_log("trigger " + message->path + " reached " + std::to_string(reached) + " endpoints", "Server");
    return reached;
}

auto OscQueryServer::observe(std::string_view path, Observer observer) -> Expected<ClientId> {
    if (!observer)
        return std::unexpected(Error{Error::Code::BadRequest, "observer callback is empty"});
    auto client = notifier_->addClient(std::make_shared<CallbackSubscriber>(std::move(observer)));
    if (auto listened = notifier_->listen(client, path); !listened) {
        notifier_->removeClient(client);
        return std::unexpected(listened.error());
    }
    return client;
}

auto OscQueryServer::unobserve(ClientId client) -> void {
    notifier_->removeClient(client);
}

auto OscQueryServer::query(std::string_view path, std::optional<QueryParam> param) const -> Expected<nlohmann::json> {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return resolver_->query(path, param);
}

auto OscQueryServer::hostInfo() const -> HostInfo {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return resolver_->hostInfo();
}

auto OscQueryServer::httpPort() const -> std::uint16_t {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return http_ ? http_->port() : 0;
}

auto OscQueryServer::oscPort() const -> std::uint16_t {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return osc_ ? osc_->port() : 0;
}

auto OscQueryServer::wsPort() const -> std::uint16_t {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    return ws_ ? ws_->port() : 0;
}

auto OscQueryServer::flushNotifications() -> void {
    notifier_->flush();
}

void RequestOscQueryStop() {
    g_should_stop.store(true);
}

void ResetOscQueryStopFlag() {
    g_should_stop.store(false);
}

int RunOscQueryServer(OscQueryOptions const& options, std::function<void(OscQueryServer&)> const& declare) {
    OscQueryServer server{options};
    if (declare)
        declare(server);

    if (auto started = server.start(); !started) {
        std::cerr << "[oscquery] failed to start: " << describeError(started.error()) << '\n';
        return EXIT_FAILURE;
    }
    std::cout << "[oscquery] '" << options.name << "' listening: http " << server.httpPort() << ", osc "
              << server.oscPort() << ", ws " << server.wsPort() << '\n';

    while (!g_should_stop.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    std::cout << "[oscquery] stopped\n";
    return EXIT_SUCCESS;
}

} // namespace OQ
