#include "OscUdpService.hpp"
#include "coordinator/MutationCoordinator.hpp"
#include "log/TaggedLogger.hpp"
#include "server/InboundOsc.hpp"

#include <string>

namespace OQ {

OscUdpService::OscUdpService(MutationCoordinator& coordinator, Options options)
    : coordinator_(coordinator), options_(std::move(options)) {}

OscUdpService::~OscUdpService() {
    this->stop();
}

auto OscUdpService::start() -> Expected<void> {
    if (server_)
        return std::unexpected(Error{Error::Code::Conflict, "OSC service already running"});

    auto const requested = options_.port > 0 ? std::to_string(options_.port) : std::string{};
    server_ = lo_server_thread_new_with_proto(requested.empty() ? nullptr : requested.c_str(), LO_UDP, &OscUdpService::handleError);
    if (!server_) {
        return std::unexpected(Error{Error::Code::UnknownError, "Failed to create OSC server on port " + std::to_string(options_.port)});
    }

    lo_server_thread_add_method(server_, nullptr, nullptr, &OscUdpService::handleMessage, this);
    lo_server_add_bundle_handlers(lo_server_thread_get_server(server_), &OscUdpService::handleBundleStart,
                                  &OscUdpService::handleBundleEnd, this);

    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        targets_.clear();
        for (auto const& target : options_.targets) {
            LoAddressPtr address{lo_address_new(target.host.c_str(), std::to_string(target.port).c_str())};
            if (!address) {
                oq_log("invalid send target " + target.host + ":" + std::to_string(target.port), "Osc");
                continue;
            }
            targets_.push_back(std::move(address));
        }
    }

    if (lo_server_thread_start(server_) < 0) {
        lo_server_thread_free(server_);
        server_ = nullptr;
        return std::unexpected(Error{Error::Code::UnknownError, "Failed to start OSC server thread"});
    }

    bound_port_ = static_cast<std::uint16_t>(lo_server_thread_get_port(server_));
    oq_log("OSC service listening on UDP port " + std::to_string(bound_port_), "Osc");
    return {};
}

auto OscUdpService::stop() -> void {
    if (!server_)
        return;
    lo_server_thread_stop(server_);
    lo_server_thread_free(server_);
    server_      = nullptr;
    bound_port_  = 0;
    bundleDepth_ = 0;
    pendingBundle_.reset();
    oq_log("OSC service stopped", "Osc");
}

auto OscUdpService::send(OscMessage const& message) -> Expected<std::size_t> {
    auto lo = makeLoMessage(message.args);
    if (!lo)
        return std::unexpected(lo.error());

    std::lock_guard<std::mutex> lock(sendMutex_);
    std::size_t                 reached = 0;
    for (auto const& target : targets_) {
        if (lo_send_message(target.get(), message.path.c_str(), lo->get()) < 0) {
            oq_log("send " + message.path + " failed: " + std::string{lo_address_errstr(target.get())}, "Osc");
            continue;
        }
        ++reached;
    }
    return reached;
}

auto OscUdpService::handleMessage(char const* path, char const* types, lo_arg** argv, int argc, lo_message, void* user) -> int {
    static_cast<OscUdpService*>(user)->onMessage(path, types, argv, argc);
    return 0;
}

auto OscUdpService::handleBundleStart(lo_timetag, void* user) -> int {
    auto* self = static_cast<OscUdpService*>(user);
    if (self->bundleDepth_++ == 0)
        self->pendingBundle_.emplace();
    return 0;
}

auto OscUdpService::handleBundleEnd(void* user) -> int {
    auto* self = static_cast<OscUdpService*>(user);
    if (self->bundleDepth_ == 0 || --self->bundleDepth_ > 0)
        return 0;
    if (self->pendingBundle_ && !self->pendingBundle_->edits.empty()) {
        TransportScope scope;
        self->coordinator_.post(std::move(*self->pendingBundle_));
    }
    self->pendingBundle_.reset();
    return 0;
}

auto OscUdpService::handleError(int num, char const* msg, char const* path) -> void {
    oq_log("liblo error " + std::to_string(num) + ": " + std::string{msg ? msg : ""} + " ("
               + std::string{path ? path : ""} + ")",
           "Osc");
}

auto OscUdpService::onMessage(char const* path, char const* types, lo_arg** argv, int argc) -> void {
    ++received_;
    auto args = decodeArguments(types, argv, argc);
    if (!args) {
        ++rejected_;
        oq_log(std::string{path} + ": " + describeError(args.error()), "Osc");
        return;
    }
    auto edit = editFromMessage(OscMessage{path, std::move(*args)});
    if (pendingBundle_) {
        pendingBundle_->edits.emplace_back(std::move(edit));
        return;
    }
    TransportScope scope;
    coordinator_.post(std::move(edit));
}

} // namespace OQ
