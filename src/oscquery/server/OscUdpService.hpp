#pragma once

#include "coordinator/Edit.hpp"
#include "core/Error.hpp"
#include "osc/OscCodec.hpp"

#include <oscquery/server/OscQueryOptions.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <lo/lo.h>

namespace OQ {

class MutationCoordinator;

struct LoAddressDeleter {
    void operator()(lo_address address) const noexcept {
        if (address)
            lo_address_free(address);
    }
};

using LoAddressPtr = std::unique_ptr<std::remove_pointer_t<lo_address>, LoAddressDeleter>;

/**
 * OSC over UDP via a liblo server thread.
 *
 * Every inbound message is posted to the coordinator as a set-value edit
 * from inside a TransportScope. Messages that arrive inside a bundle are
 * collected and posted as one batch when the bundle ends.
 *
 * send() delivers an outbound message to each configured target.
 */
class OscUdpService {
public:
    struct Options {
        int                        port = 1234; // 0 binds an ephemeral port
        std::vector<OscSendTarget> targets;
    };

    OscUdpService(MutationCoordinator& coordinator, Options options);
    ~OscUdpService();

    OscUdpService(OscUdpService const&)            = delete;
    OscUdpService& operator=(OscUdpService const&) = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;

    [[nodiscard]] auto is_running() const -> bool { return server_ != nullptr; }
    [[nodiscard]] auto port() const -> std::uint16_t { return bound_port_; }

    // Returns the number of targets the message reached; fails only when it cannot be encoded.
    [[nodiscard]] auto send(OscMessage const& message) -> Expected<std::size_t>;

    [[nodiscard]] auto receivedCount() const -> std::uint64_t { return received_.load(); }
    [[nodiscard]] auto rejectedCount() const -> std::uint64_t { return rejected_.load(); }

private:
    static auto handleMessage(char const* path, char const* types, lo_arg** argv, int argc, lo_message msg, void* user) -> int;
    static auto handleBundleStart(lo_timetag time, void* user) -> int;
    static auto handleBundleEnd(void* user) -> int;
    static auto handleError(int num, char const* msg, char const* path) -> void;

    auto onMessage(char const* path, char const* types, lo_arg** argv, int argc) -> void;

    MutationCoordinator& coordinator_;
    Options              options_;
    lo_server_thread     server_     = nullptr;
    std::uint16_t        bound_port_ = 0;

    // Touched only on the liblo server thread.
    int                      bundleDepth_ = 0;
    std::optional<BatchEdit> pendingBundle_;

    std::mutex                sendMutex_;
    std::vector<LoAddressPtr> targets_;

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace OQ
