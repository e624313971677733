#pragma once
#include "core/Error.hpp"
#include "server/HostInfo.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace OQ {

// One DNS-SD service instance, e.g. {"synth", "_oscjson._tcp", 5678}.
struct ServiceRecord {
    std::string                        instance;
    std::string                        type;
    std::uint16_t                      port = 0;
    std::map<std::string, std::string> txt;

    auto operator==(ServiceRecord const&) const -> bool = default;
};

/**
 * Host-supplied mDNS hook. The server hands it the records once all
 * transports are bound and withdraws them on stop.
 */
class ServiceAdvertiser {
public:
    virtual ~ServiceAdvertiser() = default;

    [[nodiscard]] virtual auto advertise(std::vector<ServiceRecord> const& records) -> Expected<void> = 0;
    virtual auto               withdraw() -> void                                                   = 0;
};

// _oscjson._tcp on the HTTP port, plus _osc._udp on the OSC port when one is bound.
[[nodiscard]] auto serviceRecordsFor(HostInfo const& info, std::uint16_t httpPort) -> std::vector<ServiceRecord>;

} // namespace OQ
