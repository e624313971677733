#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace OQ {

// Server-level metadata reported for HOST_INFO. Read-only once the server is started.
struct HostInfo {
    std::string                  name         = "oscquery";
    std::string                  oscTransport = "UDP";
    std::string                  oscIp        = "0.0.0.0";
    std::uint16_t                oscPort      = 0;
    std::optional<std::string>   wsIp;
    std::optional<std::uint16_t> wsPort;
    std::map<std::string, bool>  extensions   = defaultExtensions();

    static auto defaultExtensions() -> std::map<std::string, bool>;
};

[[nodiscard]] auto toJson(HostInfo const& info) -> nlohmann::json;

} // namespace OQ
