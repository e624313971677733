#include "HostInfo.hpp"

namespace OQ {

auto HostInfo::defaultExtensions() -> std::map<std::string, bool> {
    return {
        {"ACCESS", true},
        {"VALUE", true},
        {"RANGE", true},
        {"DESCRIPTION", true},
        {"CLIPMODE", true},
        {"UNIT", true},
        {"LISTEN", true},
        {"PATH_CHANGED", true},
        {"PATH_ADDED", true},
        {"PATH_REMOVED", true},
        {"TAGS", false},
        {"EXTENDED_TYPE", false},
        {"CRITICAL", false},
        {"OVERLOADS", false},
        {"HTML", false},
        {"PATH_RENAMED", false},
    };
}

auto toJson(HostInfo const& info) -> nlohmann::json {
    nlohmann::json json;
    json["NAME"]          = info.name;
    json["OSC_TRANSPORT"] = info.oscTransport;
    json["OSC_IP"]        = info.oscIp;
    json["OSC_PORT"]      = info.oscPort;
    if (info.wsIp)
        json["WS_IP"] = *info.wsIp;
    if (info.wsPort)
        json["WS_PORT"] = *info.wsPort;
    auto extensions = nlohmann::json::object();
    for (auto const& [key, enabled] : info.extensions)
        extensions[key] = enabled;
    json["EXTENSIONS"] = std::move(extensions);
    return json;
}

} // namespace OQ
