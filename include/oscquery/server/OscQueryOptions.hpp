#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace OQ {

struct OscSendTarget {
    std::string host;
    int         port{0};

    auto operator==(OscSendTarget const&) const -> bool = default;
};

struct OscQueryOptions {
    std::string                name{"oscquery"};
    std::string                host{"0.0.0.0"};
    int                        http_port{5678};
    int                        osc_port{1234};
    int                        ws_port{5679};
    std::vector<OscSendTarget> osc_send;
    int                        contents_depth{1};
    std::size_t                max_pending_events{256};
    std::size_t                max_ws_message_bytes{65536};
    bool                       enable_log{false};
    bool                       show_help{false};
};

auto ParseOscQueryArguments(int argc, char** argv) -> std::optional<OscQueryOptions>;

void PrintOscQueryUsage();

bool ApplyOscQueryEnvOverrides(OscQueryOptions& options);

auto ValidateOscQueryOptions(OscQueryOptions const& options) -> std::optional<std::string>;

// Port 0 asks the OS for an ephemeral port.
bool IsValidOscQueryPort(int port);

// "host:port"
auto ParseOscSendTarget(std::string_view text) -> std::optional<OscSendTarget>;

} // namespace OQ
