#include <oscquery/server/OscQueryOptions.hpp>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace OQ {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    if (!parse_integer(text, value)) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

} // namespace

bool IsValidOscQueryPort(int port) {
    return port >= 0 && port <= 65535;
}

auto ParseOscSendTarget(std::string_view text) -> std::optional<OscSendTarget> {
    auto const colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    OscSendTarget target;
    target.host = std::string{text.substr(0, colon)};
    if (!parse_integer_in_range<int>(text.substr(colon + 1), 1, 65535, target.port)) {
        return std::nullopt;
    }
    return target;
}

auto ValidateOscQueryOptions(OscQueryOptions const& options) -> std::optional<std::string> {
    if (options.name.empty()) {
        return std::string{"--name must not be empty"};
    }
    if (options.host.empty()) {
        return std::string{"--host must not be empty"};
    }
    if (!IsValidOscQueryPort(options.http_port)) {
        return std::string{"--http-port must be within 0-65535"};
    }
    if (!IsValidOscQueryPort(options.osc_port)) {
        return std::string{"--osc-port must be within 0-65535"};
    }
    if (!IsValidOscQueryPort(options.ws_port)) {
        return std::string{"--ws-port must be within 0-65535"};
    }
    if (options.http_port != 0 && options.http_port == options.ws_port) {
        return std::string{"--http-port and --ws-port must differ"};
    }
    if (options.contents_depth < 0) {
        return std::string{"--contents-depth must be >= 0"};
    }
    if (options.max_pending_events == 0) {
        return std::string{"--max-pending-events must be >= 1"};
    }
    if (options.max_ws_message_bytes == 0) {
        return std::string{"--max-ws-message must be >= 1"};
    }
    for (auto const& target : options.osc_send) {
        if (target.host.empty() || target.port <= 0 || target.port > 65535) {
            return std::string{"--osc-send expects host:port with a port within 1-65535"};
        }
    }
    return std::nullopt;
}

bool ApplyOscQueryEnvOverrides(OscQueryOptions& options) {
    if (!apply_env("OSCQUERY_NAME", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "OSCQUERY_NAME must not be empty\n";
                return false;
            }
            options.name = std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_env("OSCQUERY_HOST", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "OSCQUERY_HOST must not be empty\n";
                return false;
            }
            options.host = std::string{value};
            return true;
        })) {
        return false;
    }

    auto apply_port_env = [&](char const* key, int& target) {
        return apply_env(key, [&](std::string_view value) {
            int parsed = target;
            if (!parse_integer_in_range<int>(value, 0, 65535, parsed)) {
                std::cerr << key << " must be within 0-65535\n";
                return false;
            }
            target = parsed;
            return true;
        });
    };

    if (!apply_port_env("OSCQUERY_HTTP_PORT", options.http_port)) {
        return false;
    }
    if (!apply_port_env("OSCQUERY_OSC_PORT", options.osc_port)) {
        return false;
    }
    if (!apply_port_env("OSCQUERY_WS_PORT", options.ws_port)) {
        return false;
    }

    if (!apply_env("OSCQUERY_LOG", [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << "OSCQUERY_LOG must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            options.enable_log = *parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

void PrintOscQueryUsage() {
    std::cout << "Usage: oscquery_server [options]\n"
              << "  --name <name>              Service name reported in HOST_INFO (default oscquery)\n"
              << "  --host <host>              Bind address (default 0.0.0.0)\n"
              << "  --http-port <port>         HTTP query port, 0 for ephemeral (default 5678)\n"
              << "  --osc-port <port>          OSC UDP port, 0 for ephemeral (default 1234)\n"
              << "  --ws-port <port>           WebSocket port, 0 for ephemeral (default 5679)\n"
              << "  --osc-send <host:port>     Send triggered values to this target (repeatable)\n"
              << "  --contents-depth <n>       CONTENTS levels rendered in full, 0 = unlimited (default 1)\n"
              << "  --max-pending-events <n>   Per-WebSocket outbox limit (default 256)\n"
              << "  --max-ws-message <bytes>   Largest reassembled WebSocket message (default 65536)\n"
              << "  --log                      Enable tagged logging on stderr\n"
              << "  --help                     Show this help\n";
}

std::optional<OscQueryOptions> ParseOscQueryArguments(int argc, char** argv) {
    OscQueryOptions options{};
    if (!ApplyOscQueryEnvOverrides(options)) {
        return std::nullopt;
    }

    auto require_value = [&](int& index, std::string_view flag) -> std::optional<std::string_view> {
        if (index + 1 >= argc) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    auto parse_port = [&](int& index, std::string_view flag, int& target) -> bool {
        auto value = require_value(index, flag);
        if (!value) {
            return false;
        }
        int parsed = target;
        if (!parse_integer_in_range<int>(*value, 0, 65535, parsed)) {
            std::cerr << flag << " must be within 0-65535\n";
            return false;
        }
        target = parsed;
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "--name") {
            if (auto value = require_value(i, "--name")) {
                if (value->empty()) {
                    std::cerr << "--name must not be empty\n";
                    return std::nullopt;
                }
                options.name = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--host") {
            if (auto value = require_value(i, "--host")) {
                if (value->empty()) {
                    std::cerr << "--host must not be empty\n";
                    return std::nullopt;
                }
                options.host = std::string{*value};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--http-port") {
            if (!parse_port(i, "--http-port", options.http_port)) {
                return std::nullopt;
            }
        } else if (arg == "--osc-port") {
            if (!parse_port(i, "--osc-port", options.osc_port)) {
                return std::nullopt;
            }
        } else if (arg == "--ws-port") {
            if (!parse_port(i, "--ws-port", options.ws_port)) {
                return std::nullopt;
            }
        } else if (arg == "--osc-send") {
            if (auto value = require_value(i, "--osc-send")) {
                auto target = ParseOscSendTarget(*value);
                if (!target) {
                    std::cerr << "--osc-send expects host:port, got '" << *value << "'\n";
                    return std::nullopt;
                }
                options.osc_send.push_back(std::move(*target));
            } else {
                return std::nullopt;
            }
        } else if (arg == "--contents-depth") {
            if (auto value = require_value(i, "--contents-depth")) {
                int parsed = options.contents_depth;
                if (!parse_integer_in_range<int>(*value, 0, std::numeric_limits<int>::max(), parsed)) {
                    std::cerr << "--contents-depth must be >= 0\n";
                    return std::nullopt;
                }
                options.contents_depth = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--max-pending-events") {
            if (auto value = require_value(i, "--max-pending-events")) {
                std::size_t parsed = options.max_pending_events;
                if (!parse_integer_in_range<std::size_t>(*value, 1, std::numeric_limits<std::size_t>::max(), parsed)) {
                    std::cerr << "--max-pending-events must be >= 1\n";
                    return std::nullopt;
                }
                options.max_pending_events = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--max-ws-message") {
            if (auto value = require_value(i, "--max-ws-message")) {
                std::size_t parsed = options.max_ws_message_bytes;
                if (!parse_integer_in_range<std::size_t>(*value, 1, std::numeric_limits<std::size_t>::max(), parsed)) {
                    std::cerr << "--max-ws-message must be >= 1\n";
                    return std::nullopt;
                }
                options.max_ws_message_bytes = parsed;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--log") {
            options.enable_log = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            break;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (auto error = ValidateOscQueryOptions(options)) {
        std::cerr << *error << "\n";
        return std::nullopt;
    }

    return options;
}

} // namespace OQ
