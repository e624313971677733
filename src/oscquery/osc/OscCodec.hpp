#pragma once
#include "core/Error.hpp"
#include "type/OscValue.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <lo/lo.h>

namespace OQ {

struct OscMessage {
    std::string path;
    OscValues   args;
};

// A decoded packet; bundles are flattened in element order.
struct OscPacket {
    std::vector<OscMessage> messages;
    bool                    bundle = false;
};

struct LoMessageDeleter {
    void operator()(lo_message message) const noexcept {
        if (message)
            lo_message_free(message);
    }
};

using LoMessagePtr = std::unique_ptr<std::remove_pointer_t<lo_message>, LoMessageDeleter>;

// Converts the arguments liblo hands to a method handler.
[[nodiscard]] auto decodeArguments(char const* types, lo_arg** argv, int argc) -> Expected<OscValues>;

// Decodes one raw OSC packet (message or bundle), e.g. a WebSocket binary frame.
[[nodiscard]] auto decodePacket(std::span<std::byte const> data) -> Expected<OscPacket>;

[[nodiscard]] auto makeLoMessage(OscValues const& args) -> Expected<LoMessagePtr>;

[[nodiscard]] auto encodeMessage(OscMessage const& message) -> Expected<std::vector<std::byte>>;

} // namespace OQ
