#include "OscCodec.hpp"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string_view>
#include <variant>

namespace OQ {

namespace {

constexpr std::string_view kBundleTag{"#bundle\0", 8};
constexpr std::size_t      kBundleHeaderSize = 16; // tag + timetag
constexpr int              kMaxBundleDepth   = 8;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto readInt32BigEndian(std::span<std::byte const> data) -> std::int32_t {
    auto const b0 = static_cast<std::uint32_t>(data[0]);
    auto const b1 = static_cast<std::uint32_t>(data[1]);
    auto const b2 = static_cast<std::uint32_t>(data[2]);
    auto const b3 = static_cast<std::uint32_t>(data[3]);
    return static_cast<std::int32_t>((b0 << 24U) | (b1 << 16U) | (b2 << 8U) | b3);
}

auto isBundle(std::span<std::byte const> data) -> bool {
    return data.size() >= kBundleTag.size()
           && std::memcmp(data.data(), kBundleTag.data(), kBundleTag.size()) == 0;
}

auto decodeMessage(std::span<std::byte const> data, std::vector<OscMessage>& out) -> Expected<void> {
    // liblo wants a mutable buffer it may byte-swap in place.
    std::vector<std::byte> buffer(data.begin(), data.end());
    auto const*            path = lo_get_path(buffer.data(), static_cast<ssize_t>(buffer.size()));
    if (!path || path[0] != '/')
        return std::unexpected(malformed("OSC message without a valid address"));
    std::string address{path};

    int          result = 0;
    LoMessagePtr message{lo_message_deserialise(buffer.data(), buffer.size(), &result)};
    if (!message || result != 0)
        return std::unexpected(malformed("undecodable OSC message for " + address + " (liblo error "
                                         + std::to_string(result) + ")"));

    auto args = decodeArguments(lo_message_get_types(message.get()),
                                lo_message_get_argv(message.get()),
                                lo_message_get_argc(message.get()));
    if (!args)
        return std::unexpected(args.error());
    out.push_back(OscMessage{std::move(address), std::move(*args)});
    return {};
}

auto decodeElement(std::span<std::byte const> data, std::vector<OscMessage>& out, int depth) -> Expected<void> {
    if (!isBundle(data))
        return decodeMessage(data, out);
    if (depth >= kMaxBundleDepth)
        return std::unexpected(malformed("OSC bundles nested too deeply"));
    if (data.size() < kBundleHeaderSize)
        return std::unexpected(malformed("truncated OSC bundle header"));

    auto rest = data.subspan(kBundleHeaderSize);
    while (!rest.empty()) {
        if (rest.size() < 4)
            return std::unexpected(malformed("truncated OSC bundle element size"));
        auto const size = readInt32BigEndian(rest);
        rest            = rest.subspan(4);
        if (size <= 0 || static_cast<std::size_t>(size) > rest.size() || size % 4 != 0)
            return std::unexpected(malformed("invalid OSC bundle element size " + std::to_string(size)));
        if (auto decoded = decodeElement(rest.first(static_cast<std::size_t>(size)), out, depth + 1); !decoded)
            return decoded;
        rest = rest.subspan(static_cast<std::size_t>(size));
    }
    return {};
}

} // namespace

auto decodeArguments(char const* types, lo_arg** argv, int argc) -> Expected<OscValues> {
    OscValues values;
    if (argc <= 0)
        return values;
    if (!types || !argv)
        return std::unexpected(malformed("OSC arguments without type tags"));
    values.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        auto* arg = argv[i];
        switch (types[i]) {
            case LO_INT32:
                values.emplace_back(static_cast<std::int32_t>(arg->i));
                break;
            case LO_FLOAT:
                values.emplace_back(arg->f);
                break;
            case LO_STRING:
                values.emplace_back(std::string{&arg->s});
                break;
            case LO_BLOB: {
                auto        blob  = reinterpret_cast<lo_blob>(arg);
                auto const  size  = lo_blob_datasize(blob);
                auto const* bytes = static_cast<std::byte const*>(lo_blob_dataptr(blob));
                values.emplace_back(OscBlob{std::vector<std::byte>(bytes, bytes + size)});
                break;
            }
            case LO_INT64:
                values.emplace_back(static_cast<std::int64_t>(arg->h));
                break;
            case LO_DOUBLE:
                values.emplace_back(arg->d);
                break;
            case LO_CHAR:
                values.emplace_back(static_cast<char>(arg->c));
                break;
            case LO_SYMBOL:
                values.emplace_back(OscSymbol{std::string{&arg->S}});
                break;
            case LO_TRUE:
                values.emplace_back(true);
                break;
            case LO_FALSE:
                values.emplace_back(false);
                break;
            case LO_NIL:
                values.emplace_back(OscNil{});
                break;
            case LO_INFINITUM:
                values.emplace_back(OscImpulse{});
                break;
            case LO_TIMETAG:
                values.emplace_back(OscTimeTag{(static_cast<std::uint64_t>(arg->t.sec) << 32U) | arg->t.frac});
                break;
            case LO_MIDI:
                values.emplace_back(OscMidi{{arg->m[0], arg->m[1], arg->m[2], arg->m[3]}});
                break;
            default: {
                std::string message = "unsupported OSC argument type '";
                message.push_back(types[i]);
                message.push_back('\'');
                return std::unexpected(Error{Error::Code::TypeMismatch, std::move(message)});
            }
        }
    }
    return values;
}

auto decodePacket(std::span<std::byte const> data) -> Expected<OscPacket> {
    if (data.empty() || data.size() % 4 != 0)
        return std::unexpected(malformed("OSC packet size " + std::to_string(data.size()) + " is not a multiple of 4"));
    OscPacket packet;
    packet.bundle = isBundle(data);
    if (auto decoded = decodeElement(data, packet.messages, 0); !decoded)
        return std::unexpected(decoded.error());
    return packet;
}

auto makeLoMessage(OscValues const& args) -> Expected<LoMessagePtr> {
    LoMessagePtr message{lo_message_new()};
    if (!message)
        return std::unexpected(Error{Error::Code::UnknownError, "lo_message_new failed"});
    auto* m = message.get();
    for (auto const& arg : args) {
        int const rc = std::visit(Overloaded{
                                      [m](std::int32_t v) { return lo_message_add_int32(m, v); },
                                      [m](float v) { return lo_message_add_float(m, v); },
                                      [m](std::string const& v) { return lo_message_add_string(m, v.c_str()); },
                                      [m](OscBlob const& v) {
                                          lo_blob blob = lo_blob_new(static_cast<std::int32_t>(v.bytes.size()), v.bytes.data());
                                          if (!blob)
                                              return -1;
                                          int const added = lo_message_add_blob(m, blob);
                                          lo_blob_free(blob);
                                          return added;
                                      },
                                      [m](std::int64_t v) { return lo_message_add_int64(m, v); },
                                      [m](double v) { return lo_message_add_double(m, v); },
                                      [m](char v) { return lo_message_add_char(m, v); },
                                      [m](OscSymbol const& v) { return lo_message_add_symbol(m, v.name.c_str()); },
                                      [m](bool v) { return v ? lo_message_add_true(m) : lo_message_add_false(m); },
                                      [m](OscNil) { return lo_message_add_nil(m); },
                                      [m](OscImpulse) { return lo_message_add_infinitum(m); },
                                      [m](OscTimeTag v) {
                                          lo_timetag tt{static_cast<std::uint32_t>(v.ntp >> 32U),
                                                        static_cast<std::uint32_t>(v.ntp & 0xFFFFFFFFU)};
                                          return lo_message_add_timetag(m, tt);
                                      },
                                      [m](OscMidi const& v) {
                                          std::uint8_t bytes[4] = {v.bytes[0], v.bytes[1], v.bytes[2], v.bytes[3]};
                                          return lo_message_add_midi(m, bytes);
                                      },
                                  },
                                  arg);
        if (rc != 0)
            return std::unexpected(Error{Error::Code::UnknownError, "failed to add " + describeScalar(arg) + " to OSC message"});
    }
    return message;
}

auto encodeMessage(OscMessage const& message) -> Expected<std::vector<std::byte>> {
    if (message.path.empty() || message.path.front() != '/')
        return std::unexpected(Error{Error::Code::InvalidPath, "OSC address must start with '/'"});
    auto lo = makeLoMessage(message.args);
    if (!lo)
        return std::unexpected(lo.error());

    std::size_t size = 0;
    void*       raw  = lo_message_serialise(lo->get(), message.path.c_str(), nullptr, &size);
    if (!raw)
        return std::unexpected(Error{Error::Code::UnknownError, "lo_message_serialise failed for " + message.path});
    auto const* bytes = static_cast<std::byte const*>(raw);
    std::vector<std::byte> encoded(bytes, bytes + size);
    std::free(raw);
    return encoded;
}

} // namespace OQ
