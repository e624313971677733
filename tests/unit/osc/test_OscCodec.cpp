#include "osc/OscCodec.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace OQ;

namespace {

auto appendInt32(std::vector<std::byte>& out, std::uint32_t value) -> void {
    out.push_back(static_cast<std::byte>((value >> 24U) & 0xFFU));
    out.push_back(static_cast<std::byte>((value >> 16U) & 0xFFU));
    out.push_back(static_cast<std::byte>((value >> 8U) & 0xFFU));
    out.push_back(static_cast<std::byte>(value & 0xFFU));
}

auto bundleOf(std::vector<std::vector<std::byte>> const& elements) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    for (char c : std::string{"#bundle"})
        out.push_back(static_cast<std::byte>(c));
    out.push_back(std::byte{0});
    appendInt32(out, 0); // timetag: immediately
    appendInt32(out, 1);
    for (auto const& element : elements) {
        appendInt32(out, static_cast<std::uint32_t>(element.size()));
        out.insert(out.end(), element.begin(), element.end());
    }
    return out;
}

auto encoded(OscMessage const& message) -> std::vector<std::byte> {
    auto bytes = encodeMessage(message);
    REQUIRE(bytes);
    return *bytes;
}

} // namespace

TEST_SUITE("osc.codec") {

TEST_CASE("encoded messages decode to the same address and arguments") {
    OscMessage message{"/synth/voice", {440.0f, std::int32_t{3}, std::string{"saw"}, true, OscImpulse{}}};
    auto bytes = encoded(message);
    CHECK(bytes.size() % 4 == 0);

    auto packet = decodePacket(bytes);
    REQUIRE(packet);
    CHECK_FALSE(packet->bundle);
    REQUIRE(packet->messages.size() == 1);
    CHECK(packet->messages[0].path == "/synth/voice");
    CHECK(packet->messages[0].args == message.args);
}

TEST_CASE("bundles flatten in element order") {
    auto first  = encoded(OscMessage{"/a", {std::int32_t{1}}});
    auto second = encoded(OscMessage{"/b", {std::string{"two"}}});
    auto nested = bundleOf({encoded(OscMessage{"/c", {2.5}})});

    auto packet = decodePacket(bundleOf({first, second, nested}));
    REQUIRE(packet);
    CHECK(packet->bundle);
    REQUIRE(packet->messages.size() == 3);
    CHECK(packet->messages[0].path == "/a");
    CHECK(packet->messages[1].path == "/b");
    CHECK(packet->messages[2].path == "/c");
    CHECK(std::get<double>(packet->messages[2].args[0]) == doctest::Approx(2.5));
}

TEST_CASE("malformed packets are rejected") {
    SUBCASE("empty") {
        std::vector<std::byte> empty;
        auto packet = decodePacket(empty);
        REQUIRE_FALSE(packet);
        CHECK(packet.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("size not a multiple of four") {
        auto bytes = encoded(OscMessage{"/a", {std::int32_t{1}}});
        bytes.push_back(std::byte{0});
        auto packet = decodePacket(bytes);
        REQUIRE_FALSE(packet);
        CHECK(packet.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("bundle element larger than the packet") {
        auto bytes = bundleOf({});
        appendInt32(bytes, 64);
        auto packet = decodePacket(bytes);
        REQUIRE_FALSE(packet);
        CHECK(packet.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("address without a leading slash") {
        std::vector<std::byte> bytes;
        for (char c : std::string{"abc"})
            bytes.push_back(static_cast<std::byte>(c));
        bytes.push_back(std::byte{0});
        auto packet = decodePacket(bytes);
        REQUIRE_FALSE(packet);
        CHECK(packet.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("encoding needs a rooted address") {
    auto bytes = encodeMessage(OscMessage{"synth", {}});
    REQUIRE_FALSE(bytes);
    CHECK(bytes.error().code == Error::Code::InvalidPath);
}

} // TEST_SUITE
