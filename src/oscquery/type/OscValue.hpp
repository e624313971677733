#pragma once
#include "core/Error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace OQ {

/**
 * OSC 1.0/1.1 argument type tags understood by the namespace.
 *
 * The enumerator value is the tag character, so a TYPE string is just the
 * concatenation of the enumerators. Array brackets and the RGBA colour tag
 * are not supported.
 */
enum class OscType : char {
    Int32   = 'i',
    Float32 = 'f',
    String  = 's',
    Blob    = 'b',
    Int64   = 'h',
    Double  = 'd',
    Char    = 'c',
    Symbol  = 'S',
    True    = 'T',
    False   = 'F',
    Nil     = 'N',
    Impulse = 'I',
    TimeTag = 't',
    Midi    = 'm'
};

using OscTypeTags = std::vector<OscType>;

struct OscBlob {
    std::vector<std::byte> bytes;
    auto operator==(OscBlob const&) const -> bool = default;
};

struct OscSymbol {
    std::string name;
    auto operator==(OscSymbol const&) const -> bool = default;
};

struct OscNil {
    auto operator==(OscNil const&) const -> bool = default;
};

struct OscImpulse {
    auto operator==(OscImpulse const&) const -> bool = default;
};

// 64-bit NTP timestamp: seconds in the high word, fraction in the low word.
struct OscTimeTag {
    std::uint64_t ntp = 1;
    auto operator==(OscTimeTag const&) const -> bool = default;
};

// port id, status, data1, data2
struct OscMidi {
    std::array<std::uint8_t, 4> bytes{};
    auto operator==(OscMidi const&) const -> bool = default;
};

// One value slot. T and F share the bool alternative.
using OscScalar = std::variant<std::int32_t,
                               float,
                               std::string,
                               OscBlob,
                               std::int64_t,
                               double,
                               char,
                               OscSymbol,
                               bool,
                               OscNil,
                               OscImpulse,
                               OscTimeTag,
                               OscMidi>;

using OscValues = std::vector<OscScalar>;

[[nodiscard]] auto isValidTypeTag(char tag) -> bool;
[[nodiscard]] auto isNumeric(OscType type) -> bool;

// Integer slots render their range bounds as JSON integers.
[[nodiscard]] auto isIntegral(OscType type) -> bool;

[[nodiscard]] auto parseTypeTags(std::string_view tags) -> Expected<OscTypeTags>;
[[nodiscard]] auto typeTagsToString(OscTypeTags const& tags) -> std::string;

// Tag naturally carried by a scalar (a bool yields T or F by its value).
[[nodiscard]] auto tagOf(OscScalar const& value) -> OscType;

// Whether `value` may be stored in a slot declared as `type`. T and F accept either boolean.
[[nodiscard]] auto matchesTag(OscScalar const& value, OscType type) -> bool;

[[nodiscard]] auto defaultValueFor(OscType type) -> OscScalar;

[[nodiscard]] auto numericValue(OscScalar const& value) -> std::optional<double>;

// Converts a clipped double back into the alternative of `like`. Non-numeric input is returned unchanged.
[[nodiscard]] auto withNumericValue(OscScalar const& like, double value) -> OscScalar;

[[nodiscard]] auto toJson(OscScalar const& value) -> nlohmann::json;
[[nodiscard]] auto toJson(OscValues const& values) -> nlohmann::json;

[[nodiscard]] auto describeScalar(OscScalar const& value) -> std::string;

} // namespace OQ
