#pragma once
#include "core/Error.hpp"
#include "type/OscValue.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace OQ {

enum class Access : int {
    NoValue   = 0,
    ReadOnly  = 1,
    WriteOnly = 2,
    ReadWrite = 3
};

enum class ClipMode {
    None,
    Low,
    High,
    Both
};

[[nodiscard]] auto clipModeToString(ClipMode mode) -> std::string_view;

[[nodiscard]] inline auto isReadable(Access access) -> bool {
    return access == Access::ReadOnly || access == Access::ReadWrite;
}

[[nodiscard]] inline auto isWritable(Access access) -> bool {
    return access == Access::WriteOnly || access == Access::ReadWrite;
}

// Range of one numeric slot. Either bound may be open; `vals` restricts to an enumerated set.
struct SlotRange {
    std::optional<double> min;
    std::optional<double> max;
    std::vector<double>   vals;
    ClipMode              clip = ClipMode::None;

    auto operator==(SlotRange const&) const -> bool = default;
};

struct NodeAttributes {
    OscTypeTags                           typeTags;
    OscValues                             value;
    std::vector<std::optional<SlotRange>> range;
    std::vector<std::optional<std::string>> unit;
    Access                                access = Access::NoValue;
    std::optional<std::string>            description;

    auto operator==(NodeAttributes const&) const -> bool = default;

    [[nodiscard]] auto isContainer() const -> bool { return access == Access::NoValue && typeTags.empty(); }
    [[nodiscard]] auto hasRange() const -> bool;
    [[nodiscard]] auto hasUnit() const -> bool;

    static auto container(std::optional<std::string> description = std::nullopt) -> NodeAttributes;

    // A value-bearing node; `initial` defaults each slot when empty.
    static auto parameter(OscTypeTags tags, Access access, OscValues initial = {}) -> NodeAttributes;

    auto withRange(std::size_t slot, SlotRange slotRange) -> NodeAttributes&;
    auto withUnit(std::size_t slot, std::string unitName) -> NodeAttributes&;
    auto withDescription(std::string text) -> NodeAttributes&;
};

/*
 * Checks the structural invariants of a declaration:
 * - NO_VALUE carries neither value nor range
 * - value length and slot types follow the type tags
 * - range and unit entries line up with slots, ranges only on numeric slots
 * - min <= max and an initial value inside any NONE-clipped range
 */
[[nodiscard]] auto validateAttributes(NodeAttributes const& attributes) -> Expected<void>;

} // namespace OQ
