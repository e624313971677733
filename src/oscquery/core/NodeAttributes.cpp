#include "NodeAttributes.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace OQ {

namespace {

// A bound must be finite, and on an integer slot a whole number the slot can hold.
auto checkBound(double bound, OscType type, std::size_t slot, std::string_view what) -> Expected<void> {
    auto const where = std::string{what} + " on slot " + std::to_string(slot);
    if (!std::isfinite(bound))
        return std::unexpected(Error{Error::Code::Validation, "non-finite " + where});
    if (!isIntegral(type))
        return {};
    if (std::trunc(bound) != bound)
        return std::unexpected(Error{Error::Code::Validation, "non-integral " + where});
    auto const fits = type == OscType::Int32
                              ? bound >= static_cast<double>(std::numeric_limits<std::int32_t>::lowest())
                                        && bound <= static_cast<double>(std::numeric_limits<std::int32_t>::max())
                              // 2^63 is the first double past INT64_MAX
                              : bound >= -9223372036854775808.0 && bound < 9223372036854775808.0;
    if (!fits)
        return std::unexpected(Error{Error::Code::Validation, where + " does not fit the integer type"});
    return {};
}

} // namespace

auto clipModeToString(ClipMode mode) -> std::string_view {
    switch (mode) {
        case ClipMode::None:
            return "none";
        case ClipMode::Low:
            return "low";
        case ClipMode::High:
            return "high";
        case ClipMode::Both:
            return "both";
    }
    return "none";
}

auto NodeAttributes::hasRange() const -> bool {
    return std::ranges::any_of(range, [](auto const& r) { return r.has_value(); });
}

auto NodeAttributes::hasUnit() const -> bool {
    return std::ranges::any_of(unit, [](auto const& u) { return u.has_value(); });
}

auto NodeAttributes::container(std::optional<std::string> description) -> NodeAttributes {
    NodeAttributes attributes;
    attributes.description = std::move(description);
    return attributes;
}

auto NodeAttributes::parameter(OscTypeTags tags, Access access, OscValues initial) -> NodeAttributes {
    NodeAttributes attributes;
    attributes.access = access;
    if (initial.empty() && access != Access::NoValue) {
        initial.reserve(tags.size());
        for (auto tag : tags)
            initial.push_back(defaultValueFor(tag));
    }
    attributes.typeTags = std::move(tags);
    attributes.value    = std::move(initial);
    return attributes;
}

auto NodeAttributes::withRange(std::size_t slot, SlotRange slotRange) -> NodeAttributes& {
    if (range.size() <= slot)
        range.resize(slot + 1);
    range[slot] = std::move(slotRange);
    return *this;
}

auto NodeAttributes::withUnit(std::size_t slot, std::string unitName) -> NodeAttributes& {
    if (unit.size() <= slot)
        unit.resize(slot + 1);
    unit[slot] = std::move(unitName);
    return *this;
}

auto NodeAttributes::withDescription(std::string text) -> NodeAttributes& {
    description = std::move(text);
    return *this;
}

auto validateAttributes(NodeAttributes const& attributes) -> Expected<void> {
    auto const slots = attributes.typeTags.size();

    if (attributes.access == Access::NoValue) {
        if (!attributes.value.empty())
            return std::unexpected(Error{Error::Code::Validation, "NO_VALUE node must not carry a value"});
        if (attributes.hasRange())
            return std::unexpected(Error{Error::Code::Validation, "NO_VALUE node must not carry a range"});
    } else {
        if (slots == 0)
            return std::unexpected(Error{Error::Code::Validation, "value node needs at least one type tag"});
        if (attributes.value.size() != slots)
            return std::unexpected(Error{Error::Code::TypeMismatch,
                                         "value has " + std::to_string(attributes.value.size()) + " slots, type '"
                                             + typeTagsToString(attributes.typeTags) + "' has " + std::to_string(slots)});
        for (std::size_t i = 0; i < slots; ++i) {
            if (!matchesTag(attributes.value[i], attributes.typeTags[i]))
                return std::unexpected(Error{Error::Code::TypeMismatch,
                                             "slot " + std::to_string(i) + " holds " + describeScalar(attributes.value[i])
                                                 + ", declared '" + static_cast<char>(attributes.typeTags[i]) + "'"});
        }
    }

    if (attributes.range.size() > slots)
        return std::unexpected(Error{Error::Code::Validation, "more range entries than value slots"});
    if (attributes.unit.size() > slots)
        return std::unexpected(Error{Error::Code::Validation, "more unit entries than value slots"});

    for (std::size_t i = 0; i < attributes.range.size(); ++i) {
        auto const& slotRange = attributes.range[i];
        if (!slotRange)
            continue;
        if (!isNumeric(attributes.typeTags[i]))
            return std::unexpected(Error{Error::Code::Validation,
                                         "range on non-numeric slot " + std::to_string(i)});
        auto const type = attributes.typeTags[i];
        if (slotRange->min)
            if (auto checked = checkBound(*slotRange->min, type, i, "range min"); !checked)
                return checked;
        if (slotRange->max)
            if (auto checked = checkBound(*slotRange->max, type, i, "range max"); !checked)
                return checked;
        for (auto v : slotRange->vals)
            if (auto checked = checkBound(v, type, i, "VALS entry"); !checked)
                return checked;
        if (slotRange->min && slotRange->max && *slotRange->min > *slotRange->max)
            return std::unexpected(Error{Error::Code::Validation, "range min exceeds max on slot " + std::to_string(i)});
        if (slotRange->clip == ClipMode::None && i < attributes.value.size()) {
            auto const current = numericValue(attributes.value[i]);
            if (current && ((slotRange->min && *current < *slotRange->min) || (slotRange->max && *current > *slotRange->max)))
                return std::unexpected(Error{Error::Code::Validation,
                                             "initial value outside range on slot " + std::to_string(i)});
        }
    }
    return {};
}

} // namespace OQ
