#include "OscValue.hpp"
#include "type/Base64.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace OQ {

namespace {

using Json = nlohmann::json;

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

template <typename Int>
auto clampToInteger(double value) -> Int {
    if (std::isnan(value))
        return Int{0};
    auto const rounded = std::round(value);
    if (rounded <= static_cast<double>(std::numeric_limits<Int>::lowest()))
        return std::numeric_limits<Int>::lowest();
    if (rounded >= static_cast<double>(std::numeric_limits<Int>::max()))
        return std::numeric_limits<Int>::max();
    return static_cast<Int>(rounded);
}

} // namespace

auto isValidTypeTag(char tag) -> bool {
    switch (tag) {
        case 'i':
        case 'f':
        case 's':
        case 'b':
        case 'h':
        case 'd':
        case 'c':
        case 'S':
        case 'T':
        case 'F':
        case 'N':
        case 'I':
        case 't':
        case 'm':
            return true;
        default:
            return false;
    }
}

auto isNumeric(OscType type) -> bool {
    switch (type) {
        case OscType::Int32:
        case OscType::Float32:
        case OscType::Int64:
        case OscType::Double:
            return true;
        default:
            return false;
    }
}

auto isIntegral(OscType type) -> bool {
    return type == OscType::Int32 || type == OscType::Int64;
}

auto parseTypeTags(std::string_view tags) -> Expected<OscTypeTags> {
    if (!tags.empty() && tags.front() == ',')
        tags.remove_prefix(1);
    OscTypeTags parsed;
    parsed.reserve(tags.size());
    for (char tag : tags) {
        if (!isValidTypeTag(tag)) {
            std::string message = "unsupported OSC type tag '";
            message.push_back(tag);
            message.push_back('\'');
            return std::unexpected(Error{Error::Code::TypeMismatch, std::move(message)});
        }
        parsed.push_back(static_cast<OscType>(tag));
    }
    return parsed;
}

auto typeTagsToString(OscTypeTags const& tags) -> std::string {
    std::string out;
    out.reserve(tags.size());
    for (auto tag : tags)
        out.push_back(static_cast<char>(tag));
    return out;
}

auto tagOf(OscScalar const& value) -> OscType {
    return std::visit(Overloaded{
                          [](std::int32_t) { return OscType::Int32; },
                          [](float) { return OscType::Float32; },
                          [](std::string const&) { return OscType::String; },
                          [](OscBlob const&) { return OscType::Blob; },
                          [](std::int64_t) { return OscType::Int64; },
                          [](double) { return OscType::Double; },
                          [](char) { return OscType::Char; },
                          [](OscSymbol const&) { return OscType::Symbol; },
                          [](bool b) { return b ? OscType::True : OscType::False; },
                          [](OscNil) { return OscType::Nil; },
                          [](OscImpulse) { return OscType::Impulse; },
                          [](OscTimeTag) { return OscType::TimeTag; },
                          [](OscMidi const&) { return OscType::Midi; },
                      },
                      value);
}

auto matchesTag(OscScalar const& value, OscType type) -> bool {
    if (type == OscType::True || type == OscType::False)
        return std::holds_alternative<bool>(value);
    return tagOf(value) == type;
}

auto defaultValueFor(OscType type) -> OscScalar {
    switch (type) {
        case OscType::Int32:
            return std::int32_t{0};
        case OscType::Float32:
            return 0.0f;
        case OscType::String:
            return std::string{};
        case OscType::Blob:
            return OscBlob{};
        case OscType::Int64:
            return std::int64_t{0};
        case OscType::Double:
            return 0.0;
        case OscType::Char:
            return char{'\0'};
        case OscType::Symbol:
            return OscSymbol{};
        case OscType::True:
            return true;
        case OscType::False:
            return false;
        case OscType::Nil:
            return OscNil{};
        case OscType::Impulse:
            return OscImpulse{};
        case OscType::TimeTag:
            return OscTimeTag{};
        case OscType::Midi:
            return OscMidi{};
    }
    return OscNil{};
}

auto numericValue(OscScalar const& value) -> std::optional<double> {
    if (auto const* v = std::get_if<std::int32_t>(&value))
        return static_cast<double>(*v);
    if (auto const* v = std::get_if<float>(&value))
        return static_cast<double>(*v);
    if (auto const* v = std::get_if<std::int64_t>(&value))
        return static_cast<double>(*v);
    if (auto const* v = std::get_if<double>(&value))
        return *v;
    return std::nullopt;
}

auto withNumericValue(OscScalar const& like, double value) -> OscScalar {
    if (std::holds_alternative<std::int32_t>(like))
        return clampToInteger<std::int32_t>(value);
    if (std::holds_alternative<float>(like))
        return static_cast<float>(value);
    if (std::holds_alternative<std::int64_t>(like))
        return clampToInteger<std::int64_t>(value);
    if (std::holds_alternative<double>(like))
        return value;
    return like;
}

auto toJson(OscScalar const& value) -> Json {
    return std::visit(Overloaded{
                          [](std::int32_t v) -> Json { return v; },
                          [](float v) -> Json { return v; },
                          [](std::string const& v) -> Json { return v; },
                          [](OscBlob const& v) -> Json { return encode_base64(v.bytes); },
                          [](std::int64_t v) -> Json { return v; },
                          [](double v) -> Json { return v; },
                          [](char v) -> Json { return std::string(1, v); },
                          [](OscSymbol const& v) -> Json { return v.name; },
                          [](bool v) -> Json { return v; },
                          [](OscNil) -> Json { return nullptr; },
                          [](OscImpulse) -> Json { return nullptr; },
                          [](OscTimeTag v) -> Json { return v.ntp; },
                          [](OscMidi const& v) -> Json {
                              return Json::array({v.bytes[0], v.bytes[1], v.bytes[2], v.bytes[3]});
                          },
                      },
                      value);
}

auto toJson(OscValues const& values) -> Json {
    auto array = Json::array();
    for (auto const& value : values)
        array.push_back(toJson(value));
    return array;
}

auto describeScalar(OscScalar const& value) -> std::string {
    std::ostringstream oss;
    oss << static_cast<char>(tagOf(value)) << ':' << toJson(value).dump();
    return oss.str();
}

} // namespace OQ
