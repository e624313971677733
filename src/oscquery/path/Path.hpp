#pragma once
#include "core/Error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace OQ {

struct PathValidation {
    enum class Code {
        None,
        EmptyPath,
        MustStartWithSlash,
        EndsWithSlash,
        EmptyPathComponent,
        RelativePath,
        ReservedCharacter
    };
    Code        code     = Code::None;
    std::size_t position = 0;
};

// Checks an OSC address. "/" is valid and names the root.
constexpr auto validate_address(std::string_view str) -> PathValidation {
    if (str.empty())
        return {PathValidation::Code::EmptyPath, 0};
    if (str[0] != '/')
        return {PathValidation::Code::MustStartWithSlash, 0};
    if (str.size() == 1)
        return {};
    if (str.back() == '/')
        return {PathValidation::Code::EndsWithSlash, str.size() - 1};

    std::size_t segmentStart = 1;
    for (std::size_t i = 1; i <= str.size(); ++i) {
        if (i == str.size() || str[i] == '/') {
            auto const segment = str.substr(segmentStart, i - segmentStart);
            if (segment.empty())
                return {PathValidation::Code::EmptyPathComponent, i};
            if (segment == "." || segment == "..")
                return {PathValidation::Code::RelativePath, segmentStart};
            segmentStart = i + 1;
            continue;
        }
        switch (str[i]) {
            case ' ':
            case '#':
            case '*':
            case ',':
            case '?':
            case '[':
            case ']':
            case '{':
            case '}':
                return {PathValidation::Code::ReservedCharacter, i};
            default:
                break;
        }
    }
    return {};
}

constexpr auto get_validation_message(PathValidation::Code code) -> char const* {
    switch (code) {
        case PathValidation::Code::None:
            return "Valid address";
        case PathValidation::Code::EmptyPath:
            return "Empty address";
        case PathValidation::Code::MustStartWithSlash:
            return "Address must start with '/'";
        case PathValidation::Code::EndsWithSlash:
            return "Address ends with slash";
        case PathValidation::Code::EmptyPathComponent:
            return "Empty address component";
        case PathValidation::Code::RelativePath:
            return "Relative components not allowed";
        case PathValidation::Code::ReservedCharacter:
            return "Reserved OSC character in address";
    }
    return "Unknown validation error";
}

// Validates and splits; "/" yields no segments.
[[nodiscard]] auto splitAddress(std::string_view path) -> Expected<std::vector<std::string_view>>;

[[nodiscard]] auto checkAddress(std::string_view path) -> Expected<void>;

// Segments of an already-validated address. Empty components are skipped.
auto splitSegments(std::string_view path, std::vector<std::string_view>& out) -> void;

// "/a/b" -> "/a", "/a" -> "/", "/" -> "/".
auto parentOf(std::string_view path) -> std::string_view;

auto lastSegment(std::string_view path) -> std::string_view;

} // namespace OQ
