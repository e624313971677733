#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace OQ {

// Heterogeneous lookup for string-keyed maps: find(std::string_view) without a temporary std::string.
struct TransparentStringHash {
    using is_transparent = void;

    auto operator()(std::string_view sv) const noexcept -> std::size_t { return std::hash<std::string_view>{}(sv); }
    auto operator()(std::string const& s) const noexcept -> std::size_t { return std::hash<std::string_view>{}(s); }
    auto operator()(char const* s) const noexcept -> std::size_t { return std::hash<std::string_view>{}(s); }
};

} // namespace OQ
