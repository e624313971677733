#pragma once
#include "core/Error.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace OQ {

enum class QueryParam {
    Value,
    Type,
    Range,
    ClipMode,
    Access,
    Description,
    Unit,
    HostInfo
};

[[nodiscard]] auto toKey(QueryParam param) -> std::string_view;

// Case-insensitive keyword lookup ("VALUE", "host_info", ...).
[[nodiscard]] auto queryParamFromKey(std::string_view key) -> std::optional<QueryParam>;

// Zero keys yield nullopt. More than one key, or an unknown one, is BadRequest.
[[nodiscard]] auto parseQueryParams(std::span<std::string const> keys) -> Expected<std::optional<QueryParam>>;

// Raw query component, with or without the leading '?'. "a=b" pairs count by key.

} // namespace OQ
