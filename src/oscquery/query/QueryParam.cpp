#include "QueryParam.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace OQ {

namespace {

constexpr QueryParam kAllParams[] = {QueryParam::Value,
                                     QueryParam::Type,
                                     QueryParam::Range,
                                     QueryParam::ClipMode,
                                     QueryParam::Access,
                                     QueryParam::Description,
                                     QueryParam::Unit,
                                     QueryParam::HostInfo};

auto equalsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
    });
}

} // namespace

auto toKey(QueryParam param) -> std::string_view {
    switch (param) {
        case QueryParam::Value:
            return "VALUE";
        case QueryParam::Type:
            return "TYPE";
        case QueryParam::Range:
            return "RANGE";
        case QueryParam::ClipMode:
            return "CLIPMODE";
        case QueryParam::Access:
            return "ACCESS";
        case QueryParam::Description:
            return "DESCRIPTION";
        case QueryParam::Unit:
            return "UNIT";
        case QueryParam::HostInfo:
            return "HOST_INFO";
    }
    return "VALUE";
}

auto queryParamFromKey(std::string_view key) -> std::optional<QueryParam> {
    for (auto param : kAllParams) {
        if (equalsIgnoreCase(toKey(param), key))
            return param;
    }
    return std::nullopt;
}

auto parseQueryParams(std::span<std::string const> keys) -> Expected<std::optional<QueryParam>> {
    if (keys.empty())
        return std::optional<QueryParam>{};
    if (keys.size() > 1)
        return std::unexpected(Error{Error::Code::BadRequest, "only one query parameter is allowed per request"});
    auto param = queryParamFromKey(keys.front());
    if (!param)
        return std::unexpected(Error{Error::Code::BadRequest, "unknown query parameter '" + keys.front() + "'"});
    return param;
}

} // namespace OQ
