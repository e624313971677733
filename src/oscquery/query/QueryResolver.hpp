#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "query/QueryParam.hpp"
#include "server/HostInfo.hpp"

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace OQ {

class MutationCoordinator;

/**
 * Turns (path, optional parameter) into the JSON attribute view.
 *
 * Every query runs inside MutationCoordinator::read, so it observes a
 * consistent snapshot of the Tree and never a half-applied edit.
 */
class QueryResolver {
public:
    // contentsDepth: levels of CONTENTS rendered as full objects; 0 means unlimited.
    QueryResolver(MutationCoordinator const& coordinator, HostInfo hostInfo, int contentsDepth = 1);

    [[nodiscard]] auto query(std::string_view path, std::optional<QueryParam> param) const -> Expected<nlohmann::json>;

    [[nodiscard]] auto hostInfo() const -> HostInfo const& { return hostInfo_; }
    auto               setHostInfo(HostInfo hostInfo) -> void { hostInfo_ = std::move(hostInfo); }

    // Full attribute object; deeper levels are {"FULL_PATH": ...} stubs.
    [[nodiscard]] static auto renderNode(Node const& node, int contentsDepth) -> nlohmann::json;

    // {"<KEY>": value} for a single node attribute; HostInfo is not a node attribute.
    [[nodiscard]] static auto renderAttribute(Node const& node, QueryParam param) -> Expected<nlohmann::json>;

private:
    MutationCoordinator const& coordinator_;
    HostInfo                   hostInfo_;
    int                        contentsDepth_;
};

} // namespace OQ
