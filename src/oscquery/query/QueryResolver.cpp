#include "QueryResolver.hpp"
#include "coordinator/MutationCoordinator.hpp"
#include "path/Path.hpp"

namespace OQ {

namespace {

using Json = nlohmann::json;

auto boundToJson(double bound, OscType type) -> Json {
    if (isIntegral(type))
        return static_cast<std::int64_t>(bound);
    return bound;
}

auto rangeToJson(NodeAttributes const& attributes) -> Json {
    auto array = Json::array();
    for (std::size_t i = 0; i < attributes.typeTags.size(); ++i) {
        auto const* slotRange = i < attributes.range.size() && attributes.range[i] ? &*attributes.range[i] : nullptr;
        if (!slotRange) {
            array.push_back(nullptr);
            continue;
        }
        auto const type  = attributes.typeTags[i];
        auto       entry = Json::object();
        if (slotRange->min)
            entry["MIN"] = boundToJson(*slotRange->min, type);
        if (slotRange->max)
            entry["MAX"] = boundToJson(*slotRange->max, type);
        if (!slotRange->vals.empty()) {
            auto vals = Json::array();
            for (auto v : slotRange->vals)
                vals.push_back(boundToJson(v, type));
            entry["VALS"] = std::move(vals);
        }
        entry["CLIPMODE"] = std::string{clipModeToString(slotRange->clip)};
        array.push_back(std::move(entry));
    }
    return array;
}

auto clipModesToJson(NodeAttributes const& attributes) -> Json {
    auto array = Json::array();
    for (std::size_t i = 0; i < attributes.typeTags.size(); ++i) {
        auto const mode = i < attributes.range.size() && attributes.range[i] ? attributes.range[i]->clip : ClipMode::None;
        array.push_back(std::string{clipModeToString(mode)});
    }
    return array;
}

auto unitsToJson(NodeAttributes const& attributes) -> Json {
    auto array = Json::array();
    for (std::size_t i = 0; i < attributes.typeTags.size(); ++i) {
        if (i < attributes.unit.size() && attributes.unit[i])
            array.push_back(*attributes.unit[i]);
        else
            array.push_back(nullptr);
    }
    return array;
}

auto hasReadableValue(NodeAttributes const& attributes) -> bool {
    return isReadable(attributes.access) && !attributes.value.empty();
}

auto renderLevel(Node const& node, int remaining, bool unlimited) -> Json {
    auto const& attributes = node.attributes;
    auto        json       = Json::object();
    json["FULL_PATH"]      = node.fullPath;
    json["ACCESS"]         = static_cast<int>(attributes.access);
    if (!attributes.typeTags.empty())
        json["TYPE"] = typeTagsToString(attributes.typeTags);
    if (hasReadableValue(attributes))
        json["VALUE"] = toJson(attributes.value);
    if (attributes.hasRange()) {
        json["RANGE"]    = rangeToJson(attributes);
        json["CLIPMODE"] = clipModesToJson(attributes);
    }
    if (attributes.hasUnit())
        json["UNIT"] = unitsToJson(attributes);
    if (attributes.description)
        json["DESCRIPTION"] = *attributes.description;

    if (node.hasChildren()) {
        auto contents = Json::object();
        node.forEachChild([&](std::string_view name, Node const& child) {
            if (unlimited || remaining > 0) {
                contents[std::string{name}] = renderLevel(child, remaining - 1, unlimited);
            } else {
                contents[std::string{name}] = Json{{"FULL_PATH", child.fullPath}};
            }
        });
        json["CONTENTS"] = std::move(contents);
    }
    return json;
}

auto unsupported(Node const& node, QueryParam param) -> Error {
    return Error{Error::Code::UnsupportedParam,
                 std::string{toKey(param)} + " is not available on " + node.fullPath};
}

} // namespace

QueryResolver::QueryResolver(MutationCoordinator const& coordinator, HostInfo hostInfo, int contentsDepth)
    : coordinator_(coordinator), hostInfo_(std::move(hostInfo)), contentsDepth_(contentsDepth) {}

auto QueryResolver::renderNode(Node const& node, int contentsDepth) -> Json {
    return renderLevel(node, contentsDepth, contentsDepth <= 0);
}

auto QueryResolver::renderAttribute(Node const& node, QueryParam param) -> Expected<Json> {
    auto const& attributes = node.attributes;
    switch (param) {
        case QueryParam::Value:
            if (attributes.access == Access::NoValue || attributes.value.empty())
                return std::unexpected(unsupported(node, param));
            if (!isReadable(attributes.access))
                return std::unexpected(Error{Error::Code::Access, node.fullPath + " is write-only"});
            return Json{{"VALUE", toJson(attributes.value)}};
        case QueryParam::Type:
            if (attributes.typeTags.empty())
                return std::unexpected(unsupported(node, param));
            return Json{{"TYPE", typeTagsToString(attributes.typeTags)}};
        case QueryParam::Range:
            if (!attributes.hasRange())
                return std::unexpected(unsupported(node, param));
            return Json{{"RANGE", rangeToJson(attributes)}};
        case QueryParam::ClipMode:
            if (!attributes.hasRange())
                return std::unexpected(unsupported(node, param));
            return Json{{"CLIPMODE", clipModesToJson(attributes)}};
        case QueryParam::Access:
            return Json{{"ACCESS", static_cast<int>(attributes.access)}};
        case QueryParam::Description:
            if (!attributes.description)
                return std::unexpected(unsupported(node, param));
            return Json{{"DESCRIPTION", *attributes.description}};
        case QueryParam::Unit:
            if (!attributes.hasUnit())
                return std::unexpected(unsupported(node, param));
            return Json{{"UNIT", unitsToJson(attributes)}};
        case QueryParam::HostInfo:
            return std::unexpected(Error{Error::Code::BadRequest, "HOST_INFO is not a node attribute"});
    }
    return std::unexpected(Error{Error::Code::UnknownError, "unhandled query parameter"});
}

auto QueryResolver::query(std::string_view path, std::optional<QueryParam> param) const -> Expected<Json> {
    if (param == QueryParam::HostInfo)
        return toJson(hostInfo_);
    if (auto checked = checkAddress(path); !checked)
        return std::unexpected(Error{Error::Code::NotFound, describeError(checked.error())});

    return coordinator_.read([&](Tree const& tree) -> Expected<Json> {
        auto const* node = tree.resolve(path);
        if (!node)
            return std::unexpected(Error{Error::Code::NotFound, "no node at " + std::string{path}});
        if (!param)
            return renderNode(*node, contentsDepth_);
        return renderAttribute(*node, *param);
    });
}

} // namespace OQ
