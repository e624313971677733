#include "Tree.hpp"
#include "log/TaggedLogger.hpp"
#include "path/Path.hpp"

#include <algorithm>
#include <cmath>

namespace OQ {

namespace {

auto collectPostOrder(Node const& node, std::vector<std::string>& out) -> void {
    node.forEachChild([&](std::string_view, Node const& child) { collectPostOrder(child, out); });
    out.push_back(node.fullPath);
}

// NaN slots compare equal to NaN so re-sending the same NaN is not a change.
auto sameScalar(OscScalar const& lhs, OscScalar const& rhs) -> bool {
    if (auto const* l = std::get_if<float>(&lhs), *r = std::get_if<float>(&rhs); l && r)
        return *l == *r || (std::isnan(*l) && std::isnan(*r));
    if (auto const* l = std::get_if<double>(&lhs), *r = std::get_if<double>(&rhs); l && r)
        return *l == *r || (std::isnan(*l) && std::isnan(*r));
    return lhs == rhs;
}

auto sameValues(OscValues const& lhs, OscValues const& rhs) -> bool {
    return std::ranges::equal(lhs, rhs, sameScalar);
}

auto slotName(std::size_t index) -> std::string {
    return "slot " + std::to_string(index);
}

} // namespace

Tree::Tree()
    : root_(std::make_unique<Node>("/")) {}

Tree::~Tree() = default;

auto Tree::resolve(std::string_view path) const -> Node const* {
    if (validate_address(path).code != PathValidation::Code::None)
        return nullptr;
    std::vector<std::string_view> segments;
    splitSegments(path, segments);
    Node const* node = root_.get();
    for (auto const& segment : segments) {
        node = node->getChild(segment);
        if (!node)
            return nullptr;
    }
    return node;
}

auto Tree::resolveMutable(std::string_view path) -> Node* {
    return const_cast<Node*>(static_cast<Tree const*>(this)->resolve(path));
}

auto Tree::insert(std::string_view path, NodeAttributes attributes) -> Expected<InsertOutcome> {
    auto segments = splitAddress(path);
    if (!segments)
        return std::unexpected(segments.error());
    if (auto valid = validateAttributes(attributes); !valid)
        return std::unexpected(valid.error());

    // Check the target before creating any intermediate so a rejected insert leaves no trace.
    if (auto const* existing = resolve(path)) {
        if (existing->attributes == attributes)
            return InsertOutcome{};
        if (!existing->attributes.isContainer())
            return std::unexpected(Error{Error::Code::Conflict, "node already exists at " + std::string{path}});
    }

    InsertOutcome outcome;
    Node*         node = root_.get();
    for (auto const& segment : *segments) {
        if (auto* child = node->getChild(segment)) {
            node = child;
            continue;
        }
        node = &node->getOrCreateChild(segment);
        outcome.added.push_back(node->fullPath);
    }
    outcome.replaced = outcome.added.empty();
    node->attributes = std::move(attributes);
    oq_log("insert " + node->fullPath, "Tree");
    return outcome;
}

auto Tree::remove(std::string_view path) -> Expected<std::vector<std::string>> {
    if (auto checked = checkAddress(path); !checked)
        return std::unexpected(checked.error());
    if (path == "/")
        return std::unexpected(Error{Error::Code::BadRequest, "the root node cannot be removed"});

    auto* parent = resolveMutable(parentOf(path));
    auto  name   = lastSegment(path);
    auto* target = parent ? parent->getChild(name) : nullptr;
    if (!target)
        return std::unexpected(Error{Error::Code::NotFound, "no node at " + std::string{path}});

    std::vector<std::string> removed;
    collectPostOrder(*target, removed);
    parent->eraseChild(name);
    oq_log("remove " + std::string{path} + " (" + std::to_string(removed.size()) + " nodes)", "Tree");
    return removed;
}

auto Tree::setValue(std::string_view path, OscValues const& values) -> Expected<SetValueOutcome> {
    if (auto checked = checkAddress(path); !checked)
        return std::unexpected(checked.error());
    auto* node = resolveMutable(path);
    if (!node)
        return std::unexpected(Error{Error::Code::NotFound, "no node at " + std::string{path}});

    auto& attributes = node->attributes;
    if (!isWritable(attributes.access))
        return std::unexpected(Error{Error::Code::Access, std::string{path} + " is not writable"});

    auto conformed = conformValues(attributes, values);
    if (!conformed)
        return std::unexpected(conformed.error());

    SetValueOutcome outcome;
    outcome.changed = !sameValues(attributes.value, *conformed);
    if (outcome.changed) {
        for (std::size_t i = 0; i < attributes.typeTags.size(); ++i) {
            if (auto const* flag = std::get_if<bool>(&(*conformed)[i]))
                attributes.typeTags[i] = *flag ? OscType::True : OscType::False;
        }
        attributes.value = *conformed;
    }
    outcome.stored = std::move(*conformed);
    return outcome;
}

auto conformValues(NodeAttributes const& attributes, OscValues const& values) -> Expected<OscValues> {
    auto const& tags = attributes.typeTags;
    if (values.size() != tags.size())
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "expected " + std::to_string(tags.size()) + " values of type '" + typeTagsToString(tags)
                                         + "', got " + std::to_string(values.size())});

    OscValues conformed;
    conformed.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto const& value = values[i];
        if (!matchesTag(value, tags[i]))
            return std::unexpected(Error{Error::Code::TypeMismatch,
                                         slotName(i) + " expects '" + static_cast<char>(tags[i]) + "', got "
                                             + describeScalar(value)});

        auto const* slotRange = i < attributes.range.size() && attributes.range[i] ? &*attributes.range[i] : nullptr;
        auto const  number    = numericValue(value);
        if (!slotRange || !number) {
            conformed.push_back(value);
            continue;
        }
        if (std::isnan(*number))
            return std::unexpected(Error{Error::Code::Validation, slotName(i) + " is NaN"});

        if (!slotRange->vals.empty() && std::ranges::find(slotRange->vals, *number) == slotRange->vals.end())
            return std::unexpected(Error{Error::Code::Validation, slotName(i) + " value not among allowed VALS"});

        double clipped  = *number;
        bool   belowMin = slotRange->min && clipped < *slotRange->min;
        bool   aboveMax = slotRange->max && clipped > *slotRange->max;
        switch (slotRange->clip) {
            case ClipMode::None:
                if (belowMin || aboveMax)
                    return std::unexpected(Error{Error::Code::Validation, slotName(i) + " value out of range"});
                break;
            case ClipMode::Low:
                if (belowMin)
                    clipped = *slotRange->min;
                break;
            case ClipMode::High:
                if (aboveMax)
                    clipped = *slotRange->max;
                break;
            case ClipMode::Both:
                if (belowMin)
                    clipped = *slotRange->min;
                if (aboveMax)
                    clipped = *slotRange->max;
                break;
        }
        conformed.push_back(clipped == *number ? value : withNumericValue(value, clipped));
    }
    return conformed;
}

} // namespace OQ
