#pragma once

#include "core/NodeAttributes.hpp"
#include "path/TransparentString.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace OQ {

/**
 * One address in the OSC namespace.
 *
 * Structure:
 * - children: sub-tree keyed by the next address segment
 * - attributes: type tags, value slots and metadata stored at this exact address
 *
 * Notes:
 * - Concurrency: none. Nodes are only touched through the Tree, which the
 *   MutationCoordinator guards with a reader/writer lock.
 * - fullPath is fixed at construction; a rename is a remove plus an insert.
 */
struct Node final {
    using ChildrenMap = phmap::node_hash_map<std::string, std::unique_ptr<Node>, TransparentStringHash, std::equal_to<>>;

    explicit Node(std::string path)
        : fullPath(std::move(path)) {}

    std::string    fullPath;
    NodeAttributes attributes;
    ChildrenMap    children;

    bool hasChildren() const noexcept { return !children.empty(); }
    bool isLeaf() const noexcept { return !hasChildren(); }

    auto segment() const -> std::string_view {
        auto const pos = fullPath.rfind('/');
        return std::string_view{fullPath}.substr(pos + 1);
    }

    // Create or fetch a child node for the given segment
    Node& getOrCreateChild(std::string_view name) {
        if (auto* existing = getChild(name))
            return *existing;
        std::string childPath = fullPath == "/" ? std::string{} : fullPath;
        childPath.push_back('/');
        childPath.append(name);
        auto [it, inserted] = children.try_emplace(std::string{name}, std::make_unique<Node>(std::move(childPath)));
        return *it->second;
    }

    Node const* getChild(std::string_view name) const {
        auto it = children.find(name);
        return it == children.end() ? nullptr : it->second.get();
    }

    Node* getChild(std::string_view name) {
        auto it = children.find(name);
        return it == children.end() ? nullptr : it->second.get();
    }

    // Visits children in lexicographic segment order
    template <typename Fn>
    void forEachChild(Fn&& fn) const {
        std::vector<std::pair<std::string_view, Node const*>> ordered;
        ordered.reserve(children.size());
        for (auto const& kv : children)
            ordered.emplace_back(kv.first, kv.second.get());
        std::ranges::sort(ordered, {}, &std::pair<std::string_view, Node const*>::first);
        for (auto const& [name, child] : ordered)
            fn(name, *child);
    }

    // Remove a child by segment; returns true if erased
    bool eraseChild(std::string_view name) {
        auto it = children.find(name);
        if (it == children.end())
            return false;
        children.erase(it);
        return true;
    }
};

} // namespace OQ
