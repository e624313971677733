#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "core/NodeAttributes.hpp"
#include "type/OscValue.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace OQ {

struct InsertOutcome {
    std::vector<std::string> added;    // new addresses, parents first
    bool                     replaced = false; // attributes of an existing container were replaced
};

struct SetValueOutcome {
    bool      changed = false;
    OscValues stored; // the value after clipping
};

/**
 * Root-owned hierarchy of Nodes.
 *
 * The Tree has no internal locking. Every mutation runs on the
 * MutationCoordinator's executor while it holds the writer lock; reads run
 * under the shared lock through MutationCoordinator::read.
 */
class Tree {
public:
    Tree();
    ~Tree();

    Tree(Tree const&)            = delete;
    Tree& operator=(Tree const&) = delete;

    [[nodiscard]] auto root() const -> Node const& { return *root_; }

    // O(depth) lookup; nullptr for an absent or malformed address.
    [[nodiscard]] auto resolve(std::string_view path) const -> Node const*;

    // Creates intermediate containers as needed.
    [[nodiscard]] auto insert(std::string_view path, NodeAttributes attributes) -> Expected<InsertOutcome>;

    // Deletes the subtree at `path`. Returns the removed addresses, leaves first.
    [[nodiscard]] auto remove(std::string_view path) -> Expected<std::vector<std::string>>;

    // Validates against type tags, access and ranges, clips, then stores.
    [[nodiscard]] auto setValue(std::string_view path, OscValues const& values) -> Expected<SetValueOutcome>;

private:
    auto resolveMutable(std::string_view path) -> Node*;

    std::unique_ptr<Node> root_;
};

// Applies type, VALS and min/max rules for `attributes` to `values`; does not look at access.
[[nodiscard]] auto conformValues(NodeAttributes const& attributes, OscValues const& values) -> Expected<OscValues>;

} // namespace OQ
