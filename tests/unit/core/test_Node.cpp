#include "core/Node.hpp"

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace OQ;

TEST_SUITE("core.node") {

TEST_CASE("children get full paths from their parent") {
    Node root{"/"};
    auto& synth = root.getOrCreateChild("synth");
    CHECK(synth.fullPath == "/synth");
    CHECK(synth.segment() == "synth");

    auto& freq = synth.getOrCreateChild("freq");
    CHECK(freq.fullPath == "/synth/freq");
    CHECK(freq.segment() == "freq");

    CHECK(root.hasChildren());
    CHECK(freq.isLeaf());
}

TEST_CASE("getOrCreateChild returns the existing child") {
    Node root{"/"};
    auto& first  = root.getOrCreateChild("a");
    auto& second = root.getOrCreateChild("a");
    CHECK(&first == &second);
    CHECK(root.children.size() == 1);
}

TEST_CASE("children are visited in lexicographic order") {
    Node root{"/"};
    root.getOrCreateChild("gamma");
    root.getOrCreateChild("alpha");
    root.getOrCreateChild("beta");

    std::vector<std::string> seen;
    root.forEachChild([&](std::string_view name, Node const& child) {
        CHECK(child.segment() == name);
        seen.emplace_back(name);
    });
    CHECK(seen == std::vector<std::string>{"alpha", "beta", "gamma"});
}

TEST_CASE("eraseChild drops the subtree") {
    Node root{"/"};
    root.getOrCreateChild("a").getOrCreateChild("b");
    CHECK(root.eraseChild("a"));
    CHECK_FALSE(root.eraseChild("a"));
    CHECK(root.getChild("a") == nullptr);
    CHECK(root.isLeaf());
}

} // TEST_SUITE
