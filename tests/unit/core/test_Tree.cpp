#include "core/Tree.hpp"

#include <doctest/doctest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace OQ;

namespace {

auto freqAttributes(ClipMode clip = ClipMode::Both) -> NodeAttributes {
    auto attrs = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {440.0f});
    attrs.withRange(0, SlotRange{20.0, 20000.0, {}, clip});
    return attrs;
}

} // namespace

TEST_SUITE("core.tree") {

TEST_CASE("insert creates intermediates parents first") {
    Tree tree;
    auto outcome = tree.insert("/synth/osc/freq", freqAttributes());
    REQUIRE(outcome);
    CHECK(outcome->added == std::vector<std::string>{"/synth", "/synth/osc", "/synth/osc/freq"});
    CHECK_FALSE(outcome->replaced);
    CHECK(tree.root().children.size() == 1);

    auto const* node = tree.resolve("/synth/osc/freq");
    REQUIRE(node != nullptr);
    CHECK(node->attributes == freqAttributes());

    auto const* intermediate = tree.resolve("/synth/osc");
    REQUIRE(intermediate != nullptr);
    CHECK(intermediate->attributes.isContainer());
}

TEST_CASE("resolve rejects invalid and missing paths") {
    Tree tree;
    CHECK(tree.resolve("/") == &tree.root());
    CHECK(tree.resolve("/missing") == nullptr);
    CHECK(tree.resolve("not/a/path") == nullptr);
    CHECK(tree.resolve("/a b") == nullptr);
}

TEST_CASE("insert conflicts and replacements") {
    Tree tree;
    REQUIRE(tree.insert("/synth/freq", freqAttributes()));

    SUBCASE("identical insert is a no-op") {
        auto again = tree.insert("/synth/freq", freqAttributes());
        REQUIRE(again);
        CHECK(again->added.empty());
        CHECK_FALSE(again->replaced);
    }
    SUBCASE("different attributes on a parameter conflict") {
        auto other = tree.insert("/synth/freq", NodeAttributes::parameter({OscType::Int32}, Access::ReadOnly));
        REQUIRE_FALSE(other);
        CHECK(other.error().code == Error::Code::Conflict);
    }
    SUBCASE("auto-created container can be declared later and keeps its children") {
        auto replaced = tree.insert("/synth", NodeAttributes::container("the synth"));
        REQUIRE(replaced);
        CHECK(replaced->replaced);
        CHECK(tree.resolve("/synth")->attributes.description == "the synth");
        CHECK(tree.resolve("/synth/freq") != nullptr);
    }
    SUBCASE("invalid declaration leaves no trace") {
        auto bad = tree.insert("/new/branch", NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {}).withRange(0, SlotRange{5.0, 1.0, {}, ClipMode::None}));
        CHECK_FALSE(bad);
        CHECK(tree.resolve("/new") == nullptr);
    }
    SUBCASE("invalid path") {
        auto bad = tree.insert("/bad path", freqAttributes());
        REQUIRE_FALSE(bad);
        CHECK(bad.error().code == Error::Code::InvalidPath);
    }
}

TEST_CASE("remove returns leaves first") {
    Tree tree;
    REQUIRE(tree.insert("/synth/a/x", NodeAttributes::parameter({OscType::Int32}, Access::ReadWrite)));
    REQUIRE(tree.insert("/synth/b", NodeAttributes::parameter({OscType::Int32}, Access::ReadWrite)));

    auto removed = tree.remove("/synth");
    REQUIRE(removed);
    CHECK(*removed == std::vector<std::string>{"/synth/a/x", "/synth/a", "/synth/b", "/synth"});
    CHECK(tree.resolve("/synth") == nullptr);
    CHECK_FALSE(tree.root().hasChildren());

    auto missing = tree.remove("/synth");
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == Error::Code::NotFound);

    auto root = tree.remove("/");
    REQUIRE_FALSE(root);
    CHECK(root.error().code == Error::Code::BadRequest);
}

TEST_CASE("setValue clips according to the clip mode") {
    Tree tree;
    REQUIRE(tree.insert("/both", freqAttributes(ClipMode::Both)));
    REQUIRE(tree.insert("/low", freqAttributes(ClipMode::Low)));
    REQUIRE(tree.insert("/high", freqAttributes(ClipMode::High)));
    REQUIRE(tree.insert("/none", freqAttributes(ClipMode::None)));

    auto both = tree.setValue("/both", {30000.0f});
    REQUIRE(both);
    CHECK(both->changed);
    CHECK(std::get<float>(both->stored[0]) == doctest::Approx(20000.0f));
    CHECK(std::get<float>(tree.resolve("/both")->attributes.value[0]) == doctest::Approx(20000.0f));

    auto bothLow = tree.setValue("/both", {1.0f});
    REQUIRE(bothLow);
    CHECK(std::get<float>(bothLow->stored[0]) == doctest::Approx(20.0f));

    auto low = tree.setValue("/low", {30000.0f});
    REQUIRE(low);
    CHECK(std::get<float>(low->stored[0]) == doctest::Approx(30000.0f));
    auto lowClipped = tree.setValue("/low", {5.0f});
    REQUIRE(lowClipped);
    CHECK(std::get<float>(lowClipped->stored[0]) == doctest::Approx(20.0f));

    auto high = tree.setValue("/high", {5.0f});
    REQUIRE(high);
    CHECK(std::get<float>(high->stored[0]) == doctest::Approx(5.0f));
    auto highClipped = tree.setValue("/high", {30000.0f});
    REQUIRE(highClipped);
    CHECK(std::get<float>(highClipped->stored[0]) == doctest::Approx(20000.0f));

    auto none = tree.setValue("/none", {30000.0f});
    REQUIRE_FALSE(none);
    CHECK(none.error().code == Error::Code::Validation);
    CHECK(std::get<float>(tree.resolve("/none")->attributes.value[0]) == doctest::Approx(440.0f));
}

TEST_CASE("setValue reports unchanged values") {
    Tree tree;
    REQUIRE(tree.insert("/v", freqAttributes()));
    auto first = tree.setValue("/v", {100.0f});
    REQUIRE(first);
    CHECK(first->changed);
    auto second = tree.setValue("/v", {100.0f});
    REQUIRE(second);
    CHECK_FALSE(second->changed);
}

TEST_CASE("repeating NaN on an unranged float slot is not a change") {
    Tree tree;
    REQUIRE(tree.insert("/raw", NodeAttributes::parameter({OscType::Float32, OscType::Double}, Access::ReadWrite)));
    OscValues const nans{std::numeric_limits<float>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN()};

    auto first = tree.setValue("/raw", nans);
    REQUIRE(first);
    CHECK(first->changed);
    CHECK(std::isnan(std::get<float>(tree.resolve("/raw")->attributes.value[0])));

    auto second = tree.setValue("/raw", nans);
    REQUIRE(second);
    CHECK_FALSE(second->changed);

    auto third = tree.setValue("/raw", {1.0f, std::numeric_limits<double>::quiet_NaN()});
    REQUIRE(third);
    CHECK(third->changed);
}

TEST_CASE("integer slots never store a value outside their range") {
    Tree tree;
    auto fractional = NodeAttributes::parameter({OscType::Int32}, Access::ReadWrite);
    fractional.withRange(0, SlotRange{0.0, 10.5, {}, ClipMode::Both});
    auto rejected = tree.insert("/steps", fractional);
    REQUIRE_FALSE(rejected);
    CHECK(rejected.error().code == Error::Code::Validation);
    CHECK(tree.resolve("/steps") == nullptr);

    auto whole = NodeAttributes::parameter({OscType::Int32}, Access::ReadWrite);
    whole.withRange(0, SlotRange{0.0, 10.0, {}, ClipMode::Both});
    REQUIRE(tree.insert("/steps", whole));
    auto above = tree.setValue("/steps", {std::int32_t{11}});
    REQUIRE(above);
    CHECK(std::get<std::int32_t>(above->stored[0]) == 10);
    auto below = tree.setValue("/steps", {std::int32_t{-3}});
    REQUIRE(below);
    CHECK(std::get<std::int32_t>(below->stored[0]) == 0);
}

TEST_CASE("setValue errors") {
    Tree tree;
    REQUIRE(tree.insert("/ro", NodeAttributes::parameter({OscType::Int32}, Access::ReadOnly)));
    REQUIRE(tree.insert("/rw", NodeAttributes::parameter({OscType::Int32, OscType::String}, Access::ReadWrite)));
    REQUIRE(tree.insert("/group", NodeAttributes::container()));

    CHECK(tree.setValue("/missing", {std::int32_t{1}}).error().code == Error::Code::NotFound);
    CHECK(tree.setValue("/ro", {std::int32_t{1}}).error().code == Error::Code::Access);
    CHECK(tree.setValue("/group", {std::int32_t{1}}).error().code == Error::Code::Access);
    CHECK(tree.setValue("/rw", {std::int32_t{1}}).error().code == Error::Code::TypeMismatch);
    CHECK(tree.setValue("/rw", {std::string{"a"}, std::int32_t{1}}).error().code == Error::Code::TypeMismatch);
    CHECK(tree.setValue("/rw", {std::int32_t{1}, std::string{"a"}}));
}

TEST_CASE("enumerated VALS restrict accepted numbers") {
    Tree tree;
    auto attrs = NodeAttributes::parameter({OscType::Int32}, Access::ReadWrite);
    attrs.withRange(0, SlotRange{std::nullopt, std::nullopt, {0.0, 1.0, 2.0}, ClipMode::None});
    REQUIRE(tree.insert("/wave", attrs));

    CHECK(tree.setValue("/wave", {std::int32_t{2}}));
    auto rejected = tree.setValue("/wave", {std::int32_t{7}});
    REQUIRE_FALSE(rejected);
    CHECK(rejected.error().code == Error::Code::Validation);
}

TEST_CASE("boolean slots follow the stored value") {
    Tree tree;
    REQUIRE(tree.insert("/gate", NodeAttributes::parameter({OscType::False}, Access::ReadWrite)));
    REQUIRE(tree.setValue("/gate", {true}));
    CHECK(tree.resolve("/gate")->attributes.typeTags[0] == OscType::True);
}

TEST_CASE("conformValues rejects NaN in ranged slots") {
    auto attrs  = freqAttributes();
    auto result = conformValues(attrs, {std::numeric_limits<float>::quiet_NaN()});
    REQUIRE_FALSE(result);
    CHECK(result.error().code == Error::Code::Validation);
}

} // TEST_SUITE
