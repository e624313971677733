#include "core/NodeAttributes.hpp"

#include <doctest/doctest.h>

#include <limits>
#include <string>

using namespace OQ;

TEST_SUITE("core.node_attributes") {

TEST_CASE("clip mode strings") {
    CHECK(clipModeToString(ClipMode::None) == "none");
    CHECK(clipModeToString(ClipMode::Both) == "both");
    CHECK(clipModeToString(ClipMode::Low) == "low");
    CHECK(clipModeToString(ClipMode::High) == "high");
}

TEST_CASE("access helpers") {
    CHECK(isReadable(Access::ReadOnly));
    CHECK(isReadable(Access::ReadWrite));
    CHECK_FALSE(isReadable(Access::WriteOnly));
    CHECK_FALSE(isReadable(Access::NoValue));
    CHECK(isWritable(Access::WriteOnly));
    CHECK_FALSE(isWritable(Access::ReadOnly));
    CHECK(static_cast<int>(Access::ReadWrite) == 3);
}

TEST_CASE("parameter fills default values per slot") {
    auto attrs = NodeAttributes::parameter({OscType::Float32, OscType::Int32, OscType::String}, Access::ReadWrite);
    REQUIRE(attrs.value.size() == 3);
    CHECK(std::get<float>(attrs.value[0]) == 0.0f);
    CHECK(std::get<std::int32_t>(attrs.value[1]) == 0);
    CHECK(std::get<std::string>(attrs.value[2]).empty());
    CHECK_FALSE(attrs.isContainer());
    CHECK(validateAttributes(attrs));
}

TEST_CASE("container carries only a description") {
    auto attrs = NodeAttributes::container("group");
    CHECK(attrs.isContainer());
    CHECK(attrs.description == "group");
    CHECK(validateAttributes(attrs));
}

TEST_CASE("builders place range and unit on their slot") {
    auto attrs = NodeAttributes::parameter({OscType::Float32, OscType::Float32}, Access::ReadWrite);
    attrs.withRange(1, SlotRange{0.0, 1.0, {}, ClipMode::Both}).withUnit(0, "Hz").withDescription("pair");
    REQUIRE(attrs.range.size() == 2);
    CHECK_FALSE(attrs.range[0].has_value());
    CHECK(attrs.range[1]->max == 1.0);
    CHECK(attrs.hasRange());
    CHECK(attrs.hasUnit());
    CHECK(attrs.unit[0] == "Hz");
    CHECK(validateAttributes(attrs));
}

TEST_CASE("validation rejects inconsistent declarations") {
    SUBCASE("NO_VALUE with a value") {
        NodeAttributes attrs;
        attrs.value = {std::int32_t{1}};
        auto result = validateAttributes(attrs);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::Validation);
    }
    SUBCASE("value arity differs from type tags") {
        auto attrs  = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {1.0f, 2.0f});
        auto result = validateAttributes(attrs);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::TypeMismatch);
    }
    SUBCASE("value type differs from its tag") {
        auto attrs  = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {std::string{"x"}});
        auto result = validateAttributes(attrs);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::TypeMismatch);
    }
    SUBCASE("value node without tags") {
        NodeAttributes attrs;
        attrs.access = Access::ReadOnly;
        CHECK_FALSE(validateAttributes(attrs));
    }
    SUBCASE("range on a string slot") {
        auto attrs = NodeAttributes::parameter({OscType::String}, Access::ReadWrite);
        attrs.withRange(0, SlotRange{0.0, 1.0, {}, ClipMode::None});
        CHECK_FALSE(validateAttributes(attrs));
    }
    SUBCASE("more range entries than slots") {
        auto attrs = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite);
        attrs.withRange(3, SlotRange{0.0, 1.0, {}, ClipMode::None});
        CHECK_FALSE(validateAttributes(attrs));
    }
    SUBCASE("min above max") {
        auto attrs = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {5.0f});
        attrs.withRange(0, SlotRange{10.0, 1.0, {}, ClipMode::Both});
        CHECK_FALSE(validateAttributes(attrs));
    }
    SUBCASE("initial value outside a NONE range") {
        auto attrs = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {0.0f});
        attrs.withRange(0, SlotRange{20.0, 20000.0, {}, ClipMode::None});
        auto result = validateAttributes(attrs);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == Error::Code::Validation);
    }
}

TEST_CASE("range bounds must be representable on their slot") {
    auto const rejected = [](OscType type, SlotRange slotRange) {
        auto attrs  = NodeAttributes::parameter({type}, Access::ReadWrite);
        attrs.withRange(0, std::move(slotRange));
        auto result = validateAttributes(attrs);
        return !result && result.error().code == Error::Code::Validation;
    };
    auto const nan = std::numeric_limits<double>::quiet_NaN();
    auto const inf = std::numeric_limits<double>::infinity();

    SUBCASE("non-integral bound on an integer slot") {
        CHECK(rejected(OscType::Int32, SlotRange{0.0, 10.5, {}, ClipMode::Both}));
        CHECK(rejected(OscType::Int64, SlotRange{-0.25, 10.0, {}, ClipMode::Both}));
        CHECK(rejected(OscType::Int32, SlotRange{std::nullopt, std::nullopt, {0.0, 1.5}, ClipMode::None}));
    }
    SUBCASE("non-finite bounds") {
        CHECK(rejected(OscType::Float32, SlotRange{nan, 1.0, {}, ClipMode::Both}));
        CHECK(rejected(OscType::Double, SlotRange{0.0, inf, {}, ClipMode::Both}));
        CHECK(rejected(OscType::Double, SlotRange{std::nullopt, std::nullopt, {nan}, ClipMode::None}));
        CHECK(rejected(OscType::Int32, SlotRange{-inf, 0.0, {}, ClipMode::Low}));
    }
    SUBCASE("bounds past the integer width") {
        CHECK(rejected(OscType::Int32, SlotRange{0.0, 4294967296.0, {}, ClipMode::Both}));
        CHECK(rejected(OscType::Int32, SlotRange{-2147483649.0, 0.0, {}, ClipMode::Both}));
        CHECK(rejected(OscType::Int64, SlotRange{0.0, 9223372036854775808.0, {}, ClipMode::Both}));
    }
    SUBCASE("extreme but representable bounds pass") {
        auto attrs = NodeAttributes::parameter({OscType::Int32, OscType::Int64}, Access::ReadWrite);
        attrs.withRange(0, SlotRange{-2147483648.0, 2147483647.0, {}, ClipMode::Both});
        attrs.withRange(1, SlotRange{-9223372036854775808.0, 0.0, {}, ClipMode::Both});
        CHECK(validateAttributes(attrs));
    }
    SUBCASE("fractional bounds stay legal on float slots") {
        auto attrs = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite);
        attrs.withRange(0, SlotRange{0.0, 10.5, {}, ClipMode::Both});
        CHECK(validateAttributes(attrs));
    }
}

TEST_CASE("boolean slots accept either tag") {
    auto attrs = NodeAttributes::parameter({OscType::False}, Access::ReadWrite, {true});
    CHECK(validateAttributes(attrs));
}

} // TEST_SUITE
