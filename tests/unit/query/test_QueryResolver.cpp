#include "coordinator/MutationCoordinator.hpp"
#include "query/QueryResolver.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace OQ;
using Json = nlohmann::json;

namespace {

auto synthHost() -> HostInfo {
    HostInfo info;
    info.name    = "test synth";
    info.oscIp   = "127.0.0.1";
    info.oscPort = 9000;
    info.wsIp    = "127.0.0.1";
    info.wsPort  = 9001;
    return info;
}

auto declareSynth(MutationCoordinator& coordinator) -> void {
    auto freq = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {440.0f});
    freq.withRange(0, SlotRange{20.0, 20000.0, {}, ClipMode::Both}).withUnit(0, "Hz").withDescription("frequency");
    REQUIRE(coordinator.apply(InsertEdit{"/synth/freq", std::move(freq)}));

    auto steps = NodeAttributes::parameter({OscType::Int32}, Access::ReadOnly, {std::int32_t{2}});
    steps.withRange(0, SlotRange{std::nullopt, std::nullopt, {1.0, 2.0, 4.0}, ClipMode::None});
    REQUIRE(coordinator.apply(InsertEdit{"/synth/steps", std::move(steps)}));

    REQUIRE(coordinator.apply(InsertEdit{"/synth/reset",
                                         NodeAttributes::parameter({OscType::Impulse}, Access::WriteOnly)}));
    REQUIRE(coordinator.apply(InsertEdit{"/synth/env/attack",
                                         NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {0.1f})}));
}

} // namespace

TEST_SUITE("query.resolver") {

TEST_CASE("value query reflects the clipped stored value") {
    MutationCoordinator coordinator;
    declareSynth(coordinator);
    QueryResolver resolver{coordinator, synthHost()};

    REQUIRE(coordinator.apply(SetValueEdit{"/synth/freq", {30000.0f}}));
    auto value = resolver.query("/synth/freq", QueryParam::Value);
    REQUIRE(value);
    CHECK(*value == Json::parse(R"({"VALUE":[20000.0]})"));
}

TEST_CASE("full view lists every present attribute") {
    MutationCoordinator coordinator;
    declareSynth(coordinator);
    QueryResolver resolver{coordinator, synthHost()};

    auto view = resolver.query("/synth/freq", std::nullopt);
    REQUIRE(view);
    CHECK((*view)["FULL_PATH"] == "/synth/freq");
    CHECK((*view)["TYPE"] == "f");
    CHECK((*view)["ACCESS"] == 3);
    CHECK((*view)["VALUE"][0] == 440.0);
    CHECK((*view)["RANGE"][0]["MIN"] == 20.0);
    CHECK((*view)["RANGE"][0]["MAX"] == 20000.0);
    CHECK((*view)["RANGE"][0]["CLIPMODE"] == "both");
    CHECK((*view)["CLIPMODE"] == Json::array({"both"}));
    CHECK((*view)["UNIT"] == Json::array({"Hz"}));
    CHECK((*view)["DESCRIPTION"] == "frequency");
    CHECK_FALSE(view->contains("CONTENTS"));
}

TEST_CASE("integer ranges render integer bounds") {
    MutationCoordinator coordinator;
    declareSynth(coordinator);
    QueryResolver resolver{coordinator, synthHost()};

    auto range = resolver.query("/synth/steps", QueryParam::Range);
    REQUIRE(range);
    auto const& vals = (*range)["RANGE"][0]["VALS"];
    REQUIRE(vals.size() == 3);
    CHECK(vals[0].is_number_integer());
    CHECK(vals[2] == 4);
}

TEST_CASE("container contents are limited by depth") {
    MutationCoordinator coordinator;
    declareSynth(coordinator);

    QueryResolver shallow{coordinator, synthHost(), 1};
    auto root = shallow.query("/", std::nullopt);
    REQUIRE(root);
    CHECK((*root)["FULL_PATH"] == "/");
    CHECK((*root)["ACCESS"] == 0);
    auto const& synth = (*root)["CONTENTS"]["synth"];
    CHECK(synth["FULL_PATH"] == "/synth");
    REQUIRE(synth.contains("CONTENTS"));
    CHECK(synth["CONTENTS"]["freq"] == Json{{"FULL_PATH", "/synth/freq"}});

    QueryResolver unlimited{coordinator, synthHost(), 0};
    auto full = unlimited.query("/", std::nullopt);
    REQUIRE(full);
    CHECK((*full)["CONTENTS"]["synth"]["CONTENTS"]["env"]["CONTENTS"]["attack"]["TYPE"] == "f");
}

TEST_CASE("missing and invalid paths are not found") {
    MutationCoordinator coordinator;
    declareSynth(coordinator);
    QueryResolver resolver{coordinator, synthHost()};

    auto missing = resolver.query("/nonexistent", std::nullopt);
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == Error::Code::NotFound);

    auto invalid = resolver.query("synth", QueryParam::Value);
    REQUIRE_FALSE(invalid);
    CHECK(invalid.error().code == Error::Code::NotFound);
}

TEST_CASE("absent attributes are unsupported") {
    MutationCoordinator coordinator;
    declareSynth(coordinator);
    QueryResolver resolver{coordinator, synthHost()};

    auto containerValue = resolver.query("/synth", QueryParam::Value);
    REQUIRE_FALSE(containerValue);
    CHECK(containerValue.error().code == Error::Code::UnsupportedParam);

    auto noUnit = resolver.query("/synth/steps", QueryParam::Unit);
    REQUIRE_FALSE(noUnit);
    CHECK(noUnit.error().code == Error::Code::UnsupportedParam);

    auto noRange = resolver.query("/synth/env/attack", QueryParam::ClipMode);
    REQUIRE_FALSE(noRange);
    CHECK(noRange.error().code == Error::Code::UnsupportedParam);

    auto access = resolver.query("/synth", QueryParam::Access);
    REQUIRE(access);
    CHECK(*access == Json{{"ACCESS", 0}});
}

TEST_CASE("write-only values are hidden") {
    MutationCoordinator coordinator;
    declareSynth(coordinator);
    QueryResolver resolver{coordinator, synthHost()};

    auto value = resolver.query("/synth/reset", QueryParam::Value);
    REQUIRE_FALSE(value);
    CHECK(value.error().code == Error::Code::Access);

    auto view = resolver.query("/synth/reset", std::nullopt);
    REQUIRE(view);
    CHECK((*view)["ACCESS"] == 2);
    CHECK((*view)["TYPE"] == "I");
    CHECK_FALSE(view->contains("VALUE"));
}

TEST_CASE("host info ignores the path") {
    MutationCoordinator coordinator;
    QueryResolver resolver{coordinator, synthHost()};

    auto info = resolver.query("/anything/at/all", QueryParam::HostInfo);
    REQUIRE(info);
    CHECK((*info)["NAME"] == "test synth");
    CHECK((*info)["OSC_TRANSPORT"] == "UDP");
    CHECK((*info)["OSC_PORT"] == 9000);
    CHECK((*info)["WS_PORT"] == 9001);
    CHECK((*info)["EXTENSIONS"]["LISTEN"] == true);
    CHECK((*info)["EXTENSIONS"]["PATH_RENAMED"] == false);

    resolver.setHostInfo(HostInfo{});
    auto reset = resolver.query("/", QueryParam::HostInfo);
    REQUIRE(reset);
    CHECK_FALSE(reset->contains("WS_PORT"));
}

} // TEST_SUITE
