#include <csignal>
#include <cstdlib>
#include <iostream>

#include <oscquery/server/OscQueryOptions.hpp>
#include <oscquery/server/OscQueryServer.hpp>

#include "log/TaggedLogger.hpp"

namespace {

void handle_signal(int) {
    OQ::RequestOscQueryStop();
}

auto report(OQ::Expected<OQ::EditResult> const& result, char const* path) -> void {
    if (!result) {
        std::cerr << "[oscquery] failed to declare " << path << ": " << OQ::describeError(result.error()) << '\n';
    }
}

// A small synth namespace so a fresh server has something to browse.
void declare_demo_namespace(OQ::OscQueryServer& server) {
    using namespace OQ;

    report(server.addNode("/synth", NodeAttributes::container("demo synthesizer")), "/synth");

    auto freq = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {440.0f});
    freq.withRange(0, SlotRange{20.0, 20000.0, {}, ClipMode::Both}).withUnit(0, "Hz").withDescription("oscillator frequency");
    report(server.addNode("/synth/freq", std::move(freq)), "/synth/freq");

    auto gain = NodeAttributes::parameter({OscType::Float32}, Access::ReadWrite, {0.5f});
    gain.withRange(0, SlotRange{0.0, 1.0, {}, ClipMode::Both}).withDescription("output gain");
    report(server.addNode("/synth/gain", std::move(gain)), "/synth/gain");

    auto wave = NodeAttributes::parameter({OscType::Int32}, Access::ReadWrite, {0});
    wave.withRange(0, SlotRange{std::nullopt, std::nullopt, {0.0, 1.0, 2.0, 3.0}, ClipMode::None})
            .withDescription("waveform: sine, saw, square, triangle");
    report(server.addNode("/synth/wave", std::move(wave)), "/synth/wave");

    auto gate = NodeAttributes::parameter({OscType::False}, Access::ReadWrite);
    gate.withDescription("note gate");
    report(server.addNode("/synth/gate", std::move(gate)), "/synth/gate");

    auto name = NodeAttributes::parameter({OscType::String}, Access::ReadOnly, {std::string{"saw lead"}});
    report(server.addNode("/synth/patch/name", std::move(name)), "/synth/patch/name");

    report(server.addNode("/synth/reset", NodeAttributes::parameter({OscType::Impulse}, Access::WriteOnly)), "/synth/reset");
}

} // namespace

int main(int argc, char** argv) {
    auto options_opt = OQ::ParseOscQueryArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        OQ::PrintOscQueryUsage();
        return EXIT_SUCCESS;
    }

#ifdef OQ_LOG_DEBUG
    OQ::set_thread_name("Main");
    OQ::set_logging_enabled(options.enable_log);
#endif

    OQ::ResetOscQueryStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return OQ::RunOscQueryServer(options, declare_demo_namespace);
}
