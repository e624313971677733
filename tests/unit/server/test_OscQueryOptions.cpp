#include <doctest/doctest.h>
#include <oscquery/server/OscQueryOptions.hpp>

#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value)
        : key_(key) {
        if (const char* existing = std::getenv(key)) {
            original_ = std::string{existing};
        }
        if (value != nullptr) {
            setenv(key, value, 1);
        } else {
            unsetenv(key);
        }
    }

    ~EnvGuard() {
        if (original_.has_value()) {
            setenv(key_.c_str(), original_->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string                key_;
    std::optional<std::string> original_;
};

struct ArgvBuilder {
    explicit ArgvBuilder(std::initializer_list<const char*> args) {
        storage.reserve(args.size());
        for (auto value : args) {
            storage.emplace_back(value);
        }
        pointers.reserve(storage.size());
        for (auto& entry : storage) {
            pointers.push_back(entry.data());
        }
    }

    auto argc() const -> int { return static_cast<int>(pointers.size()); }
    auto argv() -> char** { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*>       pointers;
};

// Keeps stray OSCQUERY_* variables from the calling shell out of a test.
struct CleanEnv {
    EnvGuard name{"OSCQUERY_NAME", nullptr};
    EnvGuard host{"OSCQUERY_HOST", nullptr};
    EnvGuard http{"OSCQUERY_HTTP_PORT", nullptr};
    EnvGuard osc{"OSCQUERY_OSC_PORT", nullptr};
    EnvGuard ws{"OSCQUERY_WS_PORT", nullptr};
    EnvGuard log{"OSCQUERY_LOG", nullptr};
};

} // namespace

TEST_SUITE("server.options") {

TEST_CASE("port and target helpers guard ranges") {
    CHECK(OQ::IsValidOscQueryPort(0));
    CHECK(OQ::IsValidOscQueryPort(65535));
    CHECK_FALSE(OQ::IsValidOscQueryPort(-1));
    CHECK_FALSE(OQ::IsValidOscQueryPort(65536));

    auto target = OQ::ParseOscSendTarget("192.168.1.20:9000");
    REQUIRE(target.has_value());
    CHECK(target->host == "192.168.1.20");
    CHECK(target->port == 9000);

    CHECK_FALSE(OQ::ParseOscSendTarget("localhost").has_value());
    CHECK_FALSE(OQ::ParseOscSendTarget(":9000").has_value());
    CHECK_FALSE(OQ::ParseOscSendTarget("localhost:0").has_value());
    CHECK_FALSE(OQ::ParseOscSendTarget("localhost:port").has_value());
}

TEST_CASE("Validate detects invalid combinations") {
    OQ::OscQueryOptions options{};
    CHECK_FALSE(OQ::ValidateOscQueryOptions(options).has_value());

    options.http_port = 70000;
    auto error = OQ::ValidateOscQueryOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--http-port") != std::string::npos);

    options.http_port = 6000;
    options.ws_port   = 6000;
    error             = OQ::ValidateOscQueryOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("must differ") != std::string::npos);

    options.http_port = 0;
    options.ws_port   = 0;
    CHECK_FALSE(OQ::ValidateOscQueryOptions(options).has_value());

    options.max_pending_events = 0;
    error                      = OQ::ValidateOscQueryOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--max-pending-events") != std::string::npos);

    options.max_pending_events   = 1;
    options.max_ws_message_bytes = 0;
    error                        = OQ::ValidateOscQueryOptions(options);
    REQUIRE(error.has_value());
    CHECK(error->find("--max-ws-message") != std::string::npos);
}

TEST_CASE("Environment overrides apply to CLI defaults") {
    CleanEnv clean;
    EnvGuard name{"OSCQUERY_NAME", "studio"};
    EnvGuard http{"OSCQUERY_HTTP_PORT", "8080"};
    EnvGuard log{"OSCQUERY_LOG", "yes"};

    ArgvBuilder args{"oscquery_server"};
    auto options = OQ::ParseOscQueryArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->name == "studio");
    CHECK(options->http_port == 8080);
    CHECK(options->osc_port == 1234);
    CHECK(options->enable_log);
}

TEST_CASE("Invalid environment values are rejected") {
    CleanEnv clean;
    EnvGuard port{"OSCQUERY_OSC_PORT", "99999"};

    ArgvBuilder args{"oscquery_server"};
    CHECK_FALSE(OQ::ParseOscQueryArguments(args.argc(), args.argv()).has_value());
}

TEST_CASE("CLI arguments override environment values") {
    CleanEnv clean;
    EnvGuard name{"OSCQUERY_NAME", "from-env"};

    ArgvBuilder args{"oscquery_server",
                     "--name", "from-cli",
                     "--host", "127.0.0.1",
                     "--http-port", "0",
                     "--osc-port", "9000",
                     "--ws-port", "0",
                     "--osc-send", "127.0.0.1:9001",
                     "--osc-send", "10.0.0.2:57120",
                     "--contents-depth", "0",
                     "--max-pending-events", "32",
                     "--max-ws-message", "4096",
                     "--log"};
    auto options = OQ::ParseOscQueryArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->name == "from-cli");
    CHECK(options->host == "127.0.0.1");
    CHECK(options->http_port == 0);
    CHECK(options->osc_port == 9000);
    CHECK(options->ws_port == 0);
    CHECK(options->osc_send == std::vector<OQ::OscSendTarget>{{"127.0.0.1", 9001}, {"10.0.0.2", 57120}});
    CHECK(options->contents_depth == 0);
    CHECK(options->max_pending_events == 32);
    CHECK(options->max_ws_message_bytes == 4096);
    CHECK(options->enable_log);
}

TEST_CASE("Bad CLI input fails the parse") {
    CleanEnv clean;

    ArgvBuilder missing{"oscquery_server", "--osc-port"};
    CHECK_FALSE(OQ::ParseOscQueryArguments(missing.argc(), missing.argv()).has_value());

    ArgvBuilder unknown{"oscquery_server", "--frobnicate"};
    CHECK_FALSE(OQ::ParseOscQueryArguments(unknown.argc(), unknown.argv()).has_value());

    ArgvBuilder target{"oscquery_server", "--osc-send", "nowhere"};
    CHECK_FALSE(OQ::ParseOscQueryArguments(target.argc(), target.argv()).has_value());

    ArgvBuilder depth{"oscquery_server", "--contents-depth", "-2"};
    CHECK_FALSE(OQ::ParseOscQueryArguments(depth.argc(), depth.argv()).has_value());
}

TEST_CASE("Help short-circuits parsing") {
    CleanEnv clean;
    ArgvBuilder args{"oscquery_server", "--help", "--frobnicate"};
    auto options = OQ::ParseOscQueryArguments(args.argc(), args.argv());
    REQUIRE(options.has_value());
    CHECK(options->show_help);
}

} // TEST_SUITE
