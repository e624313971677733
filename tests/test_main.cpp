#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace {

// Prints "[suite] case" as each test starts and a timing line when one fails.
struct TestProgress : public doctest::IReporter {
    TestProgress(const doctest::ContextOptions&) {}

    void test_case_start(const doctest::TestCaseData& in) override {
        current_ = in.m_name;
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cout << '[' << (in.m_test_suite && *in.m_test_suite ? in.m_test_suite : "-") << "] " << in.m_name << std::endl;
    }

    void test_case_end(const doctest::CurrentTestCaseStats& stats) override {
        if (stats.testCaseSuccess)
            return;
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cout << "  FAILED " << current_ << ": " << stats.numAssertsFailedCurrentTest << " of "
                  << stats.numAssertsCurrentTest << " asserts after " << std::fixed << std::setprecision(3) << stats.seconds
                  << "s" << std::endl;
    }

    void report_query(const doctest::QueryData&) override {}
    void test_run_start() override {}
    void test_run_end(const doctest::TestRunStats&) override {}
    void test_case_reenter(const doctest::TestCaseData&) override {}
    void test_case_exception(const doctest::TestCaseException&) override {}
    void subcase_start(const doctest::SubcaseSignature&) override {}
    void subcase_end() override {}
    void log_assert(const doctest::AssertData&) override {}
    void log_message(const doctest::MessageData&) override {}
    void test_case_skipped(const doctest::TestCaseData&) override {}

private:
    static auto outputMutex() -> std::mutex& {
#ifdef OQ_LOG_DEBUG
        return OQ::TaggedLogger::coutMutex;
#else
        static std::mutex mutex;
        return mutex;
#endif
    }

    std::string current_;
};

#ifdef OQ_LOG_DEBUG
// "Notifier,WebSocket" -> {"Notifier", "WebSocket"}
auto splitTags(std::string_view text) -> std::set<std::string> {
    std::set<std::string> tags;
    while (!text.empty()) {
        auto const comma = text.find(',');
        auto const tag   = text.substr(0, comma);
        if (!tag.empty())
            tags.emplace(tag);
        if (comma == std::string_view::npos)
            break;
        text.remove_prefix(comma + 1);
    }
    return tags;
}
#endif

} // namespace

REGISTER_LISTENER("test_progress", 1, TestProgress);

int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);
    if (context.shouldExit())
        return context.run();

#ifdef OQ_LOG_DEBUG
    // OSCQUERY_LOG=1 writes the server's tagged log to stderr during the run;
    // OSCQUERY_LOG_TAGS=Coordinator,Notifier narrows it to those tags.
    char const* log     = std::getenv("OSCQUERY_LOG");
    bool const  logging = log && std::strcmp(log, "0") != 0;
    if (char const* tags = std::getenv("OSCQUERY_LOG_TAGS"))
        OQ::logger().setEnabledTags(splitTags(tags));
    OQ::set_thread_name("TestMain");
    OQ::set_logging_enabled(logging);
#endif

    int const result = context.run();

#ifdef OQ_LOG_DEBUG
    if (logging)
        OQ::logger().flush();
#endif
    return result;
}
