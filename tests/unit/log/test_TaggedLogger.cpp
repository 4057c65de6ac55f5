#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef LV_LOG_DEBUG

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("disabled_logger_drops_messages") {
    auto output = captureStderr([] {
        LV::TaggedLogger logger;
        CHECK_FALSE(logger.isLoggingEnabled());
        logger.log_impl("should not appear", std::source_location::current(), "TestTag");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("enabled_logger_writes_tags_thread_and_message") {
    auto output = captureStderr([] {
        LV::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Worker-7");
        logger.log_impl("hello log", std::source_location::current(), "RenderWorker", "ERROR");
        logger.flush();
    });
    CHECK(output.find("[ERROR][RenderWorker]") != std::string::npos);
    CHECK(output.find("[Worker-7]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
}

TEST_CASE("unnamed_threads_get_numbered_names") {
    auto output = captureStderr([] {
        LV::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("anonymous", std::source_location::current(), "Test");
        logger.flush();
    });
    CHECK(output.find("[Thread 0]") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_function_calls") {
    auto output = captureStderr([] {
        LV::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("filtered", std::source_location::current(), "Function Called");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("enabled_tags_gate_output") {
    auto output = captureStderr([] {
        LV::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"PoseStore"});
        logger.log_impl("keep me", std::source_location::current(), "PoseStore");
        logger.log_impl("drop me", std::source_location::current(), "RenderQueue");
        logger.flush();
    });
    CHECK(output.find("keep me") != std::string::npos);
    CHECK(output.find("drop me") == std::string::npos);
}

TEST_CASE("skip_tags_win_over_enabled_tags") {
    auto output = captureStderr([] {
        LV::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"RenderWorker"});
        logger.setSkipTags({"Noisy"});
        logger.log_impl("not expected", std::source_location::current(), "RenderWorker", "Noisy");
        logger.log_impl("expected", std::source_location::current(), "RenderWorker");
        logger.flush();
    });
    CHECK(output.find("not expected") == std::string::npos);
    CHECK(output.find("expected") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    auto output = captureStderr([] {
        LV::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 125 "tests/unit/log/test_TaggedLogger.cpp"
        logger.flush();
    });
    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE

#endif // LV_LOG_DEBUG
