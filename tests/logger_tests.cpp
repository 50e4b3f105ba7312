#include <doctest/doctest.h>

#include "solo/logger.hpp"
#include "test_helpers.hpp"

#include <fstream>

using namespace solo;
using solo::test::LogCapture;
using solo::test::TempDir;

TEST_CASE("Logger: events are one compact JSON line")
{
    TempDir tmp;
    auto path = tmp.path() / "logs" / "solo_test.log";
    Logger::instance().init(path, false);

    LOG_EVENT("claim", nlohmann::json({{"pid", 12}, {"build_id", "b1"}}));
    LOG_INFO("plain line");

    std::ifstream f(path);
    std::string text((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    CHECK(text.find("[EVENT] claim {\"build_id\":\"b1\",\"pid\":12}") != std::string::npos);
    CHECK(text.find("[INFO] plain line") != std::string::npos);
    CHECK(Logger::instance().path() == path);
}

TEST_CASE("Logger: sinks see messages until removed")
{
    std::vector<std::string> events;
    {
        LogCapture capture;
        LOG_DEBUG("debug line");
        LOG_EVENT("release", nlohmann::json({{"pid", 3}}));

        REQUIRE(capture.lines.size() == 2);
        CHECK(capture.lines[0].first == LogLevel::DEBUG);
        CHECK(capture.lines[0].second == "debug line");
        events = capture.events("release");
    }
    REQUIRE(events.size() == 1);
    CHECK(nlohmann::json::parse(events[0])["pid"] == 3);

    LogCapture later;
    LOG_INFO("after");
    CHECK(later.lines.size() == 1);
}

TEST_CASE("Logger: events with invalid UTF-8 are written with replacements")
{
    LogCapture log;
    CHECK_NOTHROW(LOG_EVENT("claim", nlohmann::json({{"store", "/home/u/st\xe9te"}})));

    auto claims = log.events("claim");
    REQUIRE(claims.size() == 1);
    CHECK(claims[0] == "{\"store\":\"/home/u/st\xEF\xBF\xBDte\"}");
}
