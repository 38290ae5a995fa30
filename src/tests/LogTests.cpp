// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace mcpvisor;

namespace
{
/// Routes log output into a vector for the lifetime of the object.
struct CapturedLog
{
    std::vector<std::pair<log::Level, std::string>> lines;
    log::Level previousLevel = log::getLevel();

    CapturedLog()
    {
        log::setCallback([this](log::Level level, std::string_view message) { lines.emplace_back(level, message); });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(previousLevel);
    }
};
} // namespace

TEST_CASE("log::levelFromString", "[log]")
{
    CHECK(log::levelFromString("error") == log::Level::Error);
    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(log::levelFromString("warning") == log::Level::Warning);
    CHECK(log::levelFromString("info") == log::Level::Info);
    CHECK(log::levelFromString("debug") == log::Level::Debug);
    CHECK(log::levelFromString("trace") == log::Level::Trace);
    CHECK(!log::levelFromString("DEBUG").has_value());
    CHECK(!log::levelFromString("").has_value());

    CHECK(log::levelName(log::Level::Warning) == "warning");
    CHECK(log::levelFromString(log::levelName(log::Level::Trace)) == log::Level::Trace);
}

TEST_CASE("log messages below the active level are dropped", "[log]")
{
    auto captured = CapturedLog {};
    log::setLevel(log::Level::Info);

    log::error("disk {} is full", "/dev/sda1");
    log::warning("retrying in {} ms", 2000);
    log::info("server '{}' running", "fs");
    log::debug("not shown");
    log::trace("not shown either");

    REQUIRE(captured.lines.size() == 3);
    CHECK(captured.lines[0] == std::pair { log::Level::Error, std::string("disk /dev/sda1 is full") });
    CHECK(captured.lines[1].second == "retrying in 2000 ms");
    CHECK(captured.lines[2].first == log::Level::Info);

    log::setLevel(log::Level::Trace);
    log::trace("now visible");
    CHECK(captured.lines.back().second == "now visible");

    log::setLevel(log::Level::Error);
    log::write(log::Level::Warning, "filtered");
    CHECK(captured.lines.size() == 4);
}
