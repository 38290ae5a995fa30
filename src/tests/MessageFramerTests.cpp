// SPDX-License-Identifier: Apache-2.0
#include <mcp/MessageFramer.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpvisor;

TEST_CASE("MessageFramer splits complete lines", "[framer]")
{
    auto framer = MessageFramer {};
    auto const lines = framer.feed("{\"a\":1}\n{\"b\":2}\n");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "{\"a\":1}");
    CHECK(lines[1] == "{\"b\":2}");
    CHECK(framer.pending().empty());
}

TEST_CASE("MessageFramer buffers a partial line until it is completed", "[framer]")
{
    auto framer = MessageFramer {};

    CHECK(framer.feed("{\"jsonrpc\":").empty());
    CHECK(framer.pending() == "{\"jsonrpc\":");

    auto const lines = framer.feed("\"2.0\"}\n{\"id\"");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "{\"jsonrpc\":\"2.0\"}");
    CHECK(framer.pending() == "{\"id\"");
}

TEST_CASE("MessageFramer drops carriage returns and blank lines", "[framer]")
{
    auto framer = MessageFramer {};
    auto const lines = framer.feed("first\r\n\n   \r\nsecond\n");

    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "first");
    CHECK(lines[1] == "second");
}

TEST_CASE("MessageFramer reset discards the partial line", "[framer]")
{
    auto framer = MessageFramer {};
    CHECK(framer.feed("dangling").empty());
    framer.reset();
    CHECK(framer.pending().empty());

    auto const lines = framer.feed("fresh\n");
    REQUIRE(lines.size() == 1);
    CHECK(lines[0] == "fresh");
}
