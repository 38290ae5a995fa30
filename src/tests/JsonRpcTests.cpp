// SPDX-License-Identifier: Apache-2.0
#include <mcp/JsonRpc.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcpvisor;

TEST_CASE("makeRequest creates valid JSON-RPC 2.0 request", "[jsonrpc]")
{
    auto request = jsonrpc::makeRequest(1, "test/method");

    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["id"] == 1);
    CHECK(request["method"] == "test/method");
    CHECK(!request.contains("params"));
}

TEST_CASE("makeRequest includes params when provided", "[jsonrpc]")
{
    auto params = nlohmann::json { { "key", "value" } };
    auto request = jsonrpc::makeRequest(42, "test/method", params);

    CHECK(request["id"] == 42);
    REQUIRE(request.contains("params"));
    CHECK(request["params"]["key"] == "value");
}

TEST_CASE("makeNotification creates valid notification (no id)", "[jsonrpc]")
{
    auto notif = jsonrpc::makeNotification("notifications/initialized");

    CHECK(notif["jsonrpc"] == "2.0");
    CHECK(!notif.contains("id"));
    CHECK(notif["method"] == "notifications/initialized");
}

TEST_CASE("makeErrorResponse carries code and message", "[jsonrpc]")
{
    auto response = jsonrpc::makeErrorResponse(7, jsonrpc::errors::MethodNotFound, "Method not found: x");

    CHECK(response["id"] == 7);
    CHECK(response["error"]["code"] == -32601);
    CHECK(response["error"]["message"] == "Method not found: x");
    CHECK(!response.contains("result"));
}

TEST_CASE("parseMessage classifies a success response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 1 },
        { "result", { { "status", "ok" } } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    CHECK(result->kind == jsonrpc::MessageKind::Response);
    CHECK(result->numericId() == 1);
    REQUIRE(result->result.has_value());
    CHECK(result->result->at("status") == "ok");
    CHECK(!result->error.has_value());
}

TEST_CASE("parseMessage classifies an error response", "[jsonrpc]")
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", 3 },
        { "error", { { "code", -32600 }, { "message", "Invalid Request" } } },
    };

    auto result = jsonrpc::parseMessage(msg);
    REQUIRE(result.has_value());
    CHECK(result->kind == jsonrpc::MessageKind::Response);
    REQUIRE(result->error.has_value());
    CHECK(result->error->code == -32600);
    CHECK(result->error->message == "Invalid Request");
}

TEST_CASE("parseMessage classifies requests and notifications", "[jsonrpc]")
{
    SECTION("request from the server")
    {
        auto result = jsonrpc::parseMessage(nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", "abc" },
            { "method", "ping" },
        });
        REQUIRE(result.has_value());
        CHECK(result->kind == jsonrpc::MessageKind::Request);
        CHECK(result->method == "ping");
        CHECK(!result->numericId().has_value());
    }

    SECTION("notification")
    {
        auto result = jsonrpc::parseMessage(jsonrpc::makeNotification("notifications/tools/list_changed"));
        REQUIRE(result.has_value());
        CHECK(result->kind == jsonrpc::MessageKind::Notification);
        CHECK(result->method == "notifications/tools/list_changed");
    }

    SECTION("null id is a notification")
    {
        auto result = jsonrpc::parseMessage(nlohmann::json {
            { "jsonrpc", "2.0" },
            { "id", nullptr },
            { "method", "notifications/message" },
        });
        REQUIRE(result.has_value());
        CHECK(result->kind == jsonrpc::MessageKind::Notification);
    }
}

TEST_CASE("parseMessage treats a response without result or error as a response", "[jsonrpc]")
{
    auto result = jsonrpc::parseMessage(nlohmann::json { { "jsonrpc", "2.0" }, { "id", 9 } });
    REQUIRE(result.has_value());
    CHECK(result->kind == jsonrpc::MessageKind::Response);
    CHECK(!result->result.has_value());
    CHECK(!result->error.has_value());
}

TEST_CASE("parseMessage rejects malformed envelopes", "[jsonrpc]")
{
    SECTION("not an object")
    {
        auto result = jsonrpc::parseMessage(nlohmann::json::array({ 1, 2 }));
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("wrong version")
    {
        auto result = jsonrpc::parseMessage(nlohmann::json { { "jsonrpc", "1.0" }, { "id", 1 }, { "result", 1 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("neither id nor method")
    {
        auto result = jsonrpc::parseMessage(nlohmann::json { { "jsonrpc", "2.0" }, { "result", 1 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }

    SECTION("non-string method")
    {
        auto result = jsonrpc::parseMessage(nlohmann::json { { "jsonrpc", "2.0" }, { "method", 5 } });
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ProtocolError);
    }
}

TEST_CASE("serialize rejects strings that are not valid UTF-8", "[jsonrpc]")
{
    auto const good = jsonrpc::serialize(jsonrpc::makeNotification("ping"));
    REQUIRE(good.has_value());
    CHECK(*good == R"({"jsonrpc":"2.0","method":"ping"})");

    auto const bad = jsonrpc::serialize(jsonrpc::makeRequest(1, "tools/call", { { "path", "caf\xe9.txt" } }));
    REQUIRE(!bad.has_value());
    CHECK(bad.error().code == ErrorCode::ProtocolError);
}
