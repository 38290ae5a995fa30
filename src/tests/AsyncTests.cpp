// SPDX-License-Identifier: Apache-2.0
#include "TestUtils.hpp"

#include <core/Async.hpp>
#include <core/Signal.hpp>

#include <catch2/catch_test_macros.hpp>

#include <format>
#include <string>
#include <vector>

using namespace mcpvisor;
using namespace mcpvisor::test;

TEST_CASE("Signal dispatches to listeners in registration order", "[signal]")
{
    auto signal = Signal<int> {};
    auto calls = std::vector<std::string> {};

    auto first = signal.connect([&](int value) { calls.push_back("first:" + std::to_string(value)); });
    auto second = signal.connect([&](int value) { calls.push_back("second:" + std::to_string(value)); });
    signal.emit(7);

    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == "first:7");
    CHECK(calls[1] == "second:7");
}

TEST_CASE("Signal connection unregisters when destroyed", "[signal]")
{
    auto signal = Signal<> {};
    auto count = 0;
    {
        auto connection = signal.connect([&] { ++count; });
        signal.emit();
        CHECK(signal.listenerCount() == 1);
    }
    signal.emit();
    CHECK(count == 1);
    CHECK(signal.listenerCount() == 0);
}

TEST_CASE("Signal skips listeners removed during an emission", "[signal]")
{
    auto signal = Signal<> {};
    auto secondCalls = 0;
    auto second = Connection {};

    auto first = signal.connect([&] { second.reset(); });
    second = signal.connect([&] { ++secondCalls; });
    signal.emit();

    CHECK(secondCalls == 0);
}

TEST_CASE("Connection may outlive its signal", "[signal]")
{
    auto connection = Connection {};
    {
        auto signal = Signal<> {};
        connection = signal.connect([] {});
    }
    CHECK(connection.connected());
    connection.reset();
    CHECK(!connection.connected());
}

TEST_CASE("AsyncEvent wakes waiters and stays set", "[async]")
{
    auto io = boost::asio::io_context {};
    auto event = AsyncEvent(io);
    auto woke = false;

    boost::asio::co_spawn(
        io,
        [&]() -> Task<void> {
            co_await event.wait();
            woke = true;
        },
        boost::asio::detached);

    runUntil(io, [] { return false; }, 20ms);
    CHECK(!woke);

    event.set();
    CHECK(runUntil(io, [&] { return woke; }));
    CHECK(runTask(io, event.waitFor(1s)));
}

TEST_CASE("AsyncEvent waitFor times out when never set", "[async]")
{
    auto io = boost::asio::io_context {};
    auto event = AsyncEvent(io);

    auto const started = std::chrono::steady_clock::now();
    CHECK(!runTask(io, event.waitFor(30ms)));
    CHECK(std::chrono::steady_clock::now() - started >= 30ms);
}

TEST_CASE("AsyncLock serializes coroutines", "[async]")
{
    auto io = boost::asio::io_context {};
    auto lock = AsyncLock(io);
    auto trace = std::vector<std::string> {};

    auto worker = [&](std::string name) -> Task<void> {
        auto const guard = co_await lock.acquire();
        trace.push_back(name + ":in");
        co_await sleepFor(io, 10ms);
        trace.push_back(name + ":out");
    };

    boost::asio::co_spawn(io, worker("a"), boost::asio::detached);
    boost::asio::co_spawn(io, worker("b"), boost::asio::detached);
    CHECK(runUntil(io, [&] { return trace.size() == 4; }));

    REQUIRE(trace.size() == 4);
    CHECK(trace[0] == "a:in");
    CHECK(trace[1] == "a:out");
    CHECK(trace[2] == "b:in");
    CHECK(trace[3] == "b:out");
    CHECK(!lock.isLocked());
}

TEST_CASE("waitAll returns results in input order even when tasks finish out of order", "[async]")
{
    auto io = boost::asio::io_context {};

    auto delayed = [&](int value, std::chrono::milliseconds delay) -> Task<int> {
        co_await sleepFor(io, delay);
        co_return value;
    };

    auto tasks = std::vector<Task<int>> {};
    tasks.push_back(delayed(1, 30ms));
    tasks.push_back(delayed(2, 1ms));
    tasks.push_back(delayed(3, 10ms));

    auto const results = runTask(io, waitAll(io, std::move(tasks)));
    CHECK(results == std::vector<int> { 1, 2, 3 });
}

TEST_CASE("waitAll of no tasks completes immediately", "[async]")
{
    auto io = boost::asio::io_context {};
    auto const results = runTask(io, waitAll(io, std::vector<Task<int>> {}));
    CHECK(results.empty());
}

TEST_CASE("withTimeout reports a RequestTimeoutError when the task is too slow", "[async]")
{
    auto io = boost::asio::io_context {};

    auto slow = [&]() -> Task<Result<int>> {
        co_await sleepFor(io, 1s);
        co_return 1;
    };
    auto fast = [&]() -> Task<Result<int>> { co_return 2; };

    auto const timedOut = runTask(io, withTimeout<int>(io, slow(), 20ms, "too slow"));
    REQUIRE(!timedOut.has_value());
    CHECK(timedOut.error().code == ErrorCode::RequestTimeoutError);
    CHECK(timedOut.error().message == "too slow");

    auto const finished = runTask(io, withTimeout<int>(io, fast(), 1s, "too slow"));
    REQUIRE(finished.has_value());
    CHECK(*finished == 2);
}

TEST_CASE("Error formats with its code name", "[error]")
{
    auto const error = Error { ErrorCode::ServerNotFoundError, "Server 'x' not found" };
    CHECK(std::format("{}", error) == "[ServerNotFoundError] Server 'x' not found");

    auto const wrapped = withContext(error, "Lookup failed");
    CHECK(wrapped.error().code == ErrorCode::ServerNotFoundError);
    CHECK(wrapped.error().message == "Lookup failed: Server 'x' not found");
}
