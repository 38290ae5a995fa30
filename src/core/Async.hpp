// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <format>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mcpvisor
{

template <typename T>
using Task = boost::asio::awaitable<T>;

/// @brief One-shot event that any number of coroutines can wait on.
///
/// Once set, the event stays set and all current and future waiters resume immediately.
/// The event must outlive every coroutine waiting on it.
class AsyncEvent
{
  public:
    explicit AsyncEvent(boost::asio::io_context& io);

    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;

    /// @brief Sets the event and wakes all waiters.
    void set();

    [[nodiscard]] auto isSet() const noexcept -> bool { return _set; }

    /// @brief Waits until the event is set.
    [[nodiscard]] auto wait() -> Task<void>;

    /// @brief Waits until the event is set or the timeout elapses.
    /// @return True if the event was set.
    [[nodiscard]] auto waitFor(std::chrono::steady_clock::duration timeout) -> Task<bool>;

    /// @brief Waits until the event is set or the deadline passes.
    /// @return True if the event was set.
    [[nodiscard]] auto waitUntil(std::chrono::steady_clock::time_point deadline) -> Task<bool>;

  private:
    boost::asio::io_context& _io;
    bool _set = false;
    std::list<boost::asio::steady_timer*> _waiters;
};

/// @brief Cooperative mutual exclusion between coroutines on one io_context.
class AsyncLock
{
  public:
    /// @brief Releases the lock when destroyed.
    class Guard
    {
      public:
        Guard() = default;
        explicit Guard(AsyncLock* lock): _lock(lock) {}
        ~Guard()
        {
            if (_lock)
                _lock->unlock();
        }
        Guard(Guard&& other) noexcept: _lock(std::exchange(other._lock, nullptr)) {}
        Guard& operator=(Guard&& other) noexcept
        {
            if (this != &other)
            {
                if (_lock)
                    _lock->unlock();
                _lock = std::exchange(other._lock, nullptr);
            }
            return *this;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

      private:
        AsyncLock* _lock = nullptr;
    };

    explicit AsyncLock(boost::asio::io_context& io): _io(io) {}

    /// @brief Suspends until the lock is free, then takes it.
    [[nodiscard]] auto acquire() -> Task<Guard>;

    [[nodiscard]] auto isLocked() const noexcept -> bool { return _locked; }

  private:
    void unlock();

    boost::asio::io_context& _io;
    bool _locked = false;
    std::deque<std::shared_ptr<AsyncEvent>> _waiters;
};

/// @brief Suspends the calling coroutine for the given duration.
[[nodiscard]] auto sleepFor(boost::asio::io_context& io, std::chrono::steady_clock::duration duration)
    -> Task<void>;

/// @brief Runs all tasks concurrently and waits for every one of them to finish.
///
/// Results are returned in the order of the input. A failing task never cancels the others.
template <typename T>
[[nodiscard]] auto waitAll(boost::asio::io_context& io, std::vector<Task<T>> tasks) -> Task<std::vector<T>>
{
    struct State
    {
        explicit State(boost::asio::io_context& io, size_t count): done(io), remaining(count)
        {
            results.resize(count);
        }
        AsyncEvent done;
        size_t remaining;
        std::vector<std::optional<T>> results;
    };

    auto state = std::make_shared<State>(io, tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i)
    {
        boost::asio::co_spawn(
            io,
            [state, i, task = std::move(tasks[i])]() mutable -> Task<void> {
                state->results[i].emplace(co_await std::move(task));
                if (--state->remaining == 0)
                    state->done.set();
            },
            boost::asio::detached);
    }

    if (state->remaining > 0)
        co_await state->done.wait();

    auto results = std::vector<T> {};
    results.reserve(state->results.size());
    for (auto& result: state->results)
        results.push_back(std::move(*result));
    co_return results;
}

/// @brief Races a task against a timeout.
///
/// The task keeps running to completion in the background when the timeout wins; its
/// result is then discarded.
/// @return The task's result, or a RequestTimeoutError carrying @p message.
template <typename T>
[[nodiscard]] auto withTimeout(boost::asio::io_context& io,
                               Task<Result<T>> task,
                               std::chrono::milliseconds timeout,
                               std::string message) -> Task<Result<T>>
{
    struct State
    {
        explicit State(boost::asio::io_context& io): done(io) {}
        AsyncEvent done;
        std::optional<Result<T>> result;
    };

    auto state = std::make_shared<State>(io);
    boost::asio::co_spawn(
        io,
        [state, task = std::move(task)]() mutable -> Task<void> {
            state->result.emplace(co_await std::move(task));
            state->done.set();
        },
        boost::asio::detached);

    if (!co_await state->done.waitFor(timeout))
        co_return makeError(ErrorCode::RequestTimeoutError, std::move(message));

    co_return std::move(*state->result);
}

} // namespace mcpvisor
