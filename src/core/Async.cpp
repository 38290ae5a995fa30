// SPDX-License-Identifier: Apache-2.0
#include "Async.hpp"

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcpvisor
{

namespace
{
    // Unregisters a waiter timer when the waiting coroutine frame goes away.
    struct WaiterRegistration
    {
        std::list<boost::asio::steady_timer*>& waiters;
        std::list<boost::asio::steady_timer*>::iterator it;

        ~WaiterRegistration() { waiters.erase(it); }
    };
} // namespace

AsyncEvent::AsyncEvent(boost::asio::io_context& io): _io(io)
{
}

void AsyncEvent::set()
{
    if (_set)
        return;
    _set = true;
    for (auto* timer: _waiters)
        timer->cancel();
}

auto AsyncEvent::wait() -> Task<void>
{
    if (_set)
        co_return;

    auto timer = boost::asio::steady_timer(_io, boost::asio::steady_timer::time_point::max());
    auto const registration = WaiterRegistration { _waiters, _waiters.insert(_waiters.end(), &timer) };
    auto ec = boost::system::error_code {};
    while (!_set)
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

auto AsyncEvent::waitFor(std::chrono::steady_clock::duration timeout) -> Task<bool>
{
    co_return co_await waitUntil(std::chrono::steady_clock::now() + timeout);
}

auto AsyncEvent::waitUntil(std::chrono::steady_clock::time_point deadline) -> Task<bool>
{
    if (_set)
        co_return true;

    auto timer = boost::asio::steady_timer(_io, deadline);
    auto const registration = WaiterRegistration { _waiters, _waiters.insert(_waiters.end(), &timer) };
    auto ec = boost::system::error_code {};
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    // A cancelled wait means set() woke us; an expired one means the deadline passed.
    co_return _set;
}

auto AsyncLock::acquire() -> Task<Guard>
{
    while (_locked)
    {
        auto waiter = std::make_shared<AsyncEvent>(_io);
        _waiters.push_back(waiter);
        co_await waiter->wait();
    }
    _locked = true;
    co_return Guard(this);
}

void AsyncLock::unlock()
{
    _locked = false;
    if (_waiters.empty())
        return;
    auto next = std::move(_waiters.front());
    _waiters.pop_front();
    next->set();
}

auto sleepFor(boost::asio::io_context& io, std::chrono::steady_clock::duration duration) -> Task<void>
{
    auto timer = boost::asio::steady_timer(io, duration);
    auto ec = boost::system::error_code {};
    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
}

} // namespace mcpvisor
