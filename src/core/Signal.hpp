// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace mcpvisor
{

/// @brief RAII handle for one listener registered on a Signal.
///
/// Destroying (or resetting) the handle unregisters the listener. The handle may outlive
/// the signal it was obtained from.
class Connection
{
  public:
    Connection() = default;
    Connection(std::function<void()> disconnect): _disconnect(std::move(disconnect)) {}
    ~Connection() { reset(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Connection(Connection&& other) noexcept: _disconnect(std::exchange(other._disconnect, {})) {}
    Connection& operator=(Connection&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            _disconnect = std::exchange(other._disconnect, {});
        }
        return *this;
    }

    /// @brief Unregisters the listener now.
    void reset()
    {
        if (auto disconnect = std::exchange(_disconnect, {}))
            disconnect();
    }

    /// @brief Returns true while the handle still owns a registration.
    [[nodiscard]] auto connected() const -> bool { return static_cast<bool>(_disconnect); }

  private:
    std::function<void()> _disconnect;
};

/// @brief Typed many-listener event channel with synchronous, registration-ordered dispatch.
///
/// Listeners may connect or disconnect while an emission is in progress; such changes take
/// effect for the next emission.
template <typename... Args>
class Signal
{
  public:
    using Listener = std::function<void(Args...)>;

    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /// @brief Registers a listener.
    /// @return A handle that unregisters the listener when destroyed.
    [[nodiscard]] auto connect(Listener listener) -> Connection
    {
        auto const id = _state->nextId++;
        _state->listeners.emplace(id, std::make_shared<Listener>(std::move(listener)));

        auto weak = std::weak_ptr<State>(_state);
        return Connection([weak, id]() {
            if (auto state = weak.lock())
                state->listeners.erase(id);
        });
    }

    /// @brief Invokes all currently registered listeners in registration order.
    void emit(Args... args) const
    {
        auto snapshot = std::vector<std::pair<uint64_t, std::shared_ptr<Listener>>> {};
        snapshot.reserve(_state->listeners.size());
        for (const auto& [id, listener]: _state->listeners)
            snapshot.emplace_back(id, listener);

        auto const state = _state;
        for (const auto& [id, listener]: snapshot)
        {
            // Skip listeners removed by an earlier listener of this emission.
            if (!state->listeners.contains(id))
                continue;
            (*listener)(args...);
        }
    }

    /// @brief Removes every listener.
    void disconnectAll() { _state->listeners.clear(); }

    /// @brief Returns the number of registered listeners.
    [[nodiscard]] auto listenerCount() const -> size_t { return _state->listeners.size(); }

  private:
    struct State
    {
        uint64_t nextId = 1;
        std::map<uint64_t, std::shared_ptr<Listener>> listeners;
    };

    std::shared_ptr<State> _state = std::make_shared<State>();
};

} // namespace mcpvisor
