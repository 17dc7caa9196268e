// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "ftpcore/core/logger.hpp"
#include "ftpcore/server/ftp_types.hpp"

namespace ftpcore
{
namespace server
{

struct CommandReceivedEvent
{
  FtpCommand command;
};

struct DataTransferStartedEvent
{
  std::string transferId;
  FtpCommand command;
};

struct DataTransferStoppedEvent
{
  std::string transferId;
};

struct ConnectionClosedEvent
{
};

using ConnectionEvent = std::variant<CommandReceivedEvent, DataTransferStartedEvent,
                                     DataTransferStoppedEvent, ConnectionClosedEvent>;

inline const char *eventName(const ConnectionEvent &event)
{
  switch (event.index())
  {
  case 0:
    return "CommandReceived";
  case 1:
    return "DataTransferStarted";
  case 2:
    return "DataTransferStopped";
  default:
    return "ConnectionClosed";
  }
}

/// \brief Per-connection publish point for connection events.
///
/// Delivery is synchronous on the publishing thread. Publishers are
/// serialized, so every observer sees events in publish order. An exception
/// thrown by an observer is logged and does not reach the publisher or the
/// remaining observers.
class ConnectionEventBus
{
  struct State;

public:
  using Observer = std::function<void(const ConnectionEvent &)>;

  /// \brief Keeps an observer subscribed for as long as it lives.
  class Subscription
  {
  public:
    Subscription() = default;
    Subscription(std::weak_ptr<State> state, std::uint64_t id) : _state(std::move(state)), _id(id)
    {
    }
    ~Subscription() { unsubscribe(); }

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    Subscription(Subscription &&other) noexcept : _state(std::move(other._state)), _id(other._id)
    {
      other._id = 0;
    }

    Subscription &operator=(Subscription &&other) noexcept
    {
      if (this != &other)
      {
        unsubscribe();
        _state = std::move(other._state);
        _id = other._id;
        other._id = 0;
      }
      return *this;
    }

    bool active() const { return _id != 0 && !_state.expired(); }

    /// \brief Stop delivery. When this returns no delivery to the observer
    /// is in progress on another thread. Idempotent.
    void unsubscribe()
    {
      if (_id == 0)
      {
        return;
      }
      if (auto state = _state.lock())
      {
        std::lock_guard<std::recursive_mutex> publishing(state->publishMutex);
        std::lock_guard<std::mutex> lock(state->observersMutex);
        state->observers.erase(_id);
      }
      _id = 0;
      _state.reset();
    }

  private:
    std::weak_ptr<State> _state;
    std::uint64_t _id{0};
  };

  explicit ConnectionEventBus(std::string connectionId = {})
      : _state(std::make_shared<State>()), _connectionId(std::move(connectionId))
  {
  }

  ConnectionEventBus(const ConnectionEventBus &) = delete;
  ConnectionEventBus &operator=(const ConnectionEventBus &) = delete;

  Subscription subscribe(Observer observer)
  {
    std::lock_guard<std::mutex> lock(_state->observersMutex);
    std::uint64_t id = _state->nextId++;
    _state->observers.emplace(id, std::make_shared<Observer>(std::move(observer)));
    return Subscription(_state, id);
  }

  void publish(const ConnectionEvent &event)
  {
    std::lock_guard<std::recursive_mutex> publishing(_state->publishMutex);
    std::vector<std::pair<std::uint64_t, std::shared_ptr<Observer>>> snapshot;
    {
      std::lock_guard<std::mutex> lock(_state->observersMutex);
      snapshot.assign(_state->observers.begin(), _state->observers.end());
    }
    for (auto &entry : snapshot)
    {
      {
        // skip observers removed by an earlier observer of this event
        std::lock_guard<std::mutex> lock(_state->observersMutex);
        if (_state->observers.count(entry.first) == 0)
        {
          continue;
        }
      }
      try
      {
        (*entry.second)(event);
      }
      catch (const std::exception &ex)
      {
        FTPCORE_LOG_ERROR("Connection " << _connectionId << ": observer failed on "
                                        << eventName(event) << " event: " << ex.what());
      }
      catch (...)
      {
        FTPCORE_LOG_ERROR("Connection " << _connectionId << ": observer failed on "
                                        << eventName(event) << " event: unknown exception");
      }
    }
  }

  std::size_t observerCount() const
  {
    std::lock_guard<std::mutex> lock(_state->observersMutex);
    return _state->observers.size();
  }

private:
  struct State
  {
    std::recursive_mutex publishMutex;
    mutable std::mutex observersMutex;
    std::uint64_t nextId{1};
    std::map<std::uint64_t, std::shared_ptr<Observer>> observers;
  };

  std::shared_ptr<State> _state;
  std::string _connectionId;
};

/// \brief Connection that publishes events.
struct EventCapable
{
  std::shared_ptr<ConnectionEventBus> bus;
};

/// \brief Connection that does not publish events.
struct NotEventCapable
{
};

using EventCapability = std::variant<NotEventCapable, EventCapable>;

} // namespace server
} // namespace ftpcore
