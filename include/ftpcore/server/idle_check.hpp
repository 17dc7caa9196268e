// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <type_traits>
#include <variant>

#include "ftpcore/server/connection_events.hpp"

namespace ftpcore
{
namespace server
{

/// \brief Decides whether a connection is still alive based on observed
/// activity.
///
/// Activity is every received command and every data transfer start or
/// stop. While at least one data transfer is open the connection is always
/// alive, and every check counts as activity, so the inactivity timer only
/// starts running once the last transfer stops. A connection that does not
/// publish events is always alive.
class FtpConnectionIdleCheck
{
public:
  using Clock = std::chrono::steady_clock;
  using ClockFunction = std::function<Clock::time_point()>;

  /// \param timeout inactivity timeout; nullopt or milliseconds::max() never
  /// expires
  /// \param clock time source, steady_clock::now when empty
  FtpConnectionIdleCheck(const EventCapability &capability,
                         std::optional<std::chrono::milliseconds> timeout,
                         ClockFunction clock = {})
      : _clock(clock ? std::move(clock) : ClockFunction(&Clock::now))
  {
    if (timeout && *timeout != std::chrono::milliseconds::max())
    {
      _timeout = timeout;
    }
    _lastActivity = _clock();
    updateExpiration();

    if (auto *capable = std::get_if<EventCapable>(&capability))
    {
      _eventCapable = true;
      _subscription = capable->bus->subscribe([this](const ConnectionEvent &e) { onEvent(e); });
    }
  }

  FtpConnectionIdleCheck(const FtpConnectionIdleCheck &) = delete;
  FtpConnectionIdleCheck &operator=(const FtpConnectionIdleCheck &) = delete;

  /// \brief True while the connection must be kept. Thread-safe.
  bool check()
  {
    if (!_eventCapable)
    {
      return true;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_expiration)
    {
      return true;
    }
    if (!_activeTransfers.empty())
    {
      recordActivityLocked();
      return true;
    }
    return _clock() <= *_expiration;
  }

  std::size_t activeTransferCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _activeTransfers.size();
  }

  Clock::time_point lastActivity() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastActivity;
  }

  std::optional<Clock::time_point> expiration() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _expiration;
  }

private:
  ClockFunction _clock;
  std::optional<std::chrono::milliseconds> _timeout;
  bool _eventCapable{false};
  mutable std::mutex _mutex;
  Clock::time_point _lastActivity;
  std::optional<Clock::time_point> _expiration;
  std::set<std::string> _activeTransfers;
  ConnectionEventBus::Subscription _subscription;

  void onEvent(const ConnectionEvent &event)
  {
    std::visit(
      [this](const auto &e)
      {
        using T = std::decay_t<decltype(e)>;
        std::lock_guard<std::mutex> lock(_mutex);
        if constexpr (std::is_same_v<T, CommandReceivedEvent>)
        {
          recordActivityLocked();
        }
        else if constexpr (std::is_same_v<T, DataTransferStartedEvent>)
        {
          recordActivityLocked();
          _activeTransfers.insert(e.transferId);
        }
        else if constexpr (std::is_same_v<T, DataTransferStoppedEvent>)
        {
          recordActivityLocked();
          _activeTransfers.erase(e.transferId);
        }
      },
      event);
  }

  void recordActivityLocked()
  {
    _lastActivity = _clock();
    updateExpiration();
  }

  void updateExpiration()
  {
    if (_timeout)
    {
      _expiration = _lastActivity + *_timeout;
    }
    else
    {
      _expiration.reset();
    }
  }
};

} // namespace server
} // namespace ftpcore
