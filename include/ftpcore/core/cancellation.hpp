// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace ftpcore
{
namespace core
{

/// \brief Thrown when a blocking operation observes a cancelled token.
/// Cancellation is distinct from failure and must never be reported as
/// success.
class OperationCancelled : public std::runtime_error
{
public:
  explicit OperationCancelled(const std::string &what = "Operation cancelled")
      : std::runtime_error(what)
  {
  }
};

namespace detail
{
  struct CancellationState
  {
    // Callbacks run under this mutex so that an unregister from another
    // thread waits for a running callback to finish. Recursive so that a
    // callback may unregister itself.
    std::recursive_mutex mutex;
    std::atomic<bool> cancelled{false};
    std::uint64_t nextId{1};
    std::map<std::uint64_t, std::function<void()>> callbacks;
  };
} // namespace detail

/// \brief Handle for a callback registered on a CancellationToken. The
/// callback is removed when the registration is destroyed or unregister() is
/// called. Once unregister() returns the callback is not running and will
/// not run.
class CancellationRegistration
{
public:
  CancellationRegistration() = default;

  CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id)
      : _state(std::move(state)), _id(id)
  {
  }

  ~CancellationRegistration() { unregister(); }

  CancellationRegistration(const CancellationRegistration &) = delete;
  CancellationRegistration &operator=(const CancellationRegistration &) = delete;

  CancellationRegistration(CancellationRegistration &&other) noexcept
      : _state(std::move(other._state)), _id(other._id)
  {
    other._id = 0;
  }

  CancellationRegistration &operator=(CancellationRegistration &&other) noexcept
  {
    if (this != &other)
    {
      unregister();
      _state = std::move(other._state);
      _id = other._id;
      other._id = 0;
    }
    return *this;
  }

  void unregister()
  {
    if (_id == 0)
    {
      return;
    }
    if (auto state = _state.lock())
    {
      std::lock_guard<std::recursive_mutex> lock(state->mutex);
      state->callbacks.erase(_id);
    }
    _id = 0;
    _state.reset();
  }

private:
  std::weak_ptr<detail::CancellationState> _state;
  std::uint64_t _id{0};
};

/// \brief Observer side of a cancellation scope. Cheap to copy. A
/// default-constructed token can never be cancelled.
class CancellationToken
{
public:
  CancellationToken() = default;

  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : _state(std::move(state))
  {
  }

  static CancellationToken none() { return CancellationToken(); }

  bool canBeCancelled() const { return static_cast<bool>(_state); }

  bool isCancellationRequested() const
  {
    return _state && _state->cancelled.load(std::memory_order_acquire);
  }

  void throwIfCancellationRequested() const
  {
    if (isCancellationRequested())
    {
      throw OperationCancelled();
    }
  }

  /// \brief Register \p callback to run when cancellation is requested. If
  /// the token is already cancelled the callback runs immediately on the
  /// calling thread.
  CancellationRegistration registerCallback(std::function<void()> callback) const
  {
    if (!_state)
    {
      return CancellationRegistration();
    }
    std::unique_lock<std::recursive_mutex> lock(_state->mutex);
    if (_state->cancelled.load(std::memory_order_acquire))
    {
      lock.unlock();
      callback();
      return CancellationRegistration();
    }
    std::uint64_t id = _state->nextId++;
    _state->callbacks.emplace(id, std::move(callback));
    return CancellationRegistration(_state, id);
  }

private:
  std::shared_ptr<detail::CancellationState> _state;
};

/// \brief Owner side of a cancellation scope.
class CancellationSource
{
public:
  CancellationSource() : _state(std::make_shared<detail::CancellationState>()) {}

  CancellationSource(const CancellationSource &) = delete;
  CancellationSource &operator=(const CancellationSource &) = delete;
  CancellationSource(CancellationSource &&) noexcept = default;
  CancellationSource &operator=(CancellationSource &&) noexcept = default;

  /// \brief Create a source that is cancelled whenever \p parent is.
  static CancellationSource createLinked(const CancellationToken &parent)
  {
    CancellationSource source;
    std::weak_ptr<detail::CancellationState> weak = source._state;
    source._link = std::make_unique<CancellationRegistration>(parent.registerCallback(
      [weak]()
      {
        if (auto state = weak.lock())
        {
          cancelState(*state);
        }
      }));
    return source;
  }

  CancellationToken token() const { return CancellationToken(_state); }

  bool isCancellationRequested() const
  {
    return _state->cancelled.load(std::memory_order_acquire);
  }

  /// \brief Request cancellation. Runs all registered callbacks on the
  /// calling thread. Subsequent calls do nothing.
  void cancel() { cancelState(*_state); }

private:
  std::shared_ptr<detail::CancellationState> _state;
  std::unique_ptr<CancellationRegistration> _link;

  static void cancelState(detail::CancellationState &state)
  {
    std::lock_guard<std::recursive_mutex> lock(state.mutex);
    if (state.cancelled.exchange(true, std::memory_order_acq_rel))
    {
      return;
    }
    auto callbacks = std::move(state.callbacks);
    state.callbacks.clear();
    for (auto &entry : callbacks)
    {
      entry.second();
    }
  }
};

} // namespace core
} // namespace ftpcore
