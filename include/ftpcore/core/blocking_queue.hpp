// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "ftpcore/core/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace ftpcore
{
namespace core
{

/// \brief Thread-safe bounded FIFO queue for multiple producers and
/// consumers.
///
/// Producers block while the queue is full, consumers block while it is
/// empty. Blocking consumers may observe a CancellationToken, in which case
/// cancellation wakes them and surfaces as OperationCancelled. close() wakes
/// everybody; items already queued can still be drained afterwards.
///
/// \code
///   BlockingQueue<ServerCommand> commands(1024);
///   commands.queue(SendResponse{...});
///
///   ServerCommand next;
///   while (commands.dequeue(next, token))
///   {
///     execute(next);
///   }
/// \endcode
template <typename T> class BlockingQueue
{
public:
  /// \throws std::invalid_argument if maxSize is 0
  explicit BlockingQueue(std::size_t maxSize = 1024) : _maxSize(maxSize), _closed(false)
  {
    if (maxSize == 0)
    {
      throw std::invalid_argument("BlockingQueue maxSize must be greater than 0");
    }
  }

  ~BlockingQueue() { close(); }

  BlockingQueue(const BlockingQueue &) = delete;
  BlockingQueue &operator=(const BlockingQueue &) = delete;
  BlockingQueue(BlockingQueue &&) = delete;
  BlockingQueue &operator=(BlockingQueue &&) = delete;

  /// \brief Add an item, blocking while the queue is full.
  /// \return false if the queue is closed
  bool queue(T item)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _condNotFull.wait(lock, [this]()
                      { return _queue.size() < _maxSize || _closed.load(std::memory_order_acquire); });
    if (_closed.load(std::memory_order_acquire))
    {
      return false;
    }
    _queue.push_back(std::move(item));
    lock.unlock();
    _condNotEmpty.notify_one();
    return true;
  }

  /// \brief Add an item without blocking.
  /// \return false if the queue is full or closed
  bool tryQueue(T item)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    if (_closed.load(std::memory_order_acquire) || _queue.size() >= _maxSize)
    {
      return false;
    }
    _queue.push_back(std::move(item));
    lock.unlock();
    _condNotEmpty.notify_one();
    return true;
  }

  /// \brief Remove an item, blocking while the queue is empty.
  /// \return false if the queue is closed and drained
  bool dequeue(T &out)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _condNotEmpty.wait(lock, [this]()
                       { return !_queue.empty() || _closed.load(std::memory_order_acquire); });
    return popLocked(out, lock);
  }

  /// \brief Remove an item, waiting at most \p timeout.
  /// \return false on timeout or if the queue is closed and drained
  bool dequeue(T &out, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _condNotEmpty.wait_for(lock, timeout, [this]()
                           { return !_queue.empty() || _closed.load(std::memory_order_acquire); });
    return popLocked(out, lock);
  }

  /// \brief Remove an item, blocking until one arrives, the queue closes or
  /// \p token is cancelled. A token that is already cancelled on entry wins
  /// over queued items.
  /// \return false if the queue is closed and drained
  /// \throws OperationCancelled when \p token is cancelled
  bool dequeue(T &out, const CancellationToken &token)
  {
    // Registered before taking _mutex and released after dropping it; the
    // callback itself takes _mutex so the wakeup cannot be lost.
    auto registration = token.registerCallback(
      [this]()
      {
        std::lock_guard<std::mutex> guard(_mutex);
        _condNotEmpty.notify_all();
      });

    std::unique_lock<std::mutex> lock(_mutex);
    _condNotEmpty.wait(lock,
                       [this, &token]()
                       {
                         return token.isCancellationRequested() || !_queue.empty() ||
                                _closed.load(std::memory_order_acquire);
                       });
    if (token.isCancellationRequested())
    {
      lock.unlock();
      registration.unregister();
      throw OperationCancelled();
    }
    return popLocked(out, lock);
  }

  /// \brief Remove an item without blocking.
  bool tryDequeue(T &out)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return popLocked(out, lock);
  }

  /// \brief Close the queue and wake all waiting threads. Idempotent.
  void close()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_closed.exchange(true, std::memory_order_acq_rel))
      {
        return;
      }
    }
    _condNotEmpty.notify_all();
    _condNotFull.notify_all();
  }

  /// \brief Drop every queued item without closing.
  void clear()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _queue.clear();
    _condNotFull.notify_all();
  }

  bool isClosed() const { return _closed.load(std::memory_order_acquire); }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
  }

  bool empty() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.empty();
  }

  std::size_t capacity() const { return _maxSize; }

private:
  mutable std::mutex _mutex;
  std::condition_variable _condNotEmpty;
  std::condition_variable _condNotFull;
  std::deque<T> _queue;
  const std::size_t _maxSize;
  std::atomic<bool> _closed;

  bool popLocked(T &out, std::unique_lock<std::mutex> &lock)
  {
    if (_queue.empty())
    {
      return false;
    }
    out = std::move(_queue.front());
    _queue.pop_front();
    lock.unlock();
    _condNotFull.notify_one();
    return true;
  }
};

} // namespace core
} // namespace ftpcore
