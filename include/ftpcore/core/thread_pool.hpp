// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "ftpcore/core/logger.hpp"

namespace ftpcore
{
namespace core
{

/// A thread pool that accepts void or result-returning callables with
/// arbitrary arguments. Starts with \p initialSize workers and grows up to
/// \p maxSize while every worker is busy. Exceptions escaping fire-and-forget
/// tasks go to the error handler (or the log when none is set).
class ThreadPool
{
public:
  /// @param initialSize   Number of workers started up front (at least 1).
  /// @param maxSize       Hard limit on the number of workers.
  /// @param maxQueueSize  Maximum number of queued tasks before enqueue throws.
  /// @param onTaskError   Optional handler for uncaught exceptions in tasks.
  ThreadPool(std::size_t initialSize = std::thread::hardware_concurrency(),
             std::size_t maxSize = std::thread::hardware_concurrency() * 4,
             std::size_t maxQueueSize = 1024,
             std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _initialSize(initialSize == 0 ? 1 : initialSize),
        _maxSize(maxSize < _initialSize ? _initialSize : maxSize), _maxQueueSize(maxQueueSize),
        _onTaskError(std::move(onTaskError))
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (std::size_t i = 0; i < _initialSize; ++i)
    {
      spawnWorkerLocked();
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Enqueue a fire-and-forget task.
  /// \throws std::runtime_error if the pool is shutting down or the queue is
  /// full
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    enqueueImpl(
      [bound = std::move(bound), this]() mutable
      {
        try
        {
          bound();
        }
        catch (const std::exception &ex)
        {
          reportTaskError(std::current_exception(), ex.what());
        }
      });
  }

  /// Enqueue a task that returns a value and get a future for it. Exceptions
  /// are delivered through the future.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    enqueueImpl([task]() { (*task)(); });
    return future;
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _threads.size();
  }

  std::size_t getActiveThreadCount() const { return _busyThreads.load(); }

  /// Stop accepting work, run what is already queued and join every worker.
  /// Idempotent.
  void shutdown()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return;
      }
      _shutdown = true;
    }
    _condition.notify_all();

    std::vector<std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      threads.swap(_threads);
    }
    for (auto &t : threads)
    {
      if (t.joinable())
      {
        t.join();
      }
    }
    Logger::debug("ThreadPool::shutdown() - " + std::to_string(threads.size()) +
                  " workers joined");
  }

private:
  const std::size_t _initialSize;
  const std::size_t _maxSize;
  const std::size_t _maxQueueSize;
  std::function<void(std::exception_ptr)> _onTaskError;

  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::queue<std::function<void()>> _tasks;
  std::vector<std::thread> _threads;
  bool _shutdown{false};
  std::atomic<std::size_t> _busyThreads{0};

  void enqueueImpl(std::function<void()> f)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        throw std::runtime_error("ThreadPool is shutting down");
      }
      if (_tasks.size() >= _maxQueueSize)
      {
        throw std::runtime_error("ThreadPool task queue is full");
      }
      _tasks.emplace(std::move(f));
      if (_busyThreads.load() + _tasks.size() > _threads.size() && _threads.size() < _maxSize)
      {
        spawnWorkerLocked();
      }
    }
    _condition.notify_one();
  }

  void spawnWorkerLocked()
  {
    _threads.emplace_back([this]() { workerLoop(); });
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        _condition.wait(lock, [this]() { return _shutdown || !_tasks.empty(); });
        if (_tasks.empty())
        {
          return;
        }
        task = std::move(_tasks.front());
        _tasks.pop();
        ++_busyThreads;
      }
      task();
      // Release captures before the worker is counted idle.
      task = nullptr;
      --_busyThreads;
    }
  }

  void reportTaskError(std::exception_ptr error, const char *what)
  {
    if (_onTaskError)
    {
      _onTaskError(error);
      return;
    }
    Logger::error(std::string("[ThreadPool] Unhandled exception in task: ") + what);
  }
};

} // namespace core
} // namespace ftpcore
