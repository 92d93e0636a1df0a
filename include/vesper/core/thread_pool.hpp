// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Vesper, which is licensed under the Mozilla Public
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

#include <vesper/core/logger.hpp>

namespace vesper
{
namespace core
{

/// A fixed-size worker pool that runs the exchanges behind pending futures.
/// Accepts void or result-returning callables with arguments. Exceptions
/// escaping a void task are passed to the error handler, or logged.
class ThreadPool
{
public:
  /// Constructs the pool and starts its workers.
  ///
  /// @param threadCount   Number of worker threads (at least one).
  /// @param maxQueueSize  Maximum number of queued tasks before enqueue
  /// throws.
  /// @param onTaskError   Optional handler for uncaught exceptions in tasks.
  explicit ThreadPool(std::size_t threadCount = std::thread::hardware_concurrency(),
                      std::size_t maxQueueSize = 1024,
                      std::function<void(std::exception_ptr)> onTaskError = nullptr)
    : _maxQueueSize(maxQueueSize), _onTaskError(std::move(onTaskError))
  {
    if (threadCount == 0)
    {
      threadCount = 1;
    }
    _workers.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i)
    {
      _workers.emplace_back([this]() { workerLoop(); });
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /// Enqueue a fire-and-forget task.
  /// @throws std::runtime_error if the pool is shutting down or the queue is
  /// full.
  template <typename F, typename... Args> void enqueue(F&& func, Args&&... args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    if (!push(wrapVoid(std::move(bound)), true))
    {
      throw std::runtime_error("ThreadPool rejected task");
    }
  }

  /// Enqueue a task that returns a value and get a future for it. Exceptions
  /// thrown by the task are delivered through the future.
  template <typename F, typename... Args>
  auto enqueueWithResult(F&& func, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    push([task]() { (*task)(); }, true);
    return future;
  }

  /// Like enqueue(), but returns false instead of throwing.
  template <typename F, typename... Args> bool tryEnqueue(F&& func, Args&&... args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    return push(wrapVoid(std::move(bound)), false);
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getActiveThreadCount() const { return _activeThreads.load(); }

  std::size_t getThreadCount() const { return _workers.size(); }

  /// Stop accepting work, let queued tasks finish and join every worker.
  /// Safe to call more than once.
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

    VESPER_LOG_DEBUG("ThreadPool::shutdown() - joining " << _workers.size() << " workers");
    for (auto& worker : _workers)
    {
      if (worker.joinable())
      {
        worker.join();
      }
    }
  }

private:
  template <typename Bound> std::function<void()> wrapVoid(Bound bound)
  {
    return [bound = std::move(bound), this]() mutable
    {
      try
      {
        bound();
      }
      catch (...)
      {
        reportTaskError(std::current_exception());
      }
    };
  }

  void reportTaskError(std::exception_ptr error)
  {
    if (_onTaskError)
    {
      _onTaskError(error);
      return;
    }
    try
    {
      std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
      Logger::error(std::string("ThreadPool: unhandled exception in task: ") + e.what());
    }
    catch (...)
    {
      Logger::error("ThreadPool: unhandled non-standard exception in task");
    }
  }

  bool push(std::function<void()> task, bool throwOnReject)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        if (throwOnReject)
        {
          throw std::runtime_error("ThreadPool is shutting down");
        }
        return false;
      }
      if (_tasks.size() >= _maxQueueSize)
      {
        if (throwOnReject)
        {
          throw std::runtime_error("ThreadPool task queue is full");
        }
        return false;
      }
      _tasks.emplace(std::move(task));
    }
    _condition.notify_one();
    return true;
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        _condition.wait(lock, [this]() { return _shutdown || !_tasks.empty(); });
        if (_shutdown && _tasks.empty())
        {
          return;
        }
        task = std::move(_tasks.front());
        _tasks.pop();
      }

      ++_activeThreads;
      task();
      // Release captured state before the task counts as finished
      task = nullptr;
      --_activeThreads;
    }
  }

  std::size_t _maxQueueSize;
  std::function<void(std::exception_ptr)> _onTaskError;

  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::queue<std::function<void()>> _tasks;
  std::vector<std::thread> _workers;
  std::atomic<std::size_t> _activeThreads{0};
  bool _shutdown{false};
};

} // namespace core
} // namespace vesper
