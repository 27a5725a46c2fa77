#pragma once

#include <vector>
#include <thread>
#include <future>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <stdexcept>

namespace common {

// Fixed-size pool for short tasks. Tasks already queued when the pool stops
// still run before the threads exit.
class ThreadPool {
  using Task = std::packaged_task<void()>;

public:
  explicit ThreadPool(unsigned int size = std::thread::hardware_concurrency()) {
    _poolSize = size < 1 ? 2 : size;
    _threads.reserve(_poolSize);

    for (unsigned int i = 0; i < _poolSize; i++) {
      _threads.emplace_back([this]() -> void {
        while (true) {
          Task task;
          {
            std::unique_lock<std::mutex> lock{_mtx};
            _cv.wait(lock, [this]() -> bool {
              return _stop.load(std::memory_order_acquire) || !_tasks.empty();
            });

            if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
              break;
            }

            task = std::move(_tasks.front());
            _tasks.pop();
          }
          task();
        }
      });
    }
  }

  ~ThreadPool() {
    stop();
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  template <typename Func, typename... Args>
  auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
    using ReturnType = std::invoke_result_t<Func, Args...>;

    auto task = std::packaged_task<ReturnType()>(
      [func = std::forward<Func>(func), args...]() mutable -> ReturnType {
        return func(args...);
      });

    auto ret = task.get_future();
    {
      std::lock_guard<std::mutex> lock{_mtx};
      if (_stop.load(std::memory_order_relaxed)) {
        throw std::runtime_error("ThreadPool is stopped");
      }
      _tasks.emplace([task = std::move(task)]() mutable -> void {
        task();
      });
    }
    _cv.notify_one();
    return ret;
  }

  // Drains the queue and joins every thread. Safe to call more than once.
  void stop() {
    {
      std::lock_guard<std::mutex> lock{_mtx};
      _stop.store(true, std::memory_order_release);
    }
    _cv.notify_all();
    for (auto& t : _threads) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  size_t size() const { return _poolSize; }

private:
  std::mutex _mtx;
  std::condition_variable _cv;

  std::queue<Task> _tasks;
  std::vector<std::jthread> _threads;

  std::atomic_bool _stop{false};
  size_t _poolSize{0};
};

}
