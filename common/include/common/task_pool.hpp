#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace skyshot {

// Fixed-size worker pool. Tasks observe a stop request on their worker through
// the stop token handed to them; shutdown() drains the queue without one.
class TaskPool {
 public:
  using Task = std::function<void(std::stop_token)>;

  TaskPool() = default;
  explicit TaskPool(std::size_t worker_count) { start(worker_count); }
  TaskPool(const TaskPool&) = delete;
  TaskPool& operator=(const TaskPool&) = delete;
  TaskPool(TaskPool&&) = delete;
  TaskPool& operator=(TaskPool&&) = delete;

  ~TaskPool() { shutdown(); }

  // worker_count 0 picks hardware_concurrency(), minimum 1.
  void start(std::size_t worker_count);
  // Returns false when the pool is already stopping and the task was dropped.
  bool submit(Task&& task);
  void shutdown();  // idempotent, joins workers

  std::size_t worker_count() const noexcept { return threads_.size(); }
  std::size_t queued_tasks() const noexcept;

 private:
  void worker_loop(std::stop_token stop);

  std::vector<std::jthread> threads_;
  std::queue<Task> tasks_;
  mutable std::mutex mutex_;
  std::condition_variable_any cv_;
  bool stopping_ = false;
};

inline void TaskPool::start(std::size_t worker_count) {
  if (!threads_.empty()) {
    return;
  }
  if (worker_count == 0) {
    const std::size_t hw = std::thread::hardware_concurrency();
    worker_count = hw == 0 ? 1 : hw;
  }

  threads_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    threads_.emplace_back([this](std::stop_token st) { worker_loop(st); });
  }
}

inline bool TaskPool::submit(Task&& task) {
  {
    std::scoped_lock lock(mutex_);
    if (stopping_) {
      return false;
    }
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

inline void TaskPool::shutdown() {
  {
    std::scoped_lock lock(mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  cv_.notify_all();
  // Join before the jthreads are destroyed: destruction requests stop, and a
  // worker still draining the queue would hand that token to queued tasks.
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

inline std::size_t TaskPool::queued_tasks() const noexcept {
  std::scoped_lock lock(mutex_);
  return tasks_.size();
}

inline void TaskPool::worker_loop(std::stop_token stop) {
  while (true) {
    Task task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) {
        return;
      }
      task = std::move(tasks_.front());
      tasks_.pop();
    }

    if (task) {
      task(stop);
    }
  }
}

}  // namespace skyshot
