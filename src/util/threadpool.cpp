// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/threadpool.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <exception>

namespace gossipnet {
namespace util {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queue_size, std::string name)
    : name_(std::move(name)), max_queue_size_(max_queue_size), stop_(false) {
  if (num_threads == 0) {
    num_threads = std::max(1u, std::thread::hardware_concurrency());
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this, i] { worker_loop(i); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::worker_loop(size_t index) {
  while (true) {
    std::function<void()> task;

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      condition_.wait(lock, [this] {
        return stop_.load(std::memory_order_acquire) || !tasks_.empty();
      });

      if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
      ++running_;
    }

    try {
      task();
      tasks_completed_.fetch_add(1, std::memory_order_relaxed);
    } catch (const std::exception &e) {
      task_exceptions_.fetch_add(1, std::memory_order_relaxed);
      LOG_ERROR("ThreadPool '{}' worker {} caught exception: {}", name_, index, e.what());
    }

    std::lock_guard<std::mutex> lock(queue_mutex_);
    --running_;
  }
}

const char *ThreadPool::rejection_reason_locked() {
  if (stop_.load(std::memory_order_acquire)) {
    return "pool stopped";
  }
  if (max_queue_size_ > 0 && tasks_.size() >= max_queue_size_) {
    return "queue full";
  }
  return nullptr;
}

bool ThreadPool::post(std::function<void()> task) {
  if (!task) {
    return false;
  }
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (const char *reason = rejection_reason_locked()) {
      tasks_rejected_.fetch_add(1, std::memory_order_relaxed);
      LOG_DEBUG("ThreadPool '{}' rejected task: {}", name_, reason);
      return false;
    }
    tasks_.emplace(std::move(task));
  }
  condition_.notify_one();
  return true;
}

void ThreadPool::shutdown() {
  // Release: all previous writes are visible to workers that load stop_
  stop_.store(true, std::memory_order_release);
  condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace util
} // namespace gossipnet
