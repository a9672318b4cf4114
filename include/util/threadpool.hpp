#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace gossipnet {
namespace util {

/**
 * Bounded thread pool for short-lived background tasks
 *
 * Each GossipNode owns one of these for its fan-out sends, so every task a
 * node spawns is tracked and joined when the node closes.
 *
 * Features:
 * - Exception-safe worker threads (exceptions don't kill threads)
 * - Graceful shutdown: queued tasks still run before workers exit
 * - Optional queue size limit; a full queue rejects instead of blocking
 * - Idle detection (no queued and no running tasks)
 *
 * Usage:
 *   ThreadPool pool(2, 1024, "fanout");
 *   pool.post([]{ do_send(); });   // fire-and-forget
 *   pool.shutdown();
 *   pool.wait_for_completion();
 */
class ThreadPool {
public:
  /**
   * @param num_threads Number of worker threads (0 = use hardware concurrency)
   * @param max_queue_size Maximum queued tasks (0 = unlimited)
   * @param name Label used in log messages
   */
  explicit ThreadPool(size_t num_threads = 0, size_t max_queue_size = 0,
                      std::string name = "pool");

  // Stops accepting new tasks and waits for queued tasks to complete
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  /**
   * Enqueue a task whose result nobody waits for
   * Returns false (task dropped) if the pool is stopped or the queue is full
   */
  bool post(std::function<void()> task);

  /**
   * Stop accepting new tasks (pending tasks will still execute)
   * Safe to call multiple times
   */
  void shutdown();

  /**
   * Join all worker threads
   * Should be called after shutdown(), never from one of the pool's own
   * workers.
   */
  void wait_for_completion();

  size_t size() const { return workers_.size(); }

  size_t pending_tasks() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.size();
  }

  // True when nothing is queued and no worker is running a task
  bool is_idle() const {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    return tasks_.empty() && running_ == 0;
  }

  bool is_stopped() const {
    return stop_.load(std::memory_order_acquire);
  }

  size_t tasks_completed() const {
    return tasks_completed_.load(std::memory_order_relaxed);
  }

  size_t task_exceptions() const {
    return task_exceptions_.load(std::memory_order_relaxed);
  }

  size_t tasks_rejected() const {
    return tasks_rejected_.load(std::memory_order_relaxed);
  }

private:
  // Caller must hold queue_mutex_. Returns the rejection reason, or
  // nullptr if the task may be queued.
  const char *rejection_reason_locked();

  void worker_loop(size_t index);

  std::string name_;
  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> tasks_;
  size_t max_queue_size_;  // 0 = unlimited
  size_t running_{0};      // guarded by queue_mutex_

  mutable std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_;

  std::atomic<size_t> tasks_completed_{0};
  std::atomic<size_t> task_exceptions_{0};
  std::atomic<size_t> tasks_rejected_{0};
};

} // namespace util
} // namespace gossipnet
