/**
 * @file task_queue.h
 * @brief Single-threaded cooperative task queue
 */

#pragma once

#include <cstddef>
#include <deque>
#include <functional>

namespace pagedtable::utils {

/**
 * @brief FIFO of deferred tasks drained by its owning thread
 *
 * Tasks never run inside Post(); they run when the owner drains the queue
 * with RunPending() or RunUntilIdle(). Table controllers use it to schedule
 * their first fetch and row sources use it to complete fetches
 * asynchronously.
 *
 * Not thread-safe: post and drain from one thread.
 */
class TaskQueue {
 public:
  using Task = std::function<void()>;

  TaskQueue() = default;
  ~TaskQueue();

  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;
  TaskQueue(TaskQueue&&) = delete;
  TaskQueue& operator=(TaskQueue&&) = delete;

  /**
   * @brief Enqueue a task
   * @return false if the queue has been shut down
   */
  bool Post(Task task);

  /**
   * @brief Run the tasks that were queued when the call started
   *
   * Tasks posted by those tasks stay queued for the next drain.
   *
   * @return Number of tasks executed
   */
  size_t RunPending();

  /**
   * @brief Run tasks until the queue is empty, including newly posted ones
   * @return Number of tasks executed
   */
  size_t RunUntilIdle();

  size_t Size() const { return tasks_.size(); }
  bool Empty() const { return tasks_.empty(); }
  bool IsShutdown() const { return shutdown_; }

  /**
   * @brief Drop pending tasks and refuse further posts
   */
  void Shutdown();

 private:
  std::deque<Task> tasks_;
  bool shutdown_ = false;
};

}  // namespace pagedtable::utils
