/**
 * @file task_queue.cpp
 * @brief Task queue implementation
 */

#include "utils/task_queue.h"

#include <utility>

#include "utils/structured_log.h"

namespace pagedtable::utils {

TaskQueue::~TaskQueue() {
  Shutdown();
}

bool TaskQueue::Post(Task task) {
  if (shutdown_) {
    return false;
  }
  tasks_.push_back(std::move(task));
  return true;
}

size_t TaskQueue::RunPending() {
  size_t budget = tasks_.size();
  size_t executed = 0;
  while (budget > 0 && !tasks_.empty()) {
    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    --budget;
    task();
    ++executed;
  }
  return executed;
}

size_t TaskQueue::RunUntilIdle() {
  size_t executed = 0;
  while (!tasks_.empty()) {
    Task task = std::move(tasks_.front());
    tasks_.pop_front();
    task();
    ++executed;
  }
  return executed;
}

void TaskQueue::Shutdown() {
  if (shutdown_) {
    return;
  }
  shutdown_ = true;

  if (!tasks_.empty()) {
    StructuredLog()
        .Event("task_queue_shutdown")
        .Field("dropped_tasks", static_cast<uint64_t>(tasks_.size()))
        .Debug();
    tasks_.clear();
  }
}

}  // namespace pagedtable::utils
