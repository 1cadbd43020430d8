#include "ctxcpp/task_batcher.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace ctxcpp {

TaskBatcher::TaskBatcher(std::size_t max_entries_per_batch) : max_entries_(max_entries_per_batch) {
  if (max_entries_ == 0) {
    throw std::invalid_argument("max_entries_per_batch must be positive");
  }
}

std::string TaskBatcher::NextBatchId() {
  return fmt::format("batch_{:04}", ++batch_counter_);
}

std::vector<TaskBatch> TaskBatcher::CreateBatches(std::vector<TaskSpec> tasks, bool sort_by_priority) {
  std::vector<TaskBatch> batches{};
  if (tasks.empty()) {
    return batches;
  }
  if (sort_by_priority) {
    std::stable_sort(tasks.begin(), tasks.end(), [](const TaskSpec& lhs, const TaskSpec& rhs) {
      return lhs.priority > rhs.priority;
    });
  }

  TaskBatch current{};
  auto flush = [&]() {
    if (current.tasks.empty()) {
      return;
    }
    current.batch_id = NextBatchId();
    current.exceeds_limit = current.unique_entry_ids.size() >= max_entries_;
    batches.push_back(std::move(current));
    current = TaskBatch{};
  };

  for (auto& task : tasks) {
    auto merged = current.unique_entry_ids;
    merged.insert(task.required_entry_ids.begin(), task.required_entry_ids.end());
    if (merged.size() < max_entries_ || current.tasks.empty()) {
      current.unique_entry_ids = std::move(merged);
      current.tasks.push_back(std::move(task));
      if (current.unique_entry_ids.size() >= max_entries_) {
        // A single task over the limit is isolated in its own batch.
        flush();
      }
      continue;
    }
    flush();
    current.unique_entry_ids.insert(task.required_entry_ids.begin(), task.required_entry_ids.end());
    current.tasks.push_back(std::move(task));
    if (current.unique_entry_ids.size() >= max_entries_) {
      flush();
    }
  }
  flush();

  spdlog::debug("task batcher: {} tasks packed into {} batches", tasks.size(), batches.size());
  return batches;
}

BatchExecutor::BatchExecutor(ContextBudgetAllocator& allocator) : allocator_(allocator) {}

BatchResult BatchExecutor::ExecuteBatch(const TaskBatch& batch, const BatchHandler& handler) {
  const auto started = std::chrono::steady_clock::now();
  BatchResult result{};
  result.batch_id = batch.batch_id;
  result.entry_count = batch.entry_count();

  try {
    const std::vector<std::string> entry_ids(batch.unique_entry_ids.begin(), batch.unique_entry_ids.end());
    ScopedContext scoped(allocator_, entry_ids);
    result.total_tokens = scoped.context().total_tokens;
    result.task_results = handler(scoped.context(), batch.tasks);
    result.success = true;
  } catch (const std::exception& ex) {
    result.success = false;
    result.error = ex.what();
    spdlog::warn("batch executor: {} failed: {}", batch.batch_id, ex.what());
  }

  result.duration_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  return result;
}

std::vector<BatchResult> BatchExecutor::ExecuteAll(const std::vector<TaskBatch>& batches,
                                                   const BatchHandler& handler,
                                                   bool continue_on_error) {
  std::vector<BatchResult> results{};
  results.reserve(batches.size());
  for (const auto& batch : batches) {
    results.push_back(ExecuteBatch(batch, handler));
    if (!results.back().success && !continue_on_error) {
      break;
    }
  }
  return results;
}

TaskResults BatchExecutor::CollectTaskResults(const std::vector<BatchResult>& results) {
  TaskResults merged{};
  for (const auto& result : results) {
    for (const auto& [task_id, value] : result.task_results) {
      merged.insert_or_assign(task_id, value);
    }
  }
  return merged;
}

}  // namespace ctxcpp
