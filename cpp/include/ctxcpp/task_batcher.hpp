#pragma once

#include "ctxcpp/context_budget.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ctxcpp {

struct TaskSpec {
  std::string id;
  std::string description;
  std::vector<std::string> required_entry_ids;
  // Higher runs first when batches are sorted by priority.
  int priority = 0;
};

struct TaskBatch {
  std::string batch_id;
  std::vector<TaskSpec> tasks;
  std::set<std::string> unique_entry_ids;
  bool exceeds_limit = false;

  [[nodiscard]] std::size_t entry_count() const { return unique_entry_ids.size(); }
};

// Task id -> handler output.
using TaskResults = std::map<std::string, nlohmann::json>;

struct BatchResult {
  std::string batch_id;
  TaskResults task_results;
  bool success = true;
  std::string error;
  double duration_ms = 0.0;
  std::size_t entry_count = 0;
  std::size_t total_tokens = 0;
};

using BatchHandler = std::function<TaskResults(const ImplementationContext&, const std::vector<TaskSpec>&)>;

// Greedy packing of tasks into batches whose unique entry set stays below
// max_entries, matching the allocator's bound.
class TaskBatcher {
 public:
  explicit TaskBatcher(std::size_t max_entries_per_batch = 200);

  // Batch ids (batch_0001, ...) keep counting across calls.
  std::vector<TaskBatch> CreateBatches(std::vector<TaskSpec> tasks, bool sort_by_priority = false);

  [[nodiscard]] std::size_t max_entries() const { return max_entries_; }

 private:
  std::string NextBatchId();

  std::size_t max_entries_;
  std::uint64_t batch_counter_ = 0;
};

class BatchExecutor {
 public:
  explicit BatchExecutor(ContextBudgetAllocator& allocator);

  // Never throws: allocation and handler failures are recorded on the result.
  BatchResult ExecuteBatch(const TaskBatch& batch, const BatchHandler& handler);
  std::vector<BatchResult> ExecuteAll(const std::vector<TaskBatch>& batches,
                                      const BatchHandler& handler,
                                      bool continue_on_error = true);
  // Later batches win on duplicate task ids.
  [[nodiscard]] static TaskResults CollectTaskResults(const std::vector<BatchResult>& results);

 private:
  ContextBudgetAllocator& allocator_;
};

}  // namespace ctxcpp
