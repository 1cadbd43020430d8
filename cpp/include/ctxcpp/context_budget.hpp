#pragma once

#include "ctxcpp/context_store.hpp"
#include "ctxcpp/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxcpp {

// Summary-only view handed to the planning model.
struct WorkingEntryView {
  std::string id;
  EntryType entry_type = EntryType::kFile;
  std::string source;
  TimePoint created_at{};
  std::vector<std::string> references;
  std::optional<std::string> parent_id;
  bool compressed = false;
  std::string summary;
};

struct WorkingContextOptions {
  // Empty means every type.
  std::vector<EntryType> entry_types;
  bool include_non_searchable = false;
};

struct WorkingContext {
  std::vector<WorkingEntryView> entries;
  std::size_t summary_tokens = 0;

  [[nodiscard]] std::size_t entry_count() const { return entries.size(); }
};

// Full-content view handed to an implementation call.
struct ImplementationEntryView {
  std::string id;
  EntryType entry_type = EntryType::kFile;
  std::string source;
  std::string summary;
  std::optional<std::string> content;
  std::vector<std::string> references;
  std::optional<std::string> parent_id;
  std::vector<std::string> derived_from;
  bool compressed = false;
};

struct ImplementationContext {
  std::string context_id;
  std::vector<ImplementationEntryView> entries;
  std::vector<std::string> entry_ids;
  std::size_t total_tokens = 0;

  [[nodiscard]] std::size_t entry_count() const { return entries.size(); }
};

struct AllocatorUsage {
  std::size_t active_allocations = 0;
  std::size_t active_entries = 0;
  std::uint64_t total_requests = 0;
  std::uint64_t total_releases = 0;
};

// Builds bounded context views over a ContextStore. An implementation request
// resolves the dependency closure of the requested ids and is rejected with
// EntryBoundsError when that closure holds max_entries or more entries.
class ContextBudgetAllocator {
 public:
  explicit ContextBudgetAllocator(const ContextStore& store, const BudgetConfig& config = {});
  ContextBudgetAllocator(const ContextBudgetAllocator&) = delete;
  ContextBudgetAllocator& operator=(const ContextBudgetAllocator&) = delete;

  [[nodiscard]] WorkingContext BuildWorkingContext(const WorkingContextOptions& options = {}) const;

  ImplementationContext RequestContext(const std::vector<std::string>& entry_ids);
  // False for unknown or already released handles.
  bool ReleaseContext(const std::string& context_id);

  [[nodiscard]] std::vector<std::string> OutstandingAllocations() const;
  [[nodiscard]] bool IsInUse(const std::string& entry_id) const;
  [[nodiscard]] AllocatorUsage UsageStats() const;

  // True when the dependency closure of entry_ids fits the budget.
  [[nodiscard]] bool ValidateBounds(const std::vector<std::string>& entry_ids) const;
  // Chunks of at most max_entries - 1 ids, in input order. Dependencies pulled
  // in by a chunk are not counted.
  [[nodiscard]] std::vector<std::vector<std::string>> SplitIntoBatches(const std::vector<std::string>& entry_ids) const;

  [[nodiscard]] std::size_t max_entries() const { return config_.max_entries; }
  [[nodiscard]] std::size_t EstimateTokens(const std::string& text) const;

 private:
  const ContextStore& store_;
  BudgetConfig config_;

  mutable std::mutex mutex_{};
  std::uint64_t next_context_ = 1;
  std::uint64_t total_requests_ = 0;
  std::uint64_t total_releases_ = 0;
  std::map<std::string, std::vector<std::string>> allocations_;
  std::unordered_map<std::string, std::size_t> entry_refcounts_;
};

// Holds one implementation allocation and releases it on destruction.
class ScopedContext {
 public:
  ScopedContext(ContextBudgetAllocator& allocator, const std::vector<std::string>& entry_ids);
  ~ScopedContext();
  ScopedContext(const ScopedContext&) = delete;
  ScopedContext& operator=(const ScopedContext&) = delete;
  ScopedContext(ScopedContext&& other) noexcept;
  ScopedContext& operator=(ScopedContext&&) = delete;

  [[nodiscard]] const ImplementationContext& context() const { return context_; }
  [[nodiscard]] const ImplementationContext* operator->() const { return &context_; }

  // Releases early; later calls and the destructor do nothing.
  void Release();

 private:
  ContextBudgetAllocator* allocator_ = nullptr;
  ImplementationContext context_;
};

}  // namespace ctxcpp
