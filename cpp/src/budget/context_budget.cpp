#include "ctxcpp/context_budget.hpp"

#include "ctxcpp/errors.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace ctxcpp {
namespace {

bool TypeSelected(const std::vector<EntryType>& selected, EntryType type) {
  return selected.empty() || std::find(selected.begin(), selected.end(), type) != selected.end();
}

}  // namespace

ContextBudgetAllocator::ContextBudgetAllocator(const ContextStore& store, const BudgetConfig& config)
    : store_(store), config_(config) {
  if (config_.max_entries == 0) {
    throw std::invalid_argument("budget max_entries must be positive");
  }
  if (config_.chars_per_token == 0) {
    throw std::invalid_argument("budget chars_per_token must be positive");
  }
}

std::size_t ContextBudgetAllocator::EstimateTokens(const std::string& text) const {
  return text.size() / config_.chars_per_token;
}

WorkingContext ContextBudgetAllocator::BuildWorkingContext(const WorkingContextOptions& options) const {
  WorkingContext context{};
  for (auto& entry : store_.GetAll()) {
    if (!TypeSelected(options.entry_types, entry.entry_type)) {
      continue;
    }
    if (!entry.searchable && !options.include_non_searchable) {
      continue;
    }
    context.summary_tokens += EstimateTokens(entry.summary);
    context.entries.push_back(WorkingEntryView{std::move(entry.id),
                                               entry.entry_type,
                                               std::move(entry.source),
                                               entry.created_at,
                                               std::move(entry.references),
                                               std::move(entry.parent_id),
                                               entry.compressed,
                                               std::move(entry.summary)});
  }
  return context;
}

ImplementationContext ContextBudgetAllocator::RequestContext(const std::vector<std::string>& entry_ids) {
  const auto closure = store_.DependencyClosure(entry_ids);
  if (closure.size() >= config_.max_entries) {
    spdlog::warn("budget allocator: request for {} ids resolves to {} entries; limit is {}",
                 entry_ids.size(),
                 closure.size(),
                 config_.max_entries);
    throw EntryBoundsError(closure.size(), config_.max_entries);
  }

  ImplementationContext context{};
  for (auto& entry : store_.GetMany(closure)) {
    const auto& text = entry.content.has_value() ? *entry.content : entry.summary;
    context.total_tokens += EstimateTokens(text);
    context.entry_ids.push_back(entry.id);
    context.entries.push_back(ImplementationEntryView{std::move(entry.id),
                                                      entry.entry_type,
                                                      std::move(entry.source),
                                                      std::move(entry.summary),
                                                      std::move(entry.content),
                                                      std::move(entry.references),
                                                      std::move(entry.parent_id),
                                                      std::move(entry.derived_from),
                                                      entry.compressed});
  }

  std::lock_guard<std::mutex> lock(mutex_);
  context.context_id = fmt::format("impl_{:04}", next_context_++);
  for (const auto& id : context.entry_ids) {
    ++entry_refcounts_[id];
  }
  allocations_.emplace(context.context_id, context.entry_ids);
  ++total_requests_;
  spdlog::debug("budget allocator: {} holds {} entries (~{} tokens)",
                context.context_id,
                context.entry_ids.size(),
                context.total_tokens);
  return context;
}

bool ContextBudgetAllocator::ReleaseContext(const std::string& context_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = allocations_.find(context_id);
  if (it == allocations_.end()) {
    return false;
  }
  for (const auto& id : it->second) {
    const auto ref = entry_refcounts_.find(id);
    if (ref == entry_refcounts_.end()) {
      continue;
    }
    if (--ref->second == 0) {
      entry_refcounts_.erase(ref);
    }
  }
  allocations_.erase(it);
  ++total_releases_;
  spdlog::debug("budget allocator: released {}", context_id);
  return true;
}

std::vector<std::string> ContextBudgetAllocator::OutstandingAllocations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out{};
  out.reserve(allocations_.size());
  for (const auto& [context_id, _] : allocations_) {
    out.push_back(context_id);
  }
  return out;
}

bool ContextBudgetAllocator::IsInUse(const std::string& entry_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entry_refcounts_.find(entry_id) != entry_refcounts_.end();
}

AllocatorUsage ContextBudgetAllocator::UsageStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return AllocatorUsage{allocations_.size(), entry_refcounts_.size(), total_requests_, total_releases_};
}

bool ContextBudgetAllocator::ValidateBounds(const std::vector<std::string>& entry_ids) const {
  return store_.DependencyClosure(entry_ids).size() < config_.max_entries;
}

std::vector<std::vector<std::string>> ContextBudgetAllocator::SplitIntoBatches(
    const std::vector<std::string>& entry_ids) const {
  const std::size_t chunk = std::max<std::size_t>(config_.max_entries - 1, 1);
  std::vector<std::vector<std::string>> batches{};
  for (std::size_t offset = 0; offset < entry_ids.size(); offset += chunk) {
    const auto end = std::min(entry_ids.size(), offset + chunk);
    batches.emplace_back(entry_ids.begin() + static_cast<std::ptrdiff_t>(offset),
                         entry_ids.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return batches;
}

ScopedContext::ScopedContext(ContextBudgetAllocator& allocator, const std::vector<std::string>& entry_ids)
    : allocator_(&allocator), context_(allocator.RequestContext(entry_ids)) {}

ScopedContext::~ScopedContext() {
  Release();
}

ScopedContext::ScopedContext(ScopedContext&& other) noexcept
    : allocator_(std::exchange(other.allocator_, nullptr)), context_(std::move(other.context_)) {}

void ScopedContext::Release() {
  if (allocator_ == nullptr) {
    return;
  }
  (void)allocator_->ReleaseContext(context_.context_id);
  allocator_ = nullptr;
}

}  // namespace ctxcpp
