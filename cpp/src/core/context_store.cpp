#include "ctxcpp/context_store.hpp"

#include "ctxcpp/context_entry.hpp"
#include "ctxcpp/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <limits>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace ctxcpp {
namespace {

bool EntryLess(const ContextEntry& lhs, const ContextEntry& rhs) {
  if (lhs.created_at != rhs.created_at) {
    return lhs.created_at < rhs.created_at;
  }
  return lhs.id < rhs.id;
}

// Text an entry is indexed under: content while it has one, summary otherwise.
const std::string& IndexText(const ContextEntry& entry) {
  if (!entry.compressed && entry.content.has_value()) {
    return *entry.content;
  }
  return entry.summary;
}

std::uint64_t ResolveSeed(std::uint64_t configured) {
  if (configured != 0) {
    return configured;
  }
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32U) ^ static_cast<std::uint64_t>(device());
}

}  // namespace

ContextStore::ContextStore(const StoreConfig& config)
    : config_(config), index_(config.enable_fts_prefilter), id_rng_(ResolveSeed(config.id_seed)) {}

std::string ContextStore::NextIdLocked() {
  while (true) {
    auto id = GenerateEntryId(id_rng_);
    if (entries_.find(id) == entries_.end()) {
      return id;
    }
  }
}

void ContextStore::ValidateRelationships(const ContextEntry& entry) const {
  if (entry.parent_id.has_value()) {
    if (*entry.parent_id != entry.id && entries_.find(*entry.parent_id) == entries_.end()) {
      throw RelationshipError("entry " + entry.id + ": parent_id " + *entry.parent_id + " does not exist");
    }
    graph_.CheckParentLink(entry.id, *entry.parent_id);
  }
  for (const auto& source_id : entry.derived_from) {
    if (source_id != entry.id && entries_.find(source_id) == entries_.end()) {
      throw RelationshipError("entry " + entry.id + ": derived_from " + source_id + " does not exist");
    }
  }
  graph_.CheckDerivationLink(entry.id, entry.derived_from);
}

void ContextStore::LinkRelationships(const ContextEntry& entry) {
  if (entry.parent_id.has_value()) {
    graph_.LinkParent(entry.id, *entry.parent_id);
  }
  graph_.LinkDerivation(entry.id, entry.derived_from);
}

void ContextStore::StageIndexFor(const ContextEntry& entry) {
  index_.StageIndex(entry.id, IndexText(entry), entry.entry_type);
}

std::string ContextStore::Add(ContextEntry entry) {
  std::unique_lock lock(mutex_);
  NormalizeEntry(entry);
  if (entry.id.empty()) {
    entry.id = NextIdLocked();
  }
  const auto existing = entries_.find(entry.id);
  const bool is_update = existing != entries_.end();
  if (entry.created_at == TimePoint{}) {
    entry.created_at = is_update ? existing->second.created_at : Now();
  }

  ValidateEntryShape(entry);
  ValidateRelationships(entry);

  try {
    if (is_update) {
      graph_.ClearOutgoing(entry.id);
      index_.StageRemove(entry.id);
    }
    if (entry.searchable) {
      StageIndexFor(entry);
    }
    LinkRelationships(entry);
    index_.CommitStaged();
  } catch (...) {
    index_.RollbackStaged();
    throw;
  }

  spdlog::debug("context store: {} {} ({}, source={})",
                is_update ? "updated" : "added",
                entry.id,
                EntryTypeName(entry.entry_type),
                entry.source);
  auto id = entry.id;
  entries_.insert_or_assign(id, std::move(entry));
  return id;
}

std::optional<ContextEntry> ContextStore::Get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto it = entries_.find(id);
  if (it == entries_.end() || IsExpired(it->second, Now())) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ContextEntry> ContextStore::GetAll(bool include_expired) const {
  std::shared_lock lock(mutex_);
  const auto now = Now();
  std::vector<ContextEntry> out{};
  out.reserve(entries_.size());
  for (const auto& [_, entry] : entries_) {
    if (!include_expired && IsExpired(entry, now)) {
      continue;
    }
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), EntryLess);
  return out;
}

std::vector<ContextEntry> ContextStore::GetByType(EntryType type, bool include_expired) const {
  std::shared_lock lock(mutex_);
  const auto now = Now();
  std::vector<ContextEntry> out{};
  for (const auto& [_, entry] : entries_) {
    if (entry.entry_type != type || (!include_expired && IsExpired(entry, now))) {
      continue;
    }
    out.push_back(entry);
  }
  std::sort(out.begin(), out.end(), EntryLess);
  return out;
}

std::vector<ContextEntry> ContextStore::GetMany(const std::vector<std::string>& ids) const {
  std::shared_lock lock(mutex_);
  const auto now = Now();
  std::vector<ContextEntry> out{};
  out.reserve(ids.size());
  for (const auto& id : ids) {
    const auto it = entries_.find(id);
    if (it == entries_.end() || IsExpired(it->second, now)) {
      continue;
    }
    out.push_back(it->second);
  }
  return out;
}

std::string ContextStore::GetContent(const std::string& id) const {
  std::shared_lock lock(mutex_);
  const auto it = entries_.find(id);
  if (it == entries_.end() || IsExpired(it->second, Now())) {
    throw NotFoundError(id);
  }
  if (it->second.compressed || !it->second.content.has_value()) {
    throw ContextCompressedError(id);
  }
  return *it->second.content;
}

bool ContextStore::Contains(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return entries_.find(id) != entries_.end();
}

std::size_t ContextStore::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

bool ContextStore::RemoveLocked(const std::string& id) {
  const auto it = entries_.find(id);
  if (it == entries_.end()) {
    return false;
  }
  if (index_.Contains(id)) {
    index_.StageRemove(id);
  }
  graph_.Unlink(id);
  entries_.erase(it);
  return true;
}

bool ContextStore::Remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  const bool removed = RemoveLocked(id);
  index_.CommitStaged();
  if (removed) {
    spdlog::debug("context store: removed {}", id);
  }
  return removed;
}

std::size_t ContextStore::RemoveBatch(const std::vector<std::string>& ids) {
  std::unique_lock lock(mutex_);
  std::size_t removed = 0;
  for (const auto& id : ids) {
    if (RemoveLocked(id)) {
      ++removed;
    }
  }
  index_.CommitStaged();
  spdlog::debug("context store: removed {} of {} requested entries", removed, ids.size());
  return removed;
}

std::size_t ContextStore::PurgeExpired(const std::vector<std::string>& ids, TimePoint now) {
  std::unique_lock lock(mutex_);
  std::size_t removed = 0;
  for (const auto& id : ids) {
    const auto it = entries_.find(id);
    if (it == entries_.end() || !IsExpired(it->second, now)) {
      continue;
    }
    if (RemoveLocked(id)) {
      ++removed;
    }
  }
  index_.CommitStaged();
  return removed;
}

std::vector<std::string> ContextStore::ExpiredIds(TimePoint now) const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> out{};
  for (const auto& [id, entry] : entries_) {
    if (IsExpired(entry, now)) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

void ContextStore::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  index_.Clear();
  graph_.Clear();
}

void ContextStore::Compress(const std::string& id) {
  std::unique_lock lock(mutex_);
  const auto it = entries_.find(id);
  if (it == entries_.end()) {
    throw NotFoundError(id);
  }
  auto& entry = it->second;
  if (entry.compressed) {
    return;
  }
  if (entry.searchable) {
    index_.StageIndex(entry.id, entry.summary, entry.entry_type);
    index_.CommitStaged();
  }
  entry.compressed = true;
  entry.content.reset();
  spdlog::debug("context store: compressed {}", id);
}

std::vector<SearchHit> ContextStore::Search(const std::string& query, int limit, const SearchOptions& options) const {
  if (limit <= 0) {
    return {};
  }
  std::shared_lock lock(mutex_);
  try {
    const auto raw_limit = static_cast<int>(std::min<std::size_t>(
        std::max<std::size_t>(index_.DocumentCount(), 1), static_cast<std::size_t>(std::numeric_limits<int>::max())));
    auto hits = index_.Search(query, raw_limit, options);
    const auto now = Now();
    std::vector<SearchHit> out{};
    out.reserve(std::min(hits.size(), static_cast<std::size_t>(limit)));
    for (auto& hit : hits) {
      const auto it = entries_.find(hit.entry_id);
      if (it == entries_.end() || !it->second.searchable || IsExpired(it->second, now)) {
        continue;
      }
      out.push_back(std::move(hit));
      if (out.size() >= static_cast<std::size_t>(limit)) {
        break;
      }
    }
    return out;
  } catch (const std::exception& ex) {
    spdlog::warn("context store: search for '{}' failed: {}", query, ex.what());
    return {};
  }
}

StoreStats ContextStore::Stats() const {
  std::shared_lock lock(mutex_);
  const auto now = Now();
  StoreStats stats{};
  for (const auto& [_, entry] : entries_) {
    if (IsExpired(entry, now)) {
      continue;
    }
    ++stats.total;
    ++stats.by_type[entry.entry_type];
    if (entry.compressed) {
      ++stats.compressed;
    }
  }
  return stats;
}

std::vector<std::string> ContextStore::GetChildren(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetChildren(id);
}

std::optional<std::string> ContextStore::GetParent(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetParent(id);
}

std::vector<std::string> ContextStore::GetAncestors(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetAncestors(id);
}

std::vector<std::string> ContextStore::GetDescendants(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetDescendants(id);
}

std::vector<std::string> ContextStore::GetSourceEntries(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetSourceEntries(id);
}

std::vector<std::string> ContextStore::GetDerivedEntries(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetDerivedEntries(id);
}

std::vector<std::string> ContextStore::GetDerivationChain(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetDerivationChain(id);
}

std::vector<std::string> ContextStore::GetImpactScope(const std::string& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetImpactScope(id);
}

std::vector<std::string> ContextStore::DependencyClosure(const std::vector<std::string>& ids) const {
  std::shared_lock lock(mutex_);
  const auto now = Now();
  std::vector<std::string> out{};
  std::unordered_set<std::string> seen{};
  std::deque<const ContextEntry*> queue{};

  auto visit = [&](const std::string& id) {
    if (seen.find(id) != seen.end()) {
      return;
    }
    const auto it = entries_.find(id);
    if (it == entries_.end() || IsExpired(it->second, now)) {
      return;
    }
    seen.insert(id);
    out.push_back(id);
    queue.push_back(&it->second);
  };

  for (const auto& id : ids) {
    visit(id);
  }
  while (!queue.empty()) {
    const auto* entry = queue.front();
    queue.pop_front();
    if (entry->parent_id.has_value()) {
      visit(*entry->parent_id);
    }
    for (const auto& source_id : entry->derived_from) {
      visit(source_id);
    }
  }
  return out;
}

nlohmann::json ContextStore::ExportJson() const {
  std::shared_lock lock(mutex_);
  nlohmann::json document = nlohmann::json::object();
  for (const auto& [id, entry] : entries_) {
    document[id] = EntryToJson(entry);
  }
  return document;
}

void ContextStore::ImportJson(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ValidationError("context store snapshot must be a JSON object keyed by entry id");
  }

  std::unordered_map<std::string, ContextEntry> entries{};
  entries.reserve(document.size());
  const auto now = Now();
  for (const auto& [key, value] : document.items()) {
    auto entry = EntryFromJson(value);
    if (entry.id != key) {
      throw ValidationError("snapshot key " + key + " does not match entry id " + entry.id);
    }
    if (entry.created_at == TimePoint{}) {
      entry.created_at = now;
    }
    entries.emplace(key, std::move(entry));
  }

  // Orphaned references (their target was removed before the export) are kept
  // on the entry but get no edge.
  RelationshipGraph graph{};
  VectorSearchIndex index(config_.enable_fts_prefilter);
  for (const auto& [id, entry] : entries) {
    if (entry.parent_id.has_value() && entries.find(*entry.parent_id) != entries.end()) {
      graph.LinkParent(id, *entry.parent_id);
    }
    std::vector<std::string> sources{};
    for (const auto& source_id : entry.derived_from) {
      if (entries.find(source_id) != entries.end()) {
        sources.push_back(source_id);
      }
    }
    graph.LinkDerivation(id, sources);
    if (entry.searchable) {
      index.StageIndex(id, IndexText(entry), entry.entry_type);
    }
  }
  index.CommitStaged();

  std::unique_lock lock(mutex_);
  entries_ = std::move(entries);
  graph_ = std::move(graph);
  index_ = std::move(index);
  spdlog::debug("context store: imported {} entries", entries_.size());
}

std::unique_ptr<ContextStore> ContextStore::FromJson(const nlohmann::json& document, const StoreConfig& config) {
  auto store = std::make_unique<ContextStore>(config);
  store->ImportJson(document);
  return store;
}

}  // namespace ctxcpp
