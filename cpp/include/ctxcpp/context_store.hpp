#pragma once

#include "ctxcpp/relationship_graph.hpp"
#include "ctxcpp/types.hpp"
#include "ctxcpp/vector_search_index.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxcpp {

class ContextStore {
 public:
  explicit ContextStore(const StoreConfig& config = {});
  ContextStore(const ContextStore&) = delete;
  ContextStore& operator=(const ContextStore&) = delete;

  // Validates shape and relationships before touching any state. Generates an
  // id when entry.id is empty and stamps created_at when it is unset. An
  // existing id is replaced. Returns the stored id.
  std::string Add(ContextEntry entry);

  [[nodiscard]] std::optional<ContextEntry> Get(const std::string& id) const;
  [[nodiscard]] std::vector<ContextEntry> GetAll(bool include_expired = false) const;
  [[nodiscard]] std::vector<ContextEntry> GetByType(EntryType type, bool include_expired = false) const;
  [[nodiscard]] std::vector<ContextEntry> GetMany(const std::vector<std::string>& ids) const;
  // Throws NotFoundError when absent or expired, ContextCompressedError when compressed.
  [[nodiscard]] std::string GetContent(const std::string& id) const;
  [[nodiscard]] bool Contains(const std::string& id) const;
  [[nodiscard]] std::size_t Size() const;

  bool Remove(const std::string& id);
  std::size_t RemoveBatch(const std::vector<std::string>& ids);
  // Removes ids that are still present and still expired at `now`.
  std::size_t PurgeExpired(const std::vector<std::string>& ids, TimePoint now);
  [[nodiscard]] std::vector<std::string> ExpiredIds(TimePoint now) const;
  void Clear();

  // One-way: drops content, keeps summary, re-indexes under the summary.
  void Compress(const std::string& id);

  [[nodiscard]] std::vector<SearchHit> Search(const std::string& query,
                                              int limit = 10,
                                              const SearchOptions& options = {}) const;

  [[nodiscard]] StoreStats Stats() const;

  [[nodiscard]] std::vector<std::string> GetChildren(const std::string& id) const;
  [[nodiscard]] std::optional<std::string> GetParent(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetAncestors(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetDescendants(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetSourceEntries(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetDerivedEntries(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetDerivationChain(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetImpactScope(const std::string& id) const;

  // Requested ids plus transitive parent_id / derived_from dependencies, in
  // discovery order. Absent or expired ids are skipped.
  [[nodiscard]] std::vector<std::string> DependencyClosure(const std::vector<std::string>& ids) const;

  [[nodiscard]] nlohmann::json ExportJson() const;
  // Replaces the whole store; nothing changes when the document is rejected.
  void ImportJson(const nlohmann::json& document);
  static std::unique_ptr<ContextStore> FromJson(const nlohmann::json& document, const StoreConfig& config = {});

 private:
  void ValidateRelationships(const ContextEntry& entry) const;
  void LinkRelationships(const ContextEntry& entry);
  void StageIndexFor(const ContextEntry& entry);
  bool RemoveLocked(const std::string& id);
  std::string NextIdLocked();

  StoreConfig config_;
  std::unordered_map<std::string, ContextEntry> entries_;
  VectorSearchIndex index_;
  RelationshipGraph graph_;
  std::mt19937_64 id_rng_;
  mutable std::shared_mutex mutex_{};
};

}  // namespace ctxcpp
