#pragma once

#include "ctxcpp/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ctxcpp {

// TF-IDF weighted bag-of-words index ranked by cosine similarity.
//
// Weights are raw term frequency times ln(N / df). Mutations are staged and
// become visible to Search only after CommitStaged(), which recomputes the
// corpus-wide IDF table. Tokenized documents are mirrored into an in-memory
// SQLite FTS5 table that narrows the candidate set before scoring.
//
// A term present in every document weighs zero and zero scores are dropped,
// so a single-document index never matches and a query made only of
// ubiquitous terms returns nothing.
class VectorSearchIndex {
 public:
  explicit VectorSearchIndex(bool enable_fts_prefilter = true);
  ~VectorSearchIndex();
  VectorSearchIndex(VectorSearchIndex&&) noexcept;
  VectorSearchIndex& operator=(VectorSearchIndex&&) noexcept;
  VectorSearchIndex(const VectorSearchIndex&) = delete;
  VectorSearchIndex& operator=(const VectorSearchIndex&) = delete;

  // Lowercase, strip punctuation, split on whitespace.
  static std::vector<std::string> Tokenize(std::string_view text);

  void StageIndex(const std::string& entry_id, const std::string& text, EntryType entry_type);
  void StageRemove(const std::string& entry_id);
  void CommitStaged();
  void RollbackStaged();
  [[nodiscard]] std::size_t PendingMutationCount() const;

  void Index(const std::string& entry_id, const std::string& text, EntryType entry_type);
  void Remove(const std::string& entry_id);
  void Clear();

  // Never throws for malformed input; no match yields an empty vector.
  [[nodiscard]] std::vector<SearchHit> Search(const std::string& query,
                                              int limit = 10,
                                              const SearchOptions& options = {}) const;

  [[nodiscard]] bool Contains(const std::string& entry_id) const;
  [[nodiscard]] std::size_t DocumentCount() const;
  [[nodiscard]] std::uint32_t DocumentFrequency(const std::string& term) const;
  [[nodiscard]] double Idf(const std::string& term) const;
  [[nodiscard]] bool HasFtsPrefilter() const;

 private:
  struct SQLiteState;

  struct Document {
    EntryType entry_type = EntryType::kFile;
    std::unordered_map<std::string, std::uint32_t> term_counts;
    std::unordered_map<std::string, double> weights;
    double norm = 0.0;
  };

  enum class PendingMutationType {
    kIndex,
    kRemove,
  };
  struct PendingMutation {
    PendingMutationType type = PendingMutationType::kIndex;
    std::string entry_id;
    std::vector<std::string> tokens;
    EntryType entry_type = EntryType::kFile;
  };

  void ApplyIndex(const PendingMutation& mutation);
  void ApplyRemove(const std::string& entry_id);
  void RecomputeWeights();
  void MirrorToSqlite(const std::vector<PendingMutation>& mutations);
  [[nodiscard]] std::vector<const std::pair<const std::string, Document>*> Candidates(
      const std::vector<std::string>& query_terms) const;

  std::unordered_map<std::string, Document> documents_;
  std::unordered_map<std::string, std::uint32_t> document_frequency_;
  std::unordered_map<std::string, double> idf_;
  std::vector<PendingMutation> pending_mutations_;
  std::unique_ptr<SQLiteState> sqlite_;
};

}  // namespace ctxcpp
