#include "ctxcpp/vector_search_index.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "sqlite3.h"

namespace ctxcpp {
namespace {

std::string JoinTokens(const std::vector<std::string>& tokens) {
  std::string out{};
  for (const auto& token : tokens) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(token);
  }
  return out;
}

// FTS5's unicode61 tokenizer agrees with Tokenize() only on plain ASCII
// alphanumerics; anything else falls back to scoring every document.
bool IsFtsSafeToken(const std::string& token) {
  return std::all_of(token.begin(), token.end(), [](unsigned char ch) { return ch < 0x80 && std::isalnum(ch) != 0; });
}

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db_));
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return stmt_; }

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw std::runtime_error(message);
}

std::string BuildFtsMatchQuery(const std::vector<std::string>& terms) {
  std::string query{};
  for (const auto& term : terms) {
    if (!query.empty()) {
      query.append(" OR ");
    }
    query.push_back('"');
    query.append(term);
    query.push_back('"');
  }
  return query;
}

void UpsertDoc(sqlite3* db, sqlite3_stmt* stmt, const std::string& entry_id, const std::string& body) {
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  if (sqlite3_bind_text(stmt, 1, entry_id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK ||
      sqlite3_bind_text(stmt, 2, body.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db));
  }
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite insert failed: ") + sqlite3_errmsg(db));
  }
}

void DeleteDoc(sqlite3* db, sqlite3_stmt* stmt, const std::string& entry_id) {
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);
  if (sqlite3_bind_text(stmt, 1, entry_id.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(db));
  }
  if (sqlite3_step(stmt) != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite delete failed: ") + sqlite3_errmsg(db));
  }
}

inline constexpr const char* kUpsertSql =
    "INSERT INTO entry_docs(entry_id, body) VALUES(?1, ?2) "
    "ON CONFLICT(entry_id) DO UPDATE SET body=excluded.body;";
inline constexpr const char* kDeleteSql = "DELETE FROM entry_docs WHERE entry_id = ?1;";

}  // namespace

struct VectorSearchIndex::SQLiteState {
  sqlite3* db = nullptr;

  ~SQLiteState() {
    if (db != nullptr) {
      sqlite3_close(db);
      db = nullptr;
    }
  }
};

VectorSearchIndex::VectorSearchIndex(bool enable_fts_prefilter) {
  if (!enable_fts_prefilter) {
    return;
  }
  auto sqlite_state = std::make_unique<SQLiteState>();
  if (sqlite3_open_v2(":memory:",
                      &sqlite_state->db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    spdlog::warn("vector index: cannot open in-memory sqlite ({}); scoring all documents",
                 sqlite_state->db != nullptr ? sqlite3_errmsg(sqlite_state->db) : "out of memory");
    return;
  }
  try {
    Exec(sqlite_state->db, "PRAGMA journal_mode=OFF;");
    Exec(sqlite_state->db, "PRAGMA synchronous=OFF;");
    Exec(sqlite_state->db,
         "CREATE TABLE IF NOT EXISTS entry_docs("
         "entry_id TEXT PRIMARY KEY,"
         "body TEXT NOT NULL"
         ");");
    Exec(sqlite_state->db,
         "CREATE VIRTUAL TABLE IF NOT EXISTS entry_docs_fts USING fts5("
         "body,"
         "content='entry_docs',"
         "content_rowid='rowid',"
         "tokenize='unicode61 remove_diacritics 0'"
         ");");
    Exec(sqlite_state->db,
         "CREATE TRIGGER IF NOT EXISTS entry_docs_ai AFTER INSERT ON entry_docs BEGIN "
         "INSERT INTO entry_docs_fts(rowid, body) VALUES(new.rowid, new.body); "
         "END;");
    Exec(sqlite_state->db,
         "CREATE TRIGGER IF NOT EXISTS entry_docs_ad AFTER DELETE ON entry_docs BEGIN "
         "INSERT INTO entry_docs_fts(entry_docs_fts, rowid, body) VALUES('delete', old.rowid, old.body); "
         "END;");
    Exec(sqlite_state->db,
         "CREATE TRIGGER IF NOT EXISTS entry_docs_au AFTER UPDATE ON entry_docs BEGIN "
         "INSERT INTO entry_docs_fts(entry_docs_fts, rowid, body) VALUES('delete', old.rowid, old.body); "
         "INSERT INTO entry_docs_fts(rowid, body) VALUES(new.rowid, new.body); "
         "END;");
    sqlite_ = std::move(sqlite_state);
  } catch (const std::exception& ex) {
    spdlog::warn("vector index: fts5 prefilter unavailable ({}); scoring all documents", ex.what());
  }
}

VectorSearchIndex::~VectorSearchIndex() = default;

VectorSearchIndex::VectorSearchIndex(VectorSearchIndex&&) noexcept = default;

VectorSearchIndex& VectorSearchIndex::operator=(VectorSearchIndex&&) noexcept = default;

std::vector<std::string> VectorSearchIndex::Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isspace(ch) != 0) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
        current.reserve(32);
      }
      continue;
    }
    if (std::ispunct(ch) != 0) {
      continue;
    }
    current.push_back(static_cast<char>(std::tolower(ch)));
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void VectorSearchIndex::StageIndex(const std::string& entry_id, const std::string& text, EntryType entry_type) {
  pending_mutations_.push_back(PendingMutation{PendingMutationType::kIndex, entry_id, Tokenize(text), entry_type});
}

void VectorSearchIndex::StageRemove(const std::string& entry_id) {
  pending_mutations_.push_back(PendingMutation{PendingMutationType::kRemove, entry_id, {}, EntryType::kFile});
}

void VectorSearchIndex::CommitStaged() {
  if (pending_mutations_.empty()) {
    return;
  }
  for (const auto& mutation : pending_mutations_) {
    if (mutation.type == PendingMutationType::kIndex) {
      ApplyIndex(mutation);
      continue;
    }
    ApplyRemove(mutation.entry_id);
  }
  RecomputeWeights();
  MirrorToSqlite(pending_mutations_);
  pending_mutations_.clear();
}

void VectorSearchIndex::RollbackStaged() {
  pending_mutations_.clear();
}

std::size_t VectorSearchIndex::PendingMutationCount() const {
  return pending_mutations_.size();
}

void VectorSearchIndex::Index(const std::string& entry_id, const std::string& text, EntryType entry_type) {
  StageIndex(entry_id, text, entry_type);
  CommitStaged();
}

void VectorSearchIndex::Remove(const std::string& entry_id) {
  StageRemove(entry_id);
  CommitStaged();
}

void VectorSearchIndex::Clear() {
  std::vector<PendingMutation> removals{};
  removals.reserve(documents_.size());
  for (const auto& [entry_id, _] : documents_) {
    removals.push_back(PendingMutation{PendingMutationType::kRemove, entry_id, {}, EntryType::kFile});
  }
  documents_.clear();
  document_frequency_.clear();
  idf_.clear();
  pending_mutations_.clear();
  MirrorToSqlite(removals);
}

void VectorSearchIndex::ApplyIndex(const PendingMutation& mutation) {
  ApplyRemove(mutation.entry_id);

  Document document{};
  document.entry_type = mutation.entry_type;
  for (const auto& token : mutation.tokens) {
    document.term_counts[token] += 1U;
  }
  for (const auto& [term, _] : document.term_counts) {
    document_frequency_[term] += 1U;
  }
  documents_.emplace(mutation.entry_id, std::move(document));
}

void VectorSearchIndex::ApplyRemove(const std::string& entry_id) {
  const auto it = documents_.find(entry_id);
  if (it == documents_.end()) {
    return;
  }
  for (const auto& [term, _] : it->second.term_counts) {
    auto df_it = document_frequency_.find(term);
    if (df_it == document_frequency_.end()) {
      continue;
    }
    if (df_it->second <= 1U) {
      document_frequency_.erase(df_it);
    } else {
      df_it->second -= 1U;
    }
  }
  documents_.erase(it);
}

void VectorSearchIndex::RecomputeWeights() {
  // N changes on every add/remove, so every term's IDF moves with it.
  idf_.clear();
  const double doc_count = static_cast<double>(documents_.size());
  idf_.reserve(document_frequency_.size());
  for (const auto& [term, df] : document_frequency_) {
    idf_.emplace(term, std::log(doc_count / static_cast<double>(df)));
  }

  for (auto& [_, document] : documents_) {
    document.weights.clear();
    double squared = 0.0;
    for (const auto& [term, count] : document.term_counts) {
      const auto idf_it = idf_.find(term);
      const double weight = static_cast<double>(count) * (idf_it == idf_.end() ? 0.0 : idf_it->second);
      if (weight == 0.0) {
        continue;
      }
      document.weights.emplace(term, weight);
      squared += weight * weight;
    }
    document.norm = std::sqrt(squared);
  }
}

void VectorSearchIndex::MirrorToSqlite(const std::vector<PendingMutation>& mutations) {
  if (sqlite_ == nullptr || sqlite_->db == nullptr || mutations.empty()) {
    return;
  }
  try {
    Exec(sqlite_->db, "BEGIN IMMEDIATE TRANSACTION;");
    Statement upsert_stmt(sqlite_->db, kUpsertSql);
    Statement delete_stmt(sqlite_->db, kDeleteSql);
    for (const auto& mutation : mutations) {
      if (mutation.type == PendingMutationType::kIndex) {
        UpsertDoc(sqlite_->db, upsert_stmt.get(), mutation.entry_id, JoinTokens(mutation.tokens));
        continue;
      }
      DeleteDoc(sqlite_->db, delete_stmt.get(), mutation.entry_id);
    }
    Exec(sqlite_->db, "COMMIT;");
  } catch (const std::exception& ex) {
    // The in-memory maps are authoritative; a stale mirror would hide candidates,
    // so stop using it rather than risk missing matches.
    spdlog::warn("vector index: fts5 mirror update failed ({}); disabling prefilter", ex.what());
    sqlite_.reset();
  }
}

std::vector<const std::pair<const std::string, VectorSearchIndex::Document>*> VectorSearchIndex::Candidates(
    const std::vector<std::string>& query_terms) const {
  std::vector<const std::pair<const std::string, Document>*> all{};
  const bool prefilter_usable = sqlite_ != nullptr && sqlite_->db != nullptr &&
                                std::all_of(query_terms.begin(), query_terms.end(), IsFtsSafeToken);
  if (prefilter_usable) {
    try {
      Statement select_stmt(sqlite_->db,
                            "SELECT d.entry_id FROM entry_docs_fts f JOIN entry_docs d ON d.rowid = f.rowid "
                            "WHERE entry_docs_fts MATCH ?1;");
      const auto fts_query = BuildFtsMatchQuery(query_terms);
      if (sqlite3_bind_text(select_stmt.get(), 1, fts_query.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite bind failed: ") + sqlite3_errmsg(sqlite_->db));
      }
      std::vector<const std::pair<const std::string, Document>*> candidates{};
      while (true) {
        const int rc = sqlite3_step(select_stmt.get());
        if (rc == SQLITE_DONE) {
          break;
        }
        if (rc != SQLITE_ROW) {
          throw std::runtime_error(std::string("sqlite step failed: ") + sqlite3_errmsg(sqlite_->db));
        }
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(select_stmt.get(), 0));
        if (text == nullptr) {
          continue;
        }
        const auto it = documents_.find(text);
        if (it != documents_.end()) {
          candidates.push_back(&*it);
        }
      }
      return candidates;
    } catch (const std::exception& ex) {
      spdlog::warn("vector index: fts5 candidate query failed ({}); scoring all documents", ex.what());
    }
  }

  all.reserve(documents_.size());
  for (const auto& entry : documents_) {
    all.push_back(&entry);
  }
  return all;
}

std::vector<SearchHit> VectorSearchIndex::Search(const std::string& query,
                                                 int limit,
                                                 const SearchOptions& options) const {
  if (limit <= 0 || documents_.empty()) {
    return {};
  }
  const auto query_tokens = Tokenize(query);
  if (query_tokens.empty()) {
    return {};
  }

  std::unordered_map<std::string, double> query_weights{};
  for (const auto& token : query_tokens) {
    if (idf_.find(token) == idf_.end()) {
      continue;
    }
    query_weights[token] += 1.0;
  }
  double query_squared = 0.0;
  std::vector<std::string> query_terms{};
  query_terms.reserve(query_weights.size());
  for (auto& [term, weight] : query_weights) {
    weight *= idf_.at(term);
    query_squared += weight * weight;
    query_terms.push_back(term);
  }
  const double query_norm = std::sqrt(query_squared);
  if (query_norm == 0.0) {
    return {};
  }
  std::sort(query_terms.begin(), query_terms.end());

  const std::unordered_set<EntryType> type_filter(options.entry_types.begin(), options.entry_types.end());

  std::vector<SearchHit> results{};
  for (const auto* candidate : Candidates(query_terms)) {
    const auto& [entry_id, document] = *candidate;
    if (!type_filter.empty() && type_filter.find(document.entry_type) == type_filter.end()) {
      continue;
    }
    if (document.norm == 0.0) {
      continue;
    }
    double dot = 0.0;
    for (const auto& term : query_terms) {
      const auto it = document.weights.find(term);
      if (it != document.weights.end()) {
        dot += query_weights.at(term) * it->second;
      }
    }
    const double score = dot / (query_norm * document.norm);
    if (score <= 0.0) {
      continue;
    }
    if (options.min_score.has_value() && score < *options.min_score) {
      continue;
    }
    results.push_back(SearchHit{entry_id, score, document.entry_type});
  }

  std::sort(results.begin(), results.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.entry_id < rhs.entry_id;
  });
  if (results.size() > static_cast<std::size_t>(limit)) {
    results.resize(static_cast<std::size_t>(limit));
  }
  return results;
}

bool VectorSearchIndex::Contains(const std::string& entry_id) const {
  return documents_.find(entry_id) != documents_.end();
}

std::size_t VectorSearchIndex::DocumentCount() const {
  return documents_.size();
}

std::uint32_t VectorSearchIndex::DocumentFrequency(const std::string& term) const {
  const auto it = document_frequency_.find(term);
  return it == document_frequency_.end() ? 0U : it->second;
}

double VectorSearchIndex::Idf(const std::string& term) const {
  const auto it = idf_.find(term);
  return it == idf_.end() ? 0.0 : it->second;
}

bool VectorSearchIndex::HasFtsPrefilter() const {
  return sqlite_ != nullptr && sqlite_->db != nullptr;
}

}  // namespace ctxcpp
