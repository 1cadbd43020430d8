#include "ctxcpp/vector_search_index.hpp"

#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using ctxcpp::EntryType;

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool ApproxEqual(double lhs, double rhs, double eps = 1e-9) {
  return std::fabs(lhs - rhs) <= eps;
}

std::vector<std::string> Ids(const std::vector<ctxcpp::SearchHit>& hits) {
  std::vector<std::string> ids{};
  ids.reserve(hits.size());
  for (const auto& hit : hits) {
    ids.push_back(hit.entry_id);
  }
  return ids;
}

void LoadAnimals(ctxcpp::VectorSearchIndex& index) {
  index.StageIndex("ctx_cat00001", "the cat sat", EntryType::kFile);
  index.StageIndex("ctx_dog00001", "the dog sat", EntryType::kCommand);
  index.StageIndex("ctx_bird0001", "a bird flew", EntryType::kSummary);
  index.CommitStaged();
}

void ScenarioTokenize() {
  ctxcpp::tests::Log("scenario: tokenize");
  const auto tokens = ctxcpp::VectorSearchIndex::Tokenize("Hello, World!\n  foo-bar\tBAZ.");
  Require(tokens == std::vector<std::string>({"hello", "world", "foobar", "baz"}), "tokenizer output mismatch");
  Require(ctxcpp::VectorSearchIndex::Tokenize("  ... !!! ").empty(), "punctuation-only text should have no tokens");
}

void ScenarioRankingAndIdf() {
  ctxcpp::tests::Log("scenario: ranking and idf");
  ctxcpp::VectorSearchIndex index;
  LoadAnimals(index);
  ctxcpp::tests::LogKV("fts_prefilter", index.HasFtsPrefilter());

  Require(index.DocumentCount() == 3, "document count mismatch");
  Require(index.DocumentFrequency("sat") == 2, "df(sat) mismatch");
  Require(ApproxEqual(index.Idf("cat"), std::log(3.0)), "idf(cat) mismatch");
  Require(ApproxEqual(index.Idf("sat"), std::log(3.0 / 2.0)), "idf(sat) mismatch");

  const auto hits = index.Search("cat sat", 10);
  Require(hits.size() == 2, "expected cat and dog documents");
  Require(hits[0].entry_id == "ctx_cat00001", "cat document should rank first");
  Require(hits[1].entry_id == "ctx_dog00001", "dog document should rank second");
  Require(hits[0].score > hits[1].score, "cat document must score strictly higher");
  Require(hits[0].score <= 1.0 + 1e-9, "cosine similarity must not exceed 1");
  Require(hits[0].entry_type == EntryType::kFile, "hit should carry the entry type");

  const auto cat_only = index.Search("cat", 10);
  Require(Ids(cat_only) == std::vector<std::string>({"ctx_cat00001"}), "zero-score documents must be dropped");

  for (int i = 0; i < 5; ++i) {
    Require(Ids(index.Search("cat sat", 10)) == Ids(hits), "repeated searches must return the same order");
  }
}

void ScenarioTieBreakAndLimit() {
  ctxcpp::tests::Log("scenario: tie-break and limit");
  ctxcpp::VectorSearchIndex index;
  index.Index("ctx_bbbbbbbb", "alpha beta", EntryType::kFile);
  index.Index("ctx_aaaaaaaa", "alpha beta", EntryType::kFile);
  index.Index("ctx_cccccccc", "gamma delta", EntryType::kFile);

  const auto hits = index.Search("alpha", 10);
  Require(hits.size() == 2, "tie-break result count mismatch");
  Require(ApproxEqual(hits[0].score, hits[1].score), "identical documents should tie");
  Require(hits[0].entry_id == "ctx_aaaaaaaa", "ties should break by ascending entry id");

  Require(index.Search("alpha", 1).size() == 1, "limit should cap the result count");
  Require(index.Search("alpha", 0).empty(), "limit 0 should return nothing");
  Require(index.Search("alpha", -3).empty(), "negative limit should return nothing");
}

void ScenarioFilters() {
  ctxcpp::tests::Log("scenario: min_score and type filters");
  ctxcpp::VectorSearchIndex index;
  LoadAnimals(index);

  const auto all = index.Search("cat sat", 10);
  ctxcpp::SearchOptions strict{};
  strict.min_score = (all[0].score + all[1].score) / 2.0;
  Require(Ids(index.Search("cat sat", 10, strict)) == std::vector<std::string>({"ctx_cat00001"}),
          "min_score should drop the weaker match");

  ctxcpp::SearchOptions commands_only{};
  commands_only.entry_types = {EntryType::kCommand};
  Require(Ids(index.Search("cat sat", 10, commands_only)) == std::vector<std::string>({"ctx_dog00001"}),
          "type filter should keep only command entries");
}

void ScenarioEmptyInputs() {
  ctxcpp::tests::Log("scenario: empty inputs");
  ctxcpp::VectorSearchIndex index;
  Require(index.Search("anything", 10).empty(), "empty index should return nothing");

  index.Index("ctx_solo0001", "lonely document", EntryType::kTask);
  Require(index.Search("lonely", 10).empty(), "a term present in every document carries no weight");

  LoadAnimals(index);
  Require(index.Search("", 10).empty(), "empty query should return nothing");
  Require(index.Search("?!", 10).empty(), "punctuation query should return nothing");
  Require(index.Search("unicorn", 10).empty(), "unknown terms should return nothing");
}

void ScenarioRemoveAndReindex() {
  ctxcpp::tests::Log("scenario: remove and reindex");
  ctxcpp::VectorSearchIndex index;
  LoadAnimals(index);

  index.Remove("ctx_dog00001");
  Require(!index.Contains("ctx_dog00001"), "removed document still present");
  Require(index.DocumentFrequency("sat") == 1, "remove should decrement document frequency");
  Require(index.DocumentFrequency("dog") == 0, "remove should drop terms with no documents");
  index.Remove("ctx_missing1");
  Require(index.DocumentCount() == 2, "removing an unknown id should be a no-op");

  index.Index("ctx_cat00001", "a fish swam", EntryType::kFile);
  Require(index.Search("cat", 10).empty(), "reindexing should replace the old text");
  Require(Ids(index.Search("fish", 10)) == std::vector<std::string>({"ctx_cat00001"}), "new text should match");
}

void ScenarioStagedMutations() {
  ctxcpp::tests::Log("scenario: staged mutations");
  ctxcpp::VectorSearchIndex index;
  LoadAnimals(index);

  index.StageIndex("ctx_cat00002", "another cat", EntryType::kFile);
  index.StageRemove("ctx_cat00001");
  Require(index.PendingMutationCount() == 2, "pending mutation count mismatch");
  Require(Ids(index.Search("cat", 10)) == std::vector<std::string>({"ctx_cat00001"}),
          "staged mutations must not be visible before commit");

  index.RollbackStaged();
  Require(index.PendingMutationCount() == 0, "rollback should clear pending mutations");
  Require(!index.Contains("ctx_cat00002"), "rolled back document should not exist");

  index.StageIndex("ctx_cat00002", "another cat", EntryType::kFile);
  index.StageRemove("ctx_cat00001");
  index.CommitStaged();
  Require(Ids(index.Search("cat", 10)) == std::vector<std::string>({"ctx_cat00002"}), "commit should apply in order");
}

void ScenarioPrefilterParity() {
  ctxcpp::tests::Log("scenario: prefilter parity");
  ctxcpp::VectorSearchIndex with_prefilter(true);
  ctxcpp::VectorSearchIndex without_prefilter(false);
  Require(!without_prefilter.HasFtsPrefilter(), "disabled prefilter should report unavailable");

  const std::vector<std::pair<std::string, std::string>> docs = {
      {"ctx_doc00001", "Parse the JSON config file"},
      {"ctx_doc00002", "config loader reads YAML"},
      {"ctx_doc00003", "caf\xc3\xa9 menu parser"},
      {"ctx_doc00004", "unit tests for the parser"},
      {"ctx_doc00005", "build script, release notes"},
  };
  for (const auto& [id, text] : docs) {
    with_prefilter.Index(id, text, EntryType::kFile);
    without_prefilter.Index(id, text, EntryType::kFile);
  }

  const std::vector<std::string> queries = {"config", "parser tests", "caf\xc3\xa9", "release", "json yaml", "none"};
  for (const auto& query : queries) {
    const auto lhs = with_prefilter.Search(query, 10);
    const auto rhs = without_prefilter.Search(query, 10);
    Require(Ids(lhs) == Ids(rhs), "prefilter changed results for query: " + query);
    for (std::size_t i = 0; i < lhs.size(); ++i) {
      Require(ApproxEqual(lhs[i].score, rhs[i].score), "prefilter changed scores for query: " + query);
    }
  }
  Require(Ids(with_prefilter.Search("caf\xc3\xa9", 10)) == std::vector<std::string>({"ctx_doc00003"}),
          "non-ascii terms should still match");

  with_prefilter.Clear();
  Require(with_prefilter.DocumentCount() == 0, "clear should drop every document");
  Require(with_prefilter.Search("config", 10).empty(), "cleared index should return nothing");
}

void ScenarioMoveSemantics() {
  ctxcpp::tests::Log("scenario: move semantics");
  ctxcpp::VectorSearchIndex source;
  LoadAnimals(source);

  ctxcpp::VectorSearchIndex moved = std::move(source);
  Require(Ids(moved.Search("bird", 10)) == std::vector<std::string>({"ctx_bird0001"}),
          "moved index should keep its documents");

  ctxcpp::VectorSearchIndex reassigned(false);
  reassigned = std::move(moved);
  Require(reassigned.DocumentCount() == 3, "move-assigned index should keep its documents");
  reassigned.Index("ctx_bird0002", "a bird sang", EntryType::kFile);
  Require(reassigned.Search("bird", 10).size() == 2, "move-assigned index should accept new documents");
}

}  // namespace

int main() {
  try {
    ctxcpp::tests::InitLogging();
    ctxcpp::tests::Log("vector_search_index_test: start");
    ScenarioTokenize();
    ScenarioRankingAndIdf();
    ScenarioTieBreakAndLimit();
    ScenarioFilters();
    ScenarioEmptyInputs();
    ScenarioRemoveAndReindex();
    ScenarioStagedMutations();
    ScenarioPrefilterParity();
    ScenarioMoveSemantics();
    ctxcpp::tests::Log("vector_search_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    ctxcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
