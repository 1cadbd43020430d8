#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxcpp {

// Parentage (child -> parent) and derivation (derived -> sources) DAGs keyed by
// entry id. Edges are only committed after an ancestor walk proves they keep
// the graph acyclic; violations throw RelationshipError.
class RelationshipGraph {
 public:
  RelationshipGraph() = default;

  void CheckParentLink(const std::string& child_id, const std::string& parent_id) const;
  void CheckDerivationLink(const std::string& derived_id, const std::vector<std::string>& source_ids) const;

  // Replaces any previous parent edge of child_id.
  void LinkParent(const std::string& child_id, const std::string& parent_id);
  // Adds edges derived_id -> each source; all or nothing.
  void LinkDerivation(const std::string& derived_id, const std::vector<std::string>& source_ids);

  // Drops edges from id to its parent and sources; children/derived keep pointing at id.
  void ClearOutgoing(const std::string& id);
  // Drops every edge touching id. Children and derived entries are orphaned.
  void Unlink(const std::string& id);
  void Clear();

  [[nodiscard]] std::vector<std::string> GetChildren(const std::string& id) const;
  [[nodiscard]] std::optional<std::string> GetParent(const std::string& id) const;
  // Nearest parent first.
  [[nodiscard]] std::vector<std::string> GetAncestors(const std::string& id) const;
  // Depth-first preorder over entries depending on id (children and derived entries).
  [[nodiscard]] std::vector<std::string> GetDescendants(const std::string& id) const;

  [[nodiscard]] std::vector<std::string> GetSourceEntries(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetDerivedEntries(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetDerivationChain(const std::string& id) const;
  [[nodiscard]] std::vector<std::string> GetImpactScope(const std::string& id) const;

  [[nodiscard]] std::size_t ParentEdgeCount() const;
  [[nodiscard]] std::size_t DerivationEdgeCount() const;

 private:
  using Adjacency = std::unordered_map<std::string, std::vector<std::string>>;

  static void AppendUnique(std::vector<std::string>& list, const std::string& id);
  static void EraseValue(Adjacency& adjacency, const std::string& key, const std::string& value);
  static std::vector<std::string> BreadthFirst(const Adjacency& adjacency, const std::string& start);

  std::unordered_map<std::string, std::string> parent_of_;
  Adjacency children_of_;
  Adjacency sources_of_;
  Adjacency derived_of_;
};

}  // namespace ctxcpp
