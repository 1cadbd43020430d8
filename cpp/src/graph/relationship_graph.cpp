#include "ctxcpp/relationship_graph.hpp"

#include "ctxcpp/errors.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>
#include <utility>

namespace ctxcpp {

void RelationshipGraph::AppendUnique(std::vector<std::string>& list, const std::string& id) {
  if (std::find(list.begin(), list.end(), id) == list.end()) {
    list.push_back(id);
  }
}

void RelationshipGraph::EraseValue(Adjacency& adjacency, const std::string& key, const std::string& value) {
  const auto it = adjacency.find(key);
  if (it == adjacency.end()) {
    return;
  }
  auto& list = it->second;
  list.erase(std::remove(list.begin(), list.end(), value), list.end());
  if (list.empty()) {
    adjacency.erase(it);
  }
}

std::vector<std::string> RelationshipGraph::BreadthFirst(const Adjacency& adjacency, const std::string& start) {
  std::vector<std::string> out{};
  std::unordered_set<std::string> seen{start};
  std::deque<std::string> queue{start};
  while (!queue.empty()) {
    const auto current = std::move(queue.front());
    queue.pop_front();
    const auto it = adjacency.find(current);
    if (it == adjacency.end()) {
      continue;
    }
    for (const auto& next : it->second) {
      if (seen.insert(next).second) {
        out.push_back(next);
        queue.push_back(next);
      }
    }
  }
  return out;
}

void RelationshipGraph::CheckParentLink(const std::string& child_id, const std::string& parent_id) const {
  if (child_id == parent_id) {
    throw RelationshipError("entry " + child_id + " cannot be its own parent");
  }
  for (const auto& ancestor : GetAncestors(parent_id)) {
    if (ancestor == child_id) {
      throw RelationshipError("linking " + child_id + " under " + parent_id + " would create a parent cycle");
    }
  }
}

void RelationshipGraph::CheckDerivationLink(const std::string& derived_id,
                                            const std::vector<std::string>& source_ids) const {
  for (const auto& source_id : source_ids) {
    if (source_id == derived_id) {
      throw RelationshipError("entry " + derived_id + " cannot be derived from itself");
    }
    for (const auto& upstream : GetDerivationChain(source_id)) {
      if (upstream == derived_id) {
        throw RelationshipError("deriving " + derived_id + " from " + source_id + " would create a derivation cycle");
      }
    }
  }
}

void RelationshipGraph::LinkParent(const std::string& child_id, const std::string& parent_id) {
  CheckParentLink(child_id, parent_id);
  const auto previous = parent_of_.find(child_id);
  if (previous != parent_of_.end()) {
    EraseValue(children_of_, previous->second, child_id);
  }
  parent_of_[child_id] = parent_id;
  AppendUnique(children_of_[parent_id], child_id);
}

void RelationshipGraph::LinkDerivation(const std::string& derived_id, const std::vector<std::string>& source_ids) {
  CheckDerivationLink(derived_id, source_ids);
  if (source_ids.empty()) {
    return;
  }
  auto& sources = sources_of_[derived_id];
  for (const auto& source_id : source_ids) {
    AppendUnique(sources, source_id);
    AppendUnique(derived_of_[source_id], derived_id);
  }
}

void RelationshipGraph::ClearOutgoing(const std::string& id) {
  if (const auto parent = parent_of_.find(id); parent != parent_of_.end()) {
    EraseValue(children_of_, parent->second, id);
    parent_of_.erase(parent);
  }
  if (const auto sources = sources_of_.find(id); sources != sources_of_.end()) {
    for (const auto& source_id : sources->second) {
      EraseValue(derived_of_, source_id, id);
    }
    sources_of_.erase(sources);
  }
}

void RelationshipGraph::Unlink(const std::string& id) {
  ClearOutgoing(id);
  if (const auto children = children_of_.find(id); children != children_of_.end()) {
    for (const auto& child_id : children->second) {
      parent_of_.erase(child_id);
    }
    children_of_.erase(children);
  }
  if (const auto derived = derived_of_.find(id); derived != derived_of_.end()) {
    for (const auto& derived_id : derived->second) {
      EraseValue(sources_of_, derived_id, id);
    }
    derived_of_.erase(derived);
  }
}

void RelationshipGraph::Clear() {
  parent_of_.clear();
  children_of_.clear();
  sources_of_.clear();
  derived_of_.clear();
}

std::vector<std::string> RelationshipGraph::GetChildren(const std::string& id) const {
  const auto it = children_of_.find(id);
  return it == children_of_.end() ? std::vector<std::string>{} : it->second;
}

std::optional<std::string> RelationshipGraph::GetParent(const std::string& id) const {
  const auto it = parent_of_.find(id);
  if (it == parent_of_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> RelationshipGraph::GetAncestors(const std::string& id) const {
  std::vector<std::string> out{};
  std::unordered_set<std::string> seen{id};
  auto it = parent_of_.find(id);
  while (it != parent_of_.end() && seen.insert(it->second).second) {
    out.push_back(it->second);
    it = parent_of_.find(it->second);
  }
  return out;
}

std::vector<std::string> RelationshipGraph::GetDescendants(const std::string& id) const {
  std::vector<std::string> out{};
  std::unordered_set<std::string> seen{id};
  std::vector<std::string> stack{};

  auto push_dependents = [&](const std::string& node) {
    // Reverse so the first child is visited first.
    std::vector<std::string> next{};
    if (const auto children = children_of_.find(node); children != children_of_.end()) {
      next.insert(next.end(), children->second.begin(), children->second.end());
    }
    if (const auto derived = derived_of_.find(node); derived != derived_of_.end()) {
      next.insert(next.end(), derived->second.begin(), derived->second.end());
    }
    for (auto it = next.rbegin(); it != next.rend(); ++it) {
      stack.push_back(*it);
    }
  };

  push_dependents(id);
  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();
    if (!seen.insert(current).second) {
      continue;
    }
    out.push_back(current);
    push_dependents(current);
  }
  return out;
}

std::vector<std::string> RelationshipGraph::GetSourceEntries(const std::string& id) const {
  const auto it = sources_of_.find(id);
  return it == sources_of_.end() ? std::vector<std::string>{} : it->second;
}

std::vector<std::string> RelationshipGraph::GetDerivedEntries(const std::string& id) const {
  const auto it = derived_of_.find(id);
  return it == derived_of_.end() ? std::vector<std::string>{} : it->second;
}

std::vector<std::string> RelationshipGraph::GetDerivationChain(const std::string& id) const {
  return BreadthFirst(sources_of_, id);
}

std::vector<std::string> RelationshipGraph::GetImpactScope(const std::string& id) const {
  return BreadthFirst(derived_of_, id);
}

std::size_t RelationshipGraph::ParentEdgeCount() const {
  return parent_of_.size();
}

std::size_t RelationshipGraph::DerivationEdgeCount() const {
  std::size_t count = 0;
  for (const auto& [_, sources] : sources_of_) {
    count += sources.size();
  }
  return count;
}

}  // namespace ctxcpp
