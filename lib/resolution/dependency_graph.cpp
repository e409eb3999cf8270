// cnext/resolution/dependency_graph.cpp - Include graph with topological ordering

#include "cnext/resolution/dependency_graph.hpp"

#include <algorithm>
#include <unordered_set>

namespace cnext
{

DependencyNode * DependencyGraph::get_or_add(const std::string & key, bool * created)
{
  if (auto it = by_key_.find(key); it != by_key_.end()) {
    if (created) *created = false;
    return it->second;
  }
  auto node = std::make_unique<DependencyNode>();
  node->key = key;
  DependencyNode * raw = node.get();
  nodes_.push_back(std::move(node));
  by_key_.emplace(key, raw);
  if (created) *created = true;
  return raw;
}

DependencyNode * DependencyGraph::find(std::string_view key) const
{
  if (auto it = by_key_.find(key); it != by_key_.end()) {
    return it->second;
  }
  return nullptr;
}

void DependencyGraph::add_root(DependencyNode * node)
{
  if (node != nullptr && std::find(roots_.begin(), roots_.end(), node) == roots_.end()) {
    roots_.push_back(node);
  }
}

std::vector<DependencyNode *> DependencyGraph::leaves_first_order() const
{
  std::vector<DependencyNode *> order;
  order.reserve(nodes_.size());
  std::unordered_set<const DependencyNode *> visited;

  // Iterative DFS so deep include chains cannot overflow the stack.
  struct Frame
  {
    DependencyNode * node;
    size_t next_child;
  };

  for (DependencyNode * root : roots_) {
    if (!visited.insert(root).second) continue;
    std::vector<Frame> stack{{root, 0}};
    while (!stack.empty()) {
      Frame & top = stack.back();
      if (top.next_child < top.node->children.size()) {
        DependencyNode * child = top.node->children[top.next_child++];
        if (visited.insert(child).second) {
          stack.push_back({child, 0});
        }
        continue;
      }
      order.push_back(top.node);
      stack.pop_back();
    }
  }
  return order;
}

std::vector<DependencyNode *> DependencyGraph::nodes() const
{
  std::vector<DependencyNode *> out;
  out.reserve(nodes_.size());
  for (const auto & n : nodes_) {
    out.push_back(n.get());
  }
  return out;
}

std::string DependencyGraph::key_for(const std::filesystem::path & path)
{
  std::error_code ec;
  auto canon = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
  if (ec) {
    return path.lexically_normal().generic_string();
  }
  return canon.generic_string();
}

std::string DependencyGraph::system_key(std::string_view name)
{
  return "<" + std::string(name) + ">";
}

}  // namespace cnext
