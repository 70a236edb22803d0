// ivl/sema/analysis/graph.hpp - Directed graphs over pointer-like nodes
//
// Generic graph used for block-level control flow and for the call graph.
// Provides strongly connected components (Tarjan), dominators, back edges,
// natural loops and a reducibility check.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ivl
{

/**
 * Directed graph with nodes kept in insertion order.
 *
 * Queries (successors, SCCs, loops) always enumerate nodes in the order
 * they were first added, so results are deterministic for a given
 * construction sequence.
 *
 * @tparam Node Hashable, cheaply copyable node handle (usually a pointer)
 */
template <typename Node>
class Graph
{
public:
  Graph() = default;

  // ===========================================================================
  // Construction
  // ===========================================================================

  /// Add a node (no-op if already present).
  void add_node(Node n) { index_of(n); }

  /// Mark the entry node. Dominators and loops are computed from it.
  void add_source(Node n)
  {
    index_of(n);
    source_ = n;
    hasSource_ = true;
    invalidate();
  }

  /// Add edge @p from -> @p to. Parallel edges are kept once.
  void add_edge(Node from, Node to)
  {
    const size_t f = index_of(from);
    const size_t t = index_of(to);
    auto & succ = succs_[f];
    if (std::find(succ.begin(), succ.end(), t) == succ.end()) {
      succ.push_back(t);
      preds_[t].push_back(f);
    }
    invalidate();
  }

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] const std::vector<Node> & nodes() const noexcept { return nodes_; }
  [[nodiscard]] bool has_source() const noexcept { return hasSource_; }
  [[nodiscard]] Node source() const noexcept { return source_; }

  [[nodiscard]] bool contains(Node n) const { return index_.count(n) != 0; }

  [[nodiscard]] std::vector<Node> successors(Node n) const { return lookup(n, succs_); }
  [[nodiscard]] std::vector<Node> predecessors(Node n) const { return lookup(n, preds_); }

  [[nodiscard]] bool has_edge(Node from, Node to) const
  {
    auto f = index_.find(from);
    auto t = index_.find(to);
    if (f == index_.end() || t == index_.end()) return false;
    const auto & succ = succs_[f->second];
    return std::find(succ.begin(), succ.end(), t->second) != succ.end();
  }

  /// Nodes reachable from @p start (including itself), in DFS preorder.
  [[nodiscard]] std::vector<Node> reachable_from(Node start) const
  {
    std::vector<Node> result;
    auto it = index_.find(start);
    if (it == index_.end()) return result;

    std::vector<bool> seen(nodes_.size(), false);
    std::vector<size_t> stack{it->second};
    while (!stack.empty()) {
      const size_t v = stack.back();
      stack.pop_back();
      if (seen[v]) continue;
      seen[v] = true;
      result.push_back(nodes_[v]);
      // Reverse so the first successor is visited first
      for (auto s = succs_[v].rbegin(); s != succs_[v].rend(); ++s) {
        if (!seen[*s]) stack.push_back(*s);
      }
    }
    return result;
  }

  /**
   * Strongly connected components (Tarjan).
   *
   * Components come out in reverse topological order of the condensation:
   * a component is listed before every component that can reach it.
   */
  [[nodiscard]] std::vector<std::vector<Node>> strongly_connected_components() const
  {
    TarjanState st(nodes_.size());
    for (size_t v = 0; v < nodes_.size(); ++v) {
      if (st.order[v] == k_unvisited) tarjan(v, st);
    }
    return std::move(st.components);
  }

  /// Whether @p n lies on a cycle (a self-loop counts).
  [[nodiscard]] bool on_cycle(Node n) const
  {
    auto it = index_.find(n);
    if (it == index_.end()) return false;
    const size_t v = it->second;
    for (size_t s : succs_[v]) {
      if (s == v) return true;
    }
    for (const auto & scc : strongly_connected_components()) {
      if (std::find(scc.begin(), scc.end(), n) != scc.end()) return scc.size() > 1;
    }
    return false;
  }

  // ===========================================================================
  // Dominators and Loops
  // ===========================================================================

  /// Whether @p a dominates @p b. Unreachable nodes dominate nothing.
  [[nodiscard]] bool dominates(Node a, Node b) const
  {
    compute_loops();
    auto ia = index_.find(a);
    auto ib = index_.find(b);
    if (ia == index_.end() || ib == index_.end()) return false;
    size_t v = ib->second;
    if (idom_[v] == k_unvisited) return false;
    while (true) {
      if (v == ia->second) return true;
      if (idom_[v] == v) return false;
      v = idom_[v];
    }
  }

  /// Immediate dominator of @p n (the source is its own idom).
  [[nodiscard]] std::optional<Node> immediate_dominator(Node n) const
  {
    compute_loops();
    auto it = index_.find(n);
    if (it == index_.end() || idom_[it->second] == k_unvisited) return std::nullopt;
    return nodes_[idom_[it->second]];
  }

  /// Loop headers: targets of back edges, in node insertion order.
  [[nodiscard]] std::vector<Node> headers() const
  {
    compute_loops();
    std::vector<Node> result;
    for (size_t h : headers_) result.push_back(nodes_[h]);
    return result;
  }

  /// Sources of the back edges into @p header.
  [[nodiscard]] std::vector<Node> back_edge_nodes(Node header) const
  {
    compute_loops();
    std::vector<Node> result;
    auto it = index_.find(header);
    if (it == index_.end()) return result;
    for (const auto & [from, to] : backEdges_) {
      if (to == it->second) result.push_back(nodes_[from]);
    }
    return result;
  }

  /**
   * Natural loop of the back edge @p back_edge_node -> @p header.
   *
   * The header comes first, then the back-edge source, then every node
   * that reaches the source without passing through the header, in
   * discovery order.
   */
  [[nodiscard]] std::vector<Node> natural_loop(Node header, Node back_edge_node) const
  {
    std::vector<Node> loop{header};
    std::unordered_set<Node> in_loop{header};
    std::vector<Node> stack;
    if (!(back_edge_node == header)) {
      loop.push_back(back_edge_node);
      in_loop.insert(back_edge_node);
      stack.push_back(back_edge_node);
    }
    while (!stack.empty()) {
      Node m = stack.back();
      stack.pop_back();
      for (Node p : predecessors(m)) {
        if (in_loop.insert(p).second) {
          loop.push_back(p);
          stack.push_back(p);
        }
      }
    }
    return loop;
  }

  /**
   * Whether the graph is reducible: every cycle reachable from the source
   * is entered through a node that dominates it. Equivalently, removing
   * all back edges leaves the reachable part acyclic.
   */
  [[nodiscard]] bool reducible() const
  {
    compute_loops();
    return reducible_;
  }

private:
  static constexpr size_t k_unvisited = static_cast<size_t>(-1);

  size_t index_of(Node n)
  {
    auto [it, inserted] = index_.emplace(n, nodes_.size());
    if (inserted) {
      nodes_.push_back(n);
      succs_.emplace_back();
      preds_.emplace_back();
      invalidate();
    }
    return it->second;
  }

  [[nodiscard]] std::vector<Node> lookup(
    Node n, const std::vector<std::vector<size_t>> & adj) const
  {
    std::vector<Node> result;
    auto it = index_.find(n);
    if (it == index_.end()) return result;
    for (size_t i : adj[it->second]) result.push_back(nodes_[i]);
    return result;
  }

  void invalidate() noexcept { loopsComputed_ = false; }

  struct TarjanState
  {
    explicit TarjanState(size_t n) : order(n, k_unvisited), low(n, 0), onStack(n, false) {}

    std::vector<size_t> order;
    std::vector<size_t> low;
    std::vector<bool> onStack;
    std::vector<size_t> stack;
    size_t counter = 0;
    std::vector<std::vector<Node>> components;
  };

  void tarjan(size_t v, TarjanState & st) const
  {
    st.order[v] = st.low[v] = st.counter++;
    st.stack.push_back(v);
    st.onStack[v] = true;

    for (size_t w : succs_[v]) {
      if (st.order[w] == k_unvisited) {
        tarjan(w, st);
        st.low[v] = std::min(st.low[v], st.low[w]);
      } else if (st.onStack[w]) {
        st.low[v] = std::min(st.low[v], st.order[w]);
      }
    }

    if (st.low[v] == st.order[v]) {
      std::vector<Node> component;
      size_t w = 0;
      do {
        w = st.stack.back();
        st.stack.pop_back();
        st.onStack[w] = false;
        component.push_back(nodes_[w]);
      } while (w != v);
      std::reverse(component.begin(), component.end());
      st.components.push_back(std::move(component));
    }
  }

  /// Reverse postorder of the nodes reachable from the source.
  [[nodiscard]] std::vector<size_t> reverse_postorder() const
  {
    std::vector<size_t> post;
    if (!hasSource_) return post;
    std::vector<bool> seen(nodes_.size(), false);
    // Iterative DFS: (node, next successor position)
    std::vector<std::pair<size_t, size_t>> stack{{index_.at(source_), 0}};
    seen[stack.back().first] = true;
    while (!stack.empty()) {
      auto & [v, pos] = stack.back();
      if (pos < succs_[v].size()) {
        const size_t w = succs_[v][pos++];
        if (!seen[w]) {
          seen[w] = true;
          stack.emplace_back(w, 0);
        }
      } else {
        post.push_back(v);
        stack.pop_back();
      }
    }
    std::reverse(post.begin(), post.end());
    return post;
  }

  /// Dominators (Cooper, Harvey and Kennedy), back edges and reducibility.
  void compute_loops() const
  {
    if (loopsComputed_) return;

    idom_.assign(nodes_.size(), k_unvisited);
    backEdges_.clear();
    headers_.clear();
    reducible_ = true;
    loopsComputed_ = true;
    if (!hasSource_) return;

    const std::vector<size_t> rpo = reverse_postorder();
    std::vector<size_t> rpo_number(nodes_.size(), k_unvisited);
    for (size_t i = 0; i < rpo.size(); ++i) rpo_number[rpo[i]] = i;

    const size_t src = index_.at(source_);
    idom_[src] = src;

    auto intersect = [&](size_t a, size_t b) {
      while (a != b) {
        while (rpo_number[a] > rpo_number[b]) a = idom_[a];
        while (rpo_number[b] > rpo_number[a]) b = idom_[b];
      }
      return a;
    };

    bool changed = true;
    while (changed) {
      changed = false;
      for (size_t v : rpo) {
        if (v == src) continue;
        size_t new_idom = k_unvisited;
        for (size_t p : preds_[v]) {
          if (idom_[p] == k_unvisited) continue;
          new_idom = new_idom == k_unvisited ? p : intersect(p, new_idom);
        }
        if (new_idom != k_unvisited && idom_[v] != new_idom) {
          idom_[v] = new_idom;
          changed = true;
        }
      }
    }

    auto dom = [&](size_t a, size_t b) {
      while (true) {
        if (a == b) return true;
        if (idom_[b] == b) return false;
        b = idom_[b];
      }
    };

    std::vector<bool> is_header(nodes_.size(), false);
    for (size_t v = 0; v < nodes_.size(); ++v) {
      if (rpo_number[v] == k_unvisited) continue;
      for (size_t w : succs_[v]) {
        if (dom(w, v)) {
          backEdges_.emplace_back(v, w);
          is_header[w] = true;
        }
      }
    }
    for (size_t v = 0; v < nodes_.size(); ++v) {
      if (is_header[v]) headers_.push_back(v);
    }

    // Reachable part minus back edges must be acyclic: every forward edge
    // must go to a later node in reverse postorder.
    for (size_t v : rpo) {
      for (size_t w : succs_[v]) {
        const bool back = std::find(backEdges_.begin(), backEdges_.end(), std::make_pair(v, w)) !=
                          backEdges_.end();
        if (!back && rpo_number[w] <= rpo_number[v]) {
          reducible_ = false;
          return;
        }
      }
    }
  }

  std::vector<Node> nodes_;
  std::unordered_map<Node, size_t> index_;
  std::vector<std::vector<size_t>> succs_;
  std::vector<std::vector<size_t>> preds_;
  Node source_{};
  bool hasSource_ = false;

  // Derived from the source, recomputed lazily after any change
  mutable bool loopsComputed_ = false;
  mutable std::vector<size_t> idom_;
  mutable std::vector<std::pair<size_t, size_t>> backEdges_;
  mutable std::vector<size_t> headers_;
  mutable bool reducible_ = true;
};

}  // namespace ivl
