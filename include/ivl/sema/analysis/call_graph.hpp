// ivl/sema/analysis/call_graph.hpp - Procedure call graph
//
#pragma once

#include <vector>

#include "ivl/ast/ast.hpp"
#include "ivl/sema/analysis/graph.hpp"

namespace ivl
{

/**
 * Calls between procedures of a resolved program.
 *
 * There is an edge P -> Q when some implementation of P contains
 * `call ... := Q(...)`. Every declared procedure is a node.
 */
class CallGraph
{
public:
  explicit CallGraph(const Program & program);

  [[nodiscard]] const Graph<ProcedureDecl *> & graph() const noexcept { return graph_; }

  /// Procedures called from implementations of @p proc.
  [[nodiscard]] std::vector<ProcedureDecl *> callees(ProcedureDecl * proc) const
  {
    return graph_.successors(proc);
  }

  /// Whether @p proc can reach itself through calls.
  [[nodiscard]] bool is_recursive(ProcedureDecl * proc) const { return graph_.on_cycle(proc); }

  /// Groups of mutually recursive procedures, callees before callers.
  [[nodiscard]] std::vector<std::vector<ProcedureDecl *>> components() const
  {
    return graph_.strongly_connected_components();
  }

private:
  Graph<ProcedureDecl *> graph_;
};

}  // namespace ivl
