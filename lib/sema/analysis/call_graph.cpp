// ivl/sema/analysis/call_graph.cpp - Procedure call graph
//
#include "ivl/sema/analysis/call_graph.hpp"

namespace ivl
{

CallGraph::CallGraph(const Program & program)
{
  for (Decl * d : program.decls) {
    if (auto * proc = dyn_cast<ProcedureDecl>(d)) {
      graph_.add_node(proc);
    }
  }

  for (Decl * d : program.decls) {
    const auto * impl = dyn_cast<ImplementationDecl>(d);
    if (impl == nullptr || impl->proc == nullptr) continue;
    for (const Block * b : impl->blocks) {
      for (Cmd * c : b->cmds) {
        const auto * call = dyn_cast<CallCmd>(c);
        if (call != nullptr && call->proc != nullptr) {
          graph_.add_edge(impl->proc, call->proc);
        }
      }
    }
  }
}

}  // namespace ivl
