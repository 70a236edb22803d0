// ivl/sema/analysis/loop_unroller.cpp - Bounded loop unrolling
//
#include "ivl/sema/analysis/loop_unroller.hpp"

#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>

#include "ivl/basic/internal_error.hpp"

namespace ivl
{

size_t unroll_loops(Program & program, AstContext & ast, TypeContext & types, unsigned unroll_count)
{
  LoopUnroller unroller(ast, types, unroll_count);
  return unroller.unroll(program);
}

size_t LoopUnroller::unroll(Program & program)
{
  size_t total = 0;
  for (Decl * d : program.decls) {
    auto * impl = dyn_cast<ImplementationDecl>(d);
    if (impl == nullptr || impl->blocks.empty()) continue;
    total += unroll(*impl);
  }
  return total;
}

size_t LoopUnroller::unroll(ImplementationDecl & impl)
{
  size_t unrolled = 0;
  for (;;) {
    const BlockGraph g = graph_from_implementation(impl);
    if (!g.reducible()) {
      throw InternalError("Irreducible flow graphs are unsupported.");
    }
    const std::vector<Block *> headers = g.headers();
    if (headers.empty()) break;

    // The largest loop is not nested in any other
    Block * outer = nullptr;
    size_t outer_size = 0;
    for (Block * h : headers) {
      std::unordered_set<Block *> body;
      for (Block * source : g.back_edge_nodes(h)) {
        for (Block * b : g.natural_loop(h, source)) body.insert(b);
      }
      if (body.size() > outer_size) {
        outer = h;
        outer_size = body.size();
      }
    }

    unroll_loop(impl, g, outer);
    ++unrolled;
  }

  if (unrolled != 0) {
    compute_predecessors(impl, ast_);
  }
  return unrolled;
}

void LoopUnroller::unroll_loop(ImplementationDecl & impl, const BlockGraph & g, Block * header)
{
  std::unordered_set<Block *> body;
  for (Block * source : g.back_edge_nodes(header)) {
    for (Block * b : g.natural_loop(header, source)) body.insert(b);
  }

  // Body blocks in their original order
  std::vector<Block *> loop_blocks;
  for (Block * b : impl.blocks) {
    if (body.count(b) != 0) loop_blocks.push_back(b);
  }

  const size_t copies = static_cast<size_t>(count_) + 1;
  std::vector<std::unordered_map<Block *, Block *>> copy_of(copies);
  for (size_t k = 0; k < copies; ++k) {
    for (Block * b : loop_blocks) {
      auto * copy = ast_.create<Block>(ast_.intern(fmt::format("{}#{}", b->label, k)), b->get_range());
      copy->cmds = ast_.copy_to_arena(std::vector<Cmd *>(b->cmds.begin(), b->cmds.end()));
      copy_of[k][b] = copy;
    }
  }

  auto make_goto = [this](const std::vector<Block *> & targets) {
    std::vector<std::string_view> labels;
    labels.reserve(targets.size());
    for (const Block * t : targets) labels.push_back(t->label);
    auto * go = ast_.create<GotoCmd>(ast_.copy_to_arena(labels));
    go->targets = ast_.copy_to_arena(targets);
    return go;
  };

  auto finish = [&](Block * block, const std::vector<Block *> & targets, SourceRange range) {
    if (!targets.empty()) {
      block->transfer = make_goto(targets);
      return;
    }
    auto * lit = ast_.create<BoolLiteralExpr>(false);
    lit->type = types_.bool_type();
    block->cmds = ast_.append(block->cmds, static_cast<Cmd *>(ast_.create<AssumeCmd>(lit)));
    block->transfer = ast_.create<ReturnCmd>(range);
  };

  // Copies: back edges advance to the next iteration, the last one is cut
  for (size_t k = 0; k < copies; ++k) {
    for (Block * b : loop_blocks) {
      Block * copy = copy_of[k][b];
      const auto * go = dyn_cast<GotoCmd>(b->transfer);
      if (go == nullptr) {
        copy->transfer = b->transfer;
        continue;
      }
      std::vector<Block *> targets;
      for (Block * t : go->targets) {
        if (t == header) {
          if (k + 1 < copies) targets.push_back(copy_of[k + 1][header]);
        } else if (body.count(t) != 0) {
          targets.push_back(copy_of[k][t]);
        } else {
          targets.push_back(t);
        }
      }
      finish(copy, targets, go->get_range());
    }
  }

  // Blocks outside the loop enter the first copy of the header
  for (Block * b : impl.blocks) {
    if (body.count(b) != 0) continue;
    auto * go = dyn_cast<GotoCmd>(b->transfer);
    if (go == nullptr) continue;
    bool enters = false;
    std::vector<Block *> targets;
    for (Block * t : go->targets) {
      if (t == header) {
        targets.push_back(copy_of[0][header]);
        enters = true;
      } else {
        targets.push_back(t);
      }
    }
    if (enters) b->transfer = make_goto(targets);
  }

  std::vector<Block *> blocks;
  bool placed = false;
  for (Block * b : impl.blocks) {
    if (body.count(b) == 0) {
      blocks.push_back(b);
      continue;
    }
    if (placed) continue;
    for (size_t k = 0; k < copies; ++k) {
      for (Block * lb : loop_blocks) blocks.push_back(copy_of[k][lb]);
    }
    placed = true;
  }
  impl.blocks = ast_.copy_to_arena(blocks);
  invalidate_flow_info(impl);
}

}  // namespace ivl
