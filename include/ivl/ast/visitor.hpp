// ivl/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// This header provides a visitor pattern implementation using CRTP
// for type-safe AST traversal without virtual dispatch.
//
#pragma once

#include <type_traits>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_enums.hpp"
#include "ivl/basic/casting.hpp"

namespace ivl
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements visit_<snake> methods for the node types it
 * cares about. Unhandled nodes fall back to the category method
 * (visit_expr, visit_cmd, visit_transfer_cmd, visit_decl) and finally to
 * visit_node.
 *
 * Usage:
 * @code
 *   class CountCalls : public ConstAstVisitor<CountCalls, void> {
 *   public:
 *     void visit_call_cmd(const CallCmd* node) { ++calls; }
 *     int calls = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT The node pointer type (AstNode* or const AstNode*)
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  // ===========================================================================
  // Main dispatch method
  // ===========================================================================

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define IVL_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                     \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR(Class, Kind, Snake) IVL_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_CMD(Class, Kind, Snake) IVL_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_TRANSFER(Class, Kind, Snake) IVL_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_DECL(Class, Kind, Snake) IVL_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_SUPPORT(Class, Kind, Snake) IVL_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_TOP(Class, Kind, Snake) IVL_VISIT_CASE(Class, Kind, Snake)
#include "ivl/ast/ast_nodes.def"
#undef IVL_VISIT_CASE
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#include "ivl/ast/ast_nodes.def"

#define AST_NODE_CMD(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_cmd(node);                                   \
  }
#include "ivl/ast/ast_nodes.def"

#define AST_NODE_TRANSFER(Class, Kind, Snake)                               \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_transfer_cmd(node);                          \
  }
#include "ivl/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#include "ivl/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "ivl/ast/ast_nodes.def"

#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "ivl/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_cmd(detail::propagate_const_t<NodePtrT, Cmd> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_transfer_cmd(detail::propagate_const_t<NodePtrT, TransferCmd> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that automatically traverses child nodes in source order.
 *
 * Override specific visit methods to customize behavior. Call the base
 * implementation to continue traversal, or skip it to prune the subtree.
 * Returning false stops the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves and anything not listed below
  bool visit_node(NodePtrT /*node*/) { return true; }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_old_expr(NodePtr<OldExpr> node) { return get_derived().visit(node->expr); }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    if (!get_derived().visit(node->lhs)) return false;
    return get_derived().visit(node->rhs);
  }

  bool visit_function_call_expr(NodePtr<FunctionCallExpr> node)
  {
    for (auto * arg : node->args) {
      if (!get_derived().visit(arg)) return false;
    }
    return true;
  }

  bool visit_map_select_expr(NodePtr<MapSelectExpr> node)
  {
    if (!get_derived().visit(node->map)) return false;
    for (auto * idx : node->indices) {
      if (!get_derived().visit(idx)) return false;
    }
    return true;
  }

  bool visit_map_store_expr(NodePtr<MapStoreExpr> node)
  {
    if (!get_derived().visit(node->map)) return false;
    for (auto * idx : node->indices) {
      if (!get_derived().visit(idx)) return false;
    }
    return get_derived().visit(node->value);
  }

  bool visit_bv_extract_expr(NodePtr<BvExtractExpr> node) { return get_derived().visit(node->bv); }

  bool visit_if_then_else_expr(NodePtr<IfThenElseExpr> node)
  {
    if (!get_derived().visit(node->cond)) return false;
    if (!get_derived().visit(node->thenExpr)) return false;
    return get_derived().visit(node->elseExpr);
  }

  bool visit_quantifier_expr(NodePtr<QuantifierExpr> node)
  {
    for (auto * v : node->vars) {
      if (!get_derived().visit(v)) return false;
    }
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    for (auto * t : node->triggers) {
      if (!get_derived().visit(t)) return false;
    }
    return get_derived().visit(node->body);
  }

  // ===========================================================================
  // Commands
  // ===========================================================================

  bool visit_assign_cmd(NodePtr<AssignCmd> node)
  {
    for (auto * lhs : node->lhss) {
      if (!get_derived().visit(lhs)) return false;
    }
    for (auto * rhs : node->rhss) {
      if (!get_derived().visit(rhs)) return false;
    }
    return true;
  }

  bool visit_assert_cmd(NodePtr<AssertCmd> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    return get_derived().visit(node->expr);
  }

  bool visit_assume_cmd(NodePtr<AssumeCmd> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    return get_derived().visit(node->expr);
  }

  bool visit_havoc_cmd(NodePtr<HavocCmd> node)
  {
    for (auto * v : node->vars) {
      if (!get_derived().visit(v)) return false;
    }
    return true;
  }

  bool visit_call_cmd(NodePtr<CallCmd> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    for (auto * in : node->ins) {
      if (!get_derived().visit(in)) return false;
    }
    for (auto * out : node->outs) {
      if (!get_derived().visit(out)) return false;
    }
    return true;
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  bool visit_variable(NodePtr<VariableDecl> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    return !node->where || get_derived().visit(node->where);
  }

  bool visit_global_var_decl(NodePtr<GlobalVarDecl> node) { return visit_variable(node); }
  bool visit_formal_decl(NodePtr<FormalDecl> node) { return visit_variable(node); }
  bool visit_local_var_decl(NodePtr<LocalVarDecl> node) { return visit_variable(node); }
  bool visit_bound_var_decl(NodePtr<BoundVarDecl> node) { return visit_variable(node); }

  bool visit_constant_decl(NodePtr<ConstantDecl> node)
  {
    if (node->parents) {
      for (const auto & p : *node->parents) {
        if (!get_derived().visit(p.parent)) return false;
      }
    }
    return visit_variable(node);
  }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    if (!visit_formals(node)) return false;
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_procedure_decl(NodePtr<ProcedureDecl> node)
  {
    if (!visit_formals(node)) return false;
    for (auto * r : node->requiresClauses) {
      if (!get_derived().visit(r)) return false;
    }
    for (auto * m : node->modifies) {
      if (!get_derived().visit(m)) return false;
    }
    for (auto * e : node->ensuresClauses) {
      if (!get_derived().visit(e)) return false;
    }
    return true;
  }

  bool visit_implementation_decl(NodePtr<ImplementationDecl> node)
  {
    if (!visit_formals(node)) return false;
    for (auto * l : node->locals) {
      if (!get_derived().visit(l)) return false;
    }
    for (auto * b : node->blocks) {
      if (!get_derived().visit(b)) return false;
    }
    return true;
  }

  bool visit_axiom_decl(NodePtr<AxiomDecl> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    return get_derived().visit(node->expr);
  }

  // ===========================================================================
  // Supporting nodes
  // ===========================================================================

  bool visit_attribute(NodePtr<Attribute> node)
  {
    for (const auto & p : node->params) {
      if (p.expr && !get_derived().visit(p.expr)) return false;
    }
    return true;
  }

  bool visit_trigger(NodePtr<Trigger> node)
  {
    for (auto * e : node->exprs) {
      if (!get_derived().visit(e)) return false;
    }
    return true;
  }

  bool visit_simple_assign_lhs(NodePtr<SimpleAssignLhs> node)
  {
    return get_derived().visit(node->var);
  }

  bool visit_map_assign_lhs(NodePtr<MapAssignLhs> node)
  {
    if (!get_derived().visit(node->map)) return false;
    for (auto * idx : node->indices) {
      if (!get_derived().visit(idx)) return false;
    }
    return true;
  }

  bool visit_requires_clause(NodePtr<Requires> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    return get_derived().visit(node->condition);
  }

  bool visit_ensures_clause(NodePtr<Ensures> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    return get_derived().visit(node->condition);
  }

  bool visit_block(NodePtr<Block> node)
  {
    for (auto * c : node->cmds) {
      if (!get_derived().visit(c)) return false;
    }
    return !node->transfer || get_derived().visit(node->transfer);
  }

  bool visit_program(NodePtr<Program> node)
  {
    for (auto * d : node->decls) {
      if (!get_derived().visit(d)) return false;
    }
    return true;
  }

private:
  bool visit_formals(NodePtr<DeclWithFormals> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    for (auto * f : node->inParams) {
      if (!get_derived().visit(f)) return false;
    }
    for (auto * f : node->outParams) {
      if (!get_derived().visit(f)) return false;
    }
    return true;
  }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace ivl
