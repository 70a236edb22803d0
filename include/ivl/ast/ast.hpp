// ivl/ast/ast.hpp - AST node class definitions
//
// All AST node classes follow the LLVM/Clang style with classof() for RTTI
// support. Nodes are plain data; name resolution and type checking fill in
// the resolved fields (decl, proc, type, typeArgs, targets, ...).
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "ivl/ast/ast_enums.hpp"
#include "ivl/basic/casting.hpp"
#include "ivl/basic/source_manager.hpp"

namespace ivl
{

class Type;
class TypeVariable;

class Attribute;
class Block;
class BoundVarDecl;
class FormalDecl;
class FunctionDecl;
class LocalVarDecl;
class ProcedureDecl;
class Trigger;
class VariableDecl;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 * - A unique id assigned by the AstContext that created it
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceManager.
  uint32_t uid = 0;    ///< Unique within one AstContext, never reused

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  /// Computed by the type checker (nullptr before)
  Type * type = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Simple (non-transfer) command inside a block.
class Cmd : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_cmd_kind(node->kind); }

protected:
  explicit Cmd(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Command that ends a block.
class TransferCmd : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_transfer_kind(node->kind); }

protected:
  explicit TransferCmd(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public AstNode
{
public:
  gsl::span<Attribute *> attributes;

  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class NamedDecl : public Decl
{
public:
  std::string_view name;

  static bool classof(const AstNode * node) { return is_named_decl_kind(node->kind); }

protected:
  explicit NamedDecl(NodeKind k, SourceRange r = {}) : Decl(k, r) {}
};

/**
 * Base class of global variables, constants, formals, locals and bound
 * variables.
 */
class VariableDecl : public NamedDecl
{
public:
  Type * type = nullptr;
  Expr * where = nullptr;  ///< Optional where clause

  static bool classof(const AstNode * node) { return is_variable_kind(node->kind); }

  /// Whether assignments, havoc and call outputs may target this variable.
  [[nodiscard]] bool is_mutable() const noexcept;

protected:
  explicit VariableDecl(NodeKind k, SourceRange r = {}) : NamedDecl(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Bit-vector literal `<digits>bv<bits>`.
class BvLiteralExpr : public NodeBase<BvLiteralExpr, Expr, NodeKind::BvLiteral>
{
public:
  std::string_view digits;
  uint32_t bits;

  BvLiteralExpr(std::string_view d, uint32_t b, SourceRange r = {}) : NodeBase(r), digits(d), bits(b)
  {
  }
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Variable or constant reference.
class IdentifierExpr : public NodeBase<IdentifierExpr, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  /// Set during name resolution (nullptr before)
  VariableDecl * decl = nullptr;

  explicit IdentifierExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class OldExpr : public NodeBase<OldExpr, Expr, NodeKind::Old>
{
public:
  Expr * expr;

  explicit OldExpr(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class FunctionCallExpr : public NodeBase<FunctionCallExpr, Expr, NodeKind::FunctionCall>
{
public:
  std::string_view name;
  gsl::span<Expr *> args;

  FunctionDecl * decl = nullptr;   ///< Set during name resolution
  gsl::span<Type *> typeArgs;      ///< Instantiation of decl->typeParams (type checker)

  FunctionCallExpr(std::string_view n, gsl::span<Expr *> a, SourceRange r = {})
  : NodeBase(r), name(n), args(a)
  {
  }
};

/// Map select `m[i, j]`.
class MapSelectExpr : public NodeBase<MapSelectExpr, Expr, NodeKind::MapSelect>
{
public:
  Expr * map;
  gsl::span<Expr *> indices;
  gsl::span<Type *> typeArgs;  ///< Instantiation of the map's type parameters

  MapSelectExpr(Expr * m, gsl::span<Expr *> idx, SourceRange r = {})
  : NodeBase(r), map(m), indices(idx)
  {
  }
};

/// Map update `m[i, j := v]`.
class MapStoreExpr : public NodeBase<MapStoreExpr, Expr, NodeKind::MapStore>
{
public:
  Expr * map;
  gsl::span<Expr *> indices;
  Expr * value;
  gsl::span<Type *> typeArgs;

  MapStoreExpr(Expr * m, gsl::span<Expr *> idx, Expr * v, SourceRange r = {})
  : NodeBase(r), map(m), indices(idx), value(v)
  {
  }
};

/// Bit-vector extraction `e[end:start]` (bits start..end-1).
class BvExtractExpr : public NodeBase<BvExtractExpr, Expr, NodeKind::BvExtract>
{
public:
  Expr * bv;
  uint32_t end;
  uint32_t start;

  BvExtractExpr(Expr * b, uint32_t e, uint32_t s, SourceRange r = {})
  : NodeBase(r), bv(b), end(e), start(s)
  {
  }
};

class IfThenElseExpr : public NodeBase<IfThenElseExpr, Expr, NodeKind::IfThenElse>
{
public:
  Expr * cond;
  Expr * thenExpr;
  Expr * elseExpr;

  IfThenElseExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), cond(c), thenExpr(t), elseExpr(e)
  {
  }
};

/// `(forall<T> x: T :: {:attr} { trigger } body)` or `exists`.
class QuantifierExpr : public NodeBase<QuantifierExpr, Expr, NodeKind::Quantifier>
{
public:
  QuantifierKind quantifier;
  gsl::span<TypeVariable *> typeParams;
  gsl::span<BoundVarDecl *> vars;
  gsl::span<Attribute *> attributes;
  gsl::span<Trigger *> triggers;
  Expr * body = nullptr;

  explicit QuantifierExpr(QuantifierKind q, SourceRange r = {}) : NodeBase(r), quantifier(q) {}
};

/// Missing expression (parser recovery placeholder).
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// One parameter of an attribute: an expression or a string literal.
struct AttributeParam
{
  Expr * expr = nullptr;
  std::string_view str;

  [[nodiscard]] bool is_string() const noexcept { return expr == nullptr; }
};

/// Attribute `{:key p1, p2, ...}`.
class Attribute : public NodeBase<Attribute, AstNode, NodeKind::Attribute>
{
public:
  std::string_view key;
  gsl::span<AttributeParam> params;

  explicit Attribute(std::string_view k, SourceRange r = {}) : NodeBase(r), key(k) {}
};

/// Quantifier trigger `{ e1, e2 }`.
class Trigger : public NodeBase<Trigger, AstNode, NodeKind::Trigger>
{
public:
  gsl::span<Expr *> exprs;

  explicit Trigger(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), exprs(e) {}
};

/// Left-hand side of an assignment.
class AssignLhs : public AstNode
{
public:
  Type * type = nullptr;  ///< Set by the type checker

  static bool classof(const AstNode * node) { return is_assign_lhs_kind(node->kind); }

  /// The variable ultimately assigned (`m` in `m[i][j] := e`).
  [[nodiscard]] IdentifierExpr * deep_assigned_identifier() const noexcept;

protected:
  explicit AssignLhs(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class SimpleAssignLhs : public NodeBase<SimpleAssignLhs, AssignLhs, NodeKind::SimpleAssignLhs>
{
public:
  IdentifierExpr * var;

  explicit SimpleAssignLhs(IdentifierExpr * v, SourceRange r = {}) : NodeBase(r), var(v) {}
};

class MapAssignLhs : public NodeBase<MapAssignLhs, AssignLhs, NodeKind::MapAssignLhs>
{
public:
  AssignLhs * map;
  gsl::span<Expr *> indices;
  gsl::span<Type *> typeArgs;

  MapAssignLhs(AssignLhs * m, gsl::span<Expr *> idx, SourceRange r = {})
  : NodeBase(r), map(m), indices(idx)
  {
  }
};

inline IdentifierExpr * AssignLhs::deep_assigned_identifier() const noexcept
{
  const AssignLhs * lhs = this;
  while (const auto * m = dyn_cast<MapAssignLhs>(lhs)) {
    lhs = m->map;
  }
  return cast<SimpleAssignLhs>(lhs)->var;
}

/// Precondition of a procedure.
class Requires : public NodeBase<Requires, AstNode, NodeKind::Requires>
{
public:
  bool isFree;
  Expr * condition;
  std::string_view comment;
  gsl::span<Attribute *> attributes;

  Requires(bool free, Expr * c, SourceRange r = {}) : NodeBase(r), isFree(free), condition(c) {}
};

/// Postcondition of a procedure.
class Ensures : public NodeBase<Ensures, AstNode, NodeKind::Ensures>
{
public:
  bool isFree;
  Expr * condition;
  std::string_view comment;
  gsl::span<Attribute *> attributes;

  Ensures(bool free, Expr * c, SourceRange r = {}) : NodeBase(r), isFree(free), condition(c) {}
};

/**
 * Basic block: a label, straight-line commands and a transfer command.
 */
class Block : public NodeBase<Block, AstNode, NodeKind::Block>
{
public:
  std::string_view label;
  gsl::span<Cmd *> cmds;
  TransferCmd * transfer = nullptr;

  /// Filled by compute_predecessors() (see sema/analysis/cfg.hpp)
  gsl::span<Block *> predecessors;

  explicit Block(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

// ============================================================================
// Command Nodes
// ============================================================================

/// Parallel assignment `a, m[i] := e1, e2`.
class AssignCmd : public NodeBase<AssignCmd, Cmd, NodeKind::AssignCmd>
{
public:
  gsl::span<AssignLhs *> lhss;
  gsl::span<Expr *> rhss;

  AssignCmd(gsl::span<AssignLhs *> l, gsl::span<Expr *> rh, SourceRange r = {})
  : NodeBase(r), lhss(l), rhss(rh)
  {
  }
};

class AssertCmd : public NodeBase<AssertCmd, Cmd, NodeKind::AssertCmd>
{
public:
  Expr * expr;
  gsl::span<Attribute *> attributes;

  explicit AssertCmd(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class AssumeCmd : public NodeBase<AssumeCmd, Cmd, NodeKind::AssumeCmd>
{
public:
  Expr * expr;
  gsl::span<Attribute *> attributes;

  explicit AssumeCmd(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class HavocCmd : public NodeBase<HavocCmd, Cmd, NodeKind::HavocCmd>
{
public:
  gsl::span<IdentifierExpr *> vars;

  explicit HavocCmd(gsl::span<IdentifierExpr *> v, SourceRange r = {}) : NodeBase(r), vars(v) {}
};

/// Procedure call `call r1, r2 := P(a, b)`.
class CallCmd : public NodeBase<CallCmd, Cmd, NodeKind::CallCmd>
{
public:
  std::string_view callee;
  gsl::span<Expr *> ins;
  gsl::span<IdentifierExpr *> outs;
  gsl::span<Attribute *> attributes;

  ProcedureDecl * proc = nullptr;  ///< Set during name resolution
  gsl::span<Type *> typeArgs;      ///< Instantiation of proc->typeParams (type checker)

  explicit CallCmd(std::string_view c, SourceRange r = {}) : NodeBase(r), callee(c) {}
};

class GotoCmd : public NodeBase<GotoCmd, TransferCmd, NodeKind::GotoCmd>
{
public:
  gsl::span<std::string_view> labels;
  gsl::span<Block *> targets;  ///< Parallel to labels once resolved

  explicit GotoCmd(gsl::span<std::string_view> l, SourceRange r = {}) : NodeBase(r), labels(l) {}
};

class ReturnCmd : public NodeBase<ReturnCmd, TransferCmd, NodeKind::ReturnCmd>
{
public:
  explicit ReturnCmd(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Variable Declarations
// ============================================================================

class GlobalVarDecl : public NodeBase<GlobalVarDecl, VariableDecl, NodeKind::GlobalVarDecl>
{
public:
  GlobalVarDecl(std::string_view n, Type * t, SourceRange r = {}) : NodeBase(r)
  {
    name = n;
    type = t;
  }
};

/// Parent edge of a constant (`extends [unique] p`).
struct ConstantParent
{
  IdentifierExpr * parent;
  bool unique;
};

class ConstantDecl : public NodeBase<ConstantDecl, VariableDecl, NodeKind::ConstantDecl>
{
public:
  bool unique = false;
  /// nullopt when no `extends` clause was given; an empty span for `extends` with no parents
  std::optional<gsl::span<ConstantParent>> parents;
  bool childrenComplete = false;

  ConstantDecl(std::string_view n, Type * t, bool u, SourceRange r = {}) : NodeBase(r), unique(u)
  {
    name = n;
    type = t;
  }
};

/// Parameter of a function, procedure or implementation.
class FormalDecl : public NodeBase<FormalDecl, VariableDecl, NodeKind::FormalDecl>
{
public:
  bool incoming;

  FormalDecl(std::string_view n, Type * t, bool in, SourceRange r = {}) : NodeBase(r), incoming(in)
  {
    name = n;
    type = t;
  }
};

class LocalVarDecl : public NodeBase<LocalVarDecl, VariableDecl, NodeKind::LocalVarDecl>
{
public:
  LocalVarDecl(std::string_view n, Type * t, SourceRange r = {}) : NodeBase(r)
  {
    name = n;
    type = t;
  }
};

/// Variable bound by a quantifier.
class BoundVarDecl : public NodeBase<BoundVarDecl, VariableDecl, NodeKind::BoundVarDecl>
{
public:
  BoundVarDecl(std::string_view n, Type * t, SourceRange r = {}) : NodeBase(r)
  {
    name = n;
    type = t;
  }
};

inline bool VariableDecl::is_mutable() const noexcept
{
  switch (kind) {
    case NodeKind::GlobalVarDecl:
    case NodeKind::LocalVarDecl:
      return true;
    case NodeKind::FormalDecl:
      return !cast<FormalDecl>(this)->incoming;
    default:
      return false;
  }
}

// ============================================================================
// Other Declarations
// ============================================================================

/// `type [finite] C a b;`
class TypeCtorDecl : public NodeBase<TypeCtorDecl, NamedDecl, NodeKind::TypeCtorDecl>
{
public:
  gsl::span<std::string_view> paramNames;
  bool finite = false;

  explicit TypeCtorDecl(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }

  [[nodiscard]] size_t arity() const noexcept { return paramNames.size(); }
};

/// `type S a b = body;`
class TypeSynonymDecl : public NodeBase<TypeSynonymDecl, NamedDecl, NodeKind::TypeSynonymDecl>
{
public:
  gsl::span<TypeVariable *> typeParams;
  Type * body;

  TypeSynonymDecl(std::string_view n, Type * b, SourceRange r = {}) : NodeBase(r), body(b)
  {
    name = n;
  }
};

/**
 * Common base of functions, procedures and implementations.
 */
class DeclWithFormals : public NamedDecl
{
public:
  gsl::span<TypeVariable *> typeParams;
  gsl::span<FormalDecl *> inParams;
  gsl::span<FormalDecl *> outParams;

  /// Some type parameters occur only in out-parameter types (set by resolution)
  bool typeParamsOnlyInOutputs = false;

  static bool classof(const AstNode * node)
  {
    return node->kind >= NodeKind::FunctionDecl && node->kind <= NodeKind::ImplementationDecl;
  }

protected:
  explicit DeclWithFormals(NodeKind k, SourceRange r = {}) : NamedDecl(k, r) {}
};

/// `function f<T>(x: T) returns (T) { body }`
class FunctionDecl : public NodeBase<FunctionDecl, DeclWithFormals, NodeKind::FunctionDecl>
{
public:
  Expr * body = nullptr;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }

  /// The single result formal
  [[nodiscard]] FormalDecl * out_param() const noexcept
  {
    return outParams.empty() ? nullptr : outParams[0];
  }
};

class ProcedureDecl : public NodeBase<ProcedureDecl, DeclWithFormals, NodeKind::ProcedureDecl>
{
public:
  gsl::span<Requires *> requiresClauses;
  gsl::span<IdentifierExpr *> modifies;
  gsl::span<Ensures *> ensuresClauses;

  explicit ProcedureDecl(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }
};

class ImplementationDecl
: public NodeBase<ImplementationDecl, DeclWithFormals, NodeKind::ImplementationDecl>
{
public:
  gsl::span<LocalVarDecl *> locals;
  gsl::span<Block *> blocks;

  ProcedureDecl * proc = nullptr;     ///< Set during name resolution
  bool predecessorsComputed = false;  ///< Block::predecessors are current

  /// Block-level strongly connected components, valid while sccComputed
  gsl::span<gsl::span<Block *>> blockComponents;
  bool sccComputed = false;

  explicit ImplementationDecl(std::string_view n, SourceRange r = {}) : NodeBase(r) { name = n; }
};

class AxiomDecl : public NodeBase<AxiomDecl, Decl, NodeKind::AxiomDecl>
{
public:
  Expr * expr;

  explicit AxiomDecl(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Decl *> decls;

  /// Set once name resolution finished without errors
  bool resolved = false;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

/// Name of a named declaration, empty for axioms.
[[nodiscard]] inline std::string_view decl_name(const Decl * d) noexcept
{
  const auto * nd = dyn_cast<NamedDecl>(d);
  return nd ? nd->name : std::string_view{};
}

}  // namespace ivl
