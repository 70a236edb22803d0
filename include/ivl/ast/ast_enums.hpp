// ivl/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and the binding-strength table shared by the
// parser and the emitter.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace ivl
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "ivl/ast/ast_nodes.def"

// === Simple commands ===
#define AST_NODE_CMD(Class, Kind, Snake) Kind,
#include "ivl/ast/ast_nodes.def"

// === Transfer commands ===
#define AST_NODE_TRANSFER(Class, Kind, Snake) Kind,
#include "ivl/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "ivl/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "ivl/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "ivl/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

/**
 * Binary operators, listed from weakest to strongest binding.
 */
enum class BinaryOp : uint8_t {
  Iff,  ///< <==>
  Imp,  ///< ==>
  Or,   ///< ||
  And,  ///< &&
  // Relations
  Eq,       ///< ==
  Neq,      ///< !=
  Lt,       ///< <
  Le,       ///< <=
  Gt,       ///< >
  Ge,       ///< >=
  Subtype,  ///< <:
  // Bit-vector concatenation
  Concat,  ///< ++
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< div
  Mod,  ///< mod
};

enum class QuantifierKind : uint8_t {
  Forall,
  Exists,
};

/**
 * Binding strength of each operator level.
 *
 * The parser climbs these levels and the emitter inserts parentheses when
 * a subexpression binds weaker than its context requires.
 */
namespace precedence
{
inline constexpr int k_iff = 0;
inline constexpr int k_imp = 1;
inline constexpr int k_and_or = 2;
inline constexpr int k_relation = 3;
inline constexpr int k_concat = 4;
inline constexpr int k_additive = 5;
inline constexpr int k_multiplicative = 6;
inline constexpr int k_unary = 7;
inline constexpr int k_postfix = 8;
inline constexpr int k_atom = 9;
}  // namespace precedence

[[nodiscard]] constexpr int binding_strength(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Iff:
      return precedence::k_iff;
    case BinaryOp::Imp:
      return precedence::k_imp;
    case BinaryOp::Or:
    case BinaryOp::And:
      return precedence::k_and_or;
    case BinaryOp::Eq:
    case BinaryOp::Neq:
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
    case BinaryOp::Subtype:
      return precedence::k_relation;
    case BinaryOp::Concat:
      return precedence::k_concat;
    case BinaryOp::Add:
    case BinaryOp::Sub:
      return precedence::k_additive;
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
      return precedence::k_multiplicative;
  }
  return precedence::k_atom;
}

/// Relations and arithmetic comparisons produce bool from non-bool operands.
[[nodiscard]] constexpr bool is_relation(BinaryOp op) noexcept
{
  return binding_strength(op) == precedence::k_relation;
}

[[nodiscard]] constexpr bool is_arithmetic(BinaryOp op) noexcept
{
  const int s = binding_strength(op);
  return s == precedence::k_additive || s == precedence::k_multiplicative;
}

[[nodiscard]] constexpr bool is_logical(BinaryOp op) noexcept
{
  return binding_strength(op) <= precedence::k_and_or;
}

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Iff:
      return "<==>";
    case BinaryOp::Imp:
      return "==>";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Neq:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Subtype:
      return "<:";
    case BinaryOp::Concat:
      return "++";
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "div";
    case BinaryOp::Mod:
      return "mod";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(QuantifierKind kind) noexcept
{
  switch (kind) {
    case QuantifierKind::Forall:
      return "forall";
    case QuantifierKind::Exists:
      return "exists";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::IntLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_cmd_kind = NodeKind::AssignCmd;
inline constexpr NodeKind k_last_cmd_kind = NodeKind::CallCmd;

inline constexpr NodeKind k_first_transfer_kind = NodeKind::GotoCmd;
inline constexpr NodeKind k_last_transfer_kind = NodeKind::ReturnCmd;

inline constexpr NodeKind k_first_decl_kind = NodeKind::GlobalVarDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::AxiomDecl;

/// Declarations that carry a name (everything except axioms)
inline constexpr NodeKind k_first_named_decl_kind = NodeKind::GlobalVarDecl;
inline constexpr NodeKind k_last_named_decl_kind = NodeKind::ImplementationDecl;

inline constexpr NodeKind k_first_variable_kind = NodeKind::GlobalVarDecl;
inline constexpr NodeKind k_last_variable_kind = NodeKind::BoundVarDecl;

inline constexpr NodeKind k_first_assign_lhs_kind = NodeKind::SimpleAssignLhs;
inline constexpr NodeKind k_last_assign_lhs_kind = NodeKind::MapAssignLhs;

}  // namespace detail

[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

[[nodiscard]] constexpr bool is_cmd_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_cmd_kind && kind <= detail::k_last_cmd_kind;
}

[[nodiscard]] constexpr bool is_transfer_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_transfer_kind && kind <= detail::k_last_transfer_kind;
}

[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

[[nodiscard]] constexpr bool is_named_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_named_decl_kind && kind <= detail::k_last_named_decl_kind;
}

[[nodiscard]] constexpr bool is_variable_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_variable_kind && kind <= detail::k_last_variable_kind;
}

[[nodiscard]] constexpr bool is_assign_lhs_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_assign_lhs_kind && kind <= detail::k_last_assign_lhs_kind;
}

}  // namespace ivl
