// ivl/sema/types/type_checker.hpp - Type inference and checking
//
// Type checking pass that annotates every expression with its type and
// checks declarations against their signatures. Runs after NameResolver.
//
#pragma once

#include <optional>
#include <string_view>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/diagnostic.hpp"
#include "ivl/sema/types/type.hpp"
#include "ivl/sema/types/type_utils.hpp"

namespace ivl
{

/**
 * Unification-based type checker.
 *
 * ## Algorithm
 *
 * 1. **Synthesis**: every expression's type is computed bottom-up and
 *    stored in Expr::type. Polymorphic functions, procedures and maps are
 *    instantiated with fresh proxies at each use.
 * 2. **Unification**: operator and signature constraints unify the
 *    synthesized types, which defines the proxies.
 * 3. **Ambiguity sweep**: if no error was found, every proxy must have
 *    been defined; a leftover proxy is reported at the innermost
 *    expression that mentions it.
 *
 * ## Usage
 * ```cpp
 * TypeChecker checker(types, &diags);
 * bool ok = checker.check(program);
 * // After this, all Expr::type fields are set
 * ```
 */
class TypeChecker
{
public:
  /**
   * Construct a TypeChecker.
   *
   * @param types TypeContext for type creation
   * @param diags DiagnosticBag for error reporting (nullptr for silent mode)
   */
  explicit TypeChecker(TypeContext & types, DiagnosticBag * diags = nullptr);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Type check an entire program.
   *
   * @return true if no errors occurred
   * @throws InternalError if the program has not been resolved, or if a
   *         clean check leaves an expression without a proxy-free type
   */
  bool check(Program & program);

  /**
   * Infer and set the type of an expression.
   *
   * @return Inferred type (also stored in expr->type)
   */
  Type * check_expr(Expr * expr);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return error_count_ > 0; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

private:
  // ===========================================================================
  // Expression Type Inference
  // ===========================================================================

  Type * infer_identifier(IdentifierExpr * node);
  Type * infer_unary_expr(UnaryExpr * node);
  Type * infer_binary_expr(BinaryExpr * node);
  Type * infer_concat(BinaryExpr * node, Type * lhs, Type * rhs);
  Type * infer_function_call(FunctionCallExpr * node);
  Type * infer_map_select(MapSelectExpr * node);
  Type * infer_map_store(MapStoreExpr * node);
  Type * infer_bv_extract(BvExtractExpr * node);
  Type * infer_if_then_else(IfThenElseExpr * node);
  Type * infer_quantifier(QuantifierExpr * node);

  /**
   * Element type of selecting @p indices from a value of type @p map_type.
   *
   * Sets @p type_args to the instantiation of the map's type parameters.
   * On error a fresh proxy is returned so checking can continue.
   */
  Type * map_select_type(
    Type * map_type, gsl::span<Expr *> indices, SourceRange range, gsl::span<Type *> & type_args);

  // ===========================================================================
  // Commands
  // ===========================================================================

  void check_block(Block * block);
  void check_cmd(Cmd * cmd);
  void check_assign_cmd(AssignCmd * node);
  void check_call_cmd(CallCmd * node);
  Type * check_lhs(AssignLhs * lhs);
  void check_assignment_target(IdentifierExpr * id);

  // ===========================================================================
  // Declarations
  // ===========================================================================

  void check_decl(Decl * decl);
  void check_constant(ConstantDecl * decl);
  void check_function(FunctionDecl * decl);
  void check_procedure(ProcedureDecl * decl);
  void check_implementation(ImplementationDecl * decl);
  void match_formals(
    ImplementationDecl * impl, gsl::span<FormalDecl *> impl_formals,
    gsl::span<FormalDecl *> proc_formals, std::string_view inout);

  // ===========================================================================
  // Helper Methods
  // ===========================================================================

  /// check_argument_types() with its errors counted by this checker.
  std::optional<Instantiation> instantiate(
    gsl::span<TypeVariable * const> type_params, gsl::span<Type * const> formal_ins,
    gsl::span<Expr * const> actual_ins, gsl::span<Type * const> formal_outs,
    gsl::span<IdentifierExpr * const> actual_outs, bool check_outs, SourceRange range,
    std::string_view op_name);

  /// Placeholder type after a reported error; unifies with anything.
  Type * error_type() { return types_.new_proxy("error"); }

  void check_attributes(gsl::span<Attribute *> attrs);
  void check_where(VariableDecl * var);
  /// True if @p t unifies with bool (a missing type counts as already reported)
  bool expect_bool(Type * t);
  void report_error(SourceRange range, std::string message);

  /// Report leftover proxies after an error-free check.
  void check_ambiguities(Program & program);
  /// Every expression has a proxy-free type (InternalError otherwise).
  void assert_fully_typed(Program & program);

  // ===========================================================================
  // Member Variables
  // ===========================================================================

  TypeContext & types_;
  DiagnosticBag * diags_;

  /// Modifies clause of the procedure whose implementation is being checked
  std::optional<gsl::span<IdentifierExpr *>> frame_;

  size_t error_count_ = 0;
};

}  // namespace ivl
