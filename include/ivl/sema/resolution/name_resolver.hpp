// ivl/sema/resolution/name_resolver.hpp - Name and type resolution
//
// Binds every identifier, call, goto label and type name of a program to
// its declaration, and replaces parsed type names by structural types.
//
#pragma once

#include <vector>

#include "ivl/ast/ast.hpp"
#include "ivl/ast/ast_context.hpp"
#include "ivl/ast/visitor.hpp"
#include "ivl/basic/diagnostic.hpp"
#include "ivl/sema/resolution/resolution_context.hpp"
#include "ivl/sema/types/type.hpp"

namespace ivl
{

struct ResolveOptions
{
  /// Drop implementations that fail to resolve instead of failing the program
  bool overlookTypeErrors = false;
};

/**
 * Name resolution pass.
 *
 * Runs in three phases over the program:
 * 1. register every top-level declaration in its namespace
 * 2. resolve type constructors, then type synonyms (to a fixed point),
 *    then every other declaration
 * 3. resolve the where clauses of global variables and constants
 *
 * Errors go to the DiagnosticBag; resolution always runs to the end.
 * Program::resolved is set when no error was found.
 *
 * Usage:
 * @code
 *   NameResolver resolver(ast, types, &diags);
 *   bool ok = resolver.resolve(*program);
 * @endcode
 */
class NameResolver : public RecursiveAstVisitor<NameResolver>
{
public:
  NameResolver(
    AstContext & ast, TypeContext & types, DiagnosticBag * diags = nullptr,
    ResolveOptions options = {});

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Resolve the whole program.
   *
   * @return true if no errors occurred
   */
  bool resolve(Program & program);

  // ===========================================================================
  // Visitor Methods (expressions and commands)
  // ===========================================================================

  bool visit_identifier_expr(IdentifierExpr * node);
  bool visit_old_expr(OldExpr * node);
  bool visit_function_call_expr(FunctionCallExpr * node);
  bool visit_quantifier_expr(QuantifierExpr * node);

  bool visit_assign_cmd(AssignCmd * node);
  bool visit_call_cmd(CallCmd * node);
  bool visit_goto_cmd(GotoCmd * node);

  // ===========================================================================
  // Types
  // ===========================================================================

  /// Resolve a parsed type in the current type binder scope.
  Type * resolve_type(Type * type);

  // ===========================================================================
  // Error State
  // ===========================================================================

  [[nodiscard]] bool has_errors() const noexcept { return rc_.has_errors(); }
  [[nodiscard]] size_t error_count() const noexcept { return rc_.error_count(); }

  [[nodiscard]] ResolutionContext & context() noexcept { return rc_; }

private:
  // ===========================================================================
  // Declarations
  // ===========================================================================

  void register_decl(Decl * decl);
  void resolve_type_synonyms(const std::vector<TypeSynonymDecl *> & synonyms);
  void resolve_type_synonym(TypeSynonymDecl * decl);
  void resolve_decl(Decl * decl);

  void resolve_variable(VariableDecl * var);
  void resolve_constant(ConstantDecl * decl);
  void resolve_function(FunctionDecl * decl);
  void resolve_procedure(ProcedureDecl * decl);
  void resolve_implementation(ImplementationDecl * decl);
  void resolve_axiom(AxiomDecl * decl);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  void resolve_attributes(gsl::span<Attribute *> attrs);
  void resolve_expr(Expr * expr);
  void register_type_params(gsl::span<TypeVariable *> params, SourceRange range);
  /// Bind formals in the current scope and resolve their types.
  void register_formals(gsl::span<FormalDecl *> formals);
  /// Resolve the where clauses of @p formals.
  void resolve_where_clauses(gsl::span<FormalDecl *> formals);

  /**
   * Check that every type parameter occurs in @p arg_types or @p more_types.
   *
   * @return true if some parameters occur only in @p more_types
   */
  bool check_bound_variable_occurrences(
    gsl::span<TypeVariable * const> params, const std::vector<Type *> & arg_types,
    const std::vector<Type *> & more_types, SourceRange range, std::string_view subject);

  /// Reorder decl->typeParams by first occurrence in the in- and then out-parameter types.
  void sort_type_params(DeclWithFormals * decl);

  AstContext & ast_;
  TypeContext & types_;
  DiagnosticBag * diags_;
  ResolveOptions options_;
  ResolutionContext rc_;
};

}  // namespace ivl
