// ivl/sema/resolution/resolution_context.hpp - Scopes used by name resolution
//
// Four namespaces:
// - types (constructors and synonyms), flat
// - functions and procedures, flat
// - variables, a stack of lexical scopes
// - type binders, a stack saved and restored as an integer state
//
// plus the labels of the implementation being resolved and the state mode
// that decides whether old() is allowed.
//
#pragma once

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ivl/ast/ast.hpp"
#include "ivl/basic/diagnostic.hpp"
#include "ivl/sema/types/type.hpp"

namespace ivl
{

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

template <typename V>
using NameMap = std::unordered_map<std::string_view, V, StringViewHash, StringViewEqual>;

/**
 * Which program states an expression may refer to.
 */
enum class StateMode : uint8_t {
  Stateless,    ///< axioms, function bodies: no mutable globals
  SingleState,  ///< preconditions, commands
  TwoState,     ///< postconditions, implementation bodies: old() allowed
};

// ============================================================================
// ResolutionContext
// ============================================================================

class ResolutionContext
{
public:
  explicit ResolutionContext(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  ResolutionContext(const ResolutionContext &) = delete;
  ResolutionContext & operator=(const ResolutionContext &) = delete;

  // ===========================================================================
  // Types
  // ===========================================================================

  /// Register a constructor or synonym; reports a duplicate name.
  void add_type(NamedDecl * decl);
  [[nodiscard]] TypeCtorDecl * lookup_type(std::string_view name) const;
  [[nodiscard]] TypeSynonymDecl * lookup_type_synonym(std::string_view name) const;

  // ===========================================================================
  // Functions and Procedures
  // ===========================================================================

  void add_procedure(DeclWithFormals * decl);
  /// FunctionDecl or ProcedureDecl of that name
  [[nodiscard]] DeclWithFormals * lookup_procedure(std::string_view name) const;

  // ===========================================================================
  // Variables
  // ===========================================================================

  void push_var_context();
  void pop_var_context();
  [[nodiscard]] size_t var_context_depth() const noexcept { return varScopes_.size(); }

  /**
   * Bind a variable in the innermost scope.
   *
   * A second declaration of the same name in the same scope is reported
   * and replaces the first for the rest of the scope.
   */
  void add_variable(VariableDecl * var, bool global = false);

  /// Innermost binding of @p name, or nullptr.
  [[nodiscard]] VariableDecl * lookup_variable(std::string_view name) const;

  /// True if @p var is bound in the outermost (global) scope.
  [[nodiscard]] bool is_global(const VariableDecl * var) const;

  // ===========================================================================
  // Type Binders
  // ===========================================================================

  using TypeBinderState = size_t;

  [[nodiscard]] TypeBinderState type_binder_state() const noexcept { return typeBinders_.size(); }
  void set_type_binder_state(TypeBinderState state) { typeBinders_.resize(state); }

  /**
   * Bind @p var as a type variable.
   *
   * Binders pushed since @p mark belong to the same parameter list; a name
   * bound twice there, or naming a declared type, is reported at @p range.
   * The later binder still wins.
   */
  void add_type_binder(TypeVariable * var, TypeBinderState mark, SourceRange range);
  /// Innermost type variable named @p name, or nullptr.
  [[nodiscard]] TypeVariable * lookup_type_binder(std::string_view name) const;

  // ===========================================================================
  // Labels
  // ===========================================================================

  void push_procedure_context();
  void pop_procedure_context();
  void add_block(Block * block);
  [[nodiscard]] Block * lookup_block(std::string_view label) const;

  // ===========================================================================
  // State Mode
  // ===========================================================================

  [[nodiscard]] StateMode state_mode() const noexcept { return stateMode_; }
  void set_state_mode(StateMode mode) noexcept { stateMode_ = mode; }

  // ===========================================================================
  // Errors
  // ===========================================================================

  void report_error(SourceRange range, std::string message);
  void report_warning(SourceRange range, std::string message);

  [[nodiscard]] size_t error_count() const noexcept { return errorCount_; }
  [[nodiscard]] bool has_errors() const noexcept { return errorCount_ > 0; }

  /// Roll the error count back to @p count (used when a declaration is dropped).
  void reset_error_count(size_t count) noexcept { errorCount_ = count; }

  [[nodiscard]] DiagnosticBag * diagnostics() noexcept { return diags_; }

private:
  DiagnosticBag * diags_;
  size_t errorCount_ = 0;

  NameMap<NamedDecl *> types_;
  NameMap<DeclWithFormals *> procedures_;
  std::vector<NameMap<VariableDecl *>> varScopes_;
  std::vector<TypeVariable *> typeBinders_;
  std::vector<NameMap<Block *>> labelScopes_;
  StateMode stateMode_ = StateMode::SingleState;
};

// ============================================================================
// RAII Scopes
// ============================================================================

/// Pushes a variable scope for the lifetime of the object.
class VarScope
{
public:
  explicit VarScope(ResolutionContext & rc) : rc_(rc) { rc_.push_var_context(); }
  ~VarScope() { rc_.pop_var_context(); }

  VarScope(const VarScope &) = delete;
  VarScope & operator=(const VarScope &) = delete;

private:
  ResolutionContext & rc_;
};

/// Restores the type binder state on destruction.
class TypeBinderScope
{
public:
  explicit TypeBinderScope(ResolutionContext & rc) : rc_(rc), state_(rc.type_binder_state()) {}
  ~TypeBinderScope() { rc_.set_type_binder_state(state_); }

  TypeBinderScope(const TypeBinderScope &) = delete;
  TypeBinderScope & operator=(const TypeBinderScope &) = delete;

private:
  ResolutionContext & rc_;
  ResolutionContext::TypeBinderState state_;
};

/// Switches the state mode and restores the previous one on destruction.
class StateModeScope
{
public:
  StateModeScope(ResolutionContext & rc, StateMode mode) : rc_(rc), saved_(rc.state_mode())
  {
    rc_.set_state_mode(mode);
  }
  ~StateModeScope() { rc_.set_state_mode(saved_); }

  StateModeScope(const StateModeScope &) = delete;
  StateModeScope & operator=(const StateModeScope &) = delete;

private:
  ResolutionContext & rc_;
  StateMode saved_;
};

}  // namespace ivl
