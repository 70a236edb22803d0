// ivl/sema/resolution/resolution_context.cpp - Scopes used by name resolution
//
#include "ivl/sema/resolution/resolution_context.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

#include "ivl/basic/internal_error.hpp"

namespace ivl
{

// ============================================================================
// Types
// ============================================================================

void ResolutionContext::add_type(NamedDecl * decl)
{
  auto [it, inserted] = types_.emplace(decl->name, decl);
  if (!inserted) {
    report_error(
      decl->get_range(), fmt::format("more than one declaration of type name: {}", decl->name));
  }
}

TypeCtorDecl * ResolutionContext::lookup_type(std::string_view name) const
{
  auto it = types_.find(name);
  return it == types_.end() ? nullptr : dyn_cast<TypeCtorDecl>(it->second);
}

TypeSynonymDecl * ResolutionContext::lookup_type_synonym(std::string_view name) const
{
  auto it = types_.find(name);
  return it == types_.end() ? nullptr : dyn_cast<TypeSynonymDecl>(it->second);
}

// ============================================================================
// Functions and Procedures
// ============================================================================

void ResolutionContext::add_procedure(DeclWithFormals * decl)
{
  auto [it, inserted] = procedures_.emplace(decl->name, decl);
  if (!inserted) {
    report_error(
      decl->get_range(), fmt::format("more than one declaration of function/procedure name: {}",
                                     decl->name));
  }
}

DeclWithFormals * ResolutionContext::lookup_procedure(std::string_view name) const
{
  auto it = procedures_.find(name);
  return it == procedures_.end() ? nullptr : it->second;
}

// ============================================================================
// Variables
// ============================================================================

void ResolutionContext::push_var_context() { varScopes_.emplace_back(); }

void ResolutionContext::pop_var_context()
{
  if (varScopes_.empty()) {
    throw InternalError("pop_var_context() without matching push");
  }
  varScopes_.pop_back();
}

void ResolutionContext::add_variable(VariableDecl * var, bool global)
{
  if (varScopes_.empty()) {
    push_var_context();
  }
  auto & scope = global ? varScopes_.front() : varScopes_.back();
  auto it = scope.find(var->name);
  if (it != scope.end()) {
    if (it->second != var) {
      ++errorCount_;
      if (diags_) {
        diags_->report_error(
                 var->get_range(), fmt::format("duplicate declaration of variable: {}", var->name))
          .with_secondary_label(it->second->get_range(), "previous declaration is here");
      }
    }
    it->second = var;
    return;
  }
  scope.emplace(var->name, var);
}

VariableDecl * ResolutionContext::lookup_variable(std::string_view name) const
{
  for (auto it = varScopes_.rbegin(); it != varScopes_.rend(); ++it) {
    auto found = it->find(name);
    if (found != it->end()) {
      return found->second;
    }
  }
  return nullptr;
}

bool ResolutionContext::is_global(const VariableDecl * var) const
{
  if (varScopes_.empty()) return false;
  auto it = varScopes_.front().find(var->name);
  return it != varScopes_.front().end() && it->second == var;
}

// ============================================================================
// Type Binders
// ============================================================================

void ResolutionContext::add_type_binder(TypeVariable * var, TypeBinderState mark, SourceRange range)
{
  for (size_t i = typeBinders_.size(); i > 0; --i) {
    if (typeBinders_[i - 1] == var) {
      return;
    }
  }
  for (size_t i = std::min(mark, typeBinders_.size()); i < typeBinders_.size(); ++i) {
    if (typeBinders_[i]->name == var->name) {
      report_error(range, fmt::format("more than one declaration of type variable: {}", var->name));
      break;
    }
  }
  if (types_.find(var->name) != types_.end()) {
    report_error(
      range, fmt::format("type variable has the same name as a declared type: {}", var->name));
  }
  typeBinders_.push_back(var);
}

TypeVariable * ResolutionContext::lookup_type_binder(std::string_view name) const
{
  for (auto it = typeBinders_.rbegin(); it != typeBinders_.rend(); ++it) {
    if ((*it)->name == name) {
      return *it;
    }
  }
  return nullptr;
}

// ============================================================================
// Labels
// ============================================================================

void ResolutionContext::push_procedure_context() { labelScopes_.emplace_back(); }

void ResolutionContext::pop_procedure_context()
{
  if (labelScopes_.empty()) {
    throw InternalError("pop_procedure_context() without matching push");
  }
  labelScopes_.pop_back();
}

void ResolutionContext::add_block(Block * block)
{
  if (labelScopes_.empty()) {
    throw InternalError("add_block() outside of a procedure context");
  }
  auto [it, inserted] = labelScopes_.back().emplace(block->label, block);
  if (!inserted) {
    report_error(block->get_range(), fmt::format("more than one declaration of label: {}", block->label));
  }
}

Block * ResolutionContext::lookup_block(std::string_view label) const
{
  if (labelScopes_.empty()) return nullptr;
  auto it = labelScopes_.back().find(label);
  return it == labelScopes_.back().end() ? nullptr : it->second;
}

// ============================================================================
// Errors
// ============================================================================

void ResolutionContext::report_error(SourceRange range, std::string message)
{
  ++errorCount_;
  if (diags_) {
    diags_->report_error(range, std::move(message));
  }
}

void ResolutionContext::report_warning(SourceRange range, std::string message)
{
  if (diags_) {
    diags_->report_warning(range, std::move(message));
  }
}

}  // namespace ivl
