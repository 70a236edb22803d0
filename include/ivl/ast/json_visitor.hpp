// ivl/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Provides JSON serialization for the AST, returning nlohmann::json
// objects for any AST node. Used by `ivlc dump` and by tests.
//
#pragma once

#include <nlohmann/json.hpp>

#include "ivl/ast/ast.hpp"
#include "ivl/sema/types/type.hpp"

namespace ivl
{

/**
 * Serialize an AST node to JSON.
 *
 * Every object carries a "type" tag naming the node class and a "range"
 * with byte offsets. Expressions that were type checked also carry
 * "resolvedType" in concrete syntax.
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a Program node including all its declarations.
 *
 * @param program The program to serialize
 * @return JSON representation with all declarations
 */
[[nodiscard]] nlohmann::json to_json(const Program * program);

/// Structural JSON form of a type (proxies are followed).
[[nodiscard]] nlohmann::json to_json(const Type * type);

}  // namespace ivl
