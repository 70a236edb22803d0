// ivl/syntax/keywords.hpp - Reserved words of the surface syntax
#pragma once

#include <array>
#include <string_view>

namespace ivl::syntax
{

inline constexpr std::array<std::string_view, 7> k_top_level_keywords = {
  "type", "const", "var", "function", "axiom", "procedure", "implementation",
};

inline constexpr std::array<std::string_view, 38> k_reserved_words = {
  "type",     "const",     "var",       "function", "axiom",   "procedure",      "implementation",
  "returns",  "requires",  "ensures",   "modifies", "free",    "invariant",      "unique",
  "extends",  "complete",  "finite",    "where",    "assert",  "assume",         "havoc",
  "call",     "goto",      "return",    "if",       "then",    "else",           "while",
  "break",    "old",       "forall",    "exists",   "true",    "false",          "div",
  "mod",      "int",       "bool",
};

}  // namespace ivl::syntax
