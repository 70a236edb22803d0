// ivl/ast/ast_context.hpp - AST arena allocator and string pool
//
// This header provides the AstContext class which owns all AST nodes
// and interned strings.
//
// Uses std::pmr::monotonic_buffer_resource for arena allocation.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <new>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ivl
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Context that owns all AST nodes and interned strings using PMR.
 *
 * All AST nodes created through this context are valid as long as the
 * context is alive. Every node receives a unique id (AstNode::uid) from a
 * per-context counter; nodes created later by transformation passes keep
 * drawing from the same counter, so ids are never reused.
 *
 * Example:
 * @code
 *   AstContext ctx;
 *   auto* lit = ctx.create<IntLiteralExpr>(42);
 *   auto name = ctx.intern("foo");  // returns stable string_view
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initialBufferSize = k_default_buffer_size)
  : arena_(initialBufferSize), stringPool_(&arena_)
  {
  }

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new AST node of type T and assign it the next unique id.
   *
   * @param args Arguments forwarded to T's constructor
   * @return Non-owning pointer to the created node
   *
   * Example:
   *   auto* bin = ctx.create<BinaryExpr>(lhs, BinaryOp::Add, rhs, range);
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    T * const node = new (mem) T(std::forward<Args>(args)...);
    node->uid = nextUid_++;
    return node;
  }

  /// Number of nodes created so far (also the next id to be handed out).
  [[nodiscard]] uint32_t node_count() const noexcept { return nextUid_; }

  // ===========================================================================
  // String Interning
  // ===========================================================================

  /**
   * Intern a string and return a stable string_view.
   *
   * The returned string_view is valid as long as the context is alive.
   */
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = stringPool_.find(s);
    if (it != stringPool_.end()) {
      return *it;
    }

    char * const ptr = static_cast<char *>(arena_.allocate(s.empty() ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());

    const std::string_view stored_view(ptr, s.size());
    stringPool_.insert(stored_view);
    return stored_view;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return stringPool_.find(s) != stringPool_.end();
  }

  // ===========================================================================
  // Array Allocation
  // ===========================================================================

  /**
   * Allocate a value-initialized array of type T from the arena.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /**
   * Copy elements from a vector to an arena-allocated array.
   */
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::uninitialized_copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  /// Copy of @p items with @p extra appended.
  template <typename T>
  [[nodiscard]] gsl::span<T> append(gsl::span<T> items, T extra)
  {
    std::vector<T> copy(items.begin(), items.end());
    copy.push_back(extra);
    return copy_to_arena(copy);
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return stringPool_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> stringPool_;
  uint32_t nextUid_ = 0;
};

}  // namespace ivl
