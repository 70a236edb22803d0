// ivl/driver/compiler.hpp - Compiler driver
//
// Single entry point for the check pipeline.
// Used by the CLI and by the end-to-end tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ivl/basic/diagnostic.hpp"
#include "ivl/project/project_config.hpp"
#include "ivl/syntax/frontend.hpp"

namespace ivl
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,         ///< Parse, resolve and type check only
  Print,         ///< Check, then emit the resolved program
  Dump,          ///< Check, then dump the program as JSON
  ExtractLoops,  ///< Check, extract loops, then emit the rewritten program
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Check;

  /// Drop implementations that fail to resolve instead of failing
  bool overlook_type_errors = false;

  /// Run loop extraction after a clean type check (implied by ExtractLoops)
  bool extract_loops = false;

  /// Unroll every loop this many times after a clean type check, before extraction
  std::optional<unsigned> unroll;

  /// Emit the resolved program in Check mode
  bool emit = false;

  /// Dump the program as JSON in Check mode
  bool dump_json = false;

  /// Report pass progress on stderr
  bool verbose = false;

  /// Fold the ivl.yaml flags into these options (flags only ever turn on)
  void merge(const CompilerConfig & config);
};

// ============================================================================
// Compile Result
// ============================================================================

/// Outcome of checking one program file.
struct UnitResult
{
  std::string name;  ///< Display name (path or "<input>")
  std::unique_ptr<ParsedUnit> unit;

  bool parsed = false;
  bool resolved = false;
  bool typechecked = false;
  size_t unrolled_loops = 0;
  size_t extracted_loops = 0;

  /// Emitted program or JSON dump (empty when nothing was requested)
  std::string output;
};

struct CompileResult
{
  /// Whether every unit passed every gate
  bool success = false;

  /// Problems not tied to a unit (missing entry points, ...)
  DiagnosticBag diagnostics;

  std::vector<UnitResult> units;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the check pipeline.
 *
 * The pipeline consists of:
 * 1. Parsing
 * 2. Name resolution
 * 3. Type checking (skipped when resolution failed)
 * 4. Loop unrolling (optional)
 * 5. Loop extraction (optional)
 * 6. Output: emitted source or JSON
 *
 * InternalError thrown by any pass is not caught here.
 */
class Compiler
{
public:
  /**
   * Check a single source file.
   *
   * @param file Path to the program
   * @param options Compile options
   */
  [[nodiscard]] static CompileResult compile_single_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /// Check program text that did not come from a file.
  [[nodiscard]] static CompileResult compile_source(
    std::string source_text, const CompileOptions & options);

  /**
   * Check every entry point of a project.
   *
   * @param config Project configuration (from ivl.yaml)
   * @param options Compile options; the configuration's flags are merged in
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

private:
  static UnitResult run_pipeline(std::unique_ptr<ParsedUnit> unit, const CompileOptions & options);

  /**
   * Resolve, type check and optionally unroll or extract loops.
   *
   * @return true if no errors occurred
   */
  static bool run_semantic_analysis(UnitResult & result, const CompileOptions & options);

  static void produce_output(UnitResult & result, const CompileOptions & options);
};

}  // namespace ivl
