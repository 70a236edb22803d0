// tests/driver/test_compiler.cpp - Unit tests for the compiler driver
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "ivl/driver/compiler.hpp"

using namespace ivl;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & p, const std::string & text)
{
  std::ofstream out(p);
  out << text;
}

constexpr const char * k_loop_program =
  "procedure P(n: int);\n"
  "implementation P(n: int) { var i: int; i := 0; while (i < n) { i := i + 1; } }\n";

CompileOptions with_mode(CompileMode mode)
{
  CompileOptions options;
  options.mode = mode;
  return options;
}

}  // namespace

// ============================================================================
// Gates
// ============================================================================

TEST(DriverCompiler, CleanProgramSucceeds)
{
  const auto result = Compiler::compile_source("var x: int;\naxiom x == x;\n", CompileOptions{});
  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.units.size(), 1u);
  const auto & unit = result.units[0];
  EXPECT_TRUE(unit.parsed);
  EXPECT_TRUE(unit.resolved);
  EXPECT_TRUE(unit.typechecked);
  EXPECT_TRUE(unit.output.empty());
}

TEST(DriverCompiler, SyntaxErrorStopsBeforeResolution)
{
  const auto result = Compiler::compile_source("var x int;", CompileOptions{});
  EXPECT_FALSE(result.success);
  const auto & unit = result.units[0];
  EXPECT_FALSE(unit.parsed);
  EXPECT_FALSE(unit.resolved);
  EXPECT_TRUE(unit.unit->diags.has_errors());
}

TEST(DriverCompiler, ResolutionErrorSkipsTypeChecking)
{
  const auto result = Compiler::compile_source("axiom y == 1;", CompileOptions{});
  EXPECT_FALSE(result.success);
  const auto & unit = result.units[0];
  EXPECT_TRUE(unit.parsed);
  EXPECT_FALSE(unit.resolved);
  EXPECT_FALSE(unit.typechecked);
}

TEST(DriverCompiler, TypeErrorFails)
{
  const auto result = Compiler::compile_source("axiom 1 == true;", CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.units[0].resolved);
  EXPECT_FALSE(result.units[0].typechecked);
}

TEST(DriverCompiler, OverlookDropsBrokenImplementation)
{
  const std::string src =
    "procedure P();\n"
    "implementation P() { undefined := 1; }\n";

  EXPECT_FALSE(Compiler::compile_source(src, CompileOptions{}).success);

  CompileOptions options = with_mode(CompileMode::Print);
  options.overlook_type_errors = true;
  const auto result = Compiler::compile_source(src, options);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.units[0].unit->diags.has_warnings());
  EXPECT_EQ(result.units[0].output, "procedure P();\n");
}

// ============================================================================
// Output
// ============================================================================

TEST(DriverCompiler, PrintModeEmitsProgram)
{
  const auto result =
    Compiler::compile_source("const c: int;\naxiom (c + 1) * 2 > 0;\n", with_mode(CompileMode::Print));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.units[0].output, "const c: int;\n\naxiom (c + 1) * 2 > 0;\n");
}

TEST(DriverCompiler, DumpModeProducesJson)
{
  const auto result = Compiler::compile_source("const c: int;\n", with_mode(CompileMode::Dump));
  ASSERT_TRUE(result.success);
  const auto j = nlohmann::json::parse(result.units[0].output);
  EXPECT_EQ(j["type"], "Program");
  EXPECT_EQ(j["decls"][0]["type"], "ConstantDecl");
}

TEST(DriverCompiler, CheckModeHonoursOutputFlags)
{
  CompileOptions options;
  options.emit = true;
  auto result = Compiler::compile_source("const c: int;\n", options);
  EXPECT_EQ(result.units[0].output, "const c: int;\n");

  // JSON takes precedence over the emitted program
  options.dump_json = true;
  result = Compiler::compile_source("const c: int;\n", options);
  EXPECT_EQ(result.units[0].output.front(), '{');
}

TEST(DriverCompiler, NoOutputAfterFailure)
{
  const auto result = Compiler::compile_source("axiom 1;", with_mode(CompileMode::Print));
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.units[0].output.empty());
}

TEST(DriverCompiler, ExtractLoopsMode)
{
  const auto result = Compiler::compile_source(k_loop_program, with_mode(CompileMode::ExtractLoops));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.units[0].extracted_loops, 1u);
  EXPECT_NE(result.units[0].output.find("procedure {:inline 1} loop_anon1_LoopHead("), std::string::npos);

  // Check mode leaves loops alone unless asked
  const auto plain = Compiler::compile_source(k_loop_program, CompileOptions{});
  EXPECT_EQ(plain.units[0].extracted_loops, 0u);

  CompileOptions options;
  options.extract_loops = true;
  EXPECT_EQ(Compiler::compile_source(k_loop_program, options).units[0].extracted_loops, 1u);
}

TEST(DriverCompiler, UnrollBeforeExtraction)
{
  CompileOptions options = with_mode(CompileMode::ExtractLoops);
  options.unroll = 1;
  const auto result = Compiler::compile_source(k_loop_program, options);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.units[0].unrolled_loops, 1u);
  // Nothing is left to extract
  EXPECT_EQ(result.units[0].extracted_loops, 0u);
  EXPECT_NE(result.units[0].output.find("anon1_LoopHead#1:"), std::string::npos);
}

// ============================================================================
// Files and Projects
// ============================================================================

TEST(DriverCompiler, MissingFileIsReported)
{
  const auto result =
    Compiler::compile_single_file("/nonexistent/dir/program.bpl", CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.units.empty());
  ASSERT_TRUE(result.diagnostics.has_errors());
  EXPECT_NE(result.diagnostics.errors().front().message.find("file not found"), std::string::npos);
}

TEST(DriverCompiler, SingleFileUsesPathAsName)
{
  TempDir dir(std::filesystem::temp_directory_path() / "ivl_test_compiler_single");
  const auto file = dir.path / "prog.bpl";
  write_file(file, "const c: int;\n");

  const auto result = Compiler::compile_single_file(file, CompileOptions{});
  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.units.size(), 1u);
  EXPECT_NE(result.units[0].name.find("prog.bpl"), std::string::npos);
}

TEST(DriverCompiler, ProjectChecksEveryEntryPoint)
{
  TempDir dir(std::filesystem::temp_directory_path() / "ivl_test_compiler_project");
  write_file(dir.path / "a.bpl", "const a: int;\n");
  write_file(dir.path / "b.bpl", k_loop_program);

  ProjectConfig config;
  config.project_root = dir.path;
  config.compiler.entry_points = {"a.bpl", "b.bpl"};
  config.compiler.extract_loops = true;

  const auto result = Compiler::compile_project(config, CompileOptions{});
  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.units.size(), 2u);
  EXPECT_EQ(result.units[0].extracted_loops, 0u);
  EXPECT_EQ(result.units[1].extracted_loops, 1u);
}

TEST(DriverCompiler, ProjectReportsMissingEntryPoints)
{
  TempDir dir(std::filesystem::temp_directory_path() / "ivl_test_compiler_missing");
  write_file(dir.path / "a.bpl", "const a: int;\n");

  ProjectConfig config;
  config.project_root = dir.path;
  config.compiler.entry_points = {"a.bpl", "gone.bpl"};

  const auto result = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.units.size(), 1u);
  EXPECT_TRUE(result.diagnostics.has_errors());

  ProjectConfig empty;
  const auto none = Compiler::compile_project(empty, CompileOptions{});
  EXPECT_FALSE(none.success);
  EXPECT_NE(
    none.diagnostics.errors().front().message.find("no entry points"), std::string::npos);
}

TEST(DriverCompiler, MergeOnlyTurnsFlagsOn)
{
  CompilerConfig config;
  config.overlook_type_errors = true;
  config.print_resolved = true;

  CompileOptions options;
  options.extract_loops = true;
  options.merge(config);
  EXPECT_TRUE(options.overlook_type_errors);
  EXPECT_TRUE(options.extract_loops);
  EXPECT_TRUE(options.emit);

  CompileOptions off;
  off.merge(CompilerConfig{});
  EXPECT_FALSE(off.overlook_type_errors);
  EXPECT_FALSE(off.emit);
}
