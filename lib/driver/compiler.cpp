// ivl/driver/compiler.cpp - Compiler driver implementation
//
#include "ivl/driver/compiler.hpp"

#include <cstdio>

#include <fmt/format.h>

#include "ivl/ast/emitter.hpp"
#include "ivl/ast/json_visitor.hpp"
#include "ivl/sema/analysis/loop_extractor.hpp"
#include "ivl/sema/analysis/loop_unroller.hpp"
#include "ivl/sema/resolution/name_resolver.hpp"
#include "ivl/sema/types/type_checker.hpp"

namespace ivl
{

namespace
{

void log(const CompileOptions & options, const std::string & message)
{
  if (options.verbose) {
    fmt::print(stderr, "[ivlc] {}\n", message);
  }
}

bool finish(CompileResult & result)
{
  result.success = !result.diagnostics.has_errors();
  for (const auto & u : result.units) {
    if (!u.typechecked) {
      result.success = false;
    }
  }
  return result.success;
}

}  // namespace

void CompileOptions::merge(const CompilerConfig & config)
{
  overlook_type_errors = overlook_type_errors || config.overlook_type_errors;
  extract_loops = extract_loops || config.extract_loops;
  emit = emit || config.print_resolved;
}

CompileResult Compiler::compile_single_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  CompileResult result;

  if (!std::filesystem::exists(file)) {
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return result;
  }

  log(options, fmt::format("parsing {}", file.string()));
  result.units.push_back(run_pipeline(parse_file(file), options));
  finish(result);
  return result;
}

CompileResult Compiler::compile_source(std::string source_text, const CompileOptions & options)
{
  CompileResult result;
  log(options, "parsing <input>");
  result.units.push_back(run_pipeline(parse_source(std::move(source_text)), options));
  finish(result);
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;

  if (config.compiler.entry_points.empty()) {
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  CompileOptions merged = options;
  merged.merge(config.compiler);

  // Every entry point is an independent program
  for (const auto & entry_rel : config.compiler.entry_points) {
    const std::filesystem::path entry_path = config.project_root / entry_rel;

    if (!std::filesystem::exists(entry_path)) {
      result.diagnostics.report_error(
        SourceRange{}, "entry point not found: " + entry_path.string());
      continue;
    }

    log(merged, fmt::format("parsing {}", entry_path.string()));
    result.units.push_back(run_pipeline(parse_file(entry_path), merged));
  }

  finish(result);
  return result;
}

UnitResult Compiler::run_pipeline(std::unique_ptr<ParsedUnit> unit, const CompileOptions & options)
{
  UnitResult result;
  result.name = unit->source.get_display_name();
  result.unit = std::move(unit);
  result.parsed = !result.unit->diags.has_errors();

  if (!result.parsed) {
    log(options, fmt::format("{} syntax error(s)", result.unit->diags.error_count()));
    return result;
  }

  if (run_semantic_analysis(result, options)) {
    produce_output(result, options);
  }
  return result;
}

bool Compiler::run_semantic_analysis(UnitResult & result, const CompileOptions & options)
{
  ParsedUnit & unit = *result.unit;

  // 1. Name resolution
  log(options, fmt::format("resolving {}", result.name));
  ResolveOptions resolve_options;
  resolve_options.overlookTypeErrors = options.overlook_type_errors;
  NameResolver resolver(unit.ast, unit.types, &unit.diags, resolve_options);
  result.resolved = resolver.resolve(*unit.program);
  if (!result.resolved) {
    log(options, fmt::format("{} name resolution error(s)", unit.diags.error_count()));
    return false;
  }

  // 2. Type checking
  log(options, fmt::format("type checking {}", result.name));
  const size_t errors_before = unit.diags.error_count();
  TypeChecker checker(unit.types, &unit.diags);
  result.typechecked = checker.check(*unit.program);
  if (!result.typechecked) {
    log(options, fmt::format(
                   "{} type checking error(s)", unit.diags.error_count() - errors_before));
    return false;
  }

  // 3. Loop unrolling
  if (options.unroll) {
    log(options, fmt::format("unrolling loops in {} {} time(s)", result.name, *options.unroll));
    result.unrolled_loops = unroll_loops(*unit.program, unit.ast, unit.types, *options.unroll);
    log(options, fmt::format("unrolled {} loop(s)", result.unrolled_loops));
  }

  // 4. Loop extraction
  if (options.extract_loops || options.mode == CompileMode::ExtractLoops) {
    log(options, fmt::format("extracting loops in {}", result.name));
    result.extracted_loops = extract_loops(*unit.program, unit.ast, unit.types).size();
    log(options, fmt::format("extracted {} loop(s)", result.extracted_loops));
  }

  return true;
}

void Compiler::produce_output(UnitResult & result, const CompileOptions & options)
{
  const Program & program = *result.unit->program;

  switch (options.mode) {
    case CompileMode::Print:
    case CompileMode::ExtractLoops:
      result.output = to_source(program);
      return;
    case CompileMode::Dump:
      result.output = to_json(&program).dump(2) + "\n";
      return;
    case CompileMode::Check:
      break;
  }

  if (options.dump_json) {
    result.output = to_json(&program).dump(2) + "\n";
  } else if (options.emit) {
    result.output = to_source(program);
  }
}

}  // namespace ivl
