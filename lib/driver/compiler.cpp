// crusty/driver/compiler.cpp - Compiler driver implementation
//
#include "crusty/driver/compiler.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

#include "crusty/ast/ast_context.hpp"
#include "crusty/basic/log.hpp"
#include "crusty/codegen/source_printer.hpp"
#include "crusty/sema/semantic_analyzer.hpp"
#include "crusty/sema/type.hpp"
#include "crusty/syntax/frontend.hpp"

namespace crusty
{

namespace
{

std::optional<std::string> read_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::filesystem::path output_path_for(
  const std::filesystem::path & input, const std::filesystem::path & dir, EmitKind emit)
{
  return dir / (input.stem().string() + Compiler::output_extension(emit));
}

}  // namespace

const char * Compiler::output_extension(EmitKind kind) noexcept
{
  return kind == EmitKind::Crusty ? ".crst" : ".rs";
}

CompileResult Compiler::compile_source(
  std::string text, const std::filesystem::path & name, const CompileOptions & options)
{
  CompileResult result;
  result.source = std::make_unique<SourceManager>(name, std::move(text));
  const SourceManager & sm = *result.source;

  // 1. Parse. Lexical and syntax errors stop the unit.
  AstContext ast;
  Program * program = parse_source(sm, ast, result.diagnostics);
  if (program == nullptr) {
    CRUSTY_LOG_DEBUG("driver", "{}: parse failed", sm.get_display_name());
    return result;
  }

  // 2. Semantic analysis, accumulating every error it can find.
  TypeContext types;
  SemanticAnalyzer sema(ast, types, result.diagnostics);
  if (!sema.analyze(*program) || result.diagnostics.has_errors()) {
    CRUSTY_LOG_DEBUG(
      "driver", "{}: {} semantic errors, skipping codegen", sm.get_display_name(),
      result.diagnostics.errors().size());
    return result;
  }

  // 3. Code generation. Partial output is never kept.
  if (options.mode == CompileMode::Build) {
    try {
      if (options.emit == EmitKind::Crusty) {
        result.output = SourcePrinter(options.codegen).print(*program);
      } else {
        result.output = RustGenerator(options.codegen, &sema.environment()).generate(*program);
      }
    } catch (const InternalCodegenError & e) {
      result.output.clear();
      result.diagnostics
        .report_error(e.range(), fmt::format("internal compiler error: {}", e.what()))
        .with_code(diag_code::k_internal_codegen)
        .with_help("this is a bug in crustyc, not in the input program");
      CRUSTY_LOG_ERROR("driver", "{}: {}", sm.get_display_name(), e.what());
      return result;
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

CompileResult Compiler::compile_single_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  auto text = read_file(file);
  if (!text) {
    CompileResult result;
    result.diagnostics.report_error(SourceRange{}, "file not found: " + file.string());
    return result;
  }

  CompileResult result = compile_source(std::move(*text), file, options);
  if (!result.success || options.mode != CompileMode::Build) {
    return result;
  }

  const fs::path dir = options.output_dir.value_or(file.parent_path());
  const fs::path output_path = output_path_for(file, dir, options.emit);
  std::error_code ec;
  if (fs::equivalent(output_path, file, ec)) {
    result.diagnostics.report_error(
      SourceRange{}, "refusing to overwrite the input file: " + file.string());
    result.success = false;
    return result;
  }
  if (!write_output(output_path, result.output, result.diagnostics)) {
    result.success = false;
    return result;
  }
  result.generated_files.push_back(output_path);
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  CompileResult result;

  if (config.build.sources.empty()) {
    result.diagnostics.report_error(SourceRange{}, "no sources defined in project configuration");
    return result;
  }

  // The project's emit kind applies unless the caller asked for crusty.
  CompileOptions unit_options = options;
  if (options.emit == EmitKind::Rust) {
    unit_options.emit = config.build.emit;
  }
  unit_options.output_dir =
    options.output_dir.value_or(config.project_root / config.build.output_dir);

  bool all_ok = true;
  for (const auto & rel : config.build.sources) {
    const fs::path source_path = config.project_root / rel;
    CRUSTY_LOG_INFO("driver", "compiling {}", source_path.string());

    CompileResult unit = compile_single_file(source_path, unit_options);
    all_ok = all_ok && unit.success;
    for (auto & f : unit.generated_files) {
      result.generated_files.push_back(f);
    }
    result.units.push_back(std::move(unit));
  }

  result.success = all_ok && !result.diagnostics.has_errors();
  return result;
}

bool Compiler::write_output(
  const std::filesystem::path & output_path, const std::string & text, DiagnosticBag & diags)
{
  std::error_code ec;
  if (output_path.has_parent_path()) {
    std::filesystem::create_directories(output_path.parent_path(), ec);
    if (ec) {
      diags.report_error(
        SourceRange{}, "failed to create output directory: " + output_path.parent_path().string() +
                         " (" + ec.message() + ")");
      return false;
    }
  }

  std::ofstream out(output_path, std::ios::binary);
  if (!out.is_open()) {
    diags.report_error(SourceRange{}, "failed to open output file: " + output_path.string());
    return false;
  }
  out << text;
  CRUSTY_LOG_INFO("driver", "wrote {}", output_path.string());
  return true;
}

}  // namespace crusty
