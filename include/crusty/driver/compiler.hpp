// crusty/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and by the driver tests.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "crusty/basic/diagnostic.hpp"
#include "crusty/basic/source_manager.hpp"
#include "crusty/codegen/rust_generator.hpp"
#include "crusty/project/project_config.hpp"

namespace crusty
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Syntax and semantic analysis only (no codegen)
  Build,  ///< Full build including code generation
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  EmitKind emit = EmitKind::Rust;

  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  CodegenOptions codegen;
};

// ============================================================================
// Compile Result
// ============================================================================

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Source of the unit, for rendering diagnostics. Null when the file
  /// could not be read or for a project result.
  std::unique_ptr<SourceManager> source;

  /// Generated text (Build mode, no errors)
  std::string output;

  /// Files written (Build mode of compile_single_file / compile_project)
  std::vector<std::filesystem::path> generated_files;

  /// Per-source results of compile_project, in configuration order
  std::vector<CompileResult> units;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the compilation pipeline.
 *
 * The pipeline for one unit consists of:
 * 1. Lexing and parsing (stops at the first error)
 * 2. Semantic analysis (alias registration, type checking, captures)
 * 3. Code generation (Build mode, only when no error was reported)
 *
 * Every unit gets its own AST, TypeContext and TypeEnvironment.
 */
class Compiler
{
public:
  /**
   * Compile source text held in memory. Never writes files.
   *
   * @param text Source text
   * @param name Unit name shown in diagnostics (usually the file path)
   * @param options Compile options
   */
  [[nodiscard]] static CompileResult compile_source(
    std::string text, const std::filesystem::path & name, const CompileOptions & options);

  /**
   * Compile a single source file.
   *
   * In Build mode the output is written to `<output_dir>/<stem>.rs`
   * (`.crst` when emitting crusty), next to the input when no output
   * directory is given.
   */
  [[nodiscard]] static CompileResult compile_single_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile every source listed in a project configuration.
   *
   * Sources are compiled independently; a failing source does not stop the
   * others. The aggregate result succeeds only when every unit does.
   *
   * @param config Project configuration (from crusty.yaml)
   * @param options Compile options (output_dir overrides the config)
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

  /// File extension written for `kind`, dot included.
  [[nodiscard]] static const char * output_extension(EmitKind kind) noexcept;

private:
  static bool write_output(
    const std::filesystem::path & output_path, const std::string & text, DiagnosticBag & diags);
};

}  // namespace crusty
