// crustyc - crusty to Rust compiler command line interface
//
// Usage:
//   crustyc build [file.crst | --project] [-o output]
//   crustyc check [file.crst | --project]
//   crustyc dump <file.crst> [--no-ranges]
//   crustyc fmt <file.crst>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "crusty/ast/ast_context.hpp"
#include "crusty/ast/json_visitor.hpp"
#include "crusty/basic/diagnostic_printer.hpp"
#include "crusty/basic/log.hpp"
#include "crusty/codegen/source_printer.hpp"
#include "crusty/driver/compiler.hpp"
#include "crusty/project/project_config.hpp"
#include "crusty/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "crusty compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [file.crst]        Build a file or project\n"
            << "  check [file.crst]        Check syntax and semantics (no codegen)\n"
            << "  dump <file.crst>         Print the AST as JSON\n"
            << "  fmt <file.crst>          Pretty-print the source to stdout\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output directory\n"
            << "  --project                Build project from crusty.yaml\n"
            << "  --no-ranges              Omit source ranges from dump output\n"
            << "  -v, --verbose            Verbose output (log level debug)\n"
            << "  --log-level <level>      trace, debug, info, warn, error or off\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -h, --help               Show this help message\n";
}

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::optional<crusty::log::LogLevel> log_level;
  bool use_project = false;
  bool no_ranges = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

void print_diagnostics(
  const crusty::DiagnosticBag & diagnostics, const crusty::SourceManager * source,
  const std::string & default_filename, const CommandArgs & args)
{
  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;

  // Diagnostics without a readable source still get a header line.
  const crusty::SourceManager fallback(default_filename, std::string());
  crusty::DiagnosticPrinter printer(std::cerr, source ? *source : fallback, use_color);
  printer.print_all(diagnostics);
}

void print_result(const crusty::CompileResult & result, const std::string & name, const CommandArgs & args)
{
  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, result.source.get(), name, args);
  }
  for (const auto & unit : result.units) {
    if (!unit.diagnostics.empty()) {
      print_diagnostics(unit.diagnostics, unit.source.get(), name, args);
    }
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      } else {
        args.error = "missing value for " + arg;
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-ranges") {
      args.no_ranges = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "--log-level") {
      if (i + 1 < argc) {
        const std::string name = argv[++i];
        args.log_level = crusty::log::parse_level(name);
        if (!args.log_level) {
          args.error = "invalid log level '" + name + "'";
        }
      } else {
        args.error = "missing value for --log-level";
      }
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

void apply_log_level(const CommandArgs & args, std::optional<crusty::log::LogLevel> project_level)
{
  auto & logger = crusty::log::Logger::instance();
  if (args.log_level) {
    logger.set_level(*args.log_level);
  } else if (args.verbose) {
    logger.set_level(crusty::log::LogLevel::Debug);
  } else if (project_level) {
    logger.set_level(*project_level);
  }
}

std::optional<std::string> read_source(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// ============================================================================
// Commands
// ============================================================================

/// Shared by build and check.
int run_compile(const CommandArgs & args, crusty::CompileMode mode)
{
  crusty::CompileOptions options;
  options.mode = mode;
  if (!args.output_path.empty()) {
    options.output_dir = fs::absolute(args.output_path);
  }

  const bool building = mode == crusty::CompileMode::Build;
  crusty::CompileResult result;
  std::string name;

  if (args.use_project || args.input_file.empty()) {
    // Project mode: find crusty.yaml
    auto config_path = crusty::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no " << crusty::k_project_config_file_name
                << " found in current directory or parents\n";
      return 1;
    }

    const auto config_result = crusty::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return 1;
    }
    apply_log_level(args, config_result.config.build.log_level);

    name = config_result.config.package.name.empty() ? std::string("project")
                                                     : config_result.config.package.name;
    if (args.verbose) {
      std::cerr << (building ? "Building" : "Checking") << " project: " << name << "\n";
    }

    result = crusty::Compiler::compile_project(config_result.config, options);
  } else {
    apply_log_level(args, std::nullopt);

    // Single file mode
    const fs::path input_path = fs::absolute(args.input_file);
    if (!fs::exists(input_path)) {
      std::cerr << "error: file not found: " << input_path.string() << "\n";
      return 1;
    }
    name = args.input_file;

    if (args.verbose) {
      std::cerr << (building ? "Building: " : "Checking: ") << input_path.string() << "\n";
    }

    result = crusty::Compiler::compile_single_file(input_path, options);
  }

  print_result(result, name, args);

  if (!result.success) {
    return 1;
  }

  if (building) {
    for (const auto & file : result.generated_files) {
      std::cerr << "Generated: " << file.string() << "\n";
    }
  } else {
    std::cout << name << ": OK\n";
  }
  return 0;
}

/// Parse-only commands: dump and fmt.
int run_parse_only(const CommandArgs & args, bool dump)
{
  apply_log_level(args, std::nullopt);

  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: crustyc " << args.command << " <file.crst>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  auto text = read_source(input_path);
  if (!text) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  crusty::SourceManager sm(input_path, std::move(*text));
  crusty::AstContext ast;
  crusty::DiagnosticBag diags;
  crusty::Program * program = crusty::parse_source(sm, ast, diags);
  if (!diags.empty()) {
    print_diagnostics(diags, &sm, args.input_file, args);
  }
  if (program == nullptr) {
    return 1;
  }

  if (dump) {
    crusty::JsonOptions options;
    options.includeRanges = !args.no_ranges;
    std::cout << crusty::to_json(program, options).dump(2) << "\n";
    return 0;
  }

  try {
    std::cout << crusty::SourcePrinter{}.print(*program);
  } catch (const crusty::InternalCodegenError & e) {
    std::cerr << "error: internal compiler error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "build") {
    return run_compile(args, crusty::CompileMode::Build);
  }

  if (args.command == "check") {
    return run_compile(args, crusty::CompileMode::Check);
  }

  if (args.command == "dump") {
    return run_parse_only(args, true);
  }

  if (args.command == "fmt") {
    return run_parse_only(args, false);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
