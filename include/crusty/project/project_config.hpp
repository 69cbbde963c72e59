// crusty/project/project_config.hpp - Project configuration (crusty.yaml)
//
// Parses and validates crusty.yaml project configuration files.
// Used by the CLI and the driver.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crusty/basic/log.hpp"

namespace crusty
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// What a build writes for each source.
enum class EmitKind {
  Rust,    ///< Generated Rust (`.rs`)
  Crusty,  ///< Pretty-printed crusty source (`.crst`)
};

[[nodiscard]] const char * to_string(EmitKind kind) noexcept;

/// Parse "rust" / "crusty". Unknown names yield nullopt.
[[nodiscard]] std::optional<EmitKind> parse_emit_kind(std::string_view s);

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Build configuration section.
 */
struct BuildConfig
{
  /// Source files to compile (relative to crusty.yaml)
  std::vector<std::filesystem::path> sources;

  /// Output directory for generated files
  std::filesystem::path output_dir = "generated";

  EmitKind emit = EmitKind::Rust;

  /// Log threshold requested by the project, if any
  std::optional<log::LogLevel> log_level;
};

/**
 * Complete project configuration (crusty.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  BuildConfig build;

  /// Directory containing crusty.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a crusty.yaml file.
 *
 * @param config_path Path to crusty.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text.
 *
 * @param text YAML document
 * @param project_root Directory the relative paths in `text` refer to
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to crusty.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "crusty.yaml";

}  // namespace crusty
