// crusty/project/project_config.cpp - Project configuration implementation
//
#include "crusty/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace crusty
{

const char * to_string(EmitKind kind) noexcept
{
  switch (kind) {
    case EmitKind::Rust:
      return "rust";
    case EmitKind::Crusty:
      return "crusty";
  }
  return "rust";
}

std::optional<EmitKind> parse_emit_kind(std::string_view s)
{
  if (s == "rust") return EmitKind::Rust;
  if (s == "crusty") return EmitKind::Crusty;
  return std::nullopt;
}

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  if (!root.IsDefined() || root.IsNull()) {
    return ConfigLoadResult::fail("configuration is empty");
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  ProjectConfig config;
  config.project_root = project_root;

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'build' section
  if (root["build"]) {
    const auto & build = root["build"];

    if (build["sources"]) {
      if (!build["sources"].IsSequence()) {
        return ConfigLoadResult::fail("build.sources must be a list");
      }
      for (const auto & src : build["sources"]) {
        config.build.sources.emplace_back(src.as<std::string>());
      }
    }

    if (build["output_dir"]) {
      config.build.output_dir = build["output_dir"].as<std::string>();
    }

    if (build["emit"]) {
      const auto emit = build["emit"].as<std::string>();
      const auto kind = parse_emit_kind(emit);
      if (!kind) {
        return ConfigLoadResult::fail(
          "invalid build.emit: '" + emit + "' (must be 'rust' or 'crusty')");
      }
      config.build.emit = *kind;
    }

    if (build["log_level"]) {
      const auto level = build["log_level"].as<std::string>();
      config.build.log_level = log::parse_level(level);
      if (!config.build.log_level) {
        return ConfigLoadResult::fail("invalid build.log_level: '" + level + "'");
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace crusty
