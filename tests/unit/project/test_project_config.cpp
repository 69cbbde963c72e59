// tests/unit/project/test_project_config.cpp - crusty.yaml loading and validation
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "crusty/project/project_config.hpp"

using namespace crusty;
namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(ProjectConfig, FullDocument)
{
  const auto r = parse_project_config(
    R"(
package:
  name: demo
  version: 0.1.0
build:
  sources: [src/main.crst, src/util.crst]
  output_dir: out
  emit: crusty
  log_level: debug
)",
    "/work/demo");

  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "demo");
  EXPECT_EQ(r.config.package.version, "0.1.0");
  ASSERT_EQ(r.config.build.sources.size(), 2U);
  EXPECT_EQ(r.config.build.sources[0], fs::path("src/main.crst"));
  EXPECT_EQ(r.config.build.output_dir, fs::path("out"));
  EXPECT_EQ(r.config.build.emit, EmitKind::Crusty);
  ASSERT_TRUE(r.config.build.log_level.has_value());
  EXPECT_EQ(*r.config.build.log_level, log::LogLevel::Debug);
  EXPECT_EQ(r.config.project_root, fs::path("/work/demo"));
}

TEST(ProjectConfig, Defaults)
{
  const auto r = parse_project_config("package: { name: tiny }\n", "/p");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.build.sources.empty());
  EXPECT_EQ(r.config.build.output_dir, fs::path("generated"));
  EXPECT_EQ(r.config.build.emit, EmitKind::Rust);
  EXPECT_FALSE(r.config.build.log_level.has_value());
}

TEST(ProjectConfig, SourcesMustBeAList)
{
  const auto r = parse_project_config("build:\n  sources: main.crst\n", "/p");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("build.sources must be a list"), std::string::npos);
}

TEST(ProjectConfig, RejectsUnknownEmitKind)
{
  const auto r = parse_project_config("build:\n  emit: python\n", "/p");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("python"), std::string::npos);
}

TEST(ProjectConfig, RejectsUnknownLogLevel)
{
  const auto r = parse_project_config("build:\n  log_level: loud\n", "/p");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("log_level"), std::string::npos);
}

TEST(ProjectConfig, RejectsMalformedYaml)
{
  const auto r = parse_project_config("build: [unterminated\n", "/p");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("failed to parse YAML"), std::string::npos);
}

TEST(ProjectConfig, RejectsNonMapDocument)
{
  EXPECT_FALSE(parse_project_config("- a\n- b\n", "/p").success);
  EXPECT_FALSE(parse_project_config("", "/p").success);
}

TEST(ProjectConfig, LoadFromFileSetsProjectRoot)
{
  const fs::path dir = make_temp_dir("crusty_config");
  {
    std::ofstream out(dir / k_project_config_file_name);
    out << "build:\n  sources: [main.crst]\n";
  }

  const auto r = load_project_config(dir / k_project_config_file_name);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.project_root, fs::absolute(dir));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(ProjectConfig, MissingFile)
{
  const auto r = load_project_config("/definitely/not/here/crusty.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const fs::path dir = make_temp_dir("crusty_find");
  fs::create_directories(dir / "src" / "deep");
  {
    std::ofstream out(dir / k_project_config_file_name);
    out << "package: { name: up }\n";
  }

  const auto found = find_project_config(dir / "src" / "deep");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, fs::absolute(dir) / k_project_config_file_name);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(ProjectConfig, EmitKindNames)
{
  EXPECT_STREQ(to_string(EmitKind::Rust), "rust");
  EXPECT_STREQ(to_string(EmitKind::Crusty), "crusty");
  EXPECT_EQ(parse_emit_kind("crusty").value_or(EmitKind::Rust), EmitKind::Crusty);
  EXPECT_FALSE(parse_emit_kind("Rust").has_value());
}
