// tests/unit/driver/test_compiler.cpp - compile pipeline and output files
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "crusty/driver/compiler.hpp"

using namespace crusty;
namespace fs = std::filesystem;

namespace
{

std::string read_all(const fs::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  fs::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

class TempDirTest : public ::testing::Test
{
protected:
  void SetUp() override { dir_ = make_temp_dir("crusty_driver"); }

  void TearDown() override
  {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

}  // namespace

// ============================================================================
// compile_source
// ============================================================================

TEST(CompileSource, AliasChainEndToEnd)
{
  const auto result =
    Compiler::compile_source("typedef int A; typedef A B; int f(B x) { return x; }", "e2e.crst", {});
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_NE(result.output.find("pub fn f(x: i32) -> i32 {\n    return x;\n}"), std::string::npos)
    << result.output;
}

TEST(CompileSource, CircularAliasStopsBeforeCodegen)
{
  const auto result = Compiler::compile_source("typedef int A; typedef A A;", "cycle.crst", {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_circular_type_alias));
  EXPECT_TRUE(result.output.empty());
}

TEST(CompileSource, ParseErrorStopsTheUnit)
{
  const auto result = Compiler::compile_source("int f( { }", "bad.crst", {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_parse_error));
  EXPECT_EQ(result.diagnostics.errors().size(), 1U);
  EXPECT_TRUE(result.output.empty());
}

TEST(CompileSource, SemanticErrorsAccumulate)
{
  const auto result = Compiler::compile_source(
    R"(
      Missing f() { return 1; }
      int g() { return undefined_name; }
    )",
    "many.crst", {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_undefined_type));
  EXPECT_TRUE(result.diagnostics.has_code(diag_code::k_undefined_variable));
  EXPECT_TRUE(result.output.empty());
}

TEST(CompileSource, CheckModeGeneratesNothing)
{
  CompileOptions options;
  options.mode = CompileMode::Check;
  const auto result = Compiler::compile_source("int f() { return 1; }", "check.crst", options);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.output.empty());
}

TEST(CompileSource, EmitCrustyPrettyPrints)
{
  CompileOptions options;
  options.emit = EmitKind::Crusty;
  const auto result = Compiler::compile_source("int f(){return 1+2;}", "fmt.crst", options);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, "int f() {\n    return 1 + 2;\n}\n");
}

TEST(CompileSource, IndentWidthReachesGenerator)
{
  CompileOptions options;
  options.codegen.indent_width = 2;
  const auto result = Compiler::compile_source("void f() { return; }", "indent.crst", options);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.output, "pub fn f() {\n  return;\n}\n");
}

TEST(CompileSource, KeepsSourceForDiagnostics)
{
  const auto result = Compiler::compile_source("Nope x() { }", "src/unit.crst", {});
  ASSERT_NE(result.source, nullptr);
  EXPECT_EQ(result.source->get_display_name(), "src/unit.crst");
  EXPECT_EQ(result.source->get_source(), "Nope x() { }");
}

TEST(CompileSource, DeterministicAcrossRuns)
{
  const std::string src = R"(
    struct P { int x; int get(&self) { return self.x; } };
    typedef struct { void set(&var self, int v) { self.x = v; } } @P;
    int main() { var int n = 0; void bump() { n += 1; } bump(); return n; }
  )";
  const auto a = Compiler::compile_source(src, "a.crst", {});
  const auto b = Compiler::compile_source(src, "a.crst", {});
  ASSERT_TRUE(a.success);
  ASSERT_TRUE(b.success);
  EXPECT_EQ(a.output, b.output);
}

// ============================================================================
// compile_single_file / compile_project
// ============================================================================

TEST_F(TempDirTest, SingleFileWritesNextToInput)
{
  const fs::path src = dir_ / "hello.crst";
  write_all(src, "int answer() { return 42; }\n");

  const auto result = Compiler::compile_single_file(src, {});
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.generated_files.size(), 1U);
  EXPECT_EQ(result.generated_files[0], dir_ / "hello.rs");
  EXPECT_EQ(read_all(dir_ / "hello.rs"), "pub fn answer() -> i32 {\n    return 42;\n}\n");
}

TEST_F(TempDirTest, SingleFileHonorsOutputDir)
{
  const fs::path src = dir_ / "a.crst";
  write_all(src, "void f() { }\n");

  CompileOptions options;
  options.output_dir = dir_ / "out" / "nested";
  const auto result = Compiler::compile_single_file(src, options);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(fs::exists(dir_ / "out" / "nested" / "a.rs"));
}

TEST_F(TempDirTest, FailedUnitWritesNoFile)
{
  const fs::path src = dir_ / "broken.crst";
  write_all(src, "typedef Undefined T;\n");

  const auto result = Compiler::compile_single_file(src, {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.generated_files.empty());
  EXPECT_FALSE(fs::exists(dir_ / "broken.rs"));
}

TEST_F(TempDirTest, MissingFileIsReported)
{
  const auto result = Compiler::compile_single_file(dir_ / "nope.crst", {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.diagnostics.size(), 1U);
  EXPECT_NE(result.diagnostics.all().front().message.find("file not found"), std::string::npos);
}

TEST_F(TempDirTest, EmitCrustyNeverOverwritesInput)
{
  const fs::path src = dir_ / "same.crst";
  const std::string original = "int f(){return 1;}\n";
  write_all(src, original);

  CompileOptions options;
  options.emit = EmitKind::Crusty;
  const auto result = Compiler::compile_single_file(src, options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(read_all(src), original);
}

TEST_F(TempDirTest, ProjectCompilesEachSourceIndependently)
{
  write_all(dir_ / "src" / "good.crst", "typedef int Id; Id next(Id v) { return v + 1; }\n");
  write_all(dir_ / "src" / "bad.crst", "typedef Id Id;\n");
  write_all(dir_ / "src" / "other.crst", "int Id() { return 0; }\n");

  ProjectConfig config;
  config.project_root = dir_;
  config.build.sources = {"src/good.crst", "src/bad.crst", "src/other.crst"};

  const auto result = Compiler::compile_project(config, {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.units.size(), 3U);
  EXPECT_TRUE(result.units[0].success);
  EXPECT_FALSE(result.units[1].success);
  // Aliases of one unit never leak into another.
  EXPECT_TRUE(result.units[2].success);

  EXPECT_TRUE(fs::exists(dir_ / "generated" / "good.rs"));
  EXPECT_FALSE(fs::exists(dir_ / "generated" / "bad.rs"));
  EXPECT_TRUE(fs::exists(dir_ / "generated" / "other.rs"));
  EXPECT_EQ(result.generated_files.size(), 2U);
}

TEST_F(TempDirTest, ProjectEmitSettingIsUsed)
{
  write_all(dir_ / "main.crst", "int f(){return 1;}\n");

  ProjectConfig config;
  config.project_root = dir_;
  config.build.sources = {"main.crst"};
  config.build.output_dir = "pretty";
  config.build.emit = EmitKind::Crusty;

  const auto result = Compiler::compile_project(config, {});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(read_all(dir_ / "pretty" / "main.crst"), "int f() {\n    return 1;\n}\n");
}

TEST(CompileProject, NoSourcesIsAnError)
{
  ProjectConfig config;
  const auto result = Compiler::compile_project(config, {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
}
