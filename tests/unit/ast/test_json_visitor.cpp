// test_json_visitor.cpp - Unit tests for AST JSON serialization
//
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>

#include "crusty/ast/ast.hpp"
#include "crusty/ast/ast_context.hpp"
#include "crusty/ast/json_visitor.hpp"
#include "crusty/test_support/parse_helpers.hpp"

using nlohmann::json;

namespace crusty
{

class JsonVisitorTest : public ::testing::Test
{
protected:
  static json parse_and_serialize(const std::string & source, const JsonOptions & options = {})
  {
    auto unit = test_support::parse(source);
    EXPECT_NE(unit.program, nullptr);
    return to_json(unit.program, options);
  }
};

TEST_F(JsonVisitorTest, EmptyProgram)
{
  auto j = parse_and_serialize("");
  EXPECT_EQ(j["kind"], "program");
  EXPECT_TRUE(j["items"].is_array());
  EXPECT_EQ(j["items"].size(), 0);
  EXPECT_FALSE(j.contains("innerDocs"));
}

TEST_F(JsonVisitorTest, FunctionSignature)
{
  auto j = parse_and_serialize("static int add(int a, i64 b) { return a + b; }");

  ASSERT_EQ(j["items"].size(), 1);
  auto fn = j["items"][0];
  EXPECT_EQ(fn["kind"], "function_decl");
  EXPECT_EQ(fn["name"], "add");
  EXPECT_EQ(fn["visibility"], "private");
  EXPECT_EQ(fn["returnType"]["kind"], "primitive_type");
  EXPECT_EQ(fn["returnType"]["name"], "int");
  ASSERT_EQ(fn["params"].size(), 2);
  EXPECT_EQ(fn["params"][1]["name"], "b");
  EXPECT_EQ(fn["params"][1]["paramType"]["name"], "i64");

  auto ret = fn["body"]["stmts"][0];
  EXPECT_EQ(ret["kind"], "return_stmt");
  EXPECT_EQ(ret["value"]["kind"], "binary_expr");
  EXPECT_EQ(ret["value"]["op"], "+");
  EXPECT_EQ(ret["value"]["lhs"]["name"], "a");
}

TEST_F(JsonVisitorTest, RangesAreByteOffsets)
{
  auto j = parse_and_serialize("typedef int Id;");
  auto td = j["items"][0];
  EXPECT_EQ(td["range"]["start"], 0);
  EXPECT_EQ(td["range"]["end"], 15);
  EXPECT_EQ(td["aliasedType"]["range"]["start"], 8);
  EXPECT_EQ(td["aliasedType"]["range"]["end"], 11);
}

TEST_F(JsonVisitorTest, RangesCanBeOmitted)
{
  JsonOptions options;
  options.includeRanges = false;
  auto j = parse_and_serialize("typedef int Id;", options);
  EXPECT_FALSE(j.contains("range"));
  EXPECT_FALSE(j["items"][0].contains("range"));
}

TEST_F(JsonVisitorTest, LiteralsKeepSpelling)
{
  auto j = parse_and_serialize(
    "void f() { let a = 0x1F; let b = 1.5e3; let c = \"hi\\n\"; let d = 'x'; let e = NULL; }");
  auto stmts = j["items"][0]["body"]["stmts"];
  ASSERT_EQ(stmts.size(), 5);

  EXPECT_EQ(stmts[0]["form"], "let");
  EXPECT_TRUE(stmts[0]["declType"].is_null());
  EXPECT_EQ(stmts[0]["init"]["kind"], "int_literal");
  EXPECT_EQ(stmts[0]["init"]["text"], "0x1F");
  EXPECT_EQ(stmts[0]["init"]["value"], 31);

  EXPECT_EQ(stmts[1]["init"]["kind"], "float_literal");
  EXPECT_EQ(stmts[1]["init"]["text"], "1.5e3");
  EXPECT_DOUBLE_EQ(stmts[1]["init"]["value"].get<double>(), 1500.0);

  EXPECT_EQ(stmts[2]["init"]["value"], "hi\\n");
  EXPECT_EQ(stmts[3]["init"]["kind"], "char_literal");
  EXPECT_EQ(stmts[4]["init"]["kind"], "null_literal");
}

TEST_F(JsonVisitorTest, StructWithDocsAndAttributes)
{
  auto j = parse_and_serialize(
    "//! Crate docs.\n"
    "/// A point.\n"
    "#[derive(Debug)]\n"
    "struct Point { int x; static int y; };\n");

  ASSERT_TRUE(j.contains("innerDocs"));
  EXPECT_EQ(j["innerDocs"][0], "Crate docs.");

  auto s = j["items"][0];
  EXPECT_EQ(s["kind"], "struct_decl");
  EXPECT_EQ(s["docs"][0], "A point.");
  EXPECT_EQ(s["attributes"][0]["kind"], "attribute");
  EXPECT_EQ(s["attributes"][0]["name"], "derive");
  EXPECT_EQ(s["attributes"][0]["args"], "Debug");
  ASSERT_EQ(s["fields"].size(), 2);
  EXPECT_EQ(s["fields"][1]["visibility"], "private");
  EXPECT_TRUE(s["methods"].empty());
}

TEST_F(JsonVisitorTest, EnumVariants)
{
  auto j = parse_and_serialize("enum Color { Red, Green = 5, Blue };");
  auto variants = j["items"][0]["variants"];
  ASSERT_EQ(variants.size(), 3);
  EXPECT_EQ(variants[0]["value"], 0);
  EXPECT_EQ(variants[0]["explicit"], false);
  EXPECT_EQ(variants[2]["value"], 6);
}

TEST_F(JsonVisitorTest, ImplBlockAndMacro)
{
  auto j = parse_and_serialize(
    "typedef struct { int get(&self) { return 1; } } @Point.getters;\n"
    "#define __SQ__(v) ((v) * (v))\n");
  ASSERT_EQ(j["items"].size(), 2);

  auto impl = j["items"][0];
  EXPECT_EQ(impl["kind"], "impl_block_decl");
  EXPECT_EQ(impl["target"], "Point");
  EXPECT_EQ(impl["blockName"], "getters");
  EXPECT_EQ(impl["methods"][0]["params"][0]["paramType"]["kind"], "reference_type");
  EXPECT_EQ(impl["methods"][0]["params"][0]["paramType"]["mutable"], false);

  auto macro = j["items"][1];
  EXPECT_EQ(macro["kind"], "macro_def_decl");
  EXPECT_EQ(macro["params"], json::array({"v"}));
  EXPECT_EQ(macro["body"].size(), 9);
}

TEST_F(JsonVisitorTest, LabeledLoopsAndSwitch)
{
  auto j = parse_and_serialize(
    "void f(int n) { .outer: for (x in 0..n) { switch (x) { case 1: break .outer; default: } } }");
  auto loop = j["items"][0]["body"]["stmts"][0];
  EXPECT_EQ(loop["kind"], "for_in_stmt");
  EXPECT_EQ(loop["label"], "outer");
  EXPECT_EQ(loop["iterable"]["kind"], "range_expr");
  EXPECT_EQ(loop["iterable"]["inclusive"], false);

  auto sw = loop["body"]["stmts"][0];
  EXPECT_EQ(sw["kind"], "switch_stmt");
  EXPECT_EQ(sw["cases"][0]["body"][0]["kind"], "break_stmt");
  EXPECT_EQ(sw["cases"][0]["body"][0]["label"], "outer");
  ASSERT_TRUE(sw.contains("default"));
  EXPECT_TRUE(sw["default"].empty());
}

TEST_F(JsonVisitorTest, NestedFunctionCapturesAreOptional)
{
  const std::string src = "int main() { var int n = 0; void bump() { n += 1; } return n; }";
  auto with = parse_and_serialize(src);
  auto nested = with["items"][0]["body"]["stmts"][1];
  EXPECT_EQ(nested["kind"], "nested_function_stmt");
  EXPECT_EQ(nested["static"], false);
  // Captures are filled in by semantic analysis; the parser leaves them empty.
  ASSERT_TRUE(nested.contains("captures"));
  EXPECT_TRUE(nested["captures"].empty());

  JsonOptions options;
  options.includeCaptures = false;
  auto without = parse_and_serialize(src, options);
  EXPECT_FALSE(without["items"][0]["body"]["stmts"][1].contains("captures"));
}

TEST_F(JsonVisitorTest, HandBuiltNodes)
{
  AstContext ctx;
  auto * lhs = ctx.create<IdentExpr>(ctx.intern("x"));
  auto * rhs = ctx.create<IntLiteralExpr>("2", 2);
  auto * expr = ctx.create<BinaryExpr>(lhs, BinaryOp::Shl, rhs);

  auto j = to_json(expr);
  EXPECT_EQ(j["kind"], "binary_expr");
  EXPECT_EQ(j["op"], "<<");
  EXPECT_TRUE(j["range"]["start"].is_null());
  EXPECT_EQ(j["rhs"]["value"], 2);

  EXPECT_TRUE(to_json(nullptr).is_null());
}

}  // namespace crusty
