// tests/unit/codegen/test_source_printer.cpp - crusty pretty printer
//
#include <gtest/gtest.h>

#include <string>

#include "crusty/ast/json_visitor.hpp"
#include "crusty/codegen/source_printer.hpp"
#include "crusty/test_support/parse_helpers.hpp"

using namespace crusty;

namespace
{

const JsonOptions k_structural{false, false};

std::string print_expr(const std::string & src)
{
  auto unit = test_support::parse_expr(src);
  EXPECT_NE(unit.expr, nullptr) << "failed to parse " << src;
  if (unit.expr == nullptr) return {};
  return SourcePrinter{}.print_expr(unit.expr);
}

std::string print_stmt(const std::string & src)
{
  auto unit = test_support::parse_stmt(src);
  EXPECT_NE(unit.stmt, nullptr) << "failed to parse " << src;
  if (unit.stmt == nullptr) return {};
  return SourcePrinter{}.print_stmt(unit.stmt);
}

/// Print `src`, parse the result again, and compare the two trees.
void expect_round_trip(const std::string & src)
{
  auto first = test_support::parse(src);
  ASSERT_NE(first.program, nullptr) << "failed to parse original:\n" << src;

  const std::string printed = SourcePrinter{}.print(*first.program);
  auto second = test_support::parse(printed);
  ASSERT_NE(second.program, nullptr) << "failed to parse printed source:\n" << printed;

  EXPECT_EQ(to_json(first.program, k_structural), to_json(second.program, k_structural))
    << "printed source:\n"
    << printed;

  // Printing is a fixed point after one pass.
  EXPECT_EQ(SourcePrinter{}.print(*second.program), printed);
}

}  // namespace

TEST(SourcePrinter, KeepsParenthesesWhereWritten)
{
  EXPECT_EQ(print_expr("a+b*c"), "a + b * c");
  EXPECT_EQ(print_expr("(a+b)*c"), "(a + b) * c");
  EXPECT_EQ(print_expr("((x))"), "((x))");
}

TEST(SourcePrinter, NegationDoesNotFuseIntoDecrement)
{
  EXPECT_EQ(print_expr("-(-x)"), "-(-x)");
  EXPECT_EQ(print_expr("- -x"), "- -x");
}

TEST(SourcePrinter, ExpressionForms)
{
  EXPECT_EQ(print_expr("(int)x"), "(int)x");
  EXPECT_EQ(print_expr("&var v"), "&var v");
  EXPECT_EQ(print_expr("@Vec<int>.new()"), "@Vec<int>.new()");
  EXPECT_EQ(print_expr("@Color.Red"), "@Color.Red");
  EXPECT_EQ(print_expr("__MAX__(a,b)"), "__MAX__(a, b)");
  EXPECT_EQ(print_expr("(Point){.x=1,.y=2}"), "(Point){ .x = 1, .y = 2 }");
  EXPECT_EQ(print_expr("Point{.x=1}"), "Point { .x = 1 }");
  EXPECT_EQ(print_expr("p->next"), "p->next");
  EXPECT_EQ(print_expr("c?a:b"), "c ? a : b");
  EXPECT_EQ(print_expr("NULL"), "NULL");
}

TEST(SourcePrinter, TypeSpellings)
{
  auto unit = test_support::parse_stmt("let v: &var Vec<int*>[]?;");
  ASSERT_NE(unit.stmt, nullptr);
  const auto * decl = static_cast<const DeclStmt *>(unit.stmt);
  EXPECT_EQ(SourcePrinter{}.print_type(decl->type), "&var Vec<int*>[]?");
}

TEST(SourcePrinter, CanonicalDeclarations)
{
  EXPECT_EQ(print_stmt("int x=1;"), "int x = 1;\n");
  EXPECT_EQ(print_stmt("let int y = 2;"), "let y: int = 2;\n");
  EXPECT_EQ(print_stmt("var z;"), "var z;\n");
  EXPECT_EQ(print_stmt("const MAX: int = 8;"), "const MAX: int = 8;\n");
}

TEST(SourcePrinter, ControlFlowLayout)
{
  EXPECT_EQ(
    print_stmt(".outer:for(var int i=0;i<3;i+=1){if(i==1)continue .outer;}"),
    ".outer: for (var i: int = 0; i < 3; i += 1) {\n"
    "    if (i == 1) {\n"
    "        continue .outer;\n"
    "    }\n"
    "}\n");
  EXPECT_EQ(
    print_stmt("switch(n){case 1,2: f(); default: g();}"),
    "switch (n) {\n"
    "    case 1, 2:\n"
    "        f();\n"
    "    default:\n"
    "        g();\n"
    "}\n");
}

TEST(SourcePrinter, IndentWidthOption)
{
  auto unit = test_support::parse_stmt("while (go) { f(); }");
  ASSERT_NE(unit.stmt, nullptr);
  CodegenOptions options;
  options.indent_width = 2;
  EXPECT_EQ(SourcePrinter(options).print_stmt(unit.stmt), "while (go) {\n  f();\n}\n");
}

TEST(SourcePrinterRoundTrip, Expressions)
{
  expect_round_trip(R"(
    int f(int a, int b, int* p) {
      int x = a + b * (a - b) % 3;
      int y = (int)-x;
      bool ok = !(x > y) && y != 0 || a >= b;
      x <<= 2;
      x = x > 0 ? x : -x;
      let t = (a, b);
      let s = t.0;
      let r = 0..=10;
      let arr = [1, 2, 3];
      let rep = [0; 4];
      let q = *p;
      ++x;
      return x - - y;
    }
  )");
}

TEST(SourcePrinterRoundTrip, ItemsDocsAndAttributes)
{
  expect_round_trip(R"(
//! Module docs.

/// A point.
#[derive(Debug, Clone)]
struct Point {
  /// Horizontal.
  int x;
  static int y;
  int sum(&self) { return self.x + self.y; }
};

enum Color { Red, Green = 5, Blue = -1, };

static typedef Point P;

/// Geometry helpers.
typedef struct {
  void reset(&var self) { self.x = 0; }
  static int zero() { return 0; }
} @Point.geometry;

extern "C" { int abs(int x); double sqrt(double v); }

#define __MAX__(a, b) ((a) > (b) ? (a) : (b))
#define __PI__ 3.14
)");
}

TEST(SourcePrinterRoundTrip, StatementsAndNestedFunctions)
{
  expect_round_trip(R"(
    void run(int n) {
      var int total = 0;
      static int helper(int v) { return v * 2; }
      void add(int v) { total += helper(v); }
      .scan: for (i in 0..n) {
        if (i == 3) { continue .scan; } else if (i > 8) { break .scan; } else { add(i); }
      }
      while (total > 100) { total -= 1; }
      loop { break; }
      for (;;) { break; }
      switch (total) {
        case 0: return;
        case 1, 2: add(1);
        default: add(2);
      }
      let p = (Point){ .x = 1, .y = 2 };
      let q = Point { .x = 3 };
      let v = @Vec<int>.new();
      __println__("{}", total);
    }
  )");
}
