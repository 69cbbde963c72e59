// tests/unit/codegen/test_rust_generator.cpp - Rust mapping table and closure forms
//
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "crusty/basic/casting.hpp"
#include "crusty/codegen/rust_generator.hpp"
#include "crusty/sema/semantic_analyzer.hpp"
#include "crusty/test_support/parse_helpers.hpp"

using namespace crusty;

namespace
{

void expect_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_NE(haystack.find(needle), std::string::npos)
    << "Expected to find: " << needle << "\nIn output:\n"
    << haystack;
}

void expect_not_contains(const std::string & haystack, const std::string & needle)
{
  EXPECT_EQ(haystack.find(needle), std::string::npos)
    << "Expected NOT to find: " << needle << "\nIn output:\n"
    << haystack;
}

size_t count_of(const std::string & haystack, const std::string & needle)
{
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

/// Rust spelling of a written type, without semantic analysis.
std::string rust_type(const std::string & type)
{
  auto unit = test_support::parse_stmt("let v: " + type + ";");
  EXPECT_NE(unit.stmt, nullptr) << "failed to parse type " << type;
  if (unit.stmt == nullptr) return {};
  return RustGenerator{}.generate_type(cast<DeclStmt>(unit.stmt)->type);
}

std::string rust_expr(const std::string & src)
{
  auto unit = test_support::parse_expr(src);
  EXPECT_NE(unit.expr, nullptr) << "failed to parse " << src;
  if (unit.expr == nullptr) return {};
  return RustGenerator{}.generate_expr(unit.expr);
}

std::string rust_stmt(const std::string & src)
{
  auto unit = test_support::parse_stmt(src);
  EXPECT_NE(unit.stmt, nullptr) << "failed to parse " << src;
  if (unit.stmt == nullptr) return {};
  return RustGenerator{}.generate_stmt(unit.stmt);
}

/// Parse, analyze and generate a whole unit.
class RustGenTest : public ::testing::Test
{
protected:
  std::string generate(std::string src)
  {
    unit_ = test_support::parse(std::move(src));
    if (unit_.program == nullptr) {
      ADD_FAILURE() << "parse failed";
      return {};
    }
    sema_ = std::make_unique<SemanticAnalyzer>(*unit_.ast, types_, diags_);
    const bool ok = sema_->analyze(*unit_.program);
    EXPECT_TRUE(ok) << (diags_.empty() ? std::string() : diags_.all().front().message);
    RustGenerator gen(options_, &sema_->environment());
    return gen.generate(*unit_.program);
  }

  CodegenOptions options_;
  test_support::TestParseUnit unit_;
  TypeContext types_;
  DiagnosticBag diags_;
  std::unique_ptr<SemanticAnalyzer> sema_;
};

}  // namespace

// ============================================================================
// Types
// ============================================================================

TEST(RustTypeMapping, Primitives)
{
  EXPECT_EQ(rust_type("int"), "i32");
  EXPECT_EQ(rust_type("i32"), "i32");
  EXPECT_EQ(rust_type("i64"), "i64");
  EXPECT_EQ(rust_type("u32"), "u32");
  EXPECT_EQ(rust_type("u64"), "u64");
  EXPECT_EQ(rust_type("float"), "f64");
  EXPECT_EQ(rust_type("f32"), "f32");
  EXPECT_EQ(rust_type("f64"), "f64");
  EXPECT_EQ(rust_type("bool"), "bool");
  EXPECT_EQ(rust_type("char"), "char");
  EXPECT_EQ(rust_type("void"), "()");
}

TEST(RustTypeMapping, Composites)
{
  EXPECT_EQ(rust_type("int*"), "*mut i32");
  EXPECT_EQ(rust_type("&int"), "&i32");
  EXPECT_EQ(rust_type("&var int"), "&mut i32");
  EXPECT_EQ(rust_type("int[4]"), "[i32; 4]");
  EXPECT_EQ(rust_type("int[]"), "[i32]");
  EXPECT_EQ(rust_type("(int, bool)"), "(i32, bool)");
  EXPECT_EQ(rust_type("Vec<int>"), "Vec<i32>");
  EXPECT_EQ(rust_type("HashMap<String, Vec<u64>>"), "HashMap<String, Vec<u64>>");
  EXPECT_EQ(rust_type("auto"), "_");
  EXPECT_EQ(rust_type("Point"), "Point");
}

TEST(RustTypeMapping, FallibleBecomesResult)
{
  EXPECT_EQ(rust_type("int?"), "Result<i32, Box<dyn std::error::Error>>");
  EXPECT_EQ(rust_type("&var File?"), "&mut Result<File, Box<dyn std::error::Error>>");
}

// ============================================================================
// Expressions
// ============================================================================

TEST(RustExprMapping, BinaryOperatorsAreParenthesized)
{
  EXPECT_EQ(rust_expr("a + b * c"), "(a + (b * c))");
  EXPECT_EQ(rust_expr("(a + b) * c"), "((a + b) * c)");
  EXPECT_EQ(rust_expr("a << 2 | b"), "((a << 2) | b)");
  EXPECT_EQ(rust_expr("a && !b"), "(a && !b)");
}

TEST(RustExprMapping, UnaryOperators)
{
  EXPECT_EQ(rust_expr("-x"), "-x");
  EXPECT_EQ(rust_expr("~mask"), "!mask");
  EXPECT_EQ(rust_expr("&x"), "&x");
  EXPECT_EQ(rust_expr("&var x"), "&mut x");
  EXPECT_EQ(rust_expr("*p"), "*p");
  EXPECT_EQ(rust_expr("-(a + b)"), "-(a + b)");
}

TEST(RustExprMapping, PrefixIncrementAndDecrement)
{
  EXPECT_EQ(rust_expr("++i"), "{ let __tmp = &mut (i); *__tmp += 1; *__tmp }");
  EXPECT_EQ(rust_expr("--i"), "{ let __tmp = &mut (i); *__tmp -= 1; *__tmp }");
}

TEST(RustExprMapping, CastSizeofAndTernary)
{
  EXPECT_EQ(rust_expr("(int)x"), "(x as i32)");
  EXPECT_EQ(rust_expr("(int)(x)"), "(x as i32)");
  EXPECT_EQ(rust_expr("(i64)-1"), "(-1 as i64)");
  EXPECT_EQ(rust_expr("sizeof(Point)"), "std::mem::size_of::<Point>()");
  EXPECT_EQ(rust_expr("x > 0 ? x : -x"), "if x > 0 { x } else { -x }");
}

TEST(RustExprMapping, TypeScopedCalls)
{
  EXPECT_EQ(rust_expr("@Point.origin()"), "Point::origin()");
  EXPECT_EQ(rust_expr("@Vec<int>.new()"), "Vec::<i32>::new()");
  EXPECT_EQ(rust_expr("@Color.Red"), "Color::Red");
}

TEST(RustExprMapping, MacroCalls)
{
  EXPECT_EQ(rust_expr("__println__(\"hi {}\", x)"), "println!(\"hi {}\", x)");
  EXPECT_EQ(rust_expr("__MAX__(a, b)"), "max!(a, b)");
}

TEST(RustExprMapping, LiteralsAndNull)
{
  EXPECT_EQ(rust_expr("NULL"), "Option::None");
  EXPECT_EQ(rust_expr("0xFF"), "0xFF");
  EXPECT_EQ(rust_expr("1_000"), "1_000");
  EXPECT_EQ(rust_expr("2.5"), "2.5");
  EXPECT_EQ(rust_expr("'c'"), "'c'");
  EXPECT_EQ(rust_expr("\"line\\n\""), "\"line\\n\"");
  EXPECT_EQ(rust_expr("true"), "true");
}

TEST(RustExprMapping, StructInitializers)
{
  EXPECT_EQ(rust_expr("(Point){ .x = 1, .y = 2 }"), "Point { x: 1, y: 2 }");
  EXPECT_EQ(rust_expr("Point { .x = 1 }"), "Point { x: 1 }");
  EXPECT_EQ(rust_expr("(Unit){}"), "Unit {}");
}

TEST(RustExprMapping, PostfixForms)
{
  EXPECT_EQ(rust_expr("p->x"), "(*p).x");
  EXPECT_EQ(rust_expr("obj.method(1, 2)"), "obj.method(1, 2)");
  EXPECT_EQ(rust_expr("t.0"), "t.0");
  EXPECT_EQ(rust_expr("v[i + 1]"), "v[(i + 1)]");
  EXPECT_EQ(rust_expr("read()?"), "read()?");
  EXPECT_EQ(rust_expr("(*p).len()"), "(*p).len()");
}

TEST(RustExprMapping, AggregatesAndRanges)
{
  EXPECT_EQ(rust_expr("[1, 2, 3]"), "[1, 2, 3]");
  EXPECT_EQ(rust_expr("[0; 8]"), "[0; 8]");
  EXPECT_EQ(rust_expr("(a, b)"), "(a, b)");
  EXPECT_EQ(rust_expr("0..10"), "0..10");
  EXPECT_EQ(rust_expr("0..=n"), "0..=n");
}

TEST(RustExprMapping, AssignmentAndComma)
{
  EXPECT_EQ(rust_expr("x += 1"), "x += 1");
  EXPECT_EQ(rust_expr("x = y = 0"), "x = y = 0");
  EXPECT_EQ(rust_expr("f(), g()"), "{ f(); g() }");
}

TEST(RustExprMapping, MissingExpressionIsInternalError)
{
  MissingExpr missing;
  EXPECT_THROW((void)RustGenerator{}.generate_expr(&missing), InternalCodegenError);
}

// ============================================================================
// Statements
// ============================================================================

TEST(RustStmtMapping, DeclarationForms)
{
  EXPECT_EQ(rust_stmt("int x = 42;"), "let x: i32 = 42;\n");
  EXPECT_EQ(rust_stmt("let y = 5;"), "let y = 5;\n");
  EXPECT_EQ(rust_stmt("let int y = 5;"), "let y: i32 = 5;\n");
  EXPECT_EQ(rust_stmt("let y: int = 5;"), "let y: i32 = 5;\n");
  EXPECT_EQ(rust_stmt("var int z = 0;"), "let mut z: i32 = 0;\n");
  EXPECT_EQ(rust_stmt("var z = 0;"), "let mut z = 0;\n");
  EXPECT_EQ(rust_stmt("auto w = f();"), "let w = f();\n");
  EXPECT_EQ(rust_stmt("const int MAX = 10;"), "const MAX: i32 = 10;\n");
}

TEST(RustStmtMapping, ConstantWithoutAnyTypeIsInternalError)
{
  auto unit = test_support::parse_stmt("const LIMIT = 10;");
  ASSERT_NE(unit.stmt, nullptr);
  EXPECT_THROW((void)RustGenerator{}.generate_stmt(unit.stmt), InternalCodegenError);
}

TEST(RustStmtMapping, ReturnKeepsBody)
{
  EXPECT_EQ(rust_stmt("return x + y;"), "return (x + y);\n");
  EXPECT_EQ(rust_stmt("return;"), "return;\n");
}

TEST(RustStmtMapping, IfElseChain)
{
  EXPECT_EQ(
    rust_stmt("if (a) { f(); } else if (b) { g(); } else { h(); }"),
    "if a {\n"
    "    f();\n"
    "} else if b {\n"
    "    g();\n"
    "} else {\n"
    "    h();\n"
    "}\n");
}

TEST(RustStmtMapping, LabeledWhileAndBreak)
{
  EXPECT_EQ(
    rust_stmt(".outer: while (x < 10) { break .outer; }"),
    "'outer: while x < 10 {\n"
    "    break 'outer;\n"
    "}\n");
  EXPECT_EQ(rust_stmt("loop { continue; }"), "loop {\n    continue;\n}\n");
}

TEST(RustStmtMapping, CStyleForKeepsStepOnContinue)
{
  EXPECT_EQ(
    rust_stmt("for (var int i = 0; i < 3; i += 1) { if (i == 1) { continue; } f(i); }"),
    "{\n"
    "    let mut i: i32 = 0;\n"
    "    let mut __first = true;\n"
    "    loop {\n"
    "        if !__first {\n"
    "            i += 1;\n"
    "        }\n"
    "        __first = false;\n"
    "        if !(i < 3) {\n"
    "            break;\n"
    "        }\n"
    "        if i == 1 {\n"
    "            continue;\n"
    "        }\n"
    "        f(i);\n"
    "    }\n"
    "}\n");
}

TEST(RustStmtMapping, LabeledForWithoutClauses)
{
  EXPECT_EQ(
    rust_stmt(".spin: for (;;) { break .spin; }"),
    "{\n"
    "    'spin: loop {\n"
    "        break 'spin;\n"
    "    }\n"
    "}\n");
}

TEST(RustStmtMapping, ForIn)
{
  EXPECT_EQ(rust_stmt("for (x in 0..10) { f(x); }"), "for x in 0..10 {\n    f(x);\n}\n");
}

TEST(RustStmtMapping, SwitchBecomesMatch)
{
  EXPECT_EQ(
    rust_stmt("switch (n) { case 1, 2: f(); default: g(); }"),
    "match n {\n"
    "    1 | 2 => {\n"
    "        f();\n"
    "    }\n"
    "    _ => {\n"
    "        g();\n"
    "    }\n"
    "}\n");
  expect_contains(rust_stmt("switch (n) { case 1: f(); }"), "    _ => {}\n");
}

TEST(RustStmtMapping, IndentWidthOption)
{
  auto unit = test_support::parse_stmt("while (go) { f(); }");
  ASSERT_NE(unit.stmt, nullptr);
  CodegenOptions options;
  options.indent_width = 2;
  EXPECT_EQ(RustGenerator(options).generate_stmt(unit.stmt), "while go {\n  f();\n}\n");
}

// ============================================================================
// Items
// ============================================================================

TEST_F(RustGenTest, AliasChainExpandsInSignature)
{
  EXPECT_EQ(
    generate("typedef int A; typedef A B; int f(B x) { return x; }"),
    "pub type A = i32;\n"
    "\n"
    "pub type B = A;\n"
    "\n"
    "pub fn f(x: i32) -> i32 {\n"
    "    return x;\n"
    "}\n");
}

TEST_F(RustGenTest, StaticItemsArePrivate)
{
  const auto out = generate(R"(
    static int helper() { return 1; }
    int api() { return helper(); }
    static typedef int Hidden;
  )");
  expect_contains(out, "fn helper() -> i32 {");
  expect_not_contains(out, "pub fn helper");
  expect_contains(out, "pub fn api() -> i32 {");
  expect_contains(out, "\ntype Hidden = i32;");
}

TEST_F(RustGenTest, VoidReturnIsOmitted)
{
  EXPECT_EQ(generate("void run() { }"), "pub fn run() {\n}\n");
}

TEST_F(RustGenTest, StructWithFieldsAndMethods)
{
  const auto out = generate(R"(
    struct Point {
      int x;
      static int y;
      int sum(&self) { return self.x + self.y; }
      void reset(&var self) { self.x = 0; }
    };
  )");
  EXPECT_EQ(
    out,
    "pub struct Point {\n"
    "    pub x: i32,\n"
    "    y: i32,\n"
    "}\n"
    "\n"
    "impl Point {\n"
    "    pub fn sum(&self) -> i32 {\n"
    "        return (self.x + self.y);\n"
    "    }\n"
    "\n"
    "    pub fn reset(&mut self) {\n"
    "        self.x = 0;\n"
    "    }\n"
    "}\n");
}

TEST_F(RustGenTest, ImplBlocksForOneTypeAreMerged)
{
  const auto out = generate(R"(
    struct Point { int x; int sum(&self) { return self.x; } };
    typedef struct { int dx(&self) { return self.x; } } @Point.geometry;
    int g() { return 1; }
    typedef struct { void clear(&var self) { self.x = 0; } } @Point;
  )");
  EXPECT_EQ(count_of(out, "impl Point {"), 1U) << out;
  const auto sum = out.find("pub fn sum");
  const auto dx = out.find("pub fn dx");
  const auto clear = out.find("pub fn clear");
  const auto g = out.find("pub fn g");
  ASSERT_NE(sum, std::string::npos);
  ASSERT_NE(dx, std::string::npos);
  ASSERT_NE(clear, std::string::npos);
  EXPECT_LT(sum, dx);
  EXPECT_LT(dx, clear);
  EXPECT_LT(clear, g);
}

TEST_F(RustGenTest, ImplBlocksOnAnAliasMergeWithTheStruct)
{
  const auto out = generate(R"(
    struct P { int x; };
    typedef P Alias;
    typedef struct { int get(&self) { return self.x; } } @Alias;
    typedef struct { void clear(&var self) { self.x = 0; } } @P;
  )");
  EXPECT_EQ(count_of(out, "impl P {"), 1U) << out;
  EXPECT_EQ(count_of(out, "impl Alias"), 0U) << out;
  const auto get = out.find("pub fn get");
  const auto clear = out.find("pub fn clear");
  ASSERT_NE(get, std::string::npos);
  ASSERT_NE(clear, std::string::npos);
  EXPECT_LT(get, clear);
}

TEST_F(RustGenTest, ImplEmittedAtFirstBlockWhenStructHasNoMethods)
{
  const auto out = generate(R"(
    struct S { int v; };
    int before() { return 0; }
    typedef struct { int get(&self) { return self.v; } } @S;
  )");
  const auto before = out.find("pub fn before");
  const auto impl = out.find("impl S {");
  ASSERT_NE(impl, std::string::npos);
  EXPECT_LT(before, impl);
  expect_contains(out, "impl S {\n    pub fn get(&self) -> i32 {\n        return self.v;\n    }\n}\n");
}

TEST_F(RustGenTest, EnumDiscriminants)
{
  EXPECT_EQ(
    generate("enum Color { Red, Green = 5, Blue }"),
    "pub enum Color {\n"
    "    Red,\n"
    "    Green = 5,\n"
    "    Blue,\n"
    "}\n");
}

TEST_F(RustGenTest, DocsAndAttributesPassThrough)
{
  const auto out = generate(R"(
/// A point.
#[derive(Debug, Clone)]
struct P { int x; };
)");
  expect_contains(out, "/// A point.\n#[derive(Debug, Clone)]\npub struct P {\n");
}

TEST_F(RustGenTest, ModuleDocsComeFirst)
{
  const auto out = generate("//! Demo module.\nvoid f() { }\n");
  EXPECT_EQ(out.rfind("//! Demo module.\n\n", 0), 0U) << out;
}

TEST_F(RustGenTest, MacroDefinitionBecomesMacroRules)
{
  EXPECT_EQ(
    generate("#define __MAX__(a, b) ((a) > (b) ? (a) : (b))\n"),
    "macro_rules! max {\n"
    "    ($a:expr, $b:expr) => {\n"
    "        ( ( $a ) > ( $b ) ? ( $a ) : ( $b ) )\n"
    "    };\n"
    "}\n");
}

TEST_F(RustGenTest, MacroNamesAvoidRustKeywords)
{
  EXPECT_EQ(RustGenerator::macro_name("__TYPE__"), "type_macro");
  EXPECT_EQ(RustGenerator::macro_name("__Debug_Log__"), "debug_log");
  const auto out = generate("#define __TWICE__(x) __ADD__(x, x)\n");
  expect_contains(out, "add! ( $x , $x )");
}

TEST_F(RustGenTest, ExternBlockIsPassedThrough)
{
  EXPECT_EQ(
    generate("extern \"C\" { int abs(int x); }"),
    "extern \"C\" {\n"
    "    int abs ( int x ) ;\n"
    "}\n");
}

// ============================================================================
// Closures
// ============================================================================

TEST_F(RustGenTest, ReadOnlyCaptureIsPlainClosure)
{
  const auto out = generate(R"(
    int outer() {
      int x = 42;
      int add_x(int y) { return x + y; }
      let result = add_x(10);
      return result;
    }
  )");
  expect_contains(out, "    let x: i32 = 42;\n");
  expect_contains(out, "    let add_x = |y: i32| -> i32 {\n        return (x + y);\n    };\n");
  expect_contains(out, "    let result = add_x(10);\n");
}

TEST_F(RustGenTest, MutableCaptureMakesBindingMutable)
{
  const auto out = generate(R"(
    int main() {
      var int count = 0;
      void bump() { count = count + 1; }
      bump();
      return count;
    }
  )");
  expect_contains(out, "let mut bump = || {\n");
  expect_not_contains(out, "-> ()");
}

TEST_F(RustGenTest, MoveCaptureMakesMoveClosure)
{
  const auto out = generate(R"(
    void take(String s) { }
    void main() {
      String s = @String.from("hi");
      void consume() { take(s); }
      consume();
    }
  )");
  expect_contains(out, "let consume = move || {\n");
}

TEST_F(RustGenTest, OutputIsDeterministic)
{
  const std::string src = R"(
    typedef int Id;
    struct User { Id id; Id get(&self) { return self.id; } };
    typedef struct { void set(&var self, Id v) { self.id = v; } } @User.mutators;
    int main() {
      var int total = 0;
      void add(int v) { total += v; }
      for (i in 0..3) { add(i); }
      return total;
    }
  )";
  const auto first = generate(src);
  RustGenerator again(options_, &sema_->environment());
  EXPECT_EQ(again.generate(*unit_.program), first);
}
