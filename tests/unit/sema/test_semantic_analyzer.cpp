// tests/unit/sema/test_semantic_analyzer.cpp - Unit tests for the semantic analyzer
//
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <string>
#include <string_view>

#include "crusty/basic/casting.hpp"
#include "crusty/sema/semantic_analyzer.hpp"
#include "crusty/test_support/parse_helpers.hpp"

using namespace crusty;

namespace
{

class SemaTest : public ::testing::Test
{
protected:
  /// Parse and analyze `src`; returns analyze()'s verdict.
  bool analyze(std::string src)
  {
    unit_ = test_support::parse(std::move(src));
    EXPECT_FALSE(unit_.diags.has_errors()) << "parse failed: " << first_message(unit_.diags);
    if (unit_.program == nullptr) return false;
    sema_ = std::make_unique<SemanticAnalyzer>(*unit_.ast, types_, diags_);
    return sema_->analyze(*unit_.program);
  }

  [[nodiscard]] bool has_code(std::string_view code) const { return diags_.has_code(code); }

  [[nodiscard]] bool has_message(std::string_view needle) const
  {
    return std::any_of(diags_.begin(), diags_.end(), [&](const Diagnostic & d) {
      return d.message.find(needle) != std::string::npos;
    });
  }

  static std::string first_message(const DiagnosticBag & bag)
  {
    return bag.empty() ? std::string() : bag.all().front().message;
  }

  [[nodiscard]] CaptureMode capture_mode(std::string_view fn, std::string_view var) const
  {
    const auto captures = sema_->get_captures(fn);
    EXPECT_TRUE(captures.has_value()) << "no nested function " << fn;
    if (captures) {
      for (const auto & c : *captures) {
        if (c.name == var) return c.mode;
      }
    }
    ADD_FAILURE() << fn << " does not capture " << var;
    return CaptureMode::ReadOnly;
  }

  test_support::TestParseUnit unit_;
  TypeContext types_;
  DiagnosticBag diags_;
  std::unique_ptr<SemanticAnalyzer> sema_;
};

}  // namespace

// ============================================================================
// Type aliases
// ============================================================================

TEST_F(SemaTest, AliasChainResolvesAndFunctionIsAccepted)
{
  ASSERT_TRUE(analyze("typedef int A; typedef A B; int f(B x) { return x; }"))
    << first_message(diags_);

  const auto & env = sema_->environment();
  EXPECT_EQ(env.resolve_type(types_.get_named_type("B")), types_.int_type());
  EXPECT_EQ(env.resolve_type(types_.get_named_type("A")), types_.int_type());
}

TEST_F(SemaTest, SelfCycleThroughIntermediateIsCircular)
{
  EXPECT_FALSE(analyze("typedef int A; typedef A A;"));
  EXPECT_TRUE(has_code(diag_code::k_circular_type_alias));
  EXPECT_FALSE(has_code(diag_code::k_duplicate_definition));
}

TEST_F(SemaTest, RedefinitionClosingLongCycleIsCircular)
{
  EXPECT_FALSE(analyze("typedef int B; typedef B C; typedef C D; typedef D B;"));
  EXPECT_EQ(diags_.count_code(diag_code::k_circular_type_alias), 1U);
  EXPECT_FALSE(has_code(diag_code::k_duplicate_definition));
}

TEST_F(SemaTest, MutualAliasCycleReportsBothMembers)
{
  EXPECT_FALSE(analyze("typedef B A; typedef A B;"));
  EXPECT_EQ(diags_.count_code(diag_code::k_circular_type_alias), 2U);
}

TEST_F(SemaTest, UndefinedTypeInSignature)
{
  EXPECT_FALSE(analyze("int f(Foo x) { return 0; }"));
  EXPECT_TRUE(has_code(diag_code::k_undefined_type));
  EXPECT_TRUE(has_message("cannot find type `Foo` in this scope"));
}

TEST_F(SemaTest, PreludeTypesNeedNoDeclaration)
{
  EXPECT_TRUE(analyze("void f(Vec<int> v, String s, Option<u64> o) { }")) << first_message(diags_);
}

TEST_F(SemaTest, SelfOutsideStructIsUndefined)
{
  EXPECT_FALSE(analyze("Self make() { return make(); }"));
  EXPECT_TRUE(has_code(diag_code::k_undefined_type));
}

// ============================================================================
// Declarations and scopes
// ============================================================================

TEST_F(SemaTest, DuplicateTopLevelFunction)
{
  EXPECT_FALSE(analyze("void f() { } void f() { }"));
  EXPECT_TRUE(has_code(diag_code::k_duplicate_definition));
}

TEST_F(SemaTest, RedeclarationInSameBlockIsDuplicate)
{
  EXPECT_FALSE(analyze("void f() { int x = 1; int x = 2; }"));
  EXPECT_TRUE(has_code(diag_code::k_duplicate_definition));
}

TEST_F(SemaTest, ShadowingInInnerBlockIsAllowed)
{
  EXPECT_TRUE(analyze("int f() { int x = 1; { int x = 2; } return x; }")) << first_message(diags_);
}

TEST_F(SemaTest, UndefinedVariable)
{
  EXPECT_FALSE(analyze("int f() { return y; }"));
  EXPECT_TRUE(has_code(diag_code::k_undefined_variable));
  EXPECT_TRUE(has_message("cannot find value `y` in this scope"));
}

TEST_F(SemaTest, AllDeclarationFormsAreAccepted)
{
  EXPECT_TRUE(analyze(R"(
    void f() {
      int a = 1;
      let int b = 2;
      let c = 3;
      let d: i64 = 4;
      var int e = 5;
      const int LIMIT = 6;
      e = a + b + c + LIMIT;
    }
  )")) << first_message(diags_);
}

// ============================================================================
// Expression typing
// ============================================================================

TEST_F(SemaTest, InitializerMismatch)
{
  EXPECT_FALSE(analyze("void f() { int x = true; }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
  EXPECT_TRUE(has_message("mismatched types: expected `int`, found `bool`"));
}

TEST_F(SemaTest, IntegerLiteralDoesNotInitializeFloat)
{
  EXPECT_FALSE(analyze("void f() { float x = 1; }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
}

TEST_F(SemaTest, IntegerLiteralFitsEveryIntegerWidth)
{
  EXPECT_TRUE(analyze("void f() { u64 a = 1; i64 b = 2; u32 c = 0xff; f32 d = 1.5; }"))
    << first_message(diags_);
}

TEST_F(SemaTest, ReturnMismatch)
{
  EXPECT_FALSE(analyze("bool f() { return 1; }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
}

TEST_F(SemaTest, BareReturnInValueFunction)
{
  EXPECT_FALSE(analyze("int f() { return; }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
}

TEST_F(SemaTest, ConditionMustBeBool)
{
  EXPECT_FALSE(analyze("void f() { if (1) { } }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
  EXPECT_TRUE(has_message("expected `bool`"));
}

TEST_F(SemaTest, AssignmentToImmutableBinding)
{
  EXPECT_FALSE(analyze("void f() { int x = 1; x = 2; }"));
  EXPECT_TRUE(has_code(diag_code::k_invalid_operation));
  EXPECT_TRUE(has_message("cannot assign to immutable variable `x`"));
}

TEST_F(SemaTest, AssignmentToMutableBinding)
{
  EXPECT_TRUE(analyze("void f() { var int x = 1; x = 2; x += 3; ++x; }"))
    << first_message(diags_);
}

TEST_F(SemaTest, CallArityAndArgumentTypes)
{
  EXPECT_FALSE(analyze("int add(int a, int b) { return a + b; } void f() { add(1); }"));
  EXPECT_TRUE(has_message("function `add` takes 2 arguments but 1 was supplied"));

  diags_ = DiagnosticBag();
  EXPECT_FALSE(analyze("int add(int a, int b) { return a + b; } void f() { add(1, true); }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
}

TEST_F(SemaTest, CallingNonFunction)
{
  EXPECT_FALSE(analyze("void f() { int x = 1; x(); }"));
  EXPECT_TRUE(has_message("`x` is not a function"));
}

TEST_F(SemaTest, ResolvedTypesAreAttached)
{
  ASSERT_TRUE(analyze("typedef int Id; Id f(Id x) { return x; }")) << first_message(diags_);
  const auto * fn = cast<FunctionDecl>(unit_.program->items[1]);
  const auto * ret = cast<ReturnStmt>(fn->body->stmts[0]);
  ASSERT_NE(ret->value->resolvedType, nullptr);
  EXPECT_EQ(sema_->environment().resolve_type(ret->value->resolvedType), types_.int_type());
}

TEST_F(SemaTest, FallibleReturnAndPropagation)
{
  EXPECT_TRUE(analyze(R"(
    int? parse(i32 v) { return v; }
    int? twice(i32 v) { int x = parse(v)?; return x * 2; }
  )")) << first_message(diags_);
}

TEST_F(SemaTest, ResultConstructorsAreInScope)
{
  EXPECT_TRUE(analyze(R"(
    int? check(int v) { if (v < 0) { return Err("neg"); } return Ok(v); }
    int? twice(int v) { int x = check(v)?; return Ok(x * 2); }
  )")) << first_message(diags_);
}

TEST_F(SemaTest, OptionConstructorsAreInScope)
{
  EXPECT_TRUE(analyze(R"(
    Option<int> positive(int v) { if (v <= 0) { return None; } return Some(v); }
  )")) << first_message(diags_);
}

TEST_F(SemaTest, DeclaredNameShadowsPreludeConstructor)
{
  EXPECT_FALSE(analyze("int Some(int v) { return v; } bool f() { return Some(1); }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
}

// ============================================================================
// Return paths
// ============================================================================

TEST_F(SemaTest, ValueFunctionWithEmptyBodyIsRejected)
{
  EXPECT_FALSE(analyze("int f() {}"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
  EXPECT_TRUE(has_message("function `f` may reach its end without returning `int`"));
}

TEST_F(SemaTest, IfWithoutElseCanFallOffTheEnd)
{
  EXPECT_FALSE(analyze("int f(int v) { if (v > 0) { return 1; } }"));
  EXPECT_TRUE(has_message("may reach its end"));
}

TEST_F(SemaTest, EveryBranchReturning)
{
  EXPECT_TRUE(analyze(R"(
    int sign(int v) {
      if (v > 0) { return 1; } else if (v < 0) { return -1; } else { return 0; }
    }
    int pick(int v) {
      switch (v) { case 1: return 10; default: return 0; }
    }
    int spin() { loop { } }
    int first(int n) {
      .outer: loop { for (i in 0..n) { break; } return n; }
    }
    void nothing() { }
  )")) << first_message(diags_);
}

TEST_F(SemaTest, LoopLeftByBreakCanFallOffTheEnd)
{
  EXPECT_FALSE(analyze("int f() { loop { break; } }"));
  EXPECT_TRUE(has_message("may reach its end"));
}

TEST_F(SemaTest, LabeledBreakFromInnerLoopLeavesOuterLoop)
{
  EXPECT_FALSE(analyze("int g() { .outer: loop { loop { break .outer; } } }"));
  EXPECT_TRUE(has_message("function `g` may reach its end"));
}

TEST_F(SemaTest, SwitchWithoutDefaultCanFallOffTheEnd)
{
  EXPECT_FALSE(analyze("int f(int v) { switch (v) { case 1: return 1; } }"));
  EXPECT_TRUE(has_message("may reach its end"));
}

TEST_F(SemaTest, NestedValueFunctionNeedsReturn)
{
  EXPECT_FALSE(analyze("int f() { int inner() { } return 0; }"));
  EXPECT_TRUE(has_message("function `inner` may reach its end"));
}

TEST_F(SemaTest, PropagationOnPlainValueIsRejected)
{
  EXPECT_FALSE(analyze("int f(int v) { return v?; }"));
  EXPECT_TRUE(has_message("the `?` operator cannot be applied to type `int`"));
}

// ============================================================================
// Structs, enums, impl blocks
// ============================================================================

TEST_F(SemaTest, StructFieldsAndMethods)
{
  EXPECT_TRUE(analyze(R"(
    struct Point {
      int x;
      int y;
      int sum(&self) { return self.x + self.y; }
      void shift(&var self, int d) { self.x += d; }
    };
    int f() {
      var Point p = (Point){ .x = 1, .y = 2 };
      p.shift(3);
      return p.sum();
    }
  )")) << first_message(diags_);
}

TEST_F(SemaTest, UnknownFieldAccess)
{
  EXPECT_FALSE(analyze("struct P { int x; }; int f(P p) { return p.z; }"));
  EXPECT_TRUE(has_message("no field `z` on type `P`"));
}

TEST_F(SemaTest, UnknownFieldInInitializer)
{
  EXPECT_FALSE(analyze("struct P { int x; }; void f() { P p = (P){ .x = 1, .w = 2 }; }"));
  EXPECT_TRUE(has_message("struct `P` has no field named `w`"));
}

TEST_F(SemaTest, AssignmentThroughSharedSelf)
{
  EXPECT_FALSE(analyze("struct P { int x; void set(&self) { self.x = 1; } };"));
  EXPECT_TRUE(has_code(diag_code::k_invalid_operation));
}

TEST_F(SemaTest, EnumVariants)
{
  EXPECT_TRUE(analyze("enum Color { Red, Green }; Color f() { return @Color.Red; }"))
    << first_message(diags_);

  diags_ = DiagnosticBag();
  EXPECT_FALSE(analyze("enum Color { Red, Green }; Color f() { return @Color.Blue; }"));
  EXPECT_TRUE(has_message("no variant `Blue` in enum `Color`"));
}

TEST_F(SemaTest, ImplBlockMethodsAreCallable)
{
  EXPECT_TRUE(analyze(R"(
    struct Counter { int n; };
    typedef struct {
      Self new() { return (Counter){ .n = 0 }; }
      int get(&self) { return self.n; }
    } @Counter;
    int f() { Counter c = @Counter.new(); return c.get(); }
  )")) << first_message(diags_);
}

TEST_F(SemaTest, ImplBlockOnAliasExtendsTheStruct)
{
  EXPECT_TRUE(analyze(R"(
    struct P { int x; };
    typedef P Alias;
    typedef struct { int get(&self) { return self.x; } } @Alias;
    int f(P p) { return p.get(); }
  )")) << first_message(diags_);
}

TEST_F(SemaTest, SameMethodThroughAliasAndStructIsDuplicate)
{
  EXPECT_FALSE(analyze(R"(
    struct P { int x; };
    typedef P Alias;
    typedef struct { int get(&self) { return 1; } } @Alias;
    typedef struct { int get(&self) { return 2; } } @P;
  )"));
  EXPECT_EQ(diags_.count_code(diag_code::k_duplicate_definition), 1U);
  EXPECT_TRUE(has_message("duplicate definitions with name `get` for type `P`"));
}

TEST_F(SemaTest, ImplBlockForUndeclaredType)
{
  EXPECT_FALSE(analyze("typedef struct { void f(&self) { } } @Ghost;"));
  EXPECT_TRUE(has_code(diag_code::k_undefined_type));
}

TEST_F(SemaTest, MacroFormFunctionName)
{
  EXPECT_FALSE(analyze("void __helper__() { }"));
  EXPECT_TRUE(has_code(diag_code::k_invalid_operation));
}

// ============================================================================
// Loops and jumps
// ============================================================================

TEST_F(SemaTest, BreakOutsideLoop)
{
  EXPECT_FALSE(analyze("void f() { break; }"));
  EXPECT_TRUE(has_message("`break` outside of a loop"));
}

TEST_F(SemaTest, LabeledJumps)
{
  EXPECT_TRUE(analyze(R"(
    void f() {
      .outer: while (true) {
        for (int i = 0; i < 10; ++i) {
          if (i == 3) { continue .outer; }
          break .outer;
        }
      }
    }
  )")) << first_message(diags_);

  diags_ = DiagnosticBag();
  EXPECT_FALSE(analyze("void f() { loop { break .nowhere; } }"));
  EXPECT_TRUE(has_message("use of undeclared label `.nowhere`"));
}

TEST_F(SemaTest, ForInOverRangeBindsInteger)
{
  EXPECT_TRUE(analyze("int f() { var int s = 0; for (i in 0..10) { s += i; } return s; }"))
    << first_message(diags_);
}

TEST_F(SemaTest, SwitchCaseValuesMatchSubject)
{
  EXPECT_FALSE(analyze("void f(int v) { switch (v) { case true: return; default: return; } }"));
  EXPECT_TRUE(has_code(diag_code::k_type_mismatch));
}

// ============================================================================
// Nested functions and captures
// ============================================================================

TEST_F(SemaTest, ReadOnlyCapture)
{
  ASSERT_TRUE(analyze(R"(
    int main() {
      int x = 10;
      int add_x(int y) { return x + y; }
      int result = add_x(5);
      return result;
    }
  )")) << first_message(diags_);

  const auto captures = sema_->get_captures("add_x");
  ASSERT_TRUE(captures.has_value());
  ASSERT_EQ(captures->size(), 1U);
  EXPECT_EQ((*captures)[0].name, "x");
  EXPECT_EQ((*captures)[0].mode, CaptureMode::ReadOnly);
}

TEST_F(SemaTest, MutableCapture)
{
  ASSERT_TRUE(analyze(R"(
    int main() {
      var int count = 0;
      void bump() { count = count + 1; }
      bump();
      return count;
    }
  )")) << first_message(diags_);
  EXPECT_EQ(capture_mode("bump", "count"), CaptureMode::Mutable);
}

TEST_F(SemaTest, CapturedImmutableCannotBeAssigned)
{
  EXPECT_FALSE(analyze(R"(
    void main() {
      int count = 0;
      void bump() { count += 1; }
    }
  )"));
  EXPECT_TRUE(has_message("cannot assign to immutable variable `count`"));
}

TEST_F(SemaTest, MoveCaptureWhenNotUsedAfterwards)
{
  ASSERT_TRUE(analyze(R"(
    void take(String s) { }
    void main() {
      String s = @String.from("hi");
      void consume() { take(s); }
      consume();
    }
  )")) << first_message(diags_);
  EXPECT_EQ(capture_mode("consume", "s"), CaptureMode::Move);
}

TEST_F(SemaTest, ConsumedButUsedLaterStaysReadOnly)
{
  ASSERT_TRUE(analyze(R"(
    void take(String s) { }
    void main() {
      String s = @String.from("hi");
      void consume() { take(s); }
      consume();
      take(s);
    }
  )")) << first_message(diags_);
  EXPECT_EQ(capture_mode("consume", "s"), CaptureMode::ReadOnly);
}

TEST_F(SemaTest, CopyTypesAreNeverMoved)
{
  ASSERT_TRUE(analyze(R"(
    void take(int v) { }
    void main() {
      int n = 3;
      void consume() { take(n); }
      consume();
    }
  )")) << first_message(diags_);
  EXPECT_EQ(capture_mode("consume", "n"), CaptureMode::ReadOnly);
}

TEST_F(SemaTest, MutableWinsOverMove)
{
  ASSERT_TRUE(analyze(R"(
    void take(String s) { }
    void main() {
      var String s = @String.new();
      void reset_and_take() {
        s = @String.from("x");
        take(s);
      }
      reset_and_take();
    }
  )")) << first_message(diags_);
  EXPECT_EQ(capture_mode("reset_and_take", "s"), CaptureMode::Mutable);
}

TEST_F(SemaTest, CallingMutatingMethodIsMutableCapture)
{
  ASSERT_TRUE(analyze(R"(
    struct Counter { int n; void inc(&var self) { self.n += 1; } };
    void main() {
      var Counter c = (Counter){ .n = 0 };
      void step() { c.inc(); }
      step();
    }
  )")) << first_message(diags_);
  EXPECT_EQ(capture_mode("step", "c"), CaptureMode::Mutable);
}

TEST_F(SemaTest, CallingMutatingClosureIsMutableCapture)
{
  ASSERT_TRUE(analyze(R"(
    void main() {
      var int n = 0;
      void bump() { n += 1; }
      void twice() { bump(); bump(); }
      twice();
    }
  )")) << first_message(diags_);
  EXPECT_EQ(capture_mode("twice", "bump"), CaptureMode::Mutable);
}

TEST_F(SemaTest, CapturesFollowFirstReferenceOrder)
{
  ASSERT_TRUE(analyze(R"(
    int main() {
      int a = 1;
      int b = 2;
      int c = 3;
      int f() { return c + a + b + a; }
      return f();
    }
  )")) << first_message(diags_);

  const auto captures = sema_->get_captures("f");
  ASSERT_TRUE(captures.has_value());
  ASSERT_EQ(captures->size(), 3U);
  EXPECT_EQ((*captures)[0].name, "c");
  EXPECT_EQ((*captures)[1].name, "a");
  EXPECT_EQ((*captures)[2].name, "b");
}

TEST_F(SemaTest, ParametersAndLocalsAreNotCaptures)
{
  ASSERT_TRUE(analyze(R"(
    int main() {
      int x = 1;
      int f(int x) { int y = x; return y; }
      return f(2);
    }
  )")) << first_message(diags_);
  const auto captures = sema_->get_captures("f");
  ASSERT_TRUE(captures.has_value());
  EXPECT_TRUE(captures->empty());
}

TEST_F(SemaTest, ForwardReferencedCaptureIsViolation)
{
  EXPECT_FALSE(analyze(R"(
    int main() {
      int get() { return later; }
      int later = 5;
      return get();
    }
  )"));
  EXPECT_TRUE(has_code(diag_code::k_capture_violation));
  EXPECT_FALSE(has_code(diag_code::k_undefined_variable));
}

TEST_F(SemaTest, NestedFunctionInsideNestedFunction)
{
  EXPECT_FALSE(analyze(R"(
    void main() {
      void outer() {
        void inner() { }
      }
    }
  )"));
  EXPECT_TRUE(has_code(diag_code::k_capture_violation));
}

TEST_F(SemaTest, StaticNestedFunction)
{
  EXPECT_FALSE(analyze("void main() { static void helper() { } }"));
  EXPECT_TRUE(has_code(diag_code::k_visibility_error));
}

TEST_F(SemaTest, NestedFunctionCalledBeforeDeclaration)
{
  EXPECT_FALSE(analyze(R"(
    void main() {
      helper();
      void helper() { }
    }
  )"));
  EXPECT_TRUE(has_message("`helper` is used before its declaration"));
}

TEST_F(SemaTest, RecursiveNestedFunction)
{
  EXPECT_TRUE(analyze(R"(
    int main() {
      int fact(int n) { return n <= 1 ? 1 : n * fact(n - 1); }
      return fact(5);
    }
  )")) << first_message(diags_);
  const auto captures = sema_->get_captures("fact");
  ASSERT_TRUE(captures.has_value());
  EXPECT_TRUE(captures->empty());
}

TEST_F(SemaTest, UnknownNestedFunctionHasNoCaptures)
{
  ASSERT_TRUE(analyze("void main() { }"));
  EXPECT_FALSE(sema_->get_captures("nothing").has_value());
}
