// tests/unit/basic/test_diagnostics.cpp - Source positions, diagnostic bag and printer
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "crusty/basic/diagnostic.hpp"
#include "crusty/basic/diagnostic_printer.hpp"
#include "crusty/basic/source_manager.hpp"

using namespace crusty;

// ============================================================================
// SourceManager
// ============================================================================

TEST(SourceManager, LineColumnIsOneBased)
{
  const SourceManager sm("ab\ncd\n\nef");
  EXPECT_EQ(sm.get_line_count(), 4U);

  const auto first = sm.get_line_column(0);
  EXPECT_EQ(first.line, 1U);
  EXPECT_EQ(first.column, 1U);

  const auto d = sm.get_line_column(4);
  EXPECT_EQ(d.line, 2U);
  EXPECT_EQ(d.column, 2U);

  const auto e = sm.get_line_column(7);
  EXPECT_EQ(e.line, 4U);
  EXPECT_EQ(e.column, 1U);

  EXPECT_FALSE(sm.get_line_column(SourceLocation{}).is_valid());
}

TEST(SourceManager, LinesDropTheirTerminators)
{
  const SourceManager sm("first\r\nsecond\n");
  EXPECT_EQ(sm.get_line(0), "first");
  EXPECT_EQ(sm.get_line(1), "second");
  EXPECT_EQ(sm.get_line(2), "");
  EXPECT_EQ(sm.get_line(7), "");
}

TEST(SourceManager, SlicesAreClamped)
{
  const SourceManager sm("let value = 1;");
  EXPECT_EQ(sm.get_slice(SourceRange(4, 9)), "value");
  EXPECT_EQ(sm.get_slice(SourceRange(11, 400)), " 1;");
  EXPECT_EQ(sm.get_slice(SourceRange{}), "");
  EXPECT_EQ(sm.get_slice(SourceRange(9, 4)), "");
}

TEST(SourceManager, FullRangeSpansLines)
{
  const SourceManager sm("a\nbcd\nef");
  const auto fr = sm.get_full_range(SourceRange(3, 7));
  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2U);
  EXPECT_EQ(fr.start_column, 2U);
  EXPECT_EQ(fr.end_line, 3U);
  EXPECT_EQ(fr.end_column, 2U);
}

TEST(SourceManager, DisplayName)
{
  EXPECT_EQ(SourceManager("x").get_display_name(), "<input>");
  EXPECT_EQ(SourceManager("src/a.crst", "x").get_display_name(), "src/a.crst");
}

TEST(SourceRange, JoinCoversBoth)
{
  const auto joined = join_ranges(SourceRange(8, 10), SourceRange(2, 4));
  EXPECT_EQ(joined.get_begin().get_offset(), 2U);
  EXPECT_EQ(joined.get_end().get_offset(), 10U);
  EXPECT_EQ(join_ranges(SourceRange{}, SourceRange(1, 2)), SourceRange(1, 2));
}

// ============================================================================
// DiagnosticBag
// ============================================================================

TEST(DiagnosticBag, BuilderCommitsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(SourceRange(0, 3), "undefined type 'Foo'", "not declared");
    builder.with_code(diag_code::k_undefined_type);
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = bag.all().front();
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E0101");
  ASSERT_EQ(d.labels.size(), 1U);
  EXPECT_EQ(d.labels[0].message, "not declared");
  EXPECT_EQ(d.primary_range(), SourceRange(0, 3));
}

TEST(DiagnosticBag, SeverityQueries)
{
  DiagnosticBag bag;
  bag.report_warning(SourceRange(0, 1), "unused");
  bag.report_hint(SourceRange(0, 1), "consider");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_TRUE(bag.errors().empty());

  bag.report_error(SourceRange(1, 2), "a").with_code(diag_code::k_type_mismatch);
  bag.report_error(SourceRange(2, 3), "b").with_code(diag_code::k_type_mismatch);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 2U);
  EXPECT_EQ(bag.count_code(diag_code::k_type_mismatch), 2U);
  EXPECT_FALSE(bag.has_code(diag_code::k_parse_error));
}

TEST(DiagnosticBag, SecondaryLabelsAndFixits)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange(10, 12), "duplicate definition of 'x'")
    .with_secondary_label(SourceRange(0, 2), "first defined here")
    .with_fixit(SourceRange(10, 10), "_2")
    .with_help("rename one of them");

  const Diagnostic & d = bag.all().front();
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d.primary_range(), SourceRange(10, 12));
  ASSERT_EQ(d.fixits.size(), 1U);
  EXPECT_EQ(d.fixits[0].replacement_text, "_2");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "rename one of them");
}

TEST(DiagnosticBag, MergeAppends)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error(SourceRange(0, 1), "first");
  b.report_error(SourceRange(1, 2), "second");
  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2U);
  EXPECT_EQ(a.all()[1].message, "second");
}

// ============================================================================
// DiagnosticPrinter
// ============================================================================

TEST(DiagnosticPrinter, RendersRustStyleWithoutColor)
{
  const SourceManager sm("unit.crst", "int a;\nFoo x = make();\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(7, 10), "undefined type 'Foo'", "not declared")
    .with_code(diag_code::k_undefined_type)
    .with_help("declare it");

  std::ostringstream out;
  DiagnosticPrinter printer(out, sm, false);
  printer.print_all(bag);

  const std::string expected =
    "error[E0101]: undefined type 'Foo'\n"
    "  --> unit.crst:2:1\n"
    "      |\n"
    "    2 | Foo x = make();\n"
    "      | ^^^ not declared\n"
    "      |\n"
    "   = help: declare it\n"
    "\n";
  EXPECT_EQ(out.str(), expected);
}

TEST(DiagnosticPrinter, MarkerFollowsColumn)
{
  const SourceManager sm("t.crst", "let y = zz;\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(8, 10), "undefined variable 'zz'");

  std::ostringstream out;
  DiagnosticPrinter(out, sm, false).print_all(bag);
  EXPECT_NE(out.str().find("error: undefined variable 'zz'\n"), std::string::npos);
  EXPECT_NE(out.str().find("  --> t.crst:1:9\n"), std::string::npos);
  EXPECT_NE(out.str().find("      |         ^^\n"), std::string::npos) << out.str();
}

TEST(DiagnosticPrinter, OrdersByLocation)
{
  const SourceManager sm("o.crst", "aaa\nbbb\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(4, 5), "second");
  bag.report_warning(SourceRange(0, 1), "first");

  std::ostringstream out;
  DiagnosticPrinter(out, sm, false).print_all(bag);
  const std::string text = out.str();
  const auto first = text.find("warning: first");
  const auto second = text.find("error: second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}

TEST(DiagnosticPrinter, DiagnosticWithoutLocation)
{
  const SourceManager sm("missing.crst", "");
  DiagnosticBag bag;
  bag.report_error(SourceRange{}, "file not found: missing.crst");

  std::ostringstream out;
  DiagnosticPrinter(out, sm, false).print_all(bag);
  EXPECT_EQ(
    out.str(),
    "error: file not found: missing.crst\n"
    "  --> missing.crst\n"
    "      |\n"
    "\n");
}

TEST(DiagnosticPrinter, SeverityNames)
{
  EXPECT_STREQ(to_string(Severity::Error), "error");
  EXPECT_STREQ(to_string(Severity::Warning), "warning");
  EXPECT_STREQ(to_string(Severity::Info), "info");
  EXPECT_STREQ(to_string(Severity::Hint), "hint");
}
