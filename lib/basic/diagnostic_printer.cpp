// crusty/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "crusty/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace crusty
{

namespace
{

std::string expand_tabs(std::string_view line)
{
  std::string cleaned;
  cleaned.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned += c;
    }
  }
  return cleaned;
}

}  // namespace

const char * to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

DiagnosticPrinter::DiagnosticPrinter(
  std::ostream & os, const SourceManager & source, bool use_color)
: os_(os), source_(source), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  const FullSourceRange primary_fr = source_.get_full_range(diag.primary_range());
  const std::string filename = source_.get_display_name();

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary_fr.start_line,
      primary_fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label);
  }

  for (const auto & f : diag.fixits) {
    print_fixit(f);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const char * severity_str = to_string(diag.severity);

  if (!use_color_) {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", severity_str, diag.message);
    }
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << severity_str;
  if (!diag.code.empty()) {
    os_ << "[" << diag.code << "]";
  }
  os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label_context(const Label & label)
{
  if (label.range.is_invalid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const FullSourceRange fr = source_.get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  // Multi-line spans are marked on their first line only.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  uint32_t line_index, uint32_t start_col, uint32_t end_col, LabelStyle style,
  std::string_view label_message)
{
  const std::string_view line = source_.get_line(line_index);
  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t i = 0; visual_col < start_col && i < line.size(); ++i, ++visual_col) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit)
{
  const FullSourceRange fr = source_.get_full_range(fixit.range);

  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold << "   = " << rang::style::reset
        << rang::fg::reset;
  } else {
    fmt::print(os_, "   = ");
  }
  if (fr.is_valid()) {
    fmt::print(
      os_, "fix: insert \"{}\" at {}:{}\n", fixit.replacement_text, fr.start_line,
      fr.start_column);
  } else {
    fmt::print(os_, "fix: insert \"{}\"\n", fixit.replacement_text);
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace crusty
