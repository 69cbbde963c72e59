// crusty/basic/diagnostic.hpp - Diagnostic types shared by every pass
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "crusty/basic/source_manager.hpp"

namespace crusty
{

// ============================================================================
// Error Codes
// ============================================================================

/// Stable codes attached to diagnostics via DiagnosticBuilder::with_code.
namespace diag_code
{
inline constexpr const char * k_parse_error = "E0001";
inline constexpr const char * k_invalid_token = "E0002";
inline constexpr const char * k_invalid_macro_name = "E0003";

inline constexpr const char * k_undefined_type = "E0101";
inline constexpr const char * k_type_mismatch = "E0102";
inline constexpr const char * k_circular_type_alias = "E0103";
inline constexpr const char * k_capture_violation = "E0104";
inline constexpr const char * k_visibility_error = "E0105";
inline constexpr const char * k_undefined_variable = "E0106";
inline constexpr const char * k_duplicate_definition = "E0107";
inline constexpr const char * k_invalid_operation = "E0108";

inline constexpr const char * k_internal_codegen = "E0900";
}  // namespace diag_code

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle : uint8_t {
  Primary,    // direct cause
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;
  std::string message;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that commits its diagnostic to the owning bag when it is
 * destroyed (RAII).
 *
 *   diags.report_error(range, "undefined type 'Foo'")
 *     .with_code(diag_code::k_undefined_type)
 *     .with_help("declare it with typedef or struct");
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_hint(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// Number of diagnostics carrying `code`.
  [[nodiscard]] size_t count_code(std::string_view code) const;
  [[nodiscard]] bool has_code(std::string_view code) const { return count_code(code) > 0; }

  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace crusty
