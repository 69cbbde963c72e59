// crusty/basic/source_manager.hpp - Source locations, ranges and the unit's text
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace crusty
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into the source of one compilation unit.
 *
 * Line and column information is computed on demand by SourceManager.
 */
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept : offset_(k_invalid_offset) {}
  constexpr explicit SourceLocation(uint32_t offset) noexcept : offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept { return offset_ != k_invalid_offset; }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return offset_ == k_invalid_offset; }
  [[nodiscard]] constexpr uint32_t get_offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return offset_ != other.offset_;
  }
  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    return offset_ < other.offset_;
  }
  [[nodiscard]] constexpr bool operator<=(SourceLocation other) const noexcept
  {
    return offset_ <= other.offset_;
  }

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Half-open byte span [begin, end)
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(SourceLocation start, SourceLocation end) noexcept
  : start_(start), end_(end)
  {
  }

  constexpr SourceRange(uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(SourceLocation(start_offset)), end_(SourceLocation(end_offset))
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }
  [[nodiscard]] constexpr bool is_invalid() const noexcept { return !is_valid(); }

  [[nodiscard]] constexpr bool contains(SourceLocation loc) const noexcept
  {
    return start_ <= loc && loc < end_;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (is_invalid()) return 0;
    return end_.get_offset() - start_.get_offset();
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start_ == other.start_ && end_ == other.end_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

/// Smallest range covering both inputs. Invalid inputs are ignored.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  const auto begin = a.get_begin() <= b.get_begin() ? a.get_begin() : b.get_begin();
  const auto end = a.get_end() <= b.get_end() ? b.get_end() : a.get_end();
  return {begin, end};
}

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

/// 1-indexed line and column (0 = invalid).
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

struct FullSourceRange
{
  uint32_t start_line = 0;
  uint32_t start_column = 0;
  uint32_t end_line = 0;
  uint32_t end_column = 0;
  uint32_t start_byte = 0;
  uint32_t end_byte = 0;

  [[nodiscard]] bool is_valid() const noexcept { return start_line > 0; }
};

// ============================================================================
// SourceManager - Text of one compilation unit
// ============================================================================

/**
 * Owns the text of a single compilation unit and converts byte offsets to
 * line/column positions.
 *
 * Each compilation unit has its own SourceManager; units never share one.
 */
class SourceManager
{
public:
  SourceManager() = default;

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }
  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  /// Name used in diagnostics ("<input>" when the unit has no path).
  [[nodiscard]] std::string get_display_name() const
  {
    return file_path_.empty() ? std::string("<input>") : file_path_.string();
  }

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }
  [[nodiscard]] size_t size() const noexcept { return source_.size(); }
  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;
  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept
  {
    if (loc.is_invalid()) return {};
    return get_line_column(loc.get_offset());
  }

  /// Content of a line without its terminator (0-indexed).
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace crusty
