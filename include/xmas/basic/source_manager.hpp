// xmas/basic/source_manager.hpp - Source locations, ranges and line tables
//
// Byte offsets are the canonical position representation. Line/column pairs
// are computed on demand from a pre-built line table.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace xmas
{

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/**
 * A byte offset into a single source buffer.
 */
class SourceLocation
{
public:
  /// Invalid/unknown location sentinel
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

private:
  uint32_t offset_;
};

// ============================================================================
// SourceRange - Half-open [start, end) byte range
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

// ============================================================================
// LineColumn - Human-readable position
// ============================================================================

/**
 * Line and column position (1-indexed). This is the "position" that the
 * lexer attaches to every token.
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }

  [[nodiscard]] constexpr bool operator==(LineColumn other) const noexcept
  {
    return line == other.line && column == other.column;
  }
};

// ============================================================================
// FullSourceRange - Range with line/column info
// ============================================================================

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
// SourceManager - One source buffer plus its line table
// ============================================================================

/**
 * Owns the text of one script and converts byte offsets to line/column
 * positions.
 *
 * Columns are counted in bytes. Scripts are expected to be ASCII; multi-byte
 * characters simply advance the column once per byte.
 */
class SourceManager
{
public:
  SourceManager() { build_line_table(); }

  explicit SourceManager(std::string source) : source_(std::move(source)) { build_line_table(); }

  SourceManager(std::filesystem::path file_path, std::string source)
  : file_path_(std::move(file_path)), source_(std::move(source))
  {
    build_line_table();
  }

  // ===========================================================================
  // File Path Accessors
  // ===========================================================================

  [[nodiscard]] const std::filesystem::path & get_file_path() const noexcept { return file_path_; }

  [[nodiscard]] bool has_file_path() const noexcept { return !file_path_.empty(); }

  /// Name used in diagnostics ("<stdin>" when the script has no path)
  [[nodiscard]] std::string get_display_name() const
  {
    return has_file_path() ? file_path_.string() : std::string("<stdin>");
  }

  // ===========================================================================
  // Source Content Accessors
  // ===========================================================================

  [[nodiscard]] std::string_view get_source() const noexcept { return source_; }

  [[nodiscard]] size_t size() const noexcept { return source_.size(); }

  [[nodiscard]] size_t get_line_count() const noexcept { return line_offsets_.size(); }

  // ===========================================================================
  // Location Conversion
  // ===========================================================================

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept
  {
    return get_line_column(SourceLocation(offset));
  }

  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;

  /// Content of a line (0-indexed), without the line terminator
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_source_slice(SourceRange range) const noexcept
  {
    if (range.is_invalid()) return {};
    auto start = range.get_begin().get_offset();
    auto end = range.get_end().get_offset();
    if (start >= source_.size()) return {};
    if (end > source_.size()) end = static_cast<uint32_t>(source_.size());
    if (end < start) return {};
    return std::string_view(source_).substr(start, end - start);
  }

  [[nodiscard]] FullSourceRange get_full_range(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path file_path_;
  std::string source_;
  std::vector<uint32_t> line_offsets_;  ///< Offset of each line start
};

}  // namespace xmas
