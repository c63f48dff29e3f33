// htmx_lsp/basic/source_manager.hpp - File identities, text points and document storage
//
// This header provides the types used to address text inside documents
// (FileId, TextPoint, TextRange) and the thread-safe store of open document
// contents (SourceRegistry).
//
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace htmx_lsp
{

// ============================================================================
// FileId - Opaque file identifier
// ============================================================================

/**
 * Opaque identifier of a project file.
 *
 * FileIds are handed out by DocumentIndex from a monotonic counter and are
 * never reused within a process.
 */
struct FileId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

  constexpr FileId() noexcept = default;
  constexpr explicit FileId(uint32_t v) noexcept : value(v) {}

  [[nodiscard]] static constexpr FileId invalid() noexcept { return FileId{}; }
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value != k_invalid; }

  [[nodiscard]] constexpr bool operator==(FileId other) const noexcept
  {
    return value == other.value;
  }
  [[nodiscard]] constexpr bool operator!=(FileId other) const noexcept
  {
    return value != other.value;
  }
  [[nodiscard]] constexpr bool operator<(FileId other) const noexcept
  {
    return value < other.value;
  }
};

struct FileIdHash
{
  size_t operator()(FileId id) const noexcept { return std::hash<uint32_t>{}(id.value); }
};

// ============================================================================
// TextPoint / TextRange - Line and byte column positions
// ============================================================================

/**
 * A 0-indexed (line, byte column) position, the same coordinate system
 * tree-sitter uses for TSPoint.
 *
 * Points compare lexicographically on (line, column).
 */
struct TextPoint
{
  uint32_t line = 0;
  uint32_t column = 0;

  constexpr TextPoint() noexcept = default;
  constexpr TextPoint(uint32_t l, uint32_t c) noexcept : line(l), column(c) {}

  [[nodiscard]] constexpr bool operator==(TextPoint o) const noexcept
  {
    return line == o.line && column == o.column;
  }
  [[nodiscard]] constexpr bool operator!=(TextPoint o) const noexcept { return !(*this == o); }
  [[nodiscard]] constexpr bool operator<(TextPoint o) const noexcept
  {
    return line < o.line || (line == o.line && column < o.column);
  }
  [[nodiscard]] constexpr bool operator<=(TextPoint o) const noexcept { return !(o < *this); }
  [[nodiscard]] constexpr bool operator>(TextPoint o) const noexcept { return o < *this; }
  [[nodiscard]] constexpr bool operator>=(TextPoint o) const noexcept { return !(*this < o); }
};

/**
 * Half-open range [start, end) of text points.
 */
struct TextRange
{
  TextPoint start;
  TextPoint end;

  [[nodiscard]] constexpr bool contains(TextPoint p) const noexcept
  {
    return start <= p && p < end;
  }

  [[nodiscard]] constexpr bool operator==(const TextRange & o) const noexcept
  {
    return start == o.start && end == o.end;
  }
  [[nodiscard]] constexpr bool operator!=(const TextRange & o) const noexcept
  {
    return !(*this == o);
  }
};

// ============================================================================
// SourceFile - Document content with a line table
// ============================================================================

/**
 * Immutable document content.
 *
 * Features:
 * - Stores the document URI and its text
 * - Pre-computes line start offsets for point/offset conversion
 * - Extracts single lines without the trailing line break
 */
class SourceFile
{
public:
  SourceFile() { build_line_table(); }
  SourceFile(std::string uri, std::string content);

  [[nodiscard]] const std::string & uri() const noexcept { return uri_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }

  /// Number of lines (a trailing newline opens one more, empty, line)
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Byte offset of a line start (0-indexed line number, clamped)
  [[nodiscard]] uint32_t line_offset(uint32_t line_index) const noexcept;

  /// Content of a line without '\n' / "\r\n" (0-indexed)
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Convert a point to a byte offset, clamping the column to the line length
  [[nodiscard]] uint32_t offset_at(TextPoint p) const noexcept;

  /// Convert a byte offset to a point
  [[nodiscard]] TextPoint point_at(uint32_t offset) const noexcept;

  /// Text between two points
  [[nodiscard]] std::string_view get_slice(TextRange range) const noexcept;

private:
  void build_line_table();

  std::string uri_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry - Thread-safe document store keyed by URI
// ============================================================================

/**
 * In-memory store of document contents.
 *
 * Entries are replaced, never mutated: readers obtain a shared_ptr to an
 * immutable SourceFile that stays valid after a concurrent update.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;
  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;

  /// Insert or replace the content of a document
  std::shared_ptr<const SourceFile> set_document(const std::string & uri, std::string content);

  [[nodiscard]] std::shared_ptr<const SourceFile> get(std::string_view uri) const;

  void remove(std::string_view uri);
  void clear();

  [[nodiscard]] size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const SourceFile>> files_;
};

}  // namespace htmx_lsp
