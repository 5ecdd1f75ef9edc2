// ripple/basic/source_manager.hpp - Source location and registry for YAML documents
//
// Change specifications, manifests, contracts and project files are all
// registered here so that diagnostics can point at file:line:column.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ripple
{

namespace fs = std::filesystem;

// ============================================================================
// FileId - Index into SourceRegistry
// ============================================================================

struct FileId
{
  static constexpr uint16_t k_invalid = UINT16_MAX;

  uint16_t value = k_invalid;

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
};

// ============================================================================
// SourceLocation - Compact source position
// ============================================================================

/// Byte offset into a registered document; SourceRegistry::position() maps it to line and column.
class SourceLocation
{
public:
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  constexpr SourceLocation() noexcept = default;

  constexpr SourceLocation(FileId file, uint32_t offset) noexcept : file_(file), offset_(offset) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return file_.is_valid() && offset_ != k_invalid_offset;
  }

  [[nodiscard]] constexpr FileId file_id() const noexcept { return file_; }
  [[nodiscard]] constexpr uint32_t offset() const noexcept { return offset_; }

  [[nodiscard]] constexpr bool operator==(SourceLocation other) const noexcept
  {
    return file_ == other.file_ && offset_ == other.offset_;
  }
  [[nodiscard]] constexpr bool operator!=(SourceLocation other) const noexcept
  {
    return !(*this == other);
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

// ============================================================================
// SourceRange - Half-open [start, end) range within one file
// ============================================================================

class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t start_offset, uint32_t end_offset) noexcept
  : start_(file, start_offset), end_(file, end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return start_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return start_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_.offset() - start_.offset();
  }

private:
  SourceLocation start_;
  SourceLocation end_;
};

// ============================================================================
// LineColumn / FullSourceRange - Human-readable positions
// ============================================================================

/**
 * Human-readable line and column position (1-indexed).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

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
// SourceDocument
// ============================================================================

/**
 * Immutable snapshot of one YAML document, with a table of line starts.
 */
class SourceDocument
{
public:
  SourceDocument(fs::path path, std::string text);

  [[nodiscard]] const fs::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// 1-indexed position of a byte offset; offsets past the end clamp to it
  [[nodiscard]] LineColumn position(uint32_t offset) const noexcept;

  /// 0-indexed line without its line terminator
  [[nodiscard]] std::string_view line(uint32_t index) const noexcept;

  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;
  [[nodiscard]] FullSourceRange span(SourceRange range) const noexcept;

private:
  fs::path path_;
  std::string text_;
  std::vector<uint32_t> line_starts_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

/**
 * Owns the documents read by an analyzer.
 *
 * Every add() stores a new snapshot, so diagnostics from an earlier load
 * keep pointing at the text they were reported against.
 */
class SourceRegistry
{
public:
  SourceRegistry() = default;

  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /// Store a document; FileId::invalid() once the id space is exhausted
  FileId add(fs::path path, std::string text);

  [[nodiscard]] const SourceDocument * document(FileId id) const noexcept;
  [[nodiscard]] const fs::path & path(FileId id) const noexcept;

  [[nodiscard]] LineColumn position(SourceLocation loc) const noexcept;
  [[nodiscard]] FullSourceRange span(SourceRange range) const noexcept;
  [[nodiscard]] std::string_view slice(SourceRange range) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return documents_.size(); }

private:
  std::vector<std::unique_ptr<SourceDocument>> documents_;
};

}  // namespace ripple
