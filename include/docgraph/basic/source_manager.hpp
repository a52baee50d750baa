// docgraph/basic/source_manager.hpp - Source files, locations and ranges
//
// Every source unit handed to the indexer is registered once in a
// SourceRegistry and addressed by a FileId. Locations are byte offsets into
// that file; line/column information is computed on demand.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docgraph
{

// ============================================================================
// FileId
// ============================================================================

struct FileId
{
  static constexpr uint32_t k_invalid = UINT32_MAX;

  uint32_t value = k_invalid;

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
// SourceLocation / SourceRange
// ============================================================================

/**
 * A byte offset inside one registered file.
 */
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

  [[nodiscard]] constexpr bool operator<(SourceLocation other) const noexcept
  {
    if (file_.value != other.file_.value) return file_.value < other.file_.value;
    return offset_ < other.offset_;
  }

private:
  FileId file_;
  uint32_t offset_ = k_invalid_offset;
};

/**
 * Half-open byte range [begin, end) inside one file.
 */
class SourceRange
{
public:
  constexpr SourceRange() noexcept = default;

  constexpr SourceRange(FileId file, uint32_t start_offset, uint32_t end_offset) noexcept
  : begin_(file, start_offset), end_(file, end_offset)
  {
  }

  [[nodiscard]] constexpr SourceLocation get_begin() const noexcept { return begin_; }
  [[nodiscard]] constexpr SourceLocation get_end() const noexcept { return end_; }
  [[nodiscard]] constexpr FileId file_id() const noexcept { return begin_.file_id(); }

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return begin_.is_valid() && end_.is_valid();
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    if (!is_valid()) return 0;
    return end_.offset() - begin_.offset();
  }

private:
  SourceLocation begin_;
  SourceLocation end_;
};

/// Human-readable position (1-indexed, 0 = invalid)
struct LineColumn
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Content of one source unit plus a pre-computed line table.
 *
 * The name is the file's ufid (relative path as handed over by the traversal
 * step); it is used verbatim in diagnostics.
 */
class SourceFile
{
public:
  SourceFile(std::string name, std::string content);

  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] size_t size() const noexcept { return content_.size(); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Content of a line without its terminator (0-indexed)
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  [[nodiscard]] std::string_view get_slice(uint32_t start, uint32_t end) const noexcept;

private:
  void build_line_table();

  std::string name_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

// ============================================================================
// SourceRegistry
// ============================================================================

class SourceRegistry
{
public:
  SourceRegistry() = default;
  SourceRegistry(const SourceRegistry &) = delete;
  SourceRegistry & operator=(const SourceRegistry &) = delete;
  SourceRegistry(SourceRegistry &&) = default;
  SourceRegistry & operator=(SourceRegistry &&) = default;

  /**
   * Register a file by name. Registering the same name twice keeps the first
   * content, which built entities may still point into, and returns its id.
   */
  FileId register_file(std::string name, std::string content);

  [[nodiscard]] const SourceFile * get_file(FileId id) const noexcept;
  [[nodiscard]] std::optional<FileId> find(std::string_view name) const;

  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;
  [[nodiscard]] LineColumn get_line_column(SourceLocation loc) const noexcept;

  [[nodiscard]] size_t size() const noexcept { return files_.size(); }

private:
  std::vector<std::unique_ptr<SourceFile>> files_;
  std::unordered_map<std::string, FileId> name_to_id_;
};

}  // namespace docgraph
