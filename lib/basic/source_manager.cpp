// docgraph/basic/source_manager.cpp - Source file and registry implementation
#include "docgraph/basic/source_manager.hpp"

#include <algorithm>

namespace docgraph
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(std::string name, std::string content)
: name_(std::move(name)), content_(std::move(content))
{
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

std::string_view SourceFile::get_slice(uint32_t start, uint32_t end) const noexcept
{
  if (start >= content_.size() || end < start) {
    return {};
  }
  if (end > content_.size()) {
    end = static_cast<uint32_t>(content_.size());
  }
  return std::string_view(content_).substr(start, end - start);
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::register_file(std::string name, std::string content)
{
  if (const auto it = name_to_id_.find(name); it != name_to_id_.end()) {
    return it->second;
  }

  const FileId id{static_cast<uint32_t>(files_.size())};
  name_to_id_.emplace(name, id);
  files_.push_back(std::make_unique<SourceFile>(std::move(name), std::move(content)));
  return id;
}

const SourceFile * SourceRegistry::get_file(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= files_.size()) {
    return nullptr;
  }
  return files_[id.value].get();
}

std::optional<FileId> SourceRegistry::find(std::string_view name) const
{
  if (const auto it = name_to_id_.find(std::string(name)); it != name_to_id_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::string_view SourceRegistry::get_slice(SourceRange range) const noexcept
{
  const auto * f = get_file(range.file_id());
  if (f == nullptr || !range.is_valid()) {
    return {};
  }
  return f->get_slice(range.get_begin().offset(), range.get_end().offset());
}

LineColumn SourceRegistry::get_line_column(SourceLocation loc) const noexcept
{
  const auto * f = get_file(loc.file_id());
  if (f == nullptr || !loc.is_valid()) {
    return {};
  }
  return f->get_line_column(loc.offset());
}

}  // namespace docgraph
