// htmx_lsp/basic/source_manager.cpp - Source file and registry implementation
#include "htmx_lsp/basic/source_manager.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace htmx_lsp
{

// ============================================================================
// SourceFile
// ============================================================================

SourceFile::SourceFile(std::string uri, std::string content)
: uri_(std::move(uri)), content_(std::move(content))
{
  build_line_table();
}

uint32_t SourceFile::line_offset(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return static_cast<uint32_t>(content_.size());
  }
  return line_offsets_[line_index];
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

uint32_t SourceFile::offset_at(TextPoint p) const noexcept
{
  if (p.line >= line_offsets_.size()) {
    return static_cast<uint32_t>(content_.size());
  }
  const uint32_t start = line_offsets_[p.line];
  const uint32_t next = (p.line + 1 < line_offsets_.size())
                          ? line_offsets_[p.line + 1]
                          : static_cast<uint32_t>(content_.size());
  const uint32_t line_len = next - start;
  return start + std::min(p.column, line_len);
}

TextPoint SourceFile::point_at(uint32_t offset) const noexcept
{
  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {0, offset};
  }
  --it;

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin());
  return {line, offset - *it};
}

std::string_view SourceFile::get_slice(TextRange range) const noexcept
{
  const uint32_t start = offset_at(range.start);
  const uint32_t end = offset_at(range.end);
  if (end <= start) {
    return {};
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

std::shared_ptr<const SourceFile> SourceRegistry::set_document(
  const std::string & uri, std::string content)
{
  auto file = std::make_shared<const SourceFile>(uri, std::move(content));
  std::unique_lock lock(mutex_);
  files_[uri] = file;
  return file;
}

std::shared_ptr<const SourceFile> SourceRegistry::get(std::string_view uri) const
{
  std::shared_lock lock(mutex_);
  if (const auto it = files_.find(std::string(uri)); it != files_.end()) {
    return it->second;
  }
  return nullptr;
}

void SourceRegistry::remove(std::string_view uri)
{
  std::unique_lock lock(mutex_);
  files_.erase(std::string(uri));
}

void SourceRegistry::clear()
{
  std::unique_lock lock(mutex_);
  files_.clear();
}

size_t SourceRegistry::size() const
{
  std::shared_lock lock(mutex_);
  return files_.size();
}

}  // namespace htmx_lsp
