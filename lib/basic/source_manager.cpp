// ripple/basic/source_manager.cpp - Document snapshots and registry
#include "ripple/basic/source_manager.hpp"

#include <algorithm>

namespace ripple
{

// ============================================================================
// SourceDocument
// ============================================================================

SourceDocument::SourceDocument(fs::path path, std::string text)
: path_(std::move(path)), text_(std::move(text))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_starts_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

LineColumn SourceDocument::position(uint32_t offset) const noexcept
{
  offset = std::min(offset, static_cast<uint32_t>(text_.size()));

  // Last line start not greater than offset
  const auto next = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  const auto index = static_cast<uint32_t>(std::distance(line_starts_.begin(), next)) - 1;
  return {index + 1, offset - line_starts_[index] + 1};
}

std::string_view SourceDocument::line(uint32_t index) const noexcept
{
  if (index >= line_starts_.size()) {
    return {};
  }

  const std::string_view all(text_);
  const uint32_t begin = line_starts_[index];
  const uint32_t end = index + 1 < line_starts_.size() ? line_starts_[index + 1] - 1
                                                       : static_cast<uint32_t>(all.size());
  std::string_view out = all.substr(begin, end - begin);
  if (!out.empty() && out.back() == '\r') {
    out.remove_suffix(1);
  }
  return out;
}

std::string_view SourceDocument::slice(SourceRange range) const noexcept
{
  if (!range.is_valid() || range.get_begin().offset() >= text_.size()) {
    return {};
  }
  const uint32_t begin = range.get_begin().offset();
  const uint32_t end = std::min(range.get_end().offset(), static_cast<uint32_t>(text_.size()));
  return std::string_view(text_).substr(begin, end - begin);
}

FullSourceRange SourceDocument::span(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const LineColumn begin = position(range.get_begin().offset());
  const LineColumn end = position(range.get_end().offset());

  FullSourceRange out;
  out.start_line = begin.line;
  out.start_column = begin.column;
  out.end_line = end.line;
  out.end_column = end.column;
  out.start_byte = range.get_begin().offset();
  out.end_byte = range.get_end().offset();
  return out;
}

// ============================================================================
// SourceRegistry
// ============================================================================

FileId SourceRegistry::add(fs::path path, std::string text)
{
  if (documents_.size() >= static_cast<size_t>(FileId::k_invalid)) {
    return FileId::invalid();
  }

  const FileId id{static_cast<uint16_t>(documents_.size())};
  documents_.push_back(std::make_unique<SourceDocument>(std::move(path), std::move(text)));
  return id;
}

const SourceDocument * SourceRegistry::document(FileId id) const noexcept
{
  if (!id.is_valid() || id.value >= documents_.size()) {
    return nullptr;
  }
  return documents_[id.value].get();
}

const fs::path & SourceRegistry::path(FileId id) const noexcept
{
  static const fs::path k_no_path;
  const SourceDocument * doc = document(id);
  return doc != nullptr ? doc->path() : k_no_path;
}

LineColumn SourceRegistry::position(SourceLocation loc) const noexcept
{
  const SourceDocument * doc = document(loc.file_id());
  if (doc == nullptr || !loc.is_valid()) {
    return {};
  }
  return doc->position(loc.offset());
}

FullSourceRange SourceRegistry::span(SourceRange range) const noexcept
{
  const SourceDocument * doc = document(range.file_id());
  return doc != nullptr ? doc->span(range) : FullSourceRange{};
}

std::string_view SourceRegistry::slice(SourceRange range) const noexcept
{
  const SourceDocument * doc = document(range.file_id());
  return doc != nullptr ? doc->slice(range) : std::string_view{};
}

}  // namespace ripple
