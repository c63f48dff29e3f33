// htmx_lsp/lsp/tag_extractor.cpp - hx@ tag tokenizer and comment scanner
#include "htmx_lsp/lsp/tag_extractor.hpp"

#include <string>

namespace htmx_lsp::lsp
{

namespace
{

bool is_space(char c) noexcept
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

Tag make_tag(std::string_view text, TagToken tok, uint32_t column_base, uint32_t line)
{
  Tag t;
  t.name = std::string(text.substr(tok.start, tok.end - tok.start));
  t.start = column_base + static_cast<uint32_t>(tok.start);
  t.end = column_base + static_cast<uint32_t>(tok.end);
  t.line = line;
  return t;
}

}  // namespace

std::optional<TagToken> next_tag_token(std::string_view text, size_t from) noexcept
{
  while (from < text.size()) {
    const size_t at = text.find(k_tag_prefix, from);
    if (at == std::string_view::npos) {
      return std::nullopt;
    }

    size_t end = at + k_tag_prefix.size();
    while (end < text.size() && !is_space(text[end])) {
      ++end;
    }
    if (end > at + k_tag_prefix.size()) {
      return TagToken{at, end};
    }
    from = at + k_tag_prefix.size();
  }
  return std::nullopt;
}

bool is_tag_token(std::string_view text) noexcept
{
  const auto tok = next_tag_token(text);
  return tok && tok->start == 0 && tok->end == text.size();
}

std::optional<Tag> first_tag_in_line(std::string_view line, uint32_t line_no, uint32_t column_base)
{
  const auto tok = next_tag_token(line);
  if (!tok) {
    return std::nullopt;
  }
  return make_tag(line, *tok, column_base, line_no);
}

std::optional<std::vector<Tag>> tags_in_value(
  std::string_view value, uint32_t start_column, uint32_t line)
{
  if ((!value.empty() && value.front() == ' ') || value.find("  ") != std::string_view::npos) {
    return std::nullopt;
  }

  std::vector<Tag> tags;
  size_t pos = 0;
  while (pos <= value.size()) {
    size_t space = value.find(' ', pos);
    if (space == std::string_view::npos) {
      space = value.size();
    }
    const std::string_view part = value.substr(pos, space - pos);
    if (is_tag_token(part)) {
      tags.push_back(make_tag(value, TagToken{pos, space}, start_column, line));
    }
    pos = space + 1;
  }
  return tags;
}

std::optional<Tag> tag_at_column(gsl::span<const Tag> tags, uint32_t column)
{
  for (const Tag & t : tags) {
    if (t.start <= column && column <= t.end) {
      return t;
    }
  }
  return std::nullopt;
}

std::vector<Tag> extract_tags(
  ts_ll::Node root, std::string_view source, const ts_ll::Query & comment_query)
{
  std::vector<Tag> out;
  const auto comment_index = comment_query.capture_index("comment");
  if (!comment_index) {
    return out;
  }

  for (const auto & match : comment_query.matches(root, source)) {
    const auto node = match.node_for(*comment_index);
    if (!node) {
      continue;
    }
    const std::string_view text = node->text(source);
    const TextPoint start = node->start_point();

    uint32_t i = 0;
    size_t line_begin = 0;
    while (line_begin <= text.size()) {
      size_t line_end = text.find('\n', line_begin);
      if (line_end == std::string_view::npos) {
        line_end = text.size();
      }
      std::string_view line = text.substr(line_begin, line_end - line_begin);
      if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
      }

      const uint32_t column_base = (i == 0) ? start.column : 0;
      if (auto tag = first_tag_in_line(line, start.line + i, column_base)) {
        out.push_back(std::move(*tag));
      }

      line_begin = line_end + 1;
      ++i;
    }
  }
  return out;
}

std::optional<Tag> tag_in_comment_at(
  ts_ll::Node root, std::string_view source, const ts_ll::Query & comment_query, TextPoint point)
{
  for (const Tag & t : extract_tags(root, source, comment_query)) {
    if (t.line == point.line && t.start <= point.column && point.column <= t.end) {
      return t;
    }
  }
  return std::nullopt;
}

}  // namespace htmx_lsp::lsp
