// htmx_lsp/lsp/tag_extractor.hpp - hx@ tag tokenizer and comment scanner
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include <gsl/span>

#include "htmx_lsp/index/tag.hpp"
#include "htmx_lsp/syntax/ts_ll.hpp"

namespace htmx_lsp::lsp
{

/// Byte offsets [start, end) of one tag token inside a string
struct TagToken
{
  size_t start = 0;
  size_t end = 0;
};

/**
 * Find the first tag token at or after `from`.
 *
 * A token is `hx@` immediately followed by one or more non-whitespace
 * characters; it ends at the next whitespace or at the end of `text`.
 */
[[nodiscard]] std::optional<TagToken> next_tag_token(std::string_view text, size_t from = 0) noexcept;

/// Whether the whole of `text` is exactly one tag token
[[nodiscard]] bool is_tag_token(std::string_view text) noexcept;

/**
 * Single-tag scan: the first token of a line.
 *
 * @param column_base added to the token columns (the line slice may start
 *        inside a longer line)
 */
[[nodiscard]] std::optional<Tag> first_tag_in_line(
  std::string_view line, uint32_t line_no, uint32_t column_base = 0);

/**
 * Multi-tag scan of a value made of single-space separated tokens.
 *
 * Returns nullopt when the value starts with a space or contains a double
 * space. Parts that are not tokens are skipped.
 */
[[nodiscard]] std::optional<std::vector<Tag>> tags_in_value(
  std::string_view value, uint32_t start_column, uint32_t line);

/// Tag hit by `column` (start <= column <= end)
[[nodiscard]] std::optional<Tag> tag_at_column(gsl::span<const Tag> tags, uint32_t column);

/**
 * Tags declared in the comments of a tree.
 *
 * Every line of every comment captured by `comment_query` contributes its
 * first tag. The returned tags have `line` set and `file` unset.
 */
[[nodiscard]] std::vector<Tag> extract_tags(
  ts_ll::Node root, std::string_view source, const ts_ll::Query & comment_query);

/// Tag declared in a comment and hit by `point`
[[nodiscard]] std::optional<Tag> tag_in_comment_at(
  ts_ll::Node root, std::string_view source, const ts_ll::Query & comment_query, TextPoint point);

}  // namespace htmx_lsp::lsp
