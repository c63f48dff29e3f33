// htmx_lsp/index/tag.hpp - User-declared hx@ tag
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "htmx_lsp/basic/source_manager.hpp"

namespace htmx_lsp
{

inline constexpr std::string_view k_tag_prefix = "hx@";

/**
 * A `hx@identifier` token found in a comment or in an `hx-lsp` value.
 *
 * `name` includes the `hx@` prefix. Columns are 0-based byte columns on
 * `line`; `end` is one past the last character of the token.
 */
struct Tag
{
  std::string name;
  uint32_t start = 0;
  uint32_t end = 0;
  FileId file;
  uint32_t line = 0;

  [[nodiscard]] TextRange range() const noexcept { return {{line, start}, {line, end}}; }

  [[nodiscard]] bool operator==(const Tag & o) const noexcept
  {
    return name == o.name && start == o.start && end == o.end && file == o.file &&
           line == o.line;
  }
  [[nodiscard]] bool operator!=(const Tag & o) const noexcept { return !(*this == o); }
};

}  // namespace htmx_lsp
