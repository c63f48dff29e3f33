// htmx_lsp/syntax/queries.hpp - Tree-sitter query sources and their compiled forms
#pragma once

#include <string_view>

#include "htmx_lsp/syntax/languages.hpp"
#include "htmx_lsp/syntax/ts_ll.hpp"

namespace htmx_lsp::syntax
{

// ============================================================================
// HTML (template) queries
// ============================================================================

/**
 * hx- attribute names.
 *
 * Alternatives:
 * - complete attribute without a value (`@complete_match` text equals
 *   `@attr_name` text)
 * - start tag whose last attribute is unfinished, with an optional ERROR
 *   node right after it (the `=` that has no value yet)
 */
inline constexpr std::string_view k_hx_name_query = R"query(
(
  [
    (_
      (tag_name)
      (_)*
      (attribute (attribute_name) @attr_name) @complete_match
      (#eq? @attr_name @complete_match)
    )

    (_
      (tag_name)
      (attribute (attribute_name))
      (ERROR)? @equal_error
    ) @unfinished_tag
  ]

  (#match? @attr_name "^hx-")
)
)query";

/**
 * hx- attribute values.
 *
 * Alternatives:
 * - value whose opening quote is not closed (`@open_quote_error`)
 * - attribute followed by an error character (`@error_char`)
 * - empty quoted value `""` (`@empty_attribute`)
 * - non-empty quoted value (`@non_empty_attribute`)
 */
inline constexpr std::string_view k_hx_value_query = R"query(
(
  [
    (ERROR
      (tag_name)
      (attribute_name) @attr_name
      (_)
    ) @open_quote_error

    (_
      (tag_name)
      (attribute
        (attribute_name) @attr_name
        (_)
      ) @last_item
      (ERROR) @error_char
    )

    (_
      (tag_name)
      (attribute
        (attribute_name) @attr_name
        (quoted_attribute_value) @quoted_attr_value
        (#eq? @quoted_attr_value "\"\"")
      ) @empty_attribute
    )

    (_
      (tag_name)
      (attribute
        (attribute_name) @attr_name
        (quoted_attribute_value (attribute_value) @attr_value)
      ) @non_empty_attribute
    )
  ]

  (#match? @attr_name "^hx-")
)
)query";

/// `hx-lsp="hx@a hx@b"` tag references
inline constexpr std::string_view k_hx_lsp_query = R"query(
(
  (attribute
    (attribute_name) @attr_name
    (quoted_attribute_value (attribute_value) @attr_value)
  ) @attribute
  (#eq? @attr_name "hx-lsp")
)
)query";

// ============================================================================
// Comment queries (tag declarations)
// ============================================================================

/// python, go and javascript share the `comment` node kind
inline constexpr std::string_view k_comment_tags_query = R"query(
(
  (comment) @comment
  (#match? @comment "hx@")
)
)query";

inline constexpr std::string_view k_rust_comment_tags_query = R"query(
(
  [(line_comment) (block_comment)] @comment
  (#match? @comment "hx@")
)
)query";

// ============================================================================
// Compiled queries
// ============================================================================
//
// Compiled once per process and never mutated. A query that fails to compile
// against the linked grammar is logged and reported as nullptr.

[[nodiscard]] const ts_ll::Query * hx_name_query();
[[nodiscard]] const ts_ll::Query * hx_value_query();
[[nodiscard]] const ts_ll::Query * hx_lsp_query();

/// Tag declaration query for a file domain; nullptr for Template
[[nodiscard]] const ts_ll::Query * comment_query(LangType type, BackendLang backend);

}  // namespace htmx_lsp::syntax
