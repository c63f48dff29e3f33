// htmx_lsp/lsp/position.hpp - Classify the cursor inside an htmx attribute
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "htmx_lsp/basic/source_manager.hpp"
#include "htmx_lsp/index/tag.hpp"
#include "htmx_lsp/syntax/ts_ll.hpp"

namespace htmx_lsp::lsp
{

enum class QueryMode {
  Hover,
  Completion,
};

/// Cursor is on (or completing) an attribute name
struct AttributeName
{
  std::string name;

  [[nodiscard]] bool operator==(const AttributeName & o) const { return name == o.name; }
  [[nodiscard]] bool operator!=(const AttributeName & o) const { return !(*this == o); }
};

/// Cursor is inside the value of attribute `name`
struct AttributeValue
{
  std::string name;
  std::string value;  // filled for Hover only

  [[nodiscard]] bool operator==(const AttributeValue & o) const
  {
    return name == o.name && value == o.value;
  }
  [[nodiscard]] bool operator!=(const AttributeValue & o) const { return !(*this == o); }
};

using Position = std::variant<AttributeName, AttributeValue>;

/// Attribute name completion sentinel: the cursor is past an unfinished tag
inline constexpr std::string_view k_fresh_attribute_name = "--";

/// Text and end point of one capture
struct CaptureDetails
{
  std::string value;
  TextPoint end;
};

using CaptureMap = std::unordered_map<std::string, CaptureDetails>;

/**
 * Run `query` under `node` and fold its captures by name.
 *
 * Only captures starting at or before `trigger` are kept; for each name the
 * last capture in match order wins.
 */
[[nodiscard]] CaptureMap query_props(
  ts_ll::Node node, std::string_view source, TextPoint trigger, const ts_ll::Query & query);

/**
 * Classify `point` in an HTML tree.
 *
 * Finds the smallest node at the point, walks up to the enclosing element
 * (or the fragment/document root) and tries the attribute-name patterns,
 * then the attribute-value patterns. Every pattern is restricted to `hx-`
 * attributes.
 *
 * @return nullopt when the cursor is not on an htmx attribute
 */
[[nodiscard]] std::optional<Position> resolve_position(
  ts_ll::Node root, std::string_view source, TextPoint point, QueryMode mode);

/**
 * Tag under `point` inside the value of an `hx-lsp="hx@a hx@b"` attribute.
 *
 * The returned tag has line and columns set; `file` is unset.
 */
[[nodiscard]] std::optional<Tag> find_tag_reference(
  ts_ll::Node root, std::string_view source, TextPoint point);

}  // namespace htmx_lsp::lsp
