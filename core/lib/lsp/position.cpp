// htmx_lsp/lsp/position.cpp - Classify the cursor inside an htmx attribute
#include "htmx_lsp/lsp/position.hpp"

#include "htmx_lsp/lsp/tag_extractor.hpp"
#include "htmx_lsp/syntax/queries.hpp"

namespace htmx_lsp::lsp
{

namespace
{

std::optional<ts_ll::Node> enclosing_element(ts_ll::Node node)
{
  // Newer tree-sitter-html grammars name the root `document`.
  for (; !node.is_null(); node = node.parent()) {
    const auto kind = node.kind();
    if (kind == "element" || kind == "fragment" || kind == "document") {
      return node;
    }
  }
  return std::nullopt;
}

const CaptureDetails * prop(const CaptureMap & props, const char * name)
{
  const auto it = props.find(name);
  return it == props.end() ? nullptr : &it->second;
}

std::optional<Position> query_name(
  ts_ll::Node element, std::string_view source, TextPoint trigger, QueryMode mode)
{
  const ts_ll::Query * query = syntax::hx_name_query();
  if (query == nullptr) {
    return std::nullopt;
  }

  const CaptureMap props = query_props(element, source, trigger, *query);
  const CaptureDetails * attr_name = prop(props, "attr_name");
  if (attr_name == nullptr) {
    return std::nullopt;
  }

  if (const CaptureDetails * unfinished_tag = prop(props, "unfinished_tag")) {
    if (mode == QueryMode::Hover) {
      if (prop(props, "complete_match") != nullptr && trigger <= attr_name->end) {
        return AttributeName{attr_name->value};
      }
      return std::nullopt;
    }
    if (trigger > unfinished_tag->end) {
      return AttributeName{std::string(k_fresh_attribute_name)};
    }
    if (prop(props, "equal_error") != nullptr) {
      return std::nullopt;
    }
  }

  return AttributeName{attr_name->value};
}

std::optional<Position> query_value(
  ts_ll::Node element, std::string_view source, TextPoint trigger, QueryMode mode)
{
  const ts_ll::Query * query = syntax::hx_value_query();
  if (query == nullptr) {
    return std::nullopt;
  }

  const CaptureMap props = query_props(element, source, trigger, *query);
  const CaptureDetails * attr_name = prop(props, "attr_name");
  if (attr_name == nullptr) {
    return std::nullopt;
  }

  if (mode == QueryMode::Hover && trigger < attr_name->end) {
    return AttributeName{attr_name->value};
  }

  if (prop(props, "open_quote_error") != nullptr || prop(props, "empty_attribute") != nullptr) {
    if (mode == QueryMode::Completion) {
      const CaptureDetails * quoted = prop(props, "quoted_attr_value");
      if (quoted != nullptr && trigger >= quoted->end) {
        return std::nullopt;
      }
    }
    return AttributeValue{attr_name->value, ""};
  }

  if (const CaptureDetails * error_char = prop(props, "error_char")) {
    if (error_char->value == "=") {
      return std::nullopt;
    }
  }

  std::string value;
  if (const CaptureDetails * attribute = prop(props, "non_empty_attribute")) {
    if (trigger >= attribute->end) {
      return std::nullopt;
    }
    if (mode == QueryMode::Hover) {
      if (const CaptureDetails * attr_value = prop(props, "attr_value")) {
        value = attr_value->value;
      }
    }
  }

  return AttributeValue{attr_name->value, std::move(value)};
}

}  // namespace

CaptureMap query_props(
  ts_ll::Node node, std::string_view source, TextPoint trigger, const ts_ll::Query & query)
{
  CaptureMap props;
  for (const auto & match : query.matches(node, source)) {
    for (const auto & cap : match.captures) {
      if (cap.node.start_point() > trigger) {
        continue;
      }
      props[std::string(query.capture_name(cap.index))] =
        CaptureDetails{std::string(cap.node.text(source)), cap.node.end_point()};
    }
  }
  return props;
}

std::optional<Position> resolve_position(
  ts_ll::Node root, std::string_view source, TextPoint point, QueryMode mode)
{
  if (root.is_null()) {
    return std::nullopt;
  }
  const ts_ll::Node closest = root.descendant_for_point(point);
  if (closest.is_null()) {
    return std::nullopt;
  }
  const auto element = enclosing_element(closest);
  if (!element) {
    return std::nullopt;
  }

  if (auto name = query_name(*element, source, point, mode)) {
    return name;
  }
  return query_value(*element, source, point, mode);
}

std::optional<Tag> find_tag_reference(ts_ll::Node root, std::string_view source, TextPoint point)
{
  const ts_ll::Query * query = syntax::hx_lsp_query();
  if (query == nullptr || root.is_null()) {
    return std::nullopt;
  }
  const auto value_index = query->capture_index("attr_value");
  if (!value_index) {
    return std::nullopt;
  }

  for (const auto & match : query->matches(root, source)) {
    const auto value = match.node_for(*value_index);
    if (!value) {
      continue;
    }
    const TextRange range = value->range();
    if (range.start.line != range.end.line || point < range.start || point > range.end) {
      continue;
    }

    const auto tags = tags_in_value(value->text(source), range.start.column, range.start.line);
    if (!tags) {
      return std::nullopt;
    }
    return tag_at_column(*tags, point.column);
  }
  return std::nullopt;
}

}  // namespace htmx_lsp::lsp
