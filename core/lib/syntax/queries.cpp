// htmx_lsp/syntax/queries.cpp - Compiled query cache
#include "htmx_lsp/syntax/queries.hpp"

#include <optional>
#include <string>

#include "htmx_lsp/basic/logging.hpp"

namespace htmx_lsp::syntax
{

namespace
{

std::optional<ts_ll::Query> compile_or_log(
  const TSLanguage * language, std::string_view source, std::string_view what)
{
  std::string error;
  auto q = ts_ll::Query::compile(language, source, &error);
  if (!q) {
    logger()->error("failed to compile {} query: {}", what, error);
  }
  return q;
}

const ts_ll::Query * get(const std::optional<ts_ll::Query> & q) { return q ? &*q : nullptr; }

}  // namespace

const ts_ll::Query * hx_name_query()
{
  static const auto q = compile_or_log(tree_sitter_html(), k_hx_name_query, "hx name");
  return get(q);
}

const ts_ll::Query * hx_value_query()
{
  static const auto q = compile_or_log(tree_sitter_html(), k_hx_value_query, "hx value");
  return get(q);
}

const ts_ll::Query * hx_lsp_query()
{
  static const auto q = compile_or_log(tree_sitter_html(), k_hx_lsp_query, "hx-lsp");
  return get(q);
}

const ts_ll::Query * comment_query(LangType type, BackendLang backend)
{
  switch (type) {
    case LangType::Template:
      return nullptr;
    case LangType::JavaScript: {
      static const auto q =
        compile_or_log(tree_sitter_javascript(), k_comment_tags_query, "javascript comment");
      return get(q);
    }
    case LangType::Backend:
      break;
  }

  switch (backend) {
    case BackendLang::Python: {
      static const auto q =
        compile_or_log(tree_sitter_python(), k_comment_tags_query, "python comment");
      return get(q);
    }
    case BackendLang::Rust: {
      static const auto q =
        compile_or_log(tree_sitter_rust(), k_rust_comment_tags_query, "rust comment");
      return get(q);
    }
    case BackendLang::Go: {
      static const auto q = compile_or_log(tree_sitter_go(), k_comment_tags_query, "go comment");
      return get(q);
    }
  }
  return nullptr;
}

}  // namespace htmx_lsp::syntax
