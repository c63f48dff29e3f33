// htmx_lsp/syntax/languages.cpp - Lexical domains and their tree-sitter grammars
#include "htmx_lsp/syntax/languages.hpp"

namespace htmx_lsp
{

std::string_view to_string(LangType type) noexcept
{
  switch (type) {
    case LangType::Template:
      return "template";
    case LangType::JavaScript:
      return "javascript";
    case LangType::Backend:
      return "backend";
  }
  return "unknown";
}

std::string_view to_string(BackendLang lang) noexcept
{
  switch (lang) {
    case BackendLang::Python:
      return "python";
    case BackendLang::Rust:
      return "rust";
    case BackendLang::Go:
      return "go";
  }
  return "unknown";
}

std::optional<BackendLang> parse_backend_lang(std::string_view name) noexcept
{
  if (name == "python") return BackendLang::Python;
  if (name == "rust") return BackendLang::Rust;
  if (name == "go") return BackendLang::Go;
  return std::nullopt;
}

std::string_view backend_extension(BackendLang lang) noexcept
{
  switch (lang) {
    case BackendLang::Python:
      return "py";
    case BackendLang::Rust:
      return "rs";
    case BackendLang::Go:
      return "go";
  }
  return {};
}

namespace syntax
{

const TSLanguage * backend_grammar(BackendLang backend) noexcept
{
  switch (backend) {
    case BackendLang::Python:
      return tree_sitter_python();
    case BackendLang::Rust:
      return tree_sitter_rust();
    case BackendLang::Go:
      return tree_sitter_go();
  }
  return nullptr;
}

const TSLanguage * grammar_for(LangType type, BackendLang backend) noexcept
{
  switch (type) {
    case LangType::Template:
      return tree_sitter_html();
    case LangType::JavaScript:
      return tree_sitter_javascript();
    case LangType::Backend:
      return backend_grammar(backend);
  }
  return nullptr;
}

}  // namespace syntax

}  // namespace htmx_lsp
