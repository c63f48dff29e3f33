// htmx_lsp/syntax/languages.hpp - Lexical domains and their tree-sitter grammars
#pragma once

#include <tree_sitter/api.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace htmx_lsp
{

// Grammar entry points, provided by the tree-sitter-<lang> libraries
// (see CMakeLists.txt).
extern "C" const TSLanguage * tree_sitter_html();
extern "C" const TSLanguage * tree_sitter_javascript();
extern "C" const TSLanguage * tree_sitter_python();
extern "C" const TSLanguage * tree_sitter_rust();
extern "C" const TSLanguage * tree_sitter_go();

/// Lexical domain of a project file
enum class LangType : uint8_t {
  Template,
  JavaScript,
  Backend,
};

/// Supported backend languages
enum class BackendLang : uint8_t {
  Python,
  Rust,
  Go,
};

[[nodiscard]] std::string_view to_string(LangType type) noexcept;
[[nodiscard]] std::string_view to_string(BackendLang lang) noexcept;

/// "python" | "rust" | "go"
[[nodiscard]] std::optional<BackendLang> parse_backend_lang(std::string_view name) noexcept;

/// File extension (without dot) of a backend language: "py", "rs", "go"
[[nodiscard]] std::string_view backend_extension(BackendLang lang) noexcept;

/// Whether files of this domain carry hx@ tag declarations
[[nodiscard]] constexpr bool produces_tags(LangType type) noexcept
{
  return type == LangType::Backend || type == LangType::JavaScript;
}

/**
 * Classification of a path: one LangType, or two when an extension is both
 * the backend and the template extension.
 *
 * The first element is the one given at construction.
 */
class LangTypes
{
public:
  [[nodiscard]] static constexpr LangTypes one(LangType a) noexcept { return LangTypes(a, a); }
  [[nodiscard]] static constexpr LangTypes two(LangType a, LangType b) noexcept
  {
    return LangTypes(a, b);
  }

  [[nodiscard]] constexpr bool contains(LangType type) const noexcept
  {
    return first_ == type || second_ == type;
  }
  [[nodiscard]] constexpr bool is_pair() const noexcept { return first_ != second_; }

  [[nodiscard]] constexpr bool operator==(LangTypes o) const noexcept
  {
    return (first_ == o.first_ && second_ == o.second_) ||
           (first_ == o.second_ && second_ == o.first_);
  }
  [[nodiscard]] constexpr bool operator!=(LangTypes o) const noexcept { return !(*this == o); }

private:
  constexpr LangTypes(LangType a, LangType b) noexcept : first_(a), second_(b) {}

  LangType first_;
  LangType second_;
};

namespace syntax
{

/// Grammar that parses files of `type` (the backend grammar depends on `backend`)
[[nodiscard]] const TSLanguage * grammar_for(LangType type, BackendLang backend) noexcept;

[[nodiscard]] const TSLanguage * backend_grammar(BackendLang backend) noexcept;

}  // namespace syntax

}  // namespace htmx_lsp
