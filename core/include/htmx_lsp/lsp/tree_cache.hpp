// htmx_lsp/lsp/tree_cache.hpp - Per-file syntax trees
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "htmx_lsp/basic/source_manager.hpp"
#include "htmx_lsp/syntax/languages.hpp"
#include "htmx_lsp/syntax/ts_ll.hpp"

namespace htmx_lsp::lsp
{

/// A parsed file, the text it was parsed from and the domain it was
/// classified as when first cached
struct SyntaxTree
{
  ts_ll::Tree tree;
  LangType lang = LangType::Template;
  std::string text;
};

/**
 * Owns one parser per lexical domain and the latest tree of every project
 * file.
 *
 * Parsing and replacement are serialised by one mutex (parsers are
 * stateful). Entries are immutable and shared: a reader keeps a consistent
 * tree even when the entry is replaced concurrently. Threads that read the
 * same entry should query a `tree.clone()` of it.
 */
class TreeCache
{
public:
  /// @throws std::runtime_error when a grammar cannot be loaded
  explicit TreeCache(BackendLang backend = BackendLang::Python);

  TreeCache(const TreeCache &) = delete;
  TreeCache & operator=(const TreeCache &) = delete;

  /// Select the backend grammar; false keeps the previous one
  bool set_backend(BackendLang backend);
  [[nodiscard]] BackendLang backend() const;

  /**
   * Parse `text` and replace the entry of `file`.
   *
   * An existing entry keeps its classification and `lang` is ignored. A new
   * entry needs `lang`; without it nothing is stored.
   *
   * @return the stored entry, or nullptr when nothing was stored
   */
  std::shared_ptr<const SyntaxTree> upsert(
    FileId file, std::optional<LangType> lang, std::string_view text);

  [[nodiscard]] std::shared_ptr<const SyntaxTree> get(FileId file) const;

  void erase(FileId file);
  void reset();
  [[nodiscard]] size_t size() const;

  /// Parse without caching (documents outside the indexed project)
  [[nodiscard]] ts_ll::Tree parse_detached(LangType lang, std::string_view text) const;

private:
  [[nodiscard]] ts_ll::Tree parse_locked(LangType lang, std::string_view text) const;

  mutable std::mutex parse_mutex_;
  ts_ll::Parser html_;
  ts_ll::Parser javascript_;
  ts_ll::Parser backend_;
  BackendLang backend_lang_;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<FileId, std::shared_ptr<const SyntaxTree>, FileIdHash> trees_;
};

}  // namespace htmx_lsp::lsp
