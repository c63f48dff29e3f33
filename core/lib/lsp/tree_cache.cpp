// htmx_lsp/lsp/tree_cache.cpp - Per-file syntax trees
#include "htmx_lsp/lsp/tree_cache.hpp"

#include <utility>

#include "htmx_lsp/basic/logging.hpp"

namespace htmx_lsp::lsp
{

TreeCache::TreeCache(BackendLang backend)
: html_(tree_sitter_html()),
  javascript_(tree_sitter_javascript()),
  backend_(syntax::backend_grammar(backend)),
  backend_lang_(backend)
{
}

bool TreeCache::set_backend(BackendLang backend)
{
  std::lock_guard<std::mutex> lock(parse_mutex_);
  if (backend == backend_lang_) {
    return true;
  }
  if (!backend_.set_language(syntax::backend_grammar(backend))) {
    logger()->error("cannot load the {} grammar", to_string(backend));
    return false;
  }
  backend_lang_ = backend;
  return true;
}

BackendLang TreeCache::backend() const
{
  std::lock_guard<std::mutex> lock(parse_mutex_);
  return backend_lang_;
}

std::shared_ptr<const SyntaxTree> TreeCache::upsert(
  FileId file, std::optional<LangType> lang, std::string_view text)
{
  std::lock_guard<std::mutex> lock(parse_mutex_);

  if (const auto existing = get(file)) {
    lang = existing->lang;
  } else if (!lang) {
    return nullptr;
  }

  auto entry = std::make_shared<SyntaxTree>();
  entry->tree = parse_locked(*lang, text);
  entry->lang = *lang;
  entry->text = std::string(text);
  if (entry->tree.is_null()) {
    return nullptr;
  }

  std::shared_ptr<const SyntaxTree> stored = std::move(entry);
  {
    std::unique_lock map_lock(map_mutex_);
    trees_[file] = stored;
  }
  return stored;
}

std::shared_ptr<const SyntaxTree> TreeCache::get(FileId file) const
{
  std::shared_lock lock(map_mutex_);
  if (const auto it = trees_.find(file); it != trees_.end()) {
    return it->second;
  }
  return nullptr;
}

void TreeCache::erase(FileId file)
{
  std::unique_lock lock(map_mutex_);
  trees_.erase(file);
}

void TreeCache::reset()
{
  std::unique_lock lock(map_mutex_);
  trees_.clear();
}

size_t TreeCache::size() const
{
  std::shared_lock lock(map_mutex_);
  return trees_.size();
}

ts_ll::Tree TreeCache::parse_detached(LangType lang, std::string_view text) const
{
  std::lock_guard<std::mutex> lock(parse_mutex_);
  return parse_locked(lang, text);
}

ts_ll::Tree TreeCache::parse_locked(LangType lang, std::string_view text) const
{
  switch (lang) {
    case LangType::Template:
      return html_.parse_string(text);
    case LangType::JavaScript:
      return javascript_.parse_string(text);
    case LangType::Backend:
      return backend_.parse_string(text);
  }
  return ts_ll::Tree();
}

}  // namespace htmx_lsp::lsp
