// htmx_lsp/lsp/workspace.cpp - Serverless language service
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "htmx_lsp/basic/logging.hpp"
#include "htmx_lsp/basic/uri.hpp"
#include "htmx_lsp/index/document_index.hpp"
#include "htmx_lsp/index/tag_registry.hpp"
#include "htmx_lsp/lsp.hpp"
#include "htmx_lsp/lsp/knowledge_base.hpp"
#include "htmx_lsp/lsp/tag_extractor.hpp"
#include "htmx_lsp/lsp/tree_cache.hpp"
#include "htmx_lsp/syntax/queries.hpp"

namespace htmx_lsp::lsp
{
namespace
{

namespace fs = std::filesystem;

std::optional<std::string> read_file_to_string(const fs::path & path)
{
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f.is_open()) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (f.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::string first_line(std::string_view text)
{
  const size_t nl = text.find('\n');
  return std::string(nl == std::string_view::npos ? text : text.substr(0, nl));
}

}  // namespace

// =============================================================================
// Workspace::Impl
// =============================================================================

struct Workspace::Impl
{
  SourceRegistry sources;
  DocumentIndex index;
  TreeCache trees;
  TagRegistry registry;
  const KnowledgeBase * kb = &KnowledgeBase::builtin();

  // Scan: exclusive. Edits and saves: shared. Guards `config`.
  mutable std::shared_mutex project_mutex;
  std::optional<HtmxConfig> config;

  // Store, reparse and re-tag of one edit or save run as a unit, so the
  // document text, its tree and its tags always come from the same write.
  std::mutex edit_mutex;

  // -----------------------------
  // Tag reconciliation
  // -----------------------------

  std::optional<Location> locate_tag(std::string_view name) const
  {
    const auto tag = registry.lookup(name);
    if (!tag) {
      return std::nullopt;
    }
    auto uri = index.uri_of(tag->file);
    if (!uri) {
      return std::nullopt;
    }
    return Location{std::move(*uri), tag->range()};
  }

  /// Re-extract the tags of a cached file and report the duplicates
  void reconcile(FileId file, const std::string & uri, const SyntaxTree & entry, DiagnosticBag & bag)
  {
    const ts_ll::Query * query = syntax::comment_query(entry.lang, trees.backend());
    if (query == nullptr) {
      return;
    }

    const ts_ll::Tree tree = entry.tree.clone();
    const std::vector<Tag> tags = extract_tags(tree.root_node(), entry.text, *query);
    const std::vector<Tag> conflicts = registry.replace_file_tags(file, tags);

    logger()->debug("{}: {} tags, {} duplicates", uri, tags.size(), conflicts.size());

    for (const Tag & dup : conflicts) {
      auto builder = bag.report_warning(uri, dup.range(), k_duplicate_tag_message);
      builder.with_code(k_duplicate_tag_code);
      if (const auto original = locate_tag(dup.name)) {
        builder.with_secondary_label(original->uri, original->range, "first declared here");
      }
    }
  }

  /// Register, parse and (for tag-producing domains) index one project file
  void add_file(const fs::path & path, LangType lang, DiagnosticBag & bag, size_t & count)
  {
    const auto uri = canonical_uri(path);
    if (!uri) {
      logger()->debug("skipping {}: cannot canonicalise", path.string());
      return;
    }

    // An open document keeps its editor text.
    std::string text;
    if (const auto open = sources.get(*uri)) {
      text = std::string(open->content());
    } else if (auto content = read_file_to_string(path)) {
      text = std::move(*content);
      sources.set_document(*uri, text);
    } else {
      logger()->debug("skipping {}: unreadable", path.string());
      return;
    }

    const auto file = index.add(*uri);
    if (!file) {
      // Already registered under another classification.
      return;
    }
    ++count;

    const auto entry = trees.upsert(*file, lang, text);
    if (entry && produces_tags(entry->lang)) {
      reconcile(*file, *uri, *entry, bag);
    }
  }

  /// Walk one configured directory; false when it does not exist
  bool walk(const std::string & dir, LangType lang, DiagnosticBag & bag, size_t & count)
  {
    const HtmxConfig & cfg = *config;
    const fs::path root = cfg.resolve(dir);

    std::error_code ec;
    if (!fs::exists(root, ec)) {
      return false;
    }

    auto visit = [&](const fs::path & p) {
      const auto types = classify_path(p, cfg);
      if (types && types->contains(lang)) {
        add_file(p, lang, bag, count);
      }
    };

    if (fs::is_regular_file(root, ec)) {
      visit(root);
      return true;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
      std::error_code type_ec;
      if (it->is_regular_file(type_ec)) {
        visit(it->path());
      }
    }
    if (ec) {
      logger()->debug("stopped walking {}: {}", root.string(), ec.message());
    }
    return true;
  }

  // -----------------------------
  // Tree lookup
  // -----------------------------

  std::optional<FileId> file_of(std::string_view uri) const { return index.find(uri); }

  std::shared_ptr<const SyntaxTree> cached(std::string_view uri) const
  {
    const auto file = file_of(uri);
    return file ? trees.get(*file) : nullptr;
  }

  /// HTML tree of a document: the cached template tree or a detached parse
  std::shared_ptr<const SyntaxTree> template_tree(std::string_view uri) const
  {
    if (auto entry = cached(uri); entry && entry->lang == LangType::Template) {
      return entry;
    }
    const auto src = sources.get(uri);
    if (src == nullptr) {
      return nullptr;
    }
    auto detached = std::make_shared<SyntaxTree>();
    detached->lang = LangType::Template;
    detached->text = std::string(src->content());
    detached->tree = trees.parse_detached(LangType::Template, detached->text);
    if (detached->tree.is_null()) {
      return nullptr;
    }
    return detached;
  }

  std::optional<Position> resolve(std::string_view uri, TextPoint point, QueryMode mode) const
  {
    const auto entry = template_tree(uri);
    if (entry == nullptr) {
      return std::nullopt;
    }
    const ts_ll::Tree tree = entry->tree.clone();
    return resolve_position(tree.root_node(), entry->text, point, mode);
  }

  std::optional<Tag> tag_reference(std::string_view uri, TextPoint point) const
  {
    const auto entry = template_tree(uri);
    if (entry == nullptr) {
      return std::nullopt;
    }
    const ts_ll::Tree tree = entry->tree.clone();
    return find_tag_reference(tree.root_node(), entry->text, point);
  }

  std::optional<Tag> comment_tag(std::string_view uri, TextPoint point) const
  {
    const auto entry = cached(uri);
    if (entry == nullptr || !produces_tags(entry->lang)) {
      return std::nullopt;
    }
    const ts_ll::Query * query = syntax::comment_query(entry->lang, trees.backend());
    if (query == nullptr) {
      return std::nullopt;
    }
    const ts_ll::Tree tree = entry->tree.clone();
    return tag_in_comment_at(tree.root_node(), entry->text, *query, point);
  }
};

// =============================================================================
// Workspace public API
// =============================================================================

Workspace::Workspace() : impl_(new Impl()) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

ScanResult Workspace::initial_project_scan(const HtmxConfig & config)
{
  std::unique_lock lock(impl_->project_mutex);

  impl_->index.reset();
  impl_->trees.reset();
  impl_->registry.reset();
  impl_->config.reset();

  ScanResult result;
  if (auto error = validate_config(config)) {
    result.error = std::move(*error);
    return result;
  }

  const BackendLang backend = *config.backend();
  if (!impl_->trees.set_backend(backend)) {
    result.error = "Language " + config.lang + " is not supported.";
    return result;
  }
  impl_->config = config;

  DiagnosticBag bag;
  const std::pair<const std::vector<std::string> *, LangType> groups[] = {
    {&config.templates, LangType::Template},
    {&config.js_tags, LangType::JavaScript},
    {&config.backend_tags, LangType::Backend},
  };

  result.success = true;
  for (const auto & [dirs, lang] : groups) {
    for (const std::string & dir : *dirs) {
      if (!impl_->walk(dir, lang, bag, result.file_count)) {
        result.success = false;
        result.error = "Template path: " + dir + " does not exist";
        break;
      }
    }
    if (!result.success) {
      break;
    }
  }

  logger()->info(
    "project scan: {} files, {} tags, {} duplicates", result.file_count, impl_->registry.size(),
    bag.size());
  result.diagnostics = bag.all();
  return result;
}

std::vector<Diagnostic> Workspace::on_edit(const std::string & uri, std::string text)
{
  std::shared_lock lock(impl_->project_mutex);
  std::lock_guard<std::mutex> edit_lock(impl_->edit_mutex);

  impl_->sources.set_document(uri, text);

  const auto file = impl_->file_of(uri);
  if (!file) {
    return {};
  }
  const auto entry = impl_->trees.upsert(*file, std::nullopt, text);
  if (!entry || !produces_tags(entry->lang)) {
    return {};
  }

  DiagnosticBag bag;
  impl_->reconcile(*file, uri, *entry, bag);
  return bag.all();
}

std::optional<std::vector<Diagnostic>> Workspace::on_save(const std::string & uri)
{
  std::shared_lock lock(impl_->project_mutex);
  std::lock_guard<std::mutex> edit_lock(impl_->edit_mutex);

  if (!impl_->config) {
    return std::nullopt;
  }
  const auto file = impl_->file_of(uri);
  if (!file) {
    return std::nullopt;
  }
  const auto entry = impl_->trees.get(*file);
  if (!entry || entry->lang == LangType::Template) {
    return std::nullopt;
  }

  DiagnosticBag bag;
  impl_->reconcile(*file, uri, *entry, bag);
  return bag.all();
}

std::optional<Position> Workspace::resolve_position(
  std::string_view uri, TextPoint point, QueryMode mode) const
{
  return impl_->resolve(uri, point, mode);
}

std::optional<Location> Workspace::goto_definition(std::string_view uri, TextPoint point) const
{
  // 1) hx-lsp="hx@a hx@b" reference
  if (const auto tag = impl_->tag_reference(uri, point)) {
    return impl_->locate_tag(tag->name);
  }

  // 2) tag in a comment of a backend / script file
  if (const auto tag = impl_->comment_tag(uri, point)) {
    return impl_->locate_tag(tag->name);
  }

  // 3) attribute name that is itself a registered tag
  if (const auto pos = impl_->resolve(uri, point, QueryMode::Hover)) {
    if (const auto * name = std::get_if<AttributeName>(&*pos)) {
      return impl_->locate_tag(name->name);
    }
  }
  return std::nullopt;
}

std::vector<CompletionItem> Workspace::completion(std::string_view uri, TextPoint point) const
{
  std::vector<CompletionItem> items;
  const auto pos = impl_->resolve(uri, point, QueryMode::Completion);
  if (!pos) {
    return items;
  }

  if (const auto * name = std::get_if<AttributeName>(&*pos)) {
    if (starts_with(name->name, "hx-") || name->name == k_fresh_attribute_name) {
      for (const auto & e : impl_->kb->attributes()) {
        items.push_back(
          CompletionItem{e.name, CompletionKind::Attribute, first_line(e.description), e.description});
      }
    }
    return items;
  }

  const auto & value = std::get<AttributeValue>(*pos);
  if (value.name == "hx-lsp") {
    for (const auto & tag_name : impl_->registry.names()) {
      std::string detail;
      if (const auto loc = impl_->locate_tag(tag_name)) {
        detail = loc->uri;
      }
      items.push_back(CompletionItem{tag_name, CompletionKind::Tag, std::move(detail), {}});
    }
    return items;
  }

  for (const auto & e : impl_->kb->values_for(value.name)) {
    items.push_back(
      CompletionItem{e.name, CompletionKind::Value, first_line(e.description), e.description});
  }
  return items;
}

std::optional<std::string> Workspace::hover(std::string_view uri, TextPoint point) const
{
  if (const auto tag = impl_->tag_reference(uri, point)) {
    const auto loc = impl_->locate_tag(tag->name);
    if (!loc) {
      return "`" + tag->name + "` is not declared.";
    }
    const auto path = file_uri_to_path(loc->uri);
    return "`" + tag->name + "` declared in `" + (path ? *path : loc->uri) + ":" +
           std::to_string(loc->range.start.line + 1) + "`";
  }

  const auto pos = impl_->resolve(uri, point, QueryMode::Hover);
  if (!pos) {
    return std::nullopt;
  }

  if (const auto * name = std::get_if<AttributeName>(&*pos)) {
    if (const auto * e = impl_->kb->find_attribute(name->name)) {
      return e->description;
    }
    return std::nullopt;
  }

  const auto & value = std::get<AttributeValue>(*pos);
  if (const auto * e = impl_->kb->find_value(value.name, value.value)) {
    return e->description;
  }
  return std::nullopt;
}

std::optional<HtmxConfig> Workspace::config() const
{
  std::shared_lock lock(impl_->project_mutex);
  return impl_->config;
}

const SourceRegistry & Workspace::sources() const noexcept { return impl_->sources; }

const DocumentIndex & Workspace::documents() const noexcept { return impl_->index; }

const TagRegistry & Workspace::tags() const noexcept { return impl_->registry; }

const TreeCache & Workspace::trees() const noexcept { return impl_->trees; }

const KnowledgeBase & Workspace::knowledge_base() const noexcept { return *impl_->kb; }

}  // namespace htmx_lsp::lsp
