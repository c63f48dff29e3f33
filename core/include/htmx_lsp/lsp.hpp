// htmx_lsp/lsp.hpp - Language service APIs (serverless)
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "htmx_lsp/basic/diagnostic.hpp"
#include "htmx_lsp/basic/source_manager.hpp"
#include "htmx_lsp/lsp/position.hpp"
#include "htmx_lsp/project/project_config.hpp"

namespace htmx_lsp
{
class DocumentIndex;
class TagRegistry;
}  // namespace htmx_lsp

namespace htmx_lsp::lsp
{

class KnowledgeBase;
class TreeCache;

struct Location
{
  std::string uri;
  TextRange range;

  [[nodiscard]] bool operator==(const Location & o) const
  {
    return uri == o.uri && range == o.range;
  }
};

enum class CompletionKind : uint8_t {
  Attribute,
  Value,
  Tag,
};

struct CompletionItem
{
  std::string label;
  CompletionKind kind = CompletionKind::Attribute;
  std::string detail;
  std::string documentation;  // markdown
};

/**
 * Result of a project scan.
 *
 * `diagnostics` holds the duplicate-tag warnings found before the scan ended,
 * also when it failed.
 */
struct ScanResult
{
  bool success = false;
  std::string error;
  std::vector<Diagnostic> diagnostics;
  size_t file_count = 0;
};

inline constexpr const char * k_duplicate_tag_message = "This tag already exists.";

/**
 * Serverless htmx language service.
 *
 * Owns the document store, the document index, the syntax tree cache and the
 * tag registry of one project. All positions are (line, UTF-8 byte column)
 * points; the host converts editor positions.
 *
 * Thread-safety: every method may be called concurrently. A project scan
 * excludes edits and saves, and edits and saves are serialised against each
 * other (last write wins per file); other requests only take the locks of
 * the components they touch.
 */
class Workspace
{
public:
  Workspace();
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  /**
   * Validate `config`, reset all project state and index the configured
   * directories (templates, js_tags, backend_tags, in that order).
   */
  ScanResult initial_project_scan(const HtmxConfig & config);

  /**
   * Store the new text of `uri`. A registered file is reparsed; a
   * tag-producing file also has its tags re-extracted.
   *
   * @return duplicate-tag diagnostics of this file
   */
  std::vector<Diagnostic> on_edit(const std::string & uri, std::string text);

  /**
   * Re-extract the tags of a saved file.
   *
   * @return nullopt for unregistered or template files, or without a
   *         configuration
   */
  std::optional<std::vector<Diagnostic>> on_save(const std::string & uri);

  [[nodiscard]] std::optional<Position> resolve_position(
    std::string_view uri, TextPoint point, QueryMode mode) const;

  [[nodiscard]] std::optional<Location> goto_definition(std::string_view uri, TextPoint point) const;

  [[nodiscard]] std::vector<CompletionItem> completion(std::string_view uri, TextPoint point) const;

  /// Markdown hover text
  [[nodiscard]] std::optional<std::string> hover(std::string_view uri, TextPoint point) const;

  // Accessors
  [[nodiscard]] std::optional<HtmxConfig> config() const;
  [[nodiscard]] const SourceRegistry & sources() const noexcept;
  [[nodiscard]] const DocumentIndex & documents() const noexcept;
  [[nodiscard]] const TagRegistry & tags() const noexcept;
  [[nodiscard]] const TreeCache & trees() const noexcept;
  [[nodiscard]] const KnowledgeBase & knowledge_base() const noexcept;

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace htmx_lsp::lsp
