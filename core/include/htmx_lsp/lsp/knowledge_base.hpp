// htmx_lsp/lsp/knowledge_base.hpp - htmx attribute and value documentation
#pragma once

#include <gsl/span>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace htmx_lsp::lsp
{

struct KnowledgeEntry
{
  std::string name;
  std::string description;  // markdown
};

/**
 * Lookup table of documented htmx attributes and their enumerated values.
 *
 * Attribute names are stored with their `hx-` prefix. Values that take a
 * trailing selector keep their trailing space ("closest ").
 */
class KnowledgeBase
{
public:
  KnowledgeBase() = default;
  KnowledgeBase(
    std::vector<KnowledgeEntry> attributes,
    std::unordered_map<std::string, std::vector<KnowledgeEntry>> values);

  /// The curated htmx table shipped with the server
  [[nodiscard]] static const KnowledgeBase & builtin();

  [[nodiscard]] gsl::span<const KnowledgeEntry> attributes() const noexcept
  {
    return attributes_;
  }

  [[nodiscard]] const KnowledgeEntry * find_attribute(std::string_view name) const noexcept;

  /// Enumerated values of `attribute` (empty when it has none)
  [[nodiscard]] gsl::span<const KnowledgeEntry> values_for(std::string_view attribute) const;

  [[nodiscard]] const KnowledgeEntry * find_value(
    std::string_view attribute, std::string_view value) const;

private:
  std::vector<KnowledgeEntry> attributes_;
  std::unordered_map<std::string, std::vector<KnowledgeEntry>> values_;
};

}  // namespace htmx_lsp::lsp
