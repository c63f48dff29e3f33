// htmx_lsp/index/tag_registry.hpp - Project-wide registry of unique hx@ tags
#pragma once

#include <gsl/span>

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "htmx_lsp/index/tag.hpp"

namespace htmx_lsp
{

/**
 * Maps tag names to the location that declared them.
 *
 * Names are unique: a second declaration is never merged or overwritten but
 * handed back to the caller, which reports it as a duplicate.
 *
 * All operations are internally synchronised.
 */
class TagRegistry
{
public:
  TagRegistry() = default;
  TagRegistry(const TagRegistry &) = delete;
  TagRegistry & operator=(const TagRegistry &) = delete;

  /**
   * Insert `tag` if no tag of that name exists.
   *
   * @return nullopt on success, otherwise the rejected tag unchanged
   */
  std::optional<Tag> insert(Tag tag);

  [[nodiscard]] std::optional<Tag> lookup(std::string_view name) const;

  void delete_all_for_file(FileId file);

  /**
   * Drop every tag owned by `file` and insert `tags` (with `file` set) under
   * one lock.
   *
   * @return the tags rejected as duplicates, in input order
   */
  std::vector<Tag> replace_file_tags(FileId file, gsl::span<const Tag> tags);

  void reset();

  [[nodiscard]] size_t size() const;

  /// All tag names, sorted
  [[nodiscard]] std::vector<std::string> names() const;

  [[nodiscard]] std::vector<Tag> tags_for_file(FileId file) const;

private:
  void erase_file_locked(FileId file);

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Tag> tags_;
};

}  // namespace htmx_lsp
