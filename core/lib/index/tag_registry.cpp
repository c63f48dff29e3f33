// htmx_lsp/index/tag_registry.cpp - Project-wide registry of unique hx@ tags
#include "htmx_lsp/index/tag_registry.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace htmx_lsp
{

std::optional<Tag> TagRegistry::insert(Tag tag)
{
  std::unique_lock lock(mutex_);
  if (tags_.find(tag.name) != tags_.end()) {
    return tag;
  }
  std::string key = tag.name;
  tags_.emplace(std::move(key), std::move(tag));
  return std::nullopt;
}

std::optional<Tag> TagRegistry::lookup(std::string_view name) const
{
  std::shared_lock lock(mutex_);
  if (const auto it = tags_.find(std::string(name)); it != tags_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void TagRegistry::delete_all_for_file(FileId file)
{
  std::unique_lock lock(mutex_);
  erase_file_locked(file);
}

std::vector<Tag> TagRegistry::replace_file_tags(FileId file, gsl::span<const Tag> tags)
{
  std::vector<Tag> conflicts;

  std::unique_lock lock(mutex_);
  erase_file_locked(file);
  for (const Tag & t : tags) {
    Tag owned = t;
    owned.file = file;
    if (tags_.find(owned.name) != tags_.end()) {
      conflicts.push_back(std::move(owned));
      continue;
    }
    std::string key = owned.name;
    tags_.emplace(std::move(key), std::move(owned));
  }
  return conflicts;
}

void TagRegistry::reset()
{
  std::unique_lock lock(mutex_);
  tags_.clear();
}

size_t TagRegistry::size() const
{
  std::shared_lock lock(mutex_);
  return tags_.size();
}

std::vector<std::string> TagRegistry::names() const
{
  std::vector<std::string> out;
  {
    std::shared_lock lock(mutex_);
    out.reserve(tags_.size());
    for (const auto & [name, tag] : tags_) {
      out.push_back(name);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<Tag> TagRegistry::tags_for_file(FileId file) const
{
  std::vector<Tag> out;
  {
    std::shared_lock lock(mutex_);
    for (const auto & [name, tag] : tags_) {
      if (tag.file == file) {
        out.push_back(tag);
      }
    }
  }
  std::sort(out.begin(), out.end(), [](const Tag & a, const Tag & b) {
    return a.range().start < b.range().start;
  });
  return out;
}

void TagRegistry::erase_file_locked(FileId file)
{
  for (auto it = tags_.begin(); it != tags_.end();) {
    if (it->second.file == file) {
      it = tags_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace htmx_lsp
