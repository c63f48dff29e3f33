// htmx_lsp/index/document_index.cpp - URI <-> FileId arena
#include "htmx_lsp/index/document_index.hpp"

#include <mutex>

namespace htmx_lsp
{

std::optional<FileId> DocumentIndex::add(const std::string & uri)
{
  std::unique_lock lock(mutex_);
  if (ids_.find(uri) != ids_.end()) {
    return std::nullopt;
  }
  const FileId id{next_id_++};
  ids_.emplace(uri, id);
  return id;
}

std::optional<FileId> DocumentIndex::find(std::string_view uri) const
{
  std::shared_lock lock(mutex_);
  if (const auto it = ids_.find(std::string(uri)); it != ids_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<std::string> DocumentIndex::uri_of(FileId id) const
{
  std::shared_lock lock(mutex_);
  for (const auto & [uri, file] : ids_) {
    if (file == id) {
      return uri;
    }
  }
  return std::nullopt;
}

void DocumentIndex::reset()
{
  std::unique_lock lock(mutex_);
  ids_.clear();
}

size_t DocumentIndex::size() const
{
  std::shared_lock lock(mutex_);
  return ids_.size();
}

}  // namespace htmx_lsp
