// htmx_lsp/index/document_index.hpp - URI <-> FileId arena
#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "htmx_lsp/basic/source_manager.hpp"

namespace htmx_lsp
{

/**
 * Assigns a FileId to every registered document URI.
 *
 * Ids come from a monotonic counter that survives reset(), so an id handed
 * out before a reset never names a different file afterwards.
 */
class DocumentIndex
{
public:
  DocumentIndex() = default;
  DocumentIndex(const DocumentIndex &) = delete;
  DocumentIndex & operator=(const DocumentIndex &) = delete;

  /// Register `uri`; nullopt when it is already registered
  std::optional<FileId> add(const std::string & uri);

  [[nodiscard]] std::optional<FileId> find(std::string_view uri) const;

  /// Reverse lookup (linear in the number of documents)
  [[nodiscard]] std::optional<std::string> uri_of(FileId id) const;

  void reset();

  [[nodiscard]] size_t size() const;

private:
  mutable std::shared_mutex mutex_;
  uint32_t next_id_ = 0;
  std::unordered_map<std::string, FileId> ids_;
};

}  // namespace htmx_lsp
