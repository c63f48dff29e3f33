// htmx_lsp/basic/uri.hpp - file:// URI helpers
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace htmx_lsp
{

/// Percent-decode a URI component ("%20" -> ' ')
[[nodiscard]] std::string url_decode(std::string_view s);

/**
 * Convert a `file://` URI to a local path.
 *
 * Returns nullopt for other schemes and for `file://host/...` URIs.
 */
[[nodiscard]] std::optional<std::string> file_uri_to_path(std::string_view uri);

/// Convert a local path to a `file://` URI, percent-encoding reserved bytes
[[nodiscard]] std::string path_to_file_uri(const std::filesystem::path & path);

/**
 * Canonical URI of an existing file.
 *
 * The path is resolved with std::filesystem::canonical so that symlinked and
 * relative spellings of one file map to one URI. Returns nullopt when the file
 * cannot be canonicalised.
 */
[[nodiscard]] std::optional<std::string> canonical_uri(const std::filesystem::path & path);

}  // namespace htmx_lsp
