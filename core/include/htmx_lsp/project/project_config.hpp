// htmx_lsp/project/project_config.hpp - Project configuration (htmx-lsp.yaml)
//
// Parses and validates the project configuration, either from an
// htmx-lsp.yaml file or from the client's initializationOptions.
// Designed for reuse in both CLI and LSP.
//
#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "htmx_lsp/syntax/languages.hpp"

namespace htmx_lsp
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration.
 */
struct HtmxConfig
{
  /// Backend language: "python" | "rust" | "go"
  std::string lang;

  /// Template file extension without the dot (e.g. "html", "jinja")
  std::string template_ext;

  /// Directories searched for template files
  std::vector<std::string> templates;

  /// Directories searched for .js/.ts files carrying hx@ tags
  std::vector<std::string> js_tags;

  /// Directories searched for backend files carrying hx@ tags
  std::vector<std::string> backend_tags;

  /// Directory relative entries are resolved against
  std::filesystem::path project_root;

  [[nodiscard]] std::optional<BackendLang> backend() const noexcept
  {
    return parse_backend_lang(lang);
  }

  /// Resolve a configured directory against project_root
  [[nodiscard]] std::filesystem::path resolve(const std::string & dir) const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  HtmxConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(HtmxConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

inline constexpr const char * k_config_not_found = "Config is not found";

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from an htmx-lsp.yaml file.
 *
 * Relative directories are resolved against the directory of the file.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Build a configuration from the JSON `initializationOptions` object.
 *
 * @param project_root directory relative entries are resolved against
 */
[[nodiscard]] ConfigLoadResult config_from_json(
  const nlohmann::json & options, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @return Path to htmx-lsp.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Check the fields a project scan depends on.
 *
 * @return the error message, or nullopt when the configuration is usable
 */
[[nodiscard]] std::optional<std::string> validate_config(const HtmxConfig & config);

/**
 * Classify a path by its extension.
 *
 * - `js` / `ts` -> JavaScript
 * - the backend extension -> Backend, or {Backend, Template} when it is also
 *   the template extension
 * - the template extension -> Template
 */
[[nodiscard]] std::optional<LangTypes> classify_path(
  const std::filesystem::path & path, const HtmxConfig & config);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "htmx-lsp.yaml";

}  // namespace htmx_lsp
