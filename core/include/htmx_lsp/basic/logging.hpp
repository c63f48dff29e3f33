// htmx_lsp/basic/logging.hpp - Process-wide spdlog logger
//
// stdout carries the language-server protocol, so every log line goes to
// stderr through the logger named "htmx_lsp".
//
#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>

namespace htmx_lsp
{

inline constexpr const char * k_logger_name = "htmx_lsp";
inline constexpr const char * k_log_env_var = "HTMX_LSP_LOG";

/// Parse "trace" .. "off"; nullopt for anything else
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

/**
 * Create (or return) the "htmx_lsp" stderr logger.
 *
 * The level is read from HTMX_LSP_LOG on first creation and defaults to warn.
 */
std::shared_ptr<spdlog::logger> init_logging();

/// The "htmx_lsp" logger, creating it on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

}  // namespace htmx_lsp
