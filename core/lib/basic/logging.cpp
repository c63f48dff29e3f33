// htmx_lsp/basic/logging.cpp - Process-wide spdlog logger
#include "htmx_lsp/basic/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <mutex>

namespace htmx_lsp
{

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text)
{
  if (text == "trace") return spdlog::level::trace;
  if (text == "debug") return spdlog::level::debug;
  if (text == "info") return spdlog::level::info;
  if (text == "warn" || text == "warning") return spdlog::level::warn;
  if (text == "error") return spdlog::level::err;
  if (text == "critical") return spdlog::level::critical;
  if (text == "off") return spdlog::level::off;
  return std::nullopt;
}

std::shared_ptr<spdlog::logger> init_logging()
{
  static std::mutex init_mutex;
  std::lock_guard<std::mutex> lock(init_mutex);

  if (auto existing = spdlog::get(k_logger_name)) {
    return existing;
  }

  auto log = spdlog::stderr_color_mt(k_logger_name);
  log->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");

  auto level = spdlog::level::warn;
  if (const char * env = std::getenv(k_log_env_var)) {
    if (const auto parsed = parse_log_level(env)) {
      level = *parsed;
    }
  }
  log->set_level(level);
  return log;
}

std::shared_ptr<spdlog::logger> logger() { return init_logging(); }

}  // namespace htmx_lsp
