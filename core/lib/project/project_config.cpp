// htmx_lsp/project/project_config.cpp - Project configuration implementation
//
#include "htmx_lsp/project/project_config.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace htmx_lsp
{

namespace
{

/// Parse a list of directories; a scalar is accepted as a one-element list
bool parse_dir_list(
  const YAML::Node & node, const char * key, std::vector<std::string> & out, std::string & error)
{
  const YAML::Node list = node[key];
  if (!list) {
    return true;
  }
  if (list.IsScalar()) {
    out.push_back(list.as<std::string>());
    return true;
  }
  if (!list.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  for (const auto & entry : list) {
    out.push_back(entry.as<std::string>());
  }
  return true;
}

bool parse_dir_list(
  const nlohmann::json & node, const char * key, std::vector<std::string> & out,
  std::string & error)
{
  const auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return true;
  }
  if (!it->is_array()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  for (const auto & entry : *it) {
    if (!entry.is_string()) {
      error = std::string(key) + " entries must be strings";
      return false;
    }
    out.push_back(entry.get<std::string>());
  }
  return true;
}

}  // namespace

std::filesystem::path HtmxConfig::resolve(const std::string & dir) const
{
  const std::filesystem::path p(dir);
  if (p.is_absolute() || project_root.empty()) {
    return p.lexically_normal();
  }
  return (project_root / p).lexically_normal();
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (!root.IsMap()) {
    return ConfigLoadResult::fail(k_config_not_found);
  }

  HtmxConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    if (root["lang"]) {
      config.lang = root["lang"].as<std::string>();
    }
    if (root["template_ext"]) {
      config.template_ext = root["template_ext"].as<std::string>();
    }

    std::string error;
    if (
      !parse_dir_list(root, "templates", config.templates, error) ||
      !parse_dir_list(root, "js_tags", config.js_tags, error) ||
      !parse_dir_list(root, "backend_tags", config.backend_tags, error)) {
      return ConfigLoadResult::fail(error);
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult config_from_json(
  const nlohmann::json & options, const std::filesystem::path & project_root)
{
  if (!options.is_object()) {
    return ConfigLoadResult::fail(k_config_not_found);
  }

  HtmxConfig config;
  config.project_root = project_root;

  auto read_string = [&](const char * key, std::string & out) {
    const auto it = options.find(key);
    if (it == options.end() || it->is_null()) {
      return true;
    }
    if (!it->is_string()) {
      return false;
    }
    out = it->get<std::string>();
    return true;
  };

  if (!read_string("lang", config.lang)) {
    return ConfigLoadResult::fail("lang must be a string");
  }
  if (!read_string("template_ext", config.template_ext)) {
    return ConfigLoadResult::fail("template_ext must be a string");
  }

  std::string error;
  if (
    !parse_dir_list(options, "templates", config.templates, error) ||
    !parse_dir_list(options, "js_tags", config.js_tags, error) ||
    !parse_dir_list(options, "backend_tags", config.backend_tags, error)) {
    return ConfigLoadResult::fail(error);
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::optional<std::string> validate_config(const HtmxConfig & config)
{
  if (
    config.template_ext.empty() ||
    config.template_ext.find_first_of(" \t\r\n\f\v") != std::string::npos) {
    return std::string("Template extension not found.");
  }
  if (!config.backend()) {
    return "Language " + config.lang + " is not supported.";
  }
  return std::nullopt;
}

std::optional<LangTypes> classify_path(
  const std::filesystem::path & path, const HtmxConfig & config)
{
  const std::string ext_with_dot = path.extension().string();
  if (ext_with_dot.size() < 2) {
    return std::nullopt;
  }
  const std::string ext = ext_with_dot.substr(1);

  if (ext == "js" || ext == "ts") {
    return LangTypes::one(LangType::JavaScript);
  }

  const auto backend = config.backend();
  if (backend && ext == backend_extension(*backend)) {
    if (ext == config.template_ext) {
      return LangTypes::two(LangType::Backend, LangType::Template);
    }
    return LangTypes::one(LangType::Backend);
  }
  if (ext == config.template_ext) {
    return LangTypes::one(LangType::Template);
  }
  return std::nullopt;
}

}  // namespace htmx_lsp
