// htmx LSP server (stdio JSON-RPC)
//
// This is a thin wrapper around htmx_lsp::lsp::Workspace (serverless APIs).
// It converts LSP positions to (line, byte column) points and workspace
// results back to LSP JSON.
//
#include <htmx_lsp/basic/logging.hpp>
#include <htmx_lsp/basic/source_manager.hpp>
#include <htmx_lsp/basic/uri.hpp>
#include <htmx_lsp/lsp.hpp>
#include <htmx_lsp/project/project_config.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

using nlohmann::json;

namespace
{

namespace fs = std::filesystem;

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

std::mutex g_out_mutex;

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::lock_guard<std::mutex> lock(g_out_mutex);
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    // EOF or malformed header block.
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::parse_error & e) {
    htmx_lsp::logger()->warn("dropping malformed message: {}", e.what());
    return std::nullopt;
  }
}

// ----------------------------------------------------------------------------
// Position conversion
// ----------------------------------------------------------------------------

uint32_t utf8_length(unsigned char c0)
{
  if ((c0 & 0xE0) == 0xC0) return 2;
  if ((c0 & 0xF0) == 0xE0) return 3;
  if ((c0 & 0xF8) == 0xF0) return 4;
  return 1;
}

/// UTF-16 code units -> byte column within `line`
uint32_t utf16_to_byte_column(std::string_view line, uint32_t character)
{
  uint32_t units = 0;
  uint32_t byte_index = 0;
  while (byte_index < line.size() && units < character) {
    const uint32_t nbytes = utf8_length(static_cast<unsigned char>(line[byte_index]));
    const uint32_t cp_units = (nbytes == 4) ? 2U : 1U;
    if (units + cp_units > character || byte_index + nbytes > line.size()) {
      break;
    }
    units += cp_units;
    byte_index += nbytes;
  }
  return byte_index;
}

/// Byte column within `line` -> UTF-16 code units
uint32_t byte_to_utf16_column(std::string_view line, uint32_t column)
{
  uint32_t units = 0;
  uint32_t byte_index = 0;
  const uint32_t limit = std::min<uint32_t>(column, static_cast<uint32_t>(line.size()));
  while (byte_index < limit) {
    const uint32_t nbytes = utf8_length(static_cast<unsigned char>(line[byte_index]));
    units += (nbytes == 4) ? 2U : 1U;
    byte_index += nbytes;
  }
  return units;
}

int lsp_severity(htmx_lsp::Severity s)
{
  // LSP DiagnosticSeverity: 1 Error, 2 Warning, 3 Information, 4 Hint
  switch (s) {
    case htmx_lsp::Severity::Error:
      return 1;
    case htmx_lsp::Severity::Warning:
      return 2;
    case htmx_lsp::Severity::Info:
      return 3;
    case htmx_lsp::Severity::Hint:
      return 4;
  }
  return 3;
}

int completion_kind(htmx_lsp::lsp::CompletionKind k)
{
  // LSP CompletionItemKind (subset)
  switch (k) {
    case htmx_lsp::lsp::CompletionKind::Attribute:
      return 10;  // Property
    case htmx_lsp::lsp::CompletionKind::Value:
      return 12;  // Value
    case htmx_lsp::lsp::CompletionKind::Tag:
      return 18;  // Reference
  }
  return 1;  // Text
}

class Server
{
public:
  int run();

private:
  // Documents are keyed by canonical file URIs so that editor URIs and
  // scanned URIs agree.
  std::string normalize_uri(const std::string & uri) const
  {
    const auto path = htmx_lsp::file_uri_to_path(uri);
    if (!path) {
      return uri;
    }
    if (auto canonical = htmx_lsp::canonical_uri(*path)) {
      return *canonical;
    }
    return uri;
  }

  htmx_lsp::TextPoint to_point(const std::string & uri, const json & pos) const
  {
    const auto line = pos.value<uint32_t>("line", 0U);
    const auto character = pos.value<uint32_t>("character", 0U);
    if (!utf16_) {
      return {line, character};
    }
    const auto src = ws_.sources().get(uri);
    if (src == nullptr) {
      return {line, character};
    }
    return {line, utf16_to_byte_column(src->get_line(line), character)};
  }

  json to_lsp_position(const std::string & uri, htmx_lsp::TextPoint p) const
  {
    uint32_t character = p.column;
    if (utf16_) {
      if (const auto src = ws_.sources().get(uri)) {
        character = byte_to_utf16_column(src->get_line(p.line), p.column);
      }
    }
    return json{{"line", p.line}, {"character", character}};
  }

  json to_lsp_range(const std::string & uri, const htmx_lsp::TextRange & r) const
  {
    return json{{"start", to_lsp_position(uri, r.start)}, {"end", to_lsp_position(uri, r.end)}};
  }

  json to_lsp_diagnostic(const htmx_lsp::Diagnostic & d) const
  {
    json out;
    out["range"] = to_lsp_range(d.uri(), d.primary_range());
    out["severity"] = lsp_severity(d.severity);
    out["message"] = d.message;
    out["source"] = d.source;
    if (!d.code.empty()) {
      out["code"] = d.code;
    }
    json related = json::array();
    for (const auto & label : d.labels) {
      if (label.style != htmx_lsp::LabelStyle::Secondary) continue;
      related.push_back(
        json{
          {"location", json{{"uri", label.uri}, {"range", to_lsp_range(label.uri, label.range)}}},
          {"message", label.message},
        });
    }
    if (!related.empty()) {
      out["relatedInformation"] = std::move(related);
    }
    return out;
  }

  void publish(const std::string & uri, const std::vector<htmx_lsp::Diagnostic> & diags) const
  {
    json items = json::array();
    for (const auto & d : diags) {
      items.push_back(to_lsp_diagnostic(d));
    }
    json notif;
    notif["jsonrpc"] = "2.0";
    notif["method"] = "textDocument/publishDiagnostics";
    notif["params"] = json{{"uri", uri}, {"diagnostics", std::move(items)}};
    write_message(notif);
  }

  void publish_grouped(const std::vector<htmx_lsp::Diagnostic> & diags) const
  {
    std::map<std::string, std::vector<htmx_lsp::Diagnostic>> by_uri;
    for (const auto & d : diags) {
      by_uri[d.uri()].push_back(d);
    }
    for (const auto & [uri, items] : by_uri) {
      publish(uri, items);
    }
  }

  static void show_message(int type, const std::string & message)
  {
    json notif;
    notif["jsonrpc"] = "2.0";
    notif["method"] = "window/showMessage";
    notif["params"] = json{{"type", type}, {"message", message}};
    write_message(notif);
  }

  void start_scan()
  {
    if (!config_) {
      show_message(1, config_error_.empty() ? htmx_lsp::k_config_not_found : config_error_);
      return;
    }
    if (scan_thread_.joinable()) {
      scan_thread_.join();
    }
    scan_thread_ = std::thread([this, cfg = *config_]() {
      const auto result = ws_.initial_project_scan(cfg);
      publish_grouped(result.diagnostics);
      if (!result.success) {
        show_message(1, result.error);
      }
    });
  }

  void handle_initialize(const json & params);

  htmx_lsp::lsp::Workspace ws_;
  bool utf16_ = false;
  std::optional<htmx_lsp::HtmxConfig> config_;
  std::string config_error_;
  std::thread scan_thread_;
};

void Server::handle_initialize(const json & params)
{
  // Position encoding: utf-8 preferred, utf-16 otherwise.
  utf16_ = true;
  const json caps = params.value("capabilities", json::object());
  if (caps.is_object() && caps.contains("general") && caps["general"].is_object()) {
    const auto & gen = caps["general"];
    if (gen.contains("positionEncodings") && gen["positionEncodings"].is_array()) {
      for (const auto & e : gen["positionEncodings"]) {
        if (e.is_string() && e.get<std::string>() == "utf-8") {
          utf16_ = false;
        }
      }
    }
  }

  // Project root from rootUri, falling back to the working directory.
  fs::path root = fs::current_path();
  if (params.contains("rootUri") && params["rootUri"].is_string()) {
    if (const auto p = htmx_lsp::file_uri_to_path(params["rootUri"].get<std::string>())) {
      root = *p;
    }
  }

  htmx_lsp::ConfigLoadResult loaded;
  if (params.contains("initializationOptions") && params["initializationOptions"].is_object()) {
    loaded = htmx_lsp::config_from_json(params["initializationOptions"], root);
  } else if (const auto file = htmx_lsp::find_project_config(root)) {
    loaded = htmx_lsp::load_project_config(*file);
  } else {
    loaded = htmx_lsp::ConfigLoadResult::fail(htmx_lsp::k_config_not_found);
  }

  if (loaded.success) {
    config_ = std::move(loaded.config);
  } else {
    config_error_ = loaded.error;
    htmx_lsp::logger()->warn("configuration: {}", loaded.error);
  }
}

int Server::run()
{
  bool running = true;
  while (running) {
    const auto msg_opt = read_message();
    if (!msg_opt) {
      if (!std::cin.good()) {
        break;
      }
      continue;
    }

    const json & msg = *msg_opt;
    if (!msg.is_object()) {
      continue;
    }
    const std::string method = msg.value("method", "");
    const bool is_request = msg.contains("id");

    auto respond = [&](const json & result) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = msg["id"];
      resp["result"] = result;
      write_message(resp);
    };

    auto respond_error = [&](int code, std::string message) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = msg["id"];
      resp["error"] = json{{"code", code}, {"message", std::move(message)}};
      write_message(resp);
    };

    const json params = msg.value("params", json::object());
    const json td = params.is_object() ? params.value("textDocument", json::object()) : json();
    const std::string uri =
      td.is_object() ? normalize_uri(td.value("uri", std::string())) : std::string();

    if (method == "initialize" && is_request) {
      handle_initialize(params);

      json caps;
      caps["positionEncoding"] = utf16_ ? "utf-16" : "utf-8";
      caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}, {"save", true}};
      caps["completionProvider"] =
        json{{"resolveProvider", false}, {"triggerCharacters", json::array({"-", "\"", " "})}};
      caps["hoverProvider"] = true;
      caps["definitionProvider"] = true;

      respond(json{{"capabilities", caps}, {"serverInfo", json{{"name", "htmx-lsp"}}}});
      continue;
    }

    if (method == "initialized") {
      start_scan();
      continue;
    }

    if (method == "shutdown" && is_request) {
      respond(json());
      continue;
    }

    if (method == "exit") {
      running = false;
      continue;
    }

    if (method == "textDocument/didOpen") {
      if (!uri.empty()) {
        publish(uri, ws_.on_edit(uri, td.value("text", std::string())));
      }
      continue;
    }

    if (method == "textDocument/didChange") {
      if (uri.empty()) {
        continue;
      }
      // Full sync: take the last change
      const auto changes = params.value("contentChanges", json::array());
      if (!changes.is_array() || changes.empty()) {
        continue;
      }
      const auto & c = changes.back();
      if (!c.is_object() || !c.contains("text") || !c["text"].is_string()) {
        continue;
      }
      publish(uri, ws_.on_edit(uri, c["text"].get<std::string>()));
      continue;
    }

    if (method == "textDocument/didSave") {
      if (!uri.empty()) {
        if (const auto diags = ws_.on_save(uri)) {
          publish(uri, *diags);
        }
      }
      continue;
    }

    if (method == "textDocument/didClose") {
      continue;
    }

    if (method == "textDocument/completion" && is_request) {
      const auto point = to_point(uri, params.value("position", json::object()));
      json items = json::array();
      for (const auto & c : ws_.completion(uri, point)) {
        json item;
        item["label"] = c.label;
        item["kind"] = completion_kind(c.kind);
        if (!c.detail.empty()) {
          item["detail"] = c.detail;
        }
        if (!c.documentation.empty()) {
          item["documentation"] = json{{"kind", "markdown"}, {"value", c.documentation}};
        }
        items.push_back(std::move(item));
      }
      respond(json{{"isIncomplete", false}, {"items", std::move(items)}});
      continue;
    }

    if (method == "textDocument/hover" && is_request) {
      const auto point = to_point(uri, params.value("position", json::object()));
      const auto text = ws_.hover(uri, point);
      if (!text || text->empty()) {
        respond(nullptr);
        continue;
      }
      respond(json{{"contents", json{{"kind", "markdown"}, {"value", *text}}}});
      continue;
    }

    if (method == "textDocument/definition" && is_request) {
      const auto point = to_point(uri, params.value("position", json::object()));
      const auto loc = ws_.goto_definition(uri, point);
      if (!loc) {
        respond(nullptr);
        continue;
      }
      respond(json{{"uri", loc->uri}, {"range", to_lsp_range(loc->uri, loc->range)}});
      continue;
    }

    // Unknown method
    if (is_request) {
      respond_error(-32601, "Method not found");
    }
  }

  if (scan_thread_.joinable()) {
    scan_thread_.join();
  }
  return 0;
}

}  // namespace

int main()
{
  try {
    htmx_lsp::init_logging();
    Server server;
    return server.run();
  } catch (const std::exception & e) {
    std::cerr << "htmx_lsp_server: fatal error: " << e.what() << "\n";
    return 1;
  }
}
