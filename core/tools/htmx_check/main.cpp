// htmx-check - Command line front end of the htmx language service
//
// Usage:
//   htmx-check check [--config htmx-lsp.yaml]
//   htmx-check position <file> <line> <column> [--hover | --completion]
//
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "htmx_lsp/basic/diagnostic_printer.hpp"
#include "htmx_lsp/basic/logging.hpp"
#include "htmx_lsp/basic/uri.hpp"
#include "htmx_lsp/index/tag_registry.hpp"
#include "htmx_lsp/lsp.hpp"
#include "htmx_lsp/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "htmx-check v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check                          Scan the project and report duplicate tags\n"
            << "  position <file> <line> <col>   Classify a position in a template\n\n"
            << "Options:\n"
            << "  -c, --config <path>            Use this htmx-lsp.yaml\n"
            << "  --hover                        Print the hover text of the position\n"
            << "  --completion                   Resolve in completion mode, list items\n"
            << "  -v, --verbose                  Verbose output\n"
            << "  -h, --help                     Show this help message\n\n"
            << "Lines and columns are 0-based; columns count bytes.\n";
}

void print_diagnostics(
  const std::vector<htmx_lsp::Diagnostic> & diagnostics, const htmx_lsp::SourceRegistry & sources)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  htmx_lsp::DiagnosticPrinter printer(std::cerr, use_color);

  htmx_lsp::DiagnosticBag bag;
  for (const auto & diag : diagnostics) {
    bag.add(diag);
  }
  printer.print_all(bag, sources);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string config_path;
  bool hover = false;
  bool completion = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--hover") {
      args.hover = true;
    } else if (arg == "--completion") {
      args.completion = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-') {
      args.positional.push_back(arg);
    }
  }

  return args;
}

bool parse_uint(const std::string & s, uint32_t & out)
{
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  out = static_cast<uint32_t>(std::strtoul(s.c_str(), nullptr, 10));
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  fs::path config_path;
  if (!args.config_path.empty()) {
    config_path = fs::absolute(args.config_path);
  } else if (auto found = htmx_lsp::find_project_config(fs::current_path())) {
    config_path = *found;
  } else {
    std::cerr << "error: " << htmx_lsp::k_config_not_found << "\n";
    return 1;
  }

  const auto config_result = htmx_lsp::load_project_config(config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Checking project: " << config_result.config.project_root.string() << "\n";
  }

  htmx_lsp::lsp::Workspace ws;
  const auto result = ws.initial_project_scan(config_result.config);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics, ws.sources());
  }

  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return 1;
  }

  if (!result.diagnostics.empty()) {
    return 1;
  }

  std::cout << "project: OK (" << result.file_count << " files, " << ws.tags().size()
            << " tags)\n";
  return 0;
}

int cmd_position(const CommandArgs & args)
{
  uint32_t line = 0;
  uint32_t column = 0;
  if (
    args.positional.size() != 3 || !parse_uint(args.positional[1], line) ||
    !parse_uint(args.positional[2], column)) {
    std::cerr << "error: file, line and column required\n";
    std::cerr << "usage: htmx-check position <file> <line> <col> [--hover|--completion]\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.positional[0]);
  std::ifstream file(input_path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return 1;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  htmx_lsp::lsp::Workspace ws;
  const std::string uri = htmx_lsp::path_to_file_uri(input_path);
  ws.on_edit(uri, buffer.str());

  const htmx_lsp::TextPoint point{line, column};
  const auto mode =
    args.completion ? htmx_lsp::lsp::QueryMode::Completion : htmx_lsp::lsp::QueryMode::Hover;
  const auto pos = ws.resolve_position(uri, point, mode);

  if (!pos) {
    std::cout << "none\n";
  } else if (const auto * name = std::get_if<htmx_lsp::lsp::AttributeName>(&*pos)) {
    std::cout << "AttributeName " << name->name << "\n";
  } else {
    const auto & value = std::get<htmx_lsp::lsp::AttributeValue>(*pos);
    std::cout << "AttributeValue " << value.name << "=\"" << value.value << "\"\n";
  }

  if (args.hover) {
    if (const auto text = ws.hover(uri, point)) {
      std::cout << "\n" << *text << "\n";
    }
  }

  if (args.completion) {
    for (const auto & item : ws.completion(uri, point)) {
      std::cout << "  " << item.label << "\n";
    }
  }

  return pos ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  try {
    const auto log = htmx_lsp::init_logging();
    if (args.verbose) {
      log->set_level(spdlog::level::debug);
    }

    if (args.command == "check") {
      return cmd_check(args);
    }

    if (args.command == "position") {
      return cmd_position(args);
    }
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
