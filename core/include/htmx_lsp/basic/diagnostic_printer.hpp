// htmx_lsp/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "htmx_lsp/basic/diagnostic.hpp"
#include "htmx_lsp/basic/source_manager.hpp"

namespace htmx_lsp
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[W0001]: This tag already exists.
 *     --> src/api.rs:12:4
 *      |
 *   12 | // hx@users
 *      |    ^^^^^^^^
 *      |
 *    3 | # hx@users
 *      |   -------- first defined here
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   *
   * Source lines are looked up in `sources` by the label URIs; labels whose
   * document is not registered are printed without a snippet.
   */
  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by URI and position.
   */
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceRegistry & sources);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_note(std::string_view message);

  [[nodiscard]] std::string display_name(const std::string & uri) const;

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace htmx_lsp
