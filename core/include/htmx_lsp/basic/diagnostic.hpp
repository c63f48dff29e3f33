// htmx_lsp/basic/diagnostic.hpp - Diagnostic types for tag reconciliation and config checks
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "htmx_lsp/basic/source_manager.hpp"

namespace htmx_lsp
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

enum class LabelStyle {
  Primary,    // where the problem is reported
  Secondary,  // related location
};

struct Label
{
  std::string uri;
  TextRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;    // e.g., "W0001"
  std::string message;
  std::string source = "htmx-lsp";

  std::vector<Label> labels;

  [[nodiscard]] const Label * primary_label() const noexcept;

  /// URI of the primary label (empty when the diagnostic has no location)
  [[nodiscard]] const std::string & uri() const noexcept;
  [[nodiscard]] TextRange primary_range() const noexcept;
};

/// Diagnostic codes
inline constexpr const char * k_duplicate_tag_code = "W0001";

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic with a fluent interface and adds it to the bag when
 * destroyed (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    std::string uri, TextRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(std::string uri, TextRange range, std::string msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    std::string uri, TextRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    std::string uri, TextRange range, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  /// Diagnostics whose primary label is in `uri`
  [[nodiscard]] std::vector<Diagnostic> for_uri(const std::string & uri) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace htmx_lsp
