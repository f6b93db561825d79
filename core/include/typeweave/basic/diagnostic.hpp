// typeweave/basic/diagnostic.hpp - Diagnostic types for definition, resolution and dispatch
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace typeweave
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
  Primary,    // direct subject of the diagnostic
  Secondary,  // related subject
};

/**
 * A label attaches a message to a named subject (entity, operator, operation).
 */
struct Label
{
  std::string subject;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "TW0102"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] std::string primary_subject() const;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic through a fluent interface and adds it to the bag on
 * destruction (RAII).
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
    std::string subject, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(std::string subject, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

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
    std::string subject, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    std::string subject, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    std::string subject, std::string message, std::string label_message = "");
  DiagnosticBuilder report_hint(
    std::string subject, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace typeweave
