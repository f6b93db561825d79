// typeweave/basic/diagnostic_printer.cpp - rustc-like diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "typeweave/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace typeweave
{

namespace
{

int severity_rank(Severity s)
{
  switch (s) {
    case Severity::Error:
      return 0;
    case Severity::Warning:
      return 1;
    case Severity::Info:
      return 2;
    case Severity::Hint:
      return 3;
  }
  return 4;
}

const char * severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "unknown";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Subject line: --> subject ===
  const Label * primary = diag.primary_label();
  if (primary != nullptr && !primary->subject.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), primary->subject);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label(label);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return severity_rank(a.severity) < severity_rank(b.severity);
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label)
{
  if (label.message.empty()) {
    return;
  }
  if (label.style == LabelStyle::Primary) {
    print_note(label.message);
    return;
  }
  print_note(fmt::format("{}: {}", label.subject, label.message));
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace typeweave
