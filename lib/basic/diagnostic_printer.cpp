// wirebind/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "wirebind/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace wirebind
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  std::string filename = "<schema>";
  if (!diag.location.file.empty()) {
    std::error_code ec;
    auto rel_path =
      std::filesystem::relative(diag.location.file, std::filesystem::current_path(), ec);
    filename = (ec || rel_path.empty()) ? diag.location.file : rel_path.string();
  }

  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (diag.location.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, diag.location.line, diag.location.column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  if (diag.location.is_valid()) {
    print_source_line(diag.location);
  }

  if (!diag.aggregate.empty()) {
    if (diag.field.empty()) {
      print_note(fmt::format("in '{}'", diag.aggregate));
    } else {
      print_note(fmt::format("in '{}', field '{}'", diag.aggregate, diag.field));
    }
  }

  for (const auto & note : diag.notes) {
    print_note(note);
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
    sorted_diags.begin(), sorted_diags.end(),
    [](const Diagnostic & a, const Diagnostic & b) { return a.location < b.location; });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const char * severity_str = "error";
  switch (diag.severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
    case Severity::Info:
      severity_str = "info";
      break;
    case Severity::Hint:
      severity_str = "hint";
      break;
  }

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
    os_ << severity_str << "[" << diag.code() << "]";
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, diag.code(), diag.message);
  }
}

void DiagnosticPrinter::print_source_line(const SourceLocation & loc)
{
  const auto * lines = lines_of(loc.file);
  if (lines == nullptr || loc.line == 0 || loc.line > lines->size()) {
    return;
  }

  std::string cleaned_line;
  for (const char c : (*lines)[loc.line - 1]) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else if (c != '\r') {
      cleaned_line += c;
    }
  }
  if (cleaned_line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", loc.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", loc.line);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  const std::string marker_prefix(loc.column > 0 ? loc.column - 1 : 0, ' ');
  fmt::print(os_, "      | {}", marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold << "^" << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "^");
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

const std::vector<std::string> * DiagnosticPrinter::lines_of(const std::string & file)
{
  if (file.empty()) {
    return nullptr;
  }
  auto it = line_cache_.find(file);
  if (it != line_cache_.end()) {
    return &it->second;
  }

  std::ifstream in(file);
  if (!in.is_open()) {
    return nullptr;
  }
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return &line_cache_.emplace(file, std::move(lines)).first->second;
}

// =============================================================================
// Gutter helpers (Rust-style)
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

}  // namespace wirebind
