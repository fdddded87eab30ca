// wirebind/basic/diagnostic_printer.hpp
//
// Prints diagnostics with schema source context and position markers
// in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "wirebind/basic/diagnostic.hpp"

namespace wirebind
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0103]: cannot determine wire optionality of field 'owner'
 *     --> schemas/library.wb.yaml:12:11
 *      |
 *   12 |       - { name: owner, type: std::map<std::string, int32_t> }
 *      |           ^
 *      = note: in aggregate 'Shelf', field 'owner'
 *      = help: add 'optional' or 'required' to the field directives
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
   * The source line is read lazily from the file named in the diagnostic
   * location; missing files just skip the snippet.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by location.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_source_line(const SourceLocation & loc);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  const std::vector<std::string> * lines_of(const std::string & file);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
  std::map<std::string, std::vector<std::string>> line_cache_;
};

}  // namespace wirebind
