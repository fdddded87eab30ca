// wirebind/basic/source_location.hpp - Position of a schema element
#pragma once

#include <cstdint>
#include <string>

namespace wirebind
{

/**
 * 1-based line/column position inside a schema file.
 *
 * Positions come straight from the YAML parser mark. A default-constructed
 * location is invalid and is printed as the bare file name.
 */
struct SourceLocation
{
  std::string file;
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] bool is_valid() const noexcept { return line != 0; }

  friend bool operator==(const SourceLocation & a, const SourceLocation & b)
  {
    return a.file == b.file && a.line == b.line && a.column == b.column;
  }

  friend bool operator<(const SourceLocation & a, const SourceLocation & b)
  {
    if (a.file != b.file) return a.file < b.file;
    if (a.line != b.line) return a.line < b.line;
    return a.column < b.column;
  }
};

}  // namespace wirebind
