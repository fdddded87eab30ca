// wirebind/schema/schema_loader.hpp - YAML schema front end (*.wb.yaml)
//
// Turns a schema file into field/aggregate/enum descriptors.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "wirebind/basic/source_location.hpp"
#include "wirebind/schema/schema_document.hpp"

namespace wirebind
{

/**
 * Result of loading a schema.
 */
struct SchemaLoadResult
{
  /// Parsed document (only valid if success == true)
  SchemaDocument document;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Where the error was detected, when known
  SourceLocation error_location;

  static SchemaLoadResult ok(SchemaDocument doc)
  {
    SchemaLoadResult r;
    r.document = std::move(doc);
    r.success = true;
    return r;
  }

  static SchemaLoadResult fail(std::string msg, SourceLocation where = {})
  {
    SchemaLoadResult r;
    r.error = std::move(msg);
    r.error_location = std::move(where);
    r.success = false;
    return r;
  }
};

/**
 * Load a schema from a file.
 *
 * @param path Path to a *.wb.yaml file
 * @return SchemaLoadResult with the document or an error message
 */
[[nodiscard]] SchemaLoadResult load_schema_file(const std::filesystem::path & path);

/**
 * Load a schema from YAML text.
 *
 * @param text YAML source
 * @param origin Name recorded in source locations
 */
[[nodiscard]] SchemaLoadResult load_schema_string(
  std::string_view text, std::string origin = "<string>");

/**
 * Extension recognised for schema files.
 */
inline constexpr const char * k_schema_file_extension = ".wb.yaml";

}  // namespace wirebind
