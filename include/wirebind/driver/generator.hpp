// wirebind/driver/generator.hpp - Generator driver
//
// Single entry point for the generation pipeline.
// Used by the CLI and can be integrated into other tools.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "wirebind/analysis/side_channel.hpp"
#include "wirebind/basic/diagnostic.hpp"
#include "wirebind/project/project_config.hpp"
#include "wirebind/schema/schema_document.hpp"

namespace wirebind
{

// ============================================================================
// Generate Mode
// ============================================================================

enum class GenerateMode {
  Check,     ///< Analysis only (no output)
  Generate,  ///< Analysis and header generation
  Plan,      ///< Analysis and JSON plan dump
};

// ============================================================================
// Generator Configuration
// ============================================================================

/**
 * Settings threaded explicitly through one generation pass.
 */
struct GeneratorConfig
{
  /// Progress output on std::cerr
  bool verbose = false;

  /// Prefix each field conversion with its strategy as a comment
  bool emit_plan_comments = false;

  /// Runtime header included by generated code
  std::string runtime_include = "wirebind/runtime/wire_support.hpp";
};

// ============================================================================
// Generate Options
// ============================================================================

struct GenerateOptions
{
  /// Generate mode
  GenerateMode mode = GenerateMode::Generate;

  /// Output directory for generated headers (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Lookup tables written by `wbc scan-proto`
  std::vector<std::filesystem::path> lookup_files;

  /// .proto sources scanned for optionality
  std::vector<std::filesystem::path> proto_files;

  GeneratorConfig config;
};

// ============================================================================
// Generate Result
// ============================================================================

struct GenerateResult
{
  /// Whether generation succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings)
  DiagnosticBag diagnostics;

  /// Generated files (only populated in Generate mode)
  std::vector<std::filesystem::path> generated_files;

  /// One entry per schema (only populated in Plan mode)
  nlohmann::json plan_json = nlohmann::json::array();
};

// ============================================================================
// Generator
// ============================================================================

/**
 * Generator driver that orchestrates the full pipeline.
 *
 * The pipeline consists of:
 * 1. Side channel construction (.proto scan, lookup files)
 * 2. Schema loading
 * 3. Planning (directives, shapes, wire inference, strategies, validation)
 * 4. Header emission (Generate mode) or plan dump (Plan mode)
 *
 * A schema with any error produces no output file.
 */
class Generator
{
public:
  /**
   * Process a single schema file.
   *
   * @param schema Path to the *.wb.yaml file
   * @param options Generate options
   * @return GenerateResult with success status and diagnostics
   */
  [[nodiscard]] static GenerateResult generate_file(
    const std::filesystem::path & schema, const GenerateOptions & options);

  /**
   * Process every schema listed in a project configuration.
   *
   * @param config Project configuration (from wirebind.yaml)
   * @param options Generate options (may override config settings)
   */
  [[nodiscard]] static GenerateResult generate_project(
    const ProjectConfig & config, const GenerateOptions & options);

  /**
   * Plan and render one schema document without touching the filesystem.
   *
   * @param side_channel Optionality lookup, may be nullptr
   * @return Header text, or std::nullopt if any error was reported
   */
  [[nodiscard]] static std::optional<std::string> generate_header(
    const SchemaDocument & document, const SideChannel * side_channel,
    const GeneratorConfig & config, DiagnosticBag & diags);

  /// Output file name for a schema: "person.wb.yaml" -> "person.wb.hpp".
  [[nodiscard]] static std::string output_file_name(const std::filesystem::path & schema);

private:
  /**
   * Build the side channel from scanned .proto files and lookup tables.
   *
   * @return std::nullopt if a source could not be read (reported to diags)
   */
  static std::optional<TableSideChannel> build_side_channel(
    const std::vector<std::filesystem::path> & proto_files,
    const std::vector<std::filesystem::path> & lookup_files, DiagnosticBag & diags);

  static void process_schema(
    const std::filesystem::path & schema, const SideChannel * side_channel,
    const GenerateOptions & options, const std::filesystem::path & output_dir,
    GenerateResult & result);

  static bool write_output(
    const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags);
};

}  // namespace wirebind
