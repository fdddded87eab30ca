// wirebind/project/project_config.hpp - Project configuration (wirebind.yaml)
//
// Parses and validates wirebind.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wirebind
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Generator configuration section.
 */
struct GeneratorSection
{
  /// Schema files (*.wb.yaml) to generate
  std::vector<std::filesystem::path> schemas;

  /// Output directory for generated headers
  std::filesystem::path output_dir = "generated";

  /// Prefix each field conversion with a strategy comment
  bool emit_plan_comments = false;
};

/**
 * Side channel section: where wire optionality answers come from.
 */
struct SideChannelSection
{
  /// .proto sources scanned for field labels
  std::vector<std::filesystem::path> proto_files;

  /// JSON lookup table written by `wbc scan-proto`
  std::optional<std::filesystem::path> lookup_file;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (wirebind.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  GeneratorSection generator;
  SideChannelSection side_channel;

  /// Directory containing wirebind.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Resolve a path from the configuration against the project root.
  [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path & p) const
  {
    return p.is_absolute() ? p : project_root / p;
  }
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a wirebind.yaml file.
 *
 * @param config_path Path to wirebind.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to wirebind.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "wirebind.yaml";

}  // namespace wirebind
