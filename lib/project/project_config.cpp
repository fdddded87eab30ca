// wirebind/project/project_config.cpp - Project configuration implementation
//
#include "wirebind/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace wirebind
{

namespace
{

/// Read a list of paths; false if the node is not a sequence of scalars
bool parse_path_list(
  const YAML::Node & node, std::vector<std::filesystem::path> & out, std::string & error,
  const char * what)
{
  if (!node.IsSequence()) {
    error = std::string(what) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = std::string(what) + " entries must be strings";
      return false;
    }
    out.emplace_back(item.as<std::string>());
  }
  return true;
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    std::string error;

    // Parse 'package' section
    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    // Parse 'generator' section
    if (root["generator"]) {
      const auto & gen = root["generator"];
      if (gen["schemas"] && !parse_path_list(gen["schemas"], config.generator.schemas, error, "generator.schemas")) {
        return ConfigLoadResult::fail(error);
      }
      if (gen["output_dir"]) {
        config.generator.output_dir = gen["output_dir"].as<std::string>();
      }
      if (gen["emit_plan_comments"]) {
        config.generator.emit_plan_comments = gen["emit_plan_comments"].as<bool>();
      }
    }

    // Parse 'side_channel' section
    if (root["side_channel"]) {
      const auto & sc = root["side_channel"];
      if (
        sc["proto_files"] &&
        !parse_path_list(sc["proto_files"], config.side_channel.proto_files, error, "side_channel.proto_files")) {
        return ConfigLoadResult::fail(error);
      }
      if (sc["lookup_file"]) {
        config.side_channel.lookup_file = sc["lookup_file"].as<std::string>();
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  if (config.generator.schemas.empty()) {
    return ConfigLoadResult::fail("generator.schemas must list at least one schema file");
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace wirebind
