// ivl/project/project_config.cpp - Project configuration implementation
//
#include "ivl/project/project_config.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace ivl
{

namespace
{

/// Read an optional boolean flag of the 'compiler' section
bool read_flag(const YAML::Node & section, const char * key, bool & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  try {
    out = node.as<bool>();
  } catch (const YAML::Exception &) {
    error = fmt::format("compiler.{} must be a boolean", key);
    return false;
  }
  return true;
}

ConfigLoadResult build_config(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

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

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];

    if (comp["entry_points"]) {
      if (!comp["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("compiler.entry_points must be a list");
      }
      for (const auto & ep : comp["entry_points"]) {
        config.compiler.entry_points.emplace_back(ep.as<std::string>());
      }
    }

    std::string error;
    if (
      !read_flag(comp, "overlook_type_errors", config.compiler.overlook_type_errors, error) ||
      !read_flag(comp, "extract_loops", config.compiler.extract_loops, error) ||
      !read_flag(comp, "print_resolved", config.compiler.print_resolved, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return build_config(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
    return build_config(root, project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
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

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(const std::string & name)
{
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "package" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << name;
  out << YAML::Key << "version" << YAML::Value << "0.1.0";
  out << YAML::EndMap;
  out << YAML::Key << "compiler" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "entry_points" << YAML::Value << YAML::BeginSeq << "src/main.bpl"
      << YAML::EndSeq;
  out << YAML::Key << "overlook_type_errors" << YAML::Value << false;
  out << YAML::Key << "extract_loops" << YAML::Value << false;
  out << YAML::Key << "print_resolved" << YAML::Value << false;
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

}  // namespace ivl
