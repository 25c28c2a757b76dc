// page_objects/project/factory_config.cpp - Factory configuration implementation
//
#include "page_objects/project/factory_config.hpp"

#include <yaml-cpp/yaml.h>

#include "page_objects/basic/report_printer.hpp"

namespace page_objects
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, std::filesystem::path config_root)
{
  FactoryConfig config;
  config.config_root = std::move(config_root);

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'factory' section
  if (root["factory"]) {
    const auto & factory = root["factory"];
    if (!factory.IsMap()) {
      return ConfigLoadResult::fail("factory must be a map");
    }

    try {
      if (factory["unsupported_members"]) {
        const auto text = factory["unsupported_members"].as<std::string>();
        const auto policy = parse_policy(text);
        if (!policy) {
          return ConfigLoadResult::fail(
            "invalid factory.unsupported_members: '" + text + "' (must be 'error' or 'skip')");
        }
        config.options.unsupported_members = *policy;
      }

      if (factory["verbose"]) {
        config.options.verbose = factory["verbose"].as<bool>();
      }

      if (factory["color"]) {
        config.color = factory["color"].as<bool>();
      }
    } catch (const YAML::BadConversion & e) {
      return ConfigLoadResult::fail("invalid factory value: " + std::string(e.what()));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_factory_config(const std::filesystem::path & config_path)
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

  return parse_root(root, fs::absolute(config_path).parent_path());
}

ConfigLoadResult parse_factory_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root, {});
}

std::optional<std::filesystem::path> find_factory_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_factory_config_file_name;
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

void print_report(
  std::ostream & os, const DecorationReport & report, const FactoryConfig & config,
  Severity min_severity)
{
  ReportPrinter printer(os, config.color);
  printer.print_all(report, min_severity);
}

}  // namespace page_objects
