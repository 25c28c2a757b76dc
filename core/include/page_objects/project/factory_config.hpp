// page_objects/project/factory_config.hpp - Factory configuration (page_objects.yaml)
//
// Example:
//   factory:
//     unsupported_members: skip   # error | skip
//     verbose: true
//     color: false
//
#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>

#include "page_objects/basic/decoration_report.hpp"
#include "page_objects/factory/factory_options.hpp"

namespace page_objects
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct FactoryConfig
{
  /// Factory behavior (log stream is never configured from file)
  FactoryOptions options;

  /// Colorize printed decoration reports
  bool color = true;

  /// Directory containing page_objects.yaml (empty when parsed from text)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  FactoryConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(FactoryConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

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
 * Load a factory configuration from a page_objects.yaml file.
 *
 * @param config_path Path to page_objects.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_factory_config(const std::filesystem::path & config_path);

/**
 * Parse a factory configuration from YAML text.
 */
[[nodiscard]] ConfigLoadResult parse_factory_config(const std::string & yaml_text);

/**
 * Search for page_objects.yaml from start_dir up to the filesystem root.
 *
 * @return Path to page_objects.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_factory_config(
  const std::filesystem::path & start_dir);

/**
 * Print `report` through a ReportPrinter, colorized according to `config`.
 */
void print_report(
  std::ostream & os, const DecorationReport & report, const FactoryConfig & config,
  Severity min_severity = Severity::Info);

inline constexpr const char * k_factory_config_file_name = "page_objects.yaml";

}  // namespace page_objects
