// page_objects/factory/factory_options.hpp - Factory behavior switches
#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace page_objects
{

/**
 * What the factory does when a member's declared type is unsupported.
 */
enum class UnsupportedMemberPolicy : uint8_t {
  Error,  ///< Rethrow UnsupportedMemberType (default)
  Skip,   ///< Record a warning and leave the member untouched
};

[[nodiscard]] std::string_view policy_name(UnsupportedMemberPolicy policy) noexcept;

/// Parse "error" / "skip"
[[nodiscard]] std::optional<UnsupportedMemberPolicy> parse_policy(std::string_view text) noexcept;

struct FactoryOptions
{
  UnsupportedMemberPolicy unsupported_members = UnsupportedMemberPolicy::Error;

  /// Trace every decorated member to `log`
  bool verbose = false;

  /// Trace stream (std::cerr when null)
  std::ostream * log = nullptr;
};

}  // namespace page_objects
