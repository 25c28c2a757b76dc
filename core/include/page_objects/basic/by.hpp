// page_objects/basic/by.hpp - Locator criteria (strategy + value)
//
// A member declares an ordered list of criteria, evaluated as logical OR with
// leftmost priority.
//
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace page_objects
{

// ============================================================================
// Strategy
// ============================================================================

/**
 * Strategy used to locate an element.
 */
enum class How : uint8_t {
  Id,
  Name,
  TagName,
  ClassName,
  CssSelector,
  LinkText,
  PartialLinkText,
  XPath,
};

/// Display name of a strategy ("Id", "CssSelector", ...)
[[nodiscard]] std::string_view how_name(How how) noexcept;

// ============================================================================
// By
// ============================================================================

/**
 * One locator criterion. Compared by value.
 */
class By
{
public:
  By(How how, std::string value) : how_(how), value_(std::move(value)) {}

  static By id(std::string value) { return {How::Id, std::move(value)}; }
  static By name(std::string value) { return {How::Name, std::move(value)}; }
  static By tag_name(std::string value) { return {How::TagName, std::move(value)}; }
  static By class_name(std::string value) { return {How::ClassName, std::move(value)}; }
  static By css_selector(std::string value) { return {How::CssSelector, std::move(value)}; }
  static By link_text(std::string value) { return {How::LinkText, std::move(value)}; }
  static By partial_link_text(std::string value)
  {
    return {How::PartialLinkText, std::move(value)};
  }
  static By xpath(std::string value) { return {How::XPath, std::move(value)}; }

  [[nodiscard]] How how() const noexcept { return how_; }
  [[nodiscard]] const std::string & value() const noexcept { return value_; }

  /// e.g. "By.Id: login"
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const By & a, const By & b)
  {
    return a.how_ == b.how_ && a.value_ == b.value_;
  }
  friend bool operator!=(const By & a, const By & b) { return !(a == b); }

private:
  How how_;
  std::string value_;
};

/**
 * Build a criterion from a strategy and a value.
 *
 * @throws std::invalid_argument if `how` is not a known strategy
 */
[[nodiscard]] By by_from(How how, std::string value);

// ============================================================================
// Criteria
// ============================================================================

using Criteria = std::vector<By>;

/**
 * Build a criteria list, dropping duplicates (first occurrence wins).
 */
[[nodiscard]] Criteria make_criteria(std::initializer_list<By> bys);
[[nodiscard]] Criteria make_criteria(const std::vector<By> & bys);

/// Joined description, e.g. "By.Id: x, or: By.ClassName: y"
[[nodiscard]] std::string describe_criteria(const std::vector<By> & criteria);

}  // namespace page_objects
