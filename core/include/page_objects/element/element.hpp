// page_objects/element/element.hpp - Element handle and search context interfaces
//
// These are the seams to the browser-facing client. Implementations may throw
// StaleReference from any capability once the underlying node is gone.
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "page_objects/basic/by.hpp"

namespace page_objects
{

class Element;

struct Point
{
  int32_t x = 0;
  int32_t y = 0;

  friend bool operator==(const Point & a, const Point & b) { return a.x == b.x && a.y == b.y; }
};

struct Size
{
  int32_t width = 0;
  int32_t height = 0;

  friend bool operator==(const Size & a, const Size & b)
  {
    return a.width == b.width && a.height == b.height;
  }
};

// ============================================================================
// SearchContext
// ============================================================================

/**
 * Anything elements can be searched from (a page, or an element subtree).
 */
class SearchContext
{
public:
  virtual ~SearchContext() = default;

  /// First element matching `by`, or nullptr when nothing matches
  [[nodiscard]] virtual std::shared_ptr<Element> find_element(const By & by) = 0;

  /// All elements matching `by`, in document order (empty when nothing matches)
  [[nodiscard]] virtual std::vector<std::shared_ptr<Element>> find_elements(const By & by) = 0;
};

// ============================================================================
// Element
// ============================================================================

/**
 * Live reference to a single DOM node.
 */
class Element : public SearchContext
{
public:
  // Actions
  virtual void click() = 0;
  virtual void clear() = 0;
  virtual void submit() = 0;
  virtual void send_keys(std::string_view keys) = 0;

  // State
  [[nodiscard]] virtual std::string tag_name() = 0;
  [[nodiscard]] virtual std::string text() = 0;
  [[nodiscard]] virtual bool is_enabled() = 0;
  [[nodiscard]] virtual bool is_selected() = 0;
  [[nodiscard]] virtual bool is_displayed() = 0;
  [[nodiscard]] virtual Point location() = 0;
  [[nodiscard]] virtual Size size() = 0;

  // Attributes / properties
  [[nodiscard]] virtual std::optional<std::string> get_attribute(std::string_view name) = 0;
  [[nodiscard]] virtual std::optional<std::string> get_dom_property(std::string_view name) = 0;
  [[nodiscard]] virtual std::string get_css_value(std::string_view property) = 0;
};

using ElementPtr = std::shared_ptr<Element>;

}  // namespace page_objects
