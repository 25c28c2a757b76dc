// page_objects/locator/element_locator.hpp - Resolving criteria lists to elements
//
// Locators are the only place criteria are evaluated. They do not cache and
// do not retry; proxies layer that behavior on top.
//
#pragma once

#include <cstddef>
#include <gsl/span>
#include <memory>
#include <vector>

#include "page_objects/basic/by.hpp"
#include "page_objects/element/element.hpp"

namespace page_objects
{

// ============================================================================
// ElementLocator
// ============================================================================

class ElementLocator
{
public:
  virtual ~ElementLocator() = default;

  /**
   * Locate one element: the first criterion (in order) that yields a match.
   *
   * @throws ElementNotFound naming every attempted criterion
   */
  [[nodiscard]] virtual std::shared_ptr<Element> locate_element(gsl::span<const By> criteria) = 0;

  /**
   * Locate all elements: the union of every criterion's matches, in criteria
   * order. Returns an empty list when nothing matches.
   */
  [[nodiscard]] virtual std::vector<std::shared_ptr<Element>> locate_elements(
    gsl::span<const By> criteria) = 0;
};

// ============================================================================
// DefaultElementLocator
// ============================================================================

/**
 * Evaluates criteria against a SearchContext (a page, or an element when the
 * locator is scoped to a wrapper).
 */
class DefaultElementLocator : public ElementLocator
{
public:
  explicit DefaultElementLocator(std::shared_ptr<SearchContext> search_context);

  [[nodiscard]] std::shared_ptr<Element> locate_element(gsl::span<const By> criteria) override;
  [[nodiscard]] std::vector<std::shared_ptr<Element>> locate_elements(
    gsl::span<const By> criteria) override;

  [[nodiscard]] const std::shared_ptr<SearchContext> & search_context() const noexcept
  {
    return search_context_;
  }

private:
  std::shared_ptr<SearchContext> search_context_;
};

// ============================================================================
// IndexedElementLocator
// ============================================================================

/**
 * Resolves "element #index of a collection query" through a parent locator.
 *
 * Used for elements produced by a collection so each one can re-resolve
 * after it goes stale.
 */
class IndexedElementLocator : public ElementLocator
{
public:
  IndexedElementLocator(std::shared_ptr<ElementLocator> parent, size_t index);

  [[nodiscard]] std::shared_ptr<Element> locate_element(gsl::span<const By> criteria) override;
  [[nodiscard]] std::vector<std::shared_ptr<Element>> locate_elements(
    gsl::span<const By> criteria) override;

  [[nodiscard]] size_t index() const noexcept { return index_; }

private:
  std::shared_ptr<ElementLocator> parent_;
  size_t index_;
};

}  // namespace page_objects
