// page_objects/locator/element_locator.cpp
#include "page_objects/locator/element_locator.hpp"

#include <fmt/core.h>

#include <iterator>
#include <stdexcept>
#include <utility>

#include "page_objects/basic/errors.hpp"

namespace page_objects
{

namespace
{

void require_criteria(gsl::span<const By> criteria)
{
  if (criteria.empty()) {
    throw std::invalid_argument("List of criteria may not be empty");
  }
}

std::vector<By> to_vector(gsl::span<const By> criteria)
{
  return std::vector<By>(criteria.begin(), criteria.end());
}

}  // namespace

// ============================================================================
// DefaultElementLocator
// ============================================================================

DefaultElementLocator::DefaultElementLocator(std::shared_ptr<SearchContext> search_context)
: search_context_(std::move(search_context))
{
  if (!search_context_) {
    throw std::invalid_argument("DefaultElementLocator requires a search context");
  }
}

std::shared_ptr<Element> DefaultElementLocator::locate_element(gsl::span<const By> criteria)
{
  require_criteria(criteria);

  for (const auto & by : criteria) {
    if (auto element = search_context_->find_element(by)) {
      return element;
    }
  }

  throw ElementNotFound(to_vector(criteria));
}

std::vector<std::shared_ptr<Element>> DefaultElementLocator::locate_elements(
  gsl::span<const By> criteria)
{
  require_criteria(criteria);

  std::vector<std::shared_ptr<Element>> collection;
  for (const auto & by : criteria) {
    auto found = search_context_->find_elements(by);
    collection.insert(
      collection.end(), std::make_move_iterator(found.begin()),
      std::make_move_iterator(found.end()));
  }
  return collection;
}

// ============================================================================
// IndexedElementLocator
// ============================================================================

IndexedElementLocator::IndexedElementLocator(std::shared_ptr<ElementLocator> parent, size_t index)
: parent_(std::move(parent)), index_(index)
{
  if (!parent_) {
    throw std::invalid_argument("IndexedElementLocator requires a parent locator");
  }
}

std::shared_ptr<Element> IndexedElementLocator::locate_element(gsl::span<const By> criteria)
{
  auto all = parent_->locate_elements(criteria);
  if (index_ < all.size()) {
    return all[index_];
  }

  auto attempted = to_vector(criteria);
  throw ElementNotFound(
    fmt::format(
      "Could not find element #{} by: {} ({} matched)", index_, describe_criteria(attempted),
      all.size()),
    std::move(attempted));
}

std::vector<std::shared_ptr<Element>> IndexedElementLocator::locate_elements(
  gsl::span<const By> criteria)
{
  return parent_->locate_elements(criteria);
}

}  // namespace page_objects
