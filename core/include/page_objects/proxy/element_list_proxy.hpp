// page_objects/proxy/element_list_proxy.hpp - Collection of element proxies
//
// Nothing is cached across enumerations: each one queries the locator once
// (union over all criteria) and wraps every element in its own ElementProxy.
//
#pragma once

#include <memory>
#include <vector>

#include "page_objects/basic/by.hpp"
#include "page_objects/locator/element_locator.hpp"
#include "page_objects/proxy/element_proxy.hpp"
#include "page_objects/proxy/lazy_list.hpp"

namespace page_objects
{

class ElementListProxy
{
public:
  /**
   * @throws std::invalid_argument if locator is null or criteria is empty
   */
  ElementListProxy(std::shared_ptr<ElementLocator> locator, Criteria criteria);

  /// One fresh enumeration
  [[nodiscard]] std::vector<std::shared_ptr<Element>> elements() const;

  [[nodiscard]] const Criteria & criteria() const noexcept { return criteria_; }

  /// Expose as a lazy sequence sharing this proxy's locator and criteria
  [[nodiscard]] LazyList<std::shared_ptr<Element>> as_lazy_list() const;

  [[nodiscard]] static LazyList<std::shared_ptr<Element>> create(
    std::shared_ptr<ElementLocator> locator, Criteria criteria)
  {
    return ElementListProxy(std::move(locator), std::move(criteria)).as_lazy_list();
  }

private:
  std::shared_ptr<ElementLocator> locator_;
  Criteria criteria_;
};

}  // namespace page_objects
