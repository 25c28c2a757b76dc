// page_objects/proxy/element_list_proxy.cpp
#include "page_objects/proxy/element_list_proxy.hpp"

#include <stdexcept>
#include <utility>

namespace page_objects
{

ElementListProxy::ElementListProxy(std::shared_ptr<ElementLocator> locator, Criteria criteria)
: locator_(std::move(locator)), criteria_(std::move(criteria))
{
  if (!locator_) {
    throw std::invalid_argument("ElementListProxy requires a locator");
  }
  if (criteria_.empty()) {
    throw std::invalid_argument("ElementListProxy requires at least one criterion");
  }
}

std::vector<std::shared_ptr<Element>> ElementListProxy::elements() const
{
  auto found = locator_->locate_elements(criteria_);

  std::vector<std::shared_ptr<Element>> out;
  out.reserve(found.size());
  for (size_t i = 0; i < found.size(); ++i) {
    auto indexed = std::make_shared<IndexedElementLocator>(locator_, i);
    out.push_back(std::make_shared<ElementProxy>(std::move(indexed), criteria_, found[i]));
  }
  return out;
}

LazyList<std::shared_ptr<Element>> ElementListProxy::as_lazy_list() const
{
  const ElementListProxy self = *this;
  return LazyList<std::shared_ptr<Element>>([self]() { return self.elements(); });
}

}  // namespace page_objects
