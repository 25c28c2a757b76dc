// page_objects/proxy/element_proxy.cpp - Resolve / invoke / recover pipeline
#include "page_objects/proxy/element_proxy.hpp"

#include <stdexcept>
#include <utility>

#include "page_objects/basic/errors.hpp"

namespace page_objects
{

ElementProxy::ElementProxy(std::shared_ptr<ElementLocator> locator, Criteria criteria)
: ElementProxy(std::move(locator), std::move(criteria), nullptr)
{
}

ElementProxy::ElementProxy(
  std::shared_ptr<ElementLocator> locator, Criteria criteria, std::shared_ptr<Element> resolved)
: locator_(std::move(locator)), criteria_(std::move(criteria)), cached_(std::move(resolved))
{
  if (!locator_) {
    throw std::invalid_argument("ElementProxy requires a locator");
  }
  if (criteria_.empty()) {
    throw std::invalid_argument("ElementProxy requires at least one criterion");
  }
}

bool ElementProxy::is_resolved() const
{
  const std::lock_guard<std::mutex> lock(mutex_);
  return cached_ != nullptr;
}

// =============================================================================
// Pipeline
// =============================================================================

std::shared_ptr<Element> ElementProxy::resolve_locked()
{
  auto element = locator_->locate_element(criteria_);
  if (!element) {
    throw ElementNotFound(criteria_);
  }
  cached_ = element;
  return element;
}

std::shared_ptr<Element> ElementProxy::current()
{
  const std::lock_guard<std::mutex> lock(mutex_);
  if (cached_) {
    return cached_;
  }
  return resolve_locked();
}

std::shared_ptr<Element> ElementProxy::replace_stale(const std::shared_ptr<Element> & stale)
{
  const std::lock_guard<std::mutex> lock(mutex_);

  // Another caller already replaced the handle we saw go stale.
  if (cached_ && cached_ != stale) {
    return cached_;
  }

  cached_.reset();
  return resolve_locked();
}

template <typename Fn>
decltype(auto) ElementProxy::invoke(Fn && fn)
{
  std::shared_ptr<Element> element = current();
  try {
    return fn(*element);
  } catch (const StaleReference &) {
    element = replace_stale(element);
  }
  // Second attempt: a StaleReference from here reaches the caller.
  return fn(*element);
}

// =============================================================================
// SearchContext
// =============================================================================

std::shared_ptr<Element> ElementProxy::find_element(const By & by)
{
  return invoke([&](Element & e) { return e.find_element(by); });
}

std::vector<std::shared_ptr<Element>> ElementProxy::find_elements(const By & by)
{
  return invoke([&](Element & e) { return e.find_elements(by); });
}

// =============================================================================
// Element
// =============================================================================

void ElementProxy::click()
{
  invoke([](Element & e) { e.click(); });
}

void ElementProxy::clear()
{
  invoke([](Element & e) { e.clear(); });
}

void ElementProxy::submit()
{
  invoke([](Element & e) { e.submit(); });
}

void ElementProxy::send_keys(std::string_view keys)
{
  invoke([&](Element & e) { e.send_keys(keys); });
}

std::string ElementProxy::tag_name()
{
  return invoke([](Element & e) { return e.tag_name(); });
}

std::string ElementProxy::text()
{
  return invoke([](Element & e) { return e.text(); });
}

bool ElementProxy::is_enabled()
{
  return invoke([](Element & e) { return e.is_enabled(); });
}

bool ElementProxy::is_selected()
{
  return invoke([](Element & e) { return e.is_selected(); });
}

bool ElementProxy::is_displayed()
{
  return invoke([](Element & e) { return e.is_displayed(); });
}

Point ElementProxy::location()
{
  return invoke([](Element & e) { return e.location(); });
}

Size ElementProxy::size()
{
  return invoke([](Element & e) { return e.size(); });
}

std::optional<std::string> ElementProxy::get_attribute(std::string_view name)
{
  return invoke([&](Element & e) { return e.get_attribute(name); });
}

std::optional<std::string> ElementProxy::get_dom_property(std::string_view name)
{
  return invoke([&](Element & e) { return e.get_dom_property(name); });
}

std::string ElementProxy::get_css_value(std::string_view property)
{
  return invoke([&](Element & e) { return e.get_css_value(property); });
}

}  // namespace page_objects
