// page_objects/proxy/element_proxy.hpp - Lazy, caching, self-healing element handle
//
// Every capability runs through the same pipeline:
//   1. resolve through the locator if nothing is cached
//   2. invoke the capability on the cached handle
//   3. on StaleReference: drop the cache, resolve once more, invoke once more
//   4. a second StaleReference in the same call propagates unchanged
// Any other failure propagates immediately and leaves the cache alone.
//
#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "page_objects/basic/by.hpp"
#include "page_objects/element/element.hpp"
#include "page_objects/locator/element_locator.hpp"

namespace page_objects
{

class ElementProxy : public Element
{
public:
  /**
   * Create an unresolved proxy. No locator call happens here.
   *
   * @throws std::invalid_argument if locator is null or criteria is empty
   */
  ElementProxy(std::shared_ptr<ElementLocator> locator, Criteria criteria);

  /**
   * Create a proxy whose cache already holds `resolved` (e.g. an element
   * produced by a collection query). Staleness re-resolves through `locator`.
   */
  ElementProxy(
    std::shared_ptr<ElementLocator> locator, Criteria criteria, std::shared_ptr<Element> resolved);

  ElementProxy(const ElementProxy &) = delete;
  ElementProxy & operator=(const ElementProxy &) = delete;

  static std::shared_ptr<ElementProxy> create(
    std::shared_ptr<ElementLocator> locator, Criteria criteria)
  {
    return std::make_shared<ElementProxy>(std::move(locator), std::move(criteria));
  }

  // SearchContext
  [[nodiscard]] std::shared_ptr<Element> find_element(const By & by) override;
  [[nodiscard]] std::vector<std::shared_ptr<Element>> find_elements(const By & by) override;

  // Element
  void click() override;
  void clear() override;
  void submit() override;
  void send_keys(std::string_view keys) override;

  [[nodiscard]] std::string tag_name() override;
  [[nodiscard]] std::string text() override;
  [[nodiscard]] bool is_enabled() override;
  [[nodiscard]] bool is_selected() override;
  [[nodiscard]] bool is_displayed() override;
  [[nodiscard]] Point location() override;
  [[nodiscard]] Size size() override;

  [[nodiscard]] std::optional<std::string> get_attribute(std::string_view name) override;
  [[nodiscard]] std::optional<std::string> get_dom_property(std::string_view name) override;
  [[nodiscard]] std::string get_css_value(std::string_view property) override;

  // Introspection
  [[nodiscard]] const Criteria & criteria() const noexcept { return criteria_; }
  [[nodiscard]] bool is_resolved() const;

private:
  template <typename Fn>
  decltype(auto) invoke(Fn && fn);

  std::shared_ptr<Element> current();
  std::shared_ptr<Element> replace_stale(const std::shared_ptr<Element> & stale);
  std::shared_ptr<Element> resolve_locked();

  std::shared_ptr<ElementLocator> locator_;
  Criteria criteria_;

  mutable std::mutex mutex_;
  std::shared_ptr<Element> cached_;  // guarded by mutex_
};

}  // namespace page_objects
