// page_objects/test_support/scripted.hpp - Scriptable test doubles
//
// ScriptedElement counts capability calls and runs optional hooks, so tests
// can inject StaleReference (or any other failure) on a chosen call.
// CountingLocator counts locator calls and delegates to hooks.
//
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <gsl/span>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "page_objects/basic/errors.hpp"
#include "page_objects/element/element.hpp"
#include "page_objects/locator/element_locator.hpp"

namespace page_objects::test_support
{

class ScriptedElement : public Element
{
public:
  explicit ScriptedElement(std::string label = "") : label_(std::move(label)) {}

  /// Called with the 1-based click count before the click completes
  std::function<void(size_t)> on_click;

  /// Called with the 1-based text() count before returning label()
  std::function<void(size_t)> on_text;

  [[nodiscard]] size_t click_calls() const noexcept { return click_calls_; }
  [[nodiscard]] size_t text_calls() const noexcept { return text_calls_; }
  [[nodiscard]] const std::string & label() const noexcept { return label_; }
  [[nodiscard]] const std::string & typed() const noexcept { return typed_; }

  /// Children returned from find_element / find_elements
  std::vector<std::shared_ptr<Element>> children;

  [[nodiscard]] std::shared_ptr<Element> find_element(const By &) override
  {
    return children.empty() ? nullptr : children.front();
  }
  [[nodiscard]] std::vector<std::shared_ptr<Element>> find_elements(const By &) override
  {
    return children;
  }

  void click() override
  {
    ++click_calls_;
    if (on_click) on_click(click_calls_);
  }
  void clear() override { typed_.clear(); }
  void submit() override {}
  void send_keys(std::string_view keys) override { typed_.append(keys); }

  [[nodiscard]] std::string tag_name() override { return "div"; }
  [[nodiscard]] std::string text() override
  {
    ++text_calls_;
    if (on_text) on_text(text_calls_);
    return label_;
  }
  [[nodiscard]] bool is_enabled() override { return true; }
  [[nodiscard]] bool is_selected() override { return false; }
  [[nodiscard]] bool is_displayed() override { return true; }
  [[nodiscard]] Point location() override { return {}; }
  [[nodiscard]] Size size() override { return {}; }

  [[nodiscard]] std::optional<std::string> get_attribute(std::string_view name) override
  {
    if (name == "value") return typed_;
    return std::nullopt;
  }
  [[nodiscard]] std::optional<std::string> get_dom_property(std::string_view name) override
  {
    return get_attribute(name);
  }
  [[nodiscard]] std::string get_css_value(std::string_view) override { return {}; }

private:
  std::string label_;
  std::string typed_;
  std::atomic<size_t> click_calls_{0};
  size_t text_calls_ = 0;
};

class CountingLocator : public ElementLocator
{
public:
  using LocateOne = std::function<std::shared_ptr<Element>(gsl::span<const By>)>;
  using LocateAll = std::function<std::vector<std::shared_ptr<Element>>(gsl::span<const By>)>;

  CountingLocator() = default;
  explicit CountingLocator(LocateOne one, LocateAll all = {})
  : on_locate(std::move(one)), on_locate_all(std::move(all))
  {
  }

  /// Always resolve to `element` (and `{element}` for collections)
  static std::shared_ptr<CountingLocator> returning(std::shared_ptr<Element> element)
  {
    return std::make_shared<CountingLocator>(
      [element](gsl::span<const By>) { return element; },
      [element](gsl::span<const By>) { return std::vector<std::shared_ptr<Element>>{element}; });
  }

  LocateOne on_locate;
  LocateAll on_locate_all;

  [[nodiscard]] size_t locate_calls() const noexcept { return locate_calls_; }
  [[nodiscard]] size_t locate_all_calls() const noexcept { return locate_all_calls_; }

  [[nodiscard]] std::shared_ptr<Element> locate_element(gsl::span<const By> criteria) override
  {
    ++locate_calls_;
    if (!on_locate) {
      throw ElementNotFound(std::vector<By>(criteria.begin(), criteria.end()));
    }
    return on_locate(criteria);
  }

  [[nodiscard]] std::vector<std::shared_ptr<Element>> locate_elements(
    gsl::span<const By> criteria) override
  {
    ++locate_all_calls_;
    if (!on_locate_all) return {};
    return on_locate_all(criteria);
  }

private:
  std::atomic<size_t> locate_calls_{0};
  std::atomic<size_t> locate_all_calls_{0};
};

}  // namespace page_objects::test_support
