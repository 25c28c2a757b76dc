// page_objects/element/wraps_element.hpp - User wrapper types around one element
//
// A wrapper exposes exactly one embedded element. If the wrapper type also
// declares `void set_wrapped_element(std::shared_ptr<Element>)`, the slot is
// writable and the decorator fills it with the member's proxy.
//
// Usage:
//   class SearchBox : public WrapsElement, public PageObject {
//   public:
//     std::shared_ptr<Element> wrapped_element() const override { return root_; }
//     void set_wrapped_element(std::shared_ptr<Element> e) { root_ = std::move(e); }
//     ...
//   };
//
#pragma once

#include <memory>
#include <type_traits>
#include <utility>

#include "page_objects/element/element.hpp"

namespace page_objects
{

class WrapsElement
{
public:
  virtual ~WrapsElement() = default;

  [[nodiscard]] virtual std::shared_ptr<Element> wrapped_element() const = 0;
};

namespace detail
{

/// Check if W has a `set_wrapped_element(std::shared_ptr<Element>)` member
template <typename W, typename = void>
struct HasWrappedElementSetter : std::false_type
{
};

template <typename W>
struct HasWrappedElementSetter<
  W, std::void_t<decltype(std::declval<W &>().set_wrapped_element(
       std::declval<std::shared_ptr<Element>>()))>> : std::true_type
{
};

}  // namespace detail

template <typename W>
inline constexpr bool has_writable_wrapped_element_v = detail::HasWrappedElementSetter<W>::value;

}  // namespace page_objects
