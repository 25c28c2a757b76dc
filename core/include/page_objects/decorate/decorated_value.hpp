// page_objects/decorate/decorated_value.hpp - Values produced by the decorator
#pragma once

#include <memory>
#include <optional>
#include <type_traits>
#include <variant>

#include "page_objects/basic/errors.hpp"
#include "page_objects/decorate/member_type.hpp"
#include "page_objects/element/element.hpp"
#include "page_objects/element/wraps_element.hpp"
#include "page_objects/proxy/lazy_list.hpp"

namespace page_objects
{

/**
 * One alternative per supported member shape, in shape order.
 */
using DecoratedValue = std::variant<
  std::shared_ptr<Element>, std::shared_ptr<WrapsElement>, LazyList<std::shared_ptr<Element>>,
  LazyList<std::shared_ptr<WrapsElement>>>;

[[nodiscard]] MemberShape shape_of(const DecoratedValue & value) noexcept;

/**
 * Convert a decorated value back to the declared member type T.
 *
 * Returns std::nullopt when the value does not fit T (wrong shape, or a
 * wrapper instance of another type). For wrapper lists the per-element type
 * check runs on enumeration and throws DecorationError on mismatch.
 */
template <typename T>
[[nodiscard]] std::optional<T> convert_decorated(const DecoratedValue & value)
{
  using D = std::remove_cv_t<T>;
  constexpr MemberShape shape = member_shape_v<D>;

  if constexpr (shape == MemberShape::Element) {
    if (const auto * element = std::get_if<std::shared_ptr<Element>>(&value)) {
      return D(*element);
    }
  } else if constexpr (shape == MemberShape::WrappedElement) {
    using W = typename detail::Pointee<D>::type;
    if (const auto * wrapper = std::get_if<std::shared_ptr<WrapsElement>>(&value)) {
      if (*wrapper == nullptr) return D();
      if (auto typed = std::dynamic_pointer_cast<W>(*wrapper)) {
        return typed;
      }
    }
  } else if constexpr (shape == MemberShape::ElementList) {
    using Item = typename detail::LazyListTraits<D>::item_type;
    if (const auto * list = std::get_if<LazyList<std::shared_ptr<Element>>>(&value)) {
      return list->template map<Item>([](const std::shared_ptr<Element> & e) { return Item(e); });
    }
  } else if constexpr (shape == MemberShape::WrappedElementList) {
    using Item = typename detail::LazyListTraits<D>::item_type;
    using W = typename detail::Pointee<Item>::type;
    if (const auto * list = std::get_if<LazyList<std::shared_ptr<WrapsElement>>>(&value)) {
      return list->template map<Item>([](const std::shared_ptr<WrapsElement> & w) {
        auto typed = std::dynamic_pointer_cast<W>(w);
        if (w && !typed) {
          throw DecorationError(
            "Activator produced a wrapper that is not a " + readable_type_name(typeid(W)));
        }
        return typed;
      });
    }
  }

  return std::nullopt;
}

}  // namespace page_objects
