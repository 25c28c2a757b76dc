// page_objects/decorate/member_type.hpp - Compile-time member shape dispatch
//
// A declared member type maps to exactly one shape (first match wins):
//   std::shared_ptr<X>, X = Element or a base of it        -> Element
//   std::shared_ptr<W>, W derived from WrapsElement         -> WrappedElement
//   LazyList<std::shared_ptr<X>>                            -> ElementList
//   LazyList<std::shared_ptr<W>>                            -> WrappedElementList
//   anything else                                           -> Unsupported
//
// member_type_of<T>() erases T into a MemberType descriptor that the
// decorator dispatches on at runtime.
//
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "page_objects/element/element.hpp"
#include "page_objects/element/wraps_element.hpp"
#include "page_objects/proxy/lazy_list.hpp"

namespace page_objects
{

enum class MemberShape : uint8_t {
  Element,
  WrappedElement,
  ElementList,
  WrappedElementList,
  Unsupported,
};

[[nodiscard]] std::string_view shape_name(MemberShape shape) noexcept;

/// Readable (demangled where the platform allows) name of a std::type_info
[[nodiscard]] std::string readable_type_name(const std::type_info & info);

// ============================================================================
// Shape traits
// ============================================================================

namespace detail
{

template <typename T>
struct IsElementHandle : std::false_type
{
};

template <typename X>
struct IsElementHandle<std::shared_ptr<X>> : std::bool_constant<std::is_base_of_v<X, Element>>
{
};

template <typename T>
struct IsWrapperHandle : std::false_type
{
};

template <typename W>
struct IsWrapperHandle<std::shared_ptr<W>>
: std::bool_constant<std::is_base_of_v<WrapsElement, W> && !std::is_base_of_v<W, Element>>
{
};

template <typename T>
struct LazyListTraits
{
  static constexpr bool is_list = false;
  using item_type = void;
};

template <typename U>
struct LazyListTraits<LazyList<U>>
{
  static constexpr bool is_list = true;
  using item_type = U;
};

/// Pointee of std::shared_ptr<W>
template <typename T>
struct Pointee
{
  using type = void;
};

template <typename W>
struct Pointee<std::shared_ptr<W>>
{
  using type = W;
};

}  // namespace detail

template <typename T>
[[nodiscard]] constexpr MemberShape member_shape_of() noexcept
{
  using D = std::remove_cv_t<T>;
  if constexpr (detail::IsElementHandle<D>::value) {
    return MemberShape::Element;
  } else if constexpr (detail::IsWrapperHandle<D>::value) {
    return MemberShape::WrappedElement;
  } else if constexpr (detail::LazyListTraits<D>::is_list) {
    using Item = typename detail::LazyListTraits<D>::item_type;
    if constexpr (detail::IsElementHandle<Item>::value) {
      return MemberShape::ElementList;
    } else if constexpr (detail::IsWrapperHandle<Item>::value) {
      return MemberShape::WrappedElementList;
    } else {
      return MemberShape::Unsupported;
    }
  } else {
    return MemberShape::Unsupported;
  }
}

template <typename T>
inline constexpr MemberShape member_shape_v = member_shape_of<T>();

// ============================================================================
// MemberType
// ============================================================================

using WrapperConstructor = std::function<std::shared_ptr<WrapsElement>(std::shared_ptr<Element>)>;
using WrappedElementWriter = std::function<void(WrapsElement &, std::shared_ptr<Element>)>;

/**
 * Runtime descriptor of a declared member type.
 */
struct MemberType
{
  /// Declared type name (diagnostics only)
  std::string name;

  MemberShape shape = MemberShape::Unsupported;

  /// Wrapper type name (wrapper shapes only)
  std::string wrapper_name;

  /// Builds the wrapper from an element; empty if the wrapper type cannot be
  /// constructed from `std::shared_ptr<Element>` or default-constructed.
  WrapperConstructor construct_wrapper;

  /// Writes the wrapper's embedded element; empty if the slot is read-only.
  WrappedElementWriter write_wrapped_element;

  [[nodiscard]] bool is_wrapper() const noexcept
  {
    return shape == MemberShape::WrappedElement || shape == MemberShape::WrappedElementList;
  }
};

namespace detail
{

template <typename W>
WrapperConstructor make_wrapper_constructor()
{
  if constexpr (std::is_abstract_v<W>) {
    return {};
  } else if constexpr (std::is_constructible_v<W, std::shared_ptr<Element>>) {
    return [](std::shared_ptr<Element> element) -> std::shared_ptr<WrapsElement> {
      return std::make_shared<W>(std::move(element));
    };
  } else if constexpr (std::is_default_constructible_v<W>) {
    return [](std::shared_ptr<Element>) -> std::shared_ptr<WrapsElement> {
      return std::make_shared<W>();
    };
  } else {
    return {};
  }
}

template <typename W>
WrappedElementWriter make_wrapped_element_writer()
{
  if constexpr (has_writable_wrapped_element_v<W>) {
    return [](WrapsElement & wrapper, std::shared_ptr<Element> element) {
      // Activators may hand back another type; the member assignment rejects it later.
      if (auto * typed = dynamic_cast<W *>(&wrapper)) {
        typed->set_wrapped_element(std::move(element));
      }
    };
  } else {
    return {};
  }
}

}  // namespace detail

template <typename T>
[[nodiscard]] MemberType member_type_of()
{
  MemberType type;
  type.name = readable_type_name(typeid(T));
  type.shape = member_shape_v<T>;

  if constexpr (member_shape_v<T> == MemberShape::WrappedElement) {
    using W = typename detail::Pointee<std::remove_cv_t<T>>::type;
    type.wrapper_name = readable_type_name(typeid(W));
    type.construct_wrapper = detail::make_wrapper_constructor<W>();
    type.write_wrapped_element = detail::make_wrapped_element_writer<W>();
  } else if constexpr (member_shape_v<T> == MemberShape::WrappedElementList) {
    using Item = typename detail::LazyListTraits<std::remove_cv_t<T>>::item_type;
    using W = typename detail::Pointee<Item>::type;
    type.wrapper_name = readable_type_name(typeid(W));
    type.construct_wrapper = detail::make_wrapper_constructor<W>();
    type.write_wrapped_element = detail::make_wrapped_element_writer<W>();
  }

  return type;
}

}  // namespace page_objects
