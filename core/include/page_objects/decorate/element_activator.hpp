// page_objects/decorate/element_activator.hpp - Constructing wrapper instances
#pragma once

#include <memory>

#include "page_objects/decorate/member_type.hpp"
#include "page_objects/element/element.hpp"
#include "page_objects/element/wraps_element.hpp"

namespace page_objects
{

/**
 * Builds a wrapper of `type.wrapper_name` around a resolved element.
 * Failures propagate to the caller unchanged.
 */
class ElementActivator
{
public:
  virtual ~ElementActivator() = default;

  [[nodiscard]] virtual std::shared_ptr<WrapsElement> create(
    const MemberType & type, std::shared_ptr<Element> element) = 0;
};

/**
 * Uses the constructor captured by member_type_of<T>():
 * `W(std::shared_ptr<Element>)` when available, otherwise `W()`.
 */
class DefaultElementActivator : public ElementActivator
{
public:
  /// @throws DecorationError if the wrapper type has no usable constructor
  [[nodiscard]] std::shared_ptr<WrapsElement> create(
    const MemberType & type, std::shared_ptr<Element> element) override;
};

}  // namespace page_objects
