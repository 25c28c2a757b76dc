// page_objects/decorate/decorated_value.cpp
#include "page_objects/decorate/decorated_value.hpp"

namespace page_objects
{

MemberShape shape_of(const DecoratedValue & value) noexcept
{
  if (std::holds_alternative<std::shared_ptr<Element>>(value)) {
    return MemberShape::Element;
  }
  if (std::holds_alternative<std::shared_ptr<WrapsElement>>(value)) {
    return MemberShape::WrappedElement;
  }
  if (std::holds_alternative<LazyList<std::shared_ptr<Element>>>(value)) {
    return MemberShape::ElementList;
  }
  if (std::holds_alternative<LazyList<std::shared_ptr<WrapsElement>>>(value)) {
    return MemberShape::WrappedElementList;
  }
  // valueless_by_exception
  return MemberShape::Unsupported;
}

}  // namespace page_objects
