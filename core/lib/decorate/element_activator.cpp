// page_objects/decorate/element_activator.cpp
#include "page_objects/decorate/element_activator.hpp"

#include <fmt/core.h>

#include <utility>

#include "page_objects/basic/errors.hpp"

namespace page_objects
{

std::shared_ptr<WrapsElement> DefaultElementActivator::create(
  const MemberType & type, std::shared_ptr<Element> element)
{
  if (!type.construct_wrapper) {
    throw DecorationError(fmt::format(
      "Unable to construct {}: it needs a constructor taking std::shared_ptr<Element> or a "
      "default constructor",
      type.wrapper_name.empty() ? type.name : type.wrapper_name));
  }
  return type.construct_wrapper(std::move(element));
}

}  // namespace page_objects
