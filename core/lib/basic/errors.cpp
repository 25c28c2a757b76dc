// page_objects/basic/errors.cpp
#include "page_objects/basic/errors.hpp"

#include <fmt/core.h>

#include <utility>

namespace page_objects
{

ElementNotFound::ElementNotFound(std::vector<By> criteria)
: PageObjectError("Could not find element by: " + describe_criteria(criteria)),
  criteria_(std::move(criteria))
{
}

ElementNotFound::ElementNotFound(std::string message, std::vector<By> criteria)
: PageObjectError(std::move(message)), criteria_(std::move(criteria))
{
}

UnsupportedMemberType::UnsupportedMemberType(std::string type_name)
: DecorationError(fmt::format("Unable to decorate {}, it is unsupported", type_name)),
  type_name_(std::move(type_name))
{
}

MemberNotWritable::MemberNotWritable(std::string page_name, std::string member_name)
: DecorationError(
    fmt::format("Unable to decorate {}.{}, it cannot be written to", page_name, member_name)),
  member_name_(std::move(member_name))
{
}

}  // namespace page_objects
