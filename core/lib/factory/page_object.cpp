// page_objects/factory/page_object.cpp
#include "page_objects/factory/page_object.hpp"

#include <typeinfo>

namespace page_objects
{

std::string PageObject::page_name() const
{
  return readable_type_name(typeid(*this));
}

MemberTable & MemberTable::add(DeclaredMember member)
{
  member.criteria = make_criteria(member.criteria);
  members_.push_back(std::move(member));
  return *this;
}

}  // namespace page_objects
