// page_objects/decorate/member_type.cpp
#include "page_objects/decorate/member_type.hpp"

#include <cstdlib>
#include <memory>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace page_objects
{

std::string_view shape_name(MemberShape shape) noexcept
{
  switch (shape) {
    case MemberShape::Element:
      return "element";
    case MemberShape::WrappedElement:
      return "wrapped element";
    case MemberShape::ElementList:
      return "element list";
    case MemberShape::WrappedElementList:
      return "wrapped element list";
    case MemberShape::Unsupported:
      return "unsupported";
  }
  return "unsupported";
}

std::string readable_type_name(const std::type_info & info)
{
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(
    abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
#endif
  return info.name();
}

}  // namespace page_objects
