// page_objects/basic/by.cpp - Locator criteria implementation
#include "page_objects/basic/by.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>

namespace page_objects
{

std::string_view how_name(How how) noexcept
{
  switch (how) {
    case How::Id:
      return "Id";
    case How::Name:
      return "Name";
    case How::TagName:
      return "TagName";
    case How::ClassName:
      return "ClassName";
    case How::CssSelector:
      return "CssSelector";
    case How::LinkText:
      return "LinkText";
    case How::PartialLinkText:
      return "PartialLinkText";
    case How::XPath:
      return "XPath";
  }
  return "Unknown";
}

std::string By::to_string() const
{
  return fmt::format("By.{}: {}", how_name(how_), value_);
}

By by_from(How how, std::string value)
{
  switch (how) {
    case How::Id:
      return By::id(std::move(value));
    case How::Name:
      return By::name(std::move(value));
    case How::TagName:
      return By::tag_name(std::move(value));
    case How::ClassName:
      return By::class_name(std::move(value));
    case How::CssSelector:
      return By::css_selector(std::move(value));
    case How::LinkText:
      return By::link_text(std::move(value));
    case How::PartialLinkText:
      return By::partial_link_text(std::move(value));
    case How::XPath:
      return By::xpath(std::move(value));
  }
  throw std::invalid_argument(fmt::format(
    "Did not know how to construct How from how {}, using {}", static_cast<int>(how), value));
}

Criteria make_criteria(std::initializer_list<By> bys)
{
  return make_criteria(std::vector<By>(bys));
}

Criteria make_criteria(const std::vector<By> & bys)
{
  Criteria out;
  out.reserve(bys.size());
  for (const auto & by : bys) {
    if (std::find(out.begin(), out.end(), by) == out.end()) {
      out.push_back(by);
    }
  }
  return out;
}

std::string describe_criteria(const std::vector<By> & criteria)
{
  std::string out;
  for (size_t i = 0; i < criteria.size(); ++i) {
    if (i > 0) out += ", or: ";
    out += criteria[i].to_string();
  }
  return out;
}

}  // namespace page_objects
