// page_objects/basic/decoration_report.cpp
#include "page_objects/basic/decoration_report.hpp"

#include <algorithm>
#include <iterator>
#include <nlohmann/json.hpp>
#include <utility>

namespace page_objects
{

std::string_view severity_name(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "info";
}

void DecorationReport::add(DecorationEntry && entry) { entries_.push_back(std::move(entry)); }

void DecorationReport::add(const DecorationEntry & entry) { entries_.push_back(entry); }

std::vector<DecorationEntry> DecorationReport::errors() const
{
  std::vector<DecorationEntry> out;
  std::copy_if(
    entries_.begin(), entries_.end(), std::back_inserter(out),
    [](const DecorationEntry & e) { return e.severity == Severity::Error; });
  return out;
}

std::vector<DecorationEntry> DecorationReport::warnings() const
{
  std::vector<DecorationEntry> out;
  std::copy_if(
    entries_.begin(), entries_.end(), std::back_inserter(out),
    [](const DecorationEntry & e) { return e.severity == Severity::Warning; });
  return out;
}

bool DecorationReport::has_errors() const
{
  return std::any_of(entries_.begin(), entries_.end(), [](const DecorationEntry & e) {
    return e.severity == Severity::Error;
  });
}

bool DecorationReport::has_warnings() const
{
  return std::any_of(entries_.begin(), entries_.end(), [](const DecorationEntry & e) {
    return e.severity == Severity::Warning;
  });
}

void DecorationReport::merge(const DecorationReport & other)
{
  entries_.insert(entries_.end(), other.entries_.begin(), other.entries_.end());
}

std::string DecorationReport::to_json(int indent) const
{
  using json = nlohmann::json;

  json items = json::array();
  for (const auto & e : entries_) {
    items.push_back({
      {"severity", std::string(severity_name(e.severity))},
      {"page", e.page},
      {"member", e.member},
      {"shape", std::string(shape_name(e.shape))},
      {"criteria", e.criteria},
      {"message", e.message},
    });
  }

  json root;
  root["items"] = std::move(items);
  return root.dump(indent);
}

}  // namespace page_objects
