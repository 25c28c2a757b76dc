// page_objects/factory/page_object_factory.cpp
#include "page_objects/factory/page_object_factory.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <utility>

#include "page_objects/basic/errors.hpp"

namespace page_objects
{

// ============================================================================
// FactoryOptions
// ============================================================================

std::string_view policy_name(UnsupportedMemberPolicy policy) noexcept
{
  switch (policy) {
    case UnsupportedMemberPolicy::Error:
      return "error";
    case UnsupportedMemberPolicy::Skip:
      return "skip";
  }
  return "error";
}

std::optional<UnsupportedMemberPolicy> parse_policy(std::string_view text) noexcept
{
  if (text == "error") return UnsupportedMemberPolicy::Error;
  if (text == "skip") return UnsupportedMemberPolicy::Skip;
  return std::nullopt;
}

// ============================================================================
// Member population
// ============================================================================

namespace
{

void record(
  DecorationReport * report, Severity severity, const std::string & page,
  const DeclaredMember & member, std::string message)
{
  if (report == nullptr) {
    return;
  }
  DecorationEntry entry;
  entry.severity = severity;
  entry.page = page;
  entry.member = member.name;
  entry.shape = member.type.shape;
  entry.criteria = describe_criteria(member.criteria);
  entry.message = std::move(message);
  report->add(std::move(entry));
}

void trace(
  const FactoryOptions & options, const DecorationReport * report, const std::string & page,
  const DeclaredMember & member, std::string_view outcome)
{
  if (!options.verbose || report == nullptr) {
    return;
  }
  std::ostream & os = options.log != nullptr ? *options.log : std::cerr;
  fmt::print(
    os, "[page_objects] {}.{}: {} as {} ({})\n", page, member.name, outcome,
    shape_name(member.type.shape), describe_criteria(member.criteria));
}

}  // namespace

void populate_members(
  PageObject & page, MemberDecorator & decorator, const std::shared_ptr<ElementLocator> & locator,
  const FactoryOptions & options, DecorationReport * report)
{
  MemberTable table(page.page_name());
  page.declare_members(table);
  const std::string & page_name = table.page_name();

  for (const auto & member : table.members()) {
    if (member.criteria.empty()) {
      continue;
    }

    if (!member.is_writable()) {
      MemberNotWritable error(page_name, member.name);
      record(report, Severity::Error, page_name, member, error.what());
      throw error;
    }

    std::optional<DecoratedValue> value;
    try {
      value = decorator.decorate(member.type, member.criteria, locator);
    } catch (const UnsupportedMemberType & e) {
      if (options.unsupported_members == UnsupportedMemberPolicy::Skip) {
        record(report, Severity::Warning, page_name, member, e.what());
        trace(options, report, page_name, member, "skipped");
        continue;
      }
      record(report, Severity::Error, page_name, member, e.what());
      throw;
    }

    if (!value) {
      record(report, Severity::Info, page_name, member, "left untouched by decorator");
      trace(options, report, page_name, member, "untouched");
      continue;
    }

    if (!member.assign(*value)) {
      MemberNotWritable error(page_name, member.name);
      record(
        report, Severity::Error, page_name, member,
        fmt::format(
          "{}: decorated {} does not fit {}", error.what(), shape_name(shape_of(*value)),
          member.type.name));
      throw error;
    }

    record(report, Severity::Info, page_name, member, "decorated");
    trace(options, report, page_name, member, "decorated");
  }
}

// ============================================================================
// PageObjectFactory
// ============================================================================

PageObjectFactory::PageObjectFactory(
  std::shared_ptr<SearchContext> search_context, FactoryOptions options)
: PageObjectFactory(
    std::make_shared<DefaultElementLocator>(std::move(search_context)),
    std::make_shared<DefaultElementActivator>(), options)
{
}

PageObjectFactory::PageObjectFactory(
  std::shared_ptr<ElementLocator> locator, std::shared_ptr<ElementActivator> activator,
  FactoryOptions options)
: locator_(std::move(locator)), options_(options)
{
  if (!locator_) {
    throw std::invalid_argument("PageObjectFactory requires an element locator");
  }
  decorator_ =
    std::make_shared<ProxyMemberDecorator>(std::move(activator), options_.unsupported_members);
}

PageObjectFactory::PageObjectFactory(
  std::shared_ptr<ElementLocator> locator, std::shared_ptr<MemberDecorator> decorator,
  FactoryOptions options)
: locator_(std::move(locator)), decorator_(std::move(decorator)), options_(options)
{
  if (!locator_) {
    throw std::invalid_argument("PageObjectFactory requires an element locator");
  }
  if (!decorator_) {
    throw std::invalid_argument("PageObjectFactory requires a member decorator");
  }
}

void PageObjectFactory::init_elements(PageObject & page) { init_elements(page, locator_); }

void PageObjectFactory::init_elements(
  PageObject & page, const std::shared_ptr<ElementLocator> & locator)
{
  populate_members(page, *decorator_, locator, options_, &report_);
}

}  // namespace page_objects
