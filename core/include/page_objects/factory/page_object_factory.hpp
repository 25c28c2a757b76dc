// page_objects/factory/page_object_factory.hpp - Populating page objects
//
// The factory walks a page object's declared members, asks the decorator for
// a value per member and assigns it. Policy decisions that belong above the
// proxy layer (read-only members, unsupported member types) live here.
//
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "page_objects/basic/decoration_report.hpp"
#include "page_objects/decorate/element_activator.hpp"
#include "page_objects/decorate/member_decorator.hpp"
#include "page_objects/element/element.hpp"
#include "page_objects/factory/factory_options.hpp"
#include "page_objects/factory/page_object.hpp"
#include "page_objects/locator/element_locator.hpp"

namespace page_objects
{

/**
 * Populate every declared member of `page` that has criteria, decorating
 * through `decorator` and resolving through `locator`.
 *
 * @param report Receives one entry per member; null records nothing and
 *        suppresses the verbose trace
 * @throws MemberNotWritable if a member with criteria is read-only, or the
 *         decorated value does not fit the member
 * @throws UnsupportedMemberType under UnsupportedMemberPolicy::Error
 */
void populate_members(
  PageObject & page, MemberDecorator & decorator, const std::shared_ptr<ElementLocator> & locator,
  const FactoryOptions & options, DecorationReport * report);

class PageObjectFactory
{
public:
  /**
   * Factory rooted at a search context (typically the page), using the
   * default locator, the default activator and proxy decoration.
   */
  explicit PageObjectFactory(
    std::shared_ptr<SearchContext> search_context, FactoryOptions options = {});

  /**
   * Proxy decoration with a custom locator and/or activator.
   */
  PageObjectFactory(
    std::shared_ptr<ElementLocator> locator, std::shared_ptr<ElementActivator> activator,
    FactoryOptions options = {});

  /**
   * Fully custom decoration.
   *
   * @throws std::invalid_argument if locator or decorator is null
   */
  PageObjectFactory(
    std::shared_ptr<ElementLocator> locator, std::shared_ptr<MemberDecorator> decorator,
    FactoryOptions options = {});

  // One report per factory.
  PageObjectFactory(const PageObjectFactory &) = delete;
  PageObjectFactory & operator=(const PageObjectFactory &) = delete;
  PageObjectFactory(PageObjectFactory &&) = delete;
  PageObjectFactory & operator=(PageObjectFactory &&) = delete;

  /**
   * Populate every declared member of `page` that has criteria.
   *
   * @throws MemberNotWritable if a member with criteria is read-only, or the
   *         decorated value does not fit the member
   * @throws UnsupportedMemberType under UnsupportedMemberPolicy::Error
   */
  void init_elements(PageObject & page);

  /// Same, resolving through `locator` instead of the factory root
  void init_elements(PageObject & page, const std::shared_ptr<ElementLocator> & locator);

  [[nodiscard]] const DecorationReport & report() const noexcept { return report_; }
  [[nodiscard]] const FactoryOptions & options() const noexcept { return options_; }
  [[nodiscard]] const std::shared_ptr<ElementLocator> & locator() const noexcept
  {
    return locator_;
  }

private:
  std::shared_ptr<ElementLocator> locator_;
  std::shared_ptr<MemberDecorator> decorator_;
  FactoryOptions options_;
  DecorationReport report_;
};

}  // namespace page_objects
