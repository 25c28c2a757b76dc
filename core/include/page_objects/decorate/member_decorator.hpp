// page_objects/decorate/member_decorator.hpp - Choosing and building member proxies
#pragma once

#include <memory>
#include <optional>

#include "page_objects/basic/by.hpp"
#include "page_objects/decorate/decorated_value.hpp"
#include "page_objects/decorate/element_activator.hpp"
#include "page_objects/decorate/member_type.hpp"
#include "page_objects/factory/factory_options.hpp"
#include "page_objects/locator/element_locator.hpp"

namespace page_objects
{

/**
 * Produces the value assigned to one declared member.
 */
class MemberDecorator
{
public:
  virtual ~MemberDecorator() = default;

  /**
   * Decorate one member.
   *
   * @param type Declared member type
   * @param criteria Non-empty, deduplicated criteria
   * @param locator Locator the member's proxies resolve through
   * @return The value for the member, or std::nullopt to leave it untouched
   * @throws UnsupportedMemberType if `type` has no supported shape
   */
  [[nodiscard]] virtual std::optional<DecoratedValue> decorate(
    const MemberType & type, const Criteria & criteria,
    const std::shared_ptr<ElementLocator> & locator) = 0;
};

/**
 * Decorator that installs lazy proxies.
 *
 * Dispatch (first match wins):
 *   Element            -> ElementProxy
 *   WrappedElement     -> activator(ElementProxy), nested members decorated
 *                         against a locator rooted at that proxy
 *   ElementList        -> ElementListProxy as LazyList
 *   WrappedElementList -> one populated wrapper per element, per enumeration
 *   otherwise          -> UnsupportedMemberType
 *
 * Nested members are populated by this decorator itself under
 * `nested_policy`, without report entries or trace output. Must be owned by a
 * std::shared_ptr (wrapper lists hold on to it through shared_from_this()).
 */
class ProxyMemberDecorator : public MemberDecorator,
                             public std::enable_shared_from_this<ProxyMemberDecorator>
{
public:
  explicit ProxyMemberDecorator(
    std::shared_ptr<ElementActivator> activator,
    UnsupportedMemberPolicy nested_policy = UnsupportedMemberPolicy::Error);

  [[nodiscard]] std::optional<DecoratedValue> decorate(
    const MemberType & type, const Criteria & criteria,
    const std::shared_ptr<ElementLocator> & locator) override;

  /**
   * Build one wrapper around `element`: activate, fill the embedded-element
   * slot when writable, then decorate the wrapper's own members.
   */
  [[nodiscard]] std::shared_ptr<WrapsElement> create_and_populate_wrapper(
    const MemberType & type, const std::shared_ptr<Element> & element);

private:
  std::shared_ptr<ElementActivator> activator_;
  UnsupportedMemberPolicy nested_policy_;
};

}  // namespace page_objects
