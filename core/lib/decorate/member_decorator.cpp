// page_objects/decorate/member_decorator.cpp - Proxy dispatch per member shape
#include "page_objects/decorate/member_decorator.hpp"

#include <stdexcept>
#include <utility>

#include "page_objects/basic/errors.hpp"
#include "page_objects/factory/page_object.hpp"
#include "page_objects/factory/page_object_factory.hpp"
#include "page_objects/proxy/element_list_proxy.hpp"
#include "page_objects/proxy/element_proxy.hpp"

namespace page_objects
{

ProxyMemberDecorator::ProxyMemberDecorator(
  std::shared_ptr<ElementActivator> activator, UnsupportedMemberPolicy nested_policy)
: activator_(std::move(activator)), nested_policy_(nested_policy)
{
  if (!activator_) {
    throw std::invalid_argument("ProxyMemberDecorator requires an element activator");
  }
}

std::optional<DecoratedValue> ProxyMemberDecorator::decorate(
  const MemberType & type, const Criteria & criteria,
  const std::shared_ptr<ElementLocator> & locator)
{
  switch (type.shape) {
    case MemberShape::Element: {
      std::shared_ptr<Element> proxy = ElementProxy::create(locator, criteria);
      return DecoratedValue(std::move(proxy));
    }

    case MemberShape::WrappedElement: {
      std::shared_ptr<Element> proxy = ElementProxy::create(locator, criteria);
      return DecoratedValue(create_and_populate_wrapper(type, proxy));
    }

    case MemberShape::ElementList:
      return DecoratedValue(ElementListProxy::create(locator, criteria));

    case MemberShape::WrappedElementList: {
      auto elements = ElementListProxy::create(locator, criteria);
      auto self = shared_from_this();
      return DecoratedValue(elements.map<std::shared_ptr<WrapsElement>>(
        [self, type](const std::shared_ptr<Element> & element) {
          return self->create_and_populate_wrapper(type, element);
        }));
    }

    case MemberShape::Unsupported:
      break;
  }

  throw UnsupportedMemberType(type.name);
}

std::shared_ptr<WrapsElement> ProxyMemberDecorator::create_and_populate_wrapper(
  const MemberType & type, const std::shared_ptr<Element> & element)
{
  auto wrapper = activator_->create(type, element);
  if (!wrapper) {
    throw DecorationError("Element activator returned no instance of " + type.wrapper_name);
  }

  if (type.write_wrapped_element) {
    type.write_wrapped_element(*wrapper, element);
  }

  if (auto * nested = dynamic_cast<PageObject *>(wrapper.get())) {
    FactoryOptions options;
    options.unsupported_members = nested_policy_;
    populate_members(
      *nested, *this, std::make_shared<DefaultElementLocator>(element), options, nullptr);
  }

  return wrapper;
}

}  // namespace page_objects
