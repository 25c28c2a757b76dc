// tests/unit/decorate/test_member_decorator.cpp - Proxy decoration per member shape
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "page_objects/basic/errors.hpp"
#include "page_objects/decorate/element_activator.hpp"
#include "page_objects/decorate/member_decorator.hpp"
#include "page_objects/factory/page_object.hpp"
#include "page_objects/proxy/element_proxy.hpp"
#include "page_objects/test_support/fake_page.hpp"

using namespace page_objects;
using page_objects::test_support::FakePage;

namespace
{

class Button : public WrapsElement
{
public:
  explicit Button(std::shared_ptr<Element> element) : element_(std::move(element)) {}
  [[nodiscard]] std::shared_ptr<Element> wrapped_element() const override { return element_; }

private:
  std::shared_ptr<Element> element_;
};

/// Wrapper with its own members, decorated relative to the wrapped element
class Section : public WrapsElement, public PageObject
{
public:
  [[nodiscard]] std::shared_ptr<Element> wrapped_element() const override { return element_; }
  void set_wrapped_element(std::shared_ptr<Element> element) { element_ = std::move(element); }

  void declare_members(MemberTable & table) override
  {
    table.find(title, "title", {By::tag_name("h2")});
    table.find(items, "items", {By::tag_name("li")});
  }

  std::shared_ptr<Element> title;
  LazyList<std::shared_ptr<Element>> items;

private:
  std::shared_ptr<Element> element_;
};

/// Wrapper with one member of an unsupported type
class Gauge : public WrapsElement, public PageObject
{
public:
  explicit Gauge(std::shared_ptr<Element> element) : element_(std::move(element)) {}
  [[nodiscard]] std::shared_ptr<Element> wrapped_element() const override { return element_; }

  void declare_members(MemberTable & table) override
  {
    table.find(reading, "reading", {By::class_name("value")});
    table.find(needle, "needle", {By::class_name("needle")});
  }

  int reading = 3;
  std::shared_ptr<Element> needle;

private:
  std::shared_ptr<Element> element_;
};

class Widget : public WrapsElement
{
public:
  virtual void render() = 0;
};

/// Records every activation and delegates to the default activator
class CountingActivator : public ElementActivator
{
public:
  [[nodiscard]] std::shared_ptr<WrapsElement> create(
    const MemberType & type, std::shared_ptr<Element> element) override
  {
    ++calls;
    if (fail_with_null) return nullptr;
    return DefaultElementActivator().create(type, std::move(element));
  }

  size_t calls = 0;
  bool fail_with_null = false;
};

struct Fixture
{
  std::shared_ptr<FakePage> page = std::make_shared<FakePage>();
  std::shared_ptr<CountingActivator> activator = std::make_shared<CountingActivator>();
  std::shared_ptr<DefaultElementLocator> locator = std::make_shared<DefaultElementLocator>(page);
  std::shared_ptr<ProxyMemberDecorator> decorator =
    std::make_shared<ProxyMemberDecorator>(activator);

  template <typename T>
  std::optional<DecoratedValue> decorate(const Criteria & criteria)
  {
    return decorator->decorate(member_type_of<T>(), criteria, locator);
  }
};

}  // namespace

// ============================================================================
// Dispatch
// ============================================================================

TEST(ProxyMemberDecorator, ElementBecomesLazyProxy)
{
  Fixture f;
  auto value = f.decorate<std::shared_ptr<Element>>({By::id("go")});

  ASSERT_TRUE(value.has_value());
  ASSERT_EQ(shape_of(*value), MemberShape::Element);
  auto proxy = std::dynamic_pointer_cast<ElementProxy>(std::get<std::shared_ptr<Element>>(*value));
  ASSERT_NE(proxy, nullptr);
  EXPECT_FALSE(proxy->is_resolved());
  EXPECT_EQ(f.page->query_count(), 0U);
}

TEST(ProxyMemberDecorator, WrapperReceivesProxy)
{
  Fixture f;
  auto node = f.page->append(nullptr, "button", {{"id", "go"}});

  auto value = f.decorate<std::shared_ptr<Button>>({By::id("go")});
  ASSERT_TRUE(value.has_value());
  ASSERT_EQ(shape_of(*value), MemberShape::WrappedElement);
  EXPECT_EQ(f.activator->calls, 1U);
  EXPECT_EQ(f.page->query_count(), 0U);

  auto button = convert_decorated<std::shared_ptr<Button>>(*value);
  ASSERT_TRUE(button.has_value());
  ASSERT_NE(std::dynamic_pointer_cast<ElementProxy>((*button)->wrapped_element()), nullptr);

  (*button)->wrapped_element()->click();
  EXPECT_EQ(node->clicks, 1U);
}

TEST(ProxyMemberDecorator, ElementListIsFreshPerEnumeration)
{
  Fixture f;
  f.page->append(nullptr, "li", {}, "one");

  auto value = f.decorate<LazyList<std::shared_ptr<Element>>>({By::tag_name("li")});
  ASSERT_TRUE(value.has_value());
  ASSERT_EQ(shape_of(*value), MemberShape::ElementList);
  EXPECT_EQ(f.page->query_count(), 0U);

  const auto & list = std::get<LazyList<std::shared_ptr<Element>>>(*value);
  EXPECT_EQ(list.size(), 1U);
  f.page->append(nullptr, "li", {}, "two");
  EXPECT_EQ(list.size(), 2U);
}

TEST(ProxyMemberDecorator, WrapperListActivatesPerEnumeration)
{
  Fixture f;
  f.page->append(nullptr, "button", {{"class", "b"}}, "one");
  f.page->append(nullptr, "button", {{"class", "b"}}, "two");

  auto value = f.decorate<LazyList<std::shared_ptr<Button>>>({By::class_name("b")});
  ASSERT_TRUE(value.has_value());
  ASSERT_EQ(shape_of(*value), MemberShape::WrappedElementList);
  EXPECT_EQ(f.activator->calls, 0U);

  auto buttons = convert_decorated<LazyList<std::shared_ptr<Button>>>(*value);
  ASSERT_TRUE(buttons.has_value());

  std::vector<std::string> texts;
  for (const auto & button : *buttons) {
    texts.push_back(button->wrapped_element()->text());
  }
  EXPECT_EQ(texts, (std::vector<std::string>{"one", "two"}));
  EXPECT_EQ(f.activator->calls, 2U);

  EXPECT_EQ(buttons->size(), 2U);
  EXPECT_EQ(f.activator->calls, 4U);
}

TEST(ProxyMemberDecorator, UnsupportedTypeFails)
{
  Fixture f;
  EXPECT_THROW((void)f.decorate<int>({By::id("x")}), UnsupportedMemberType);
  EXPECT_THROW((void)f.decorate<std::vector<std::shared_ptr<Element>>>({By::id("x")}),
               UnsupportedMemberType);
  EXPECT_THROW((void)f.decorate<LazyList<std::string>>({By::id("x")}), UnsupportedMemberType);
}

// ============================================================================
// Wrapper construction
// ============================================================================

TEST(ProxyMemberDecorator, NestedMembersScopedToWrapper)
{
  Fixture f;
  auto first = f.page->append(nullptr, "section", {{"id", "first"}});
  f.page->append(first, "h2", {}, "First");
  auto second = f.page->append(nullptr, "section", {{"id", "second"}});
  f.page->append(second, "h2", {}, "Second");
  f.page->append(second, "li", {}, "a");
  f.page->append(second, "li", {}, "b");

  auto value = f.decorate<std::shared_ptr<Section>>({By::id("second")});
  auto section = convert_decorated<std::shared_ptr<Section>>(*value);
  ASSERT_TRUE(section.has_value());

  // Writable slot filled with the proxy
  ASSERT_NE((*section)->wrapped_element(), nullptr);
  ASSERT_NE((*section)->title, nullptr);

  EXPECT_EQ((*section)->title->text(), "Second");
  EXPECT_EQ((*section)->items.size(), 2U);
}

TEST(ProxyMemberDecorator, NestedMembersRecoverWithParent)
{
  Fixture f;
  auto panel = f.page->append(nullptr, "section", {{"id", "panel"}});
  auto heading = f.page->append(panel, "h2", {}, "Before");

  auto value = f.decorate<std::shared_ptr<Section>>({By::id("panel")});
  auto section = *convert_decorated<std::shared_ptr<Section>>(*value);
  EXPECT_EQ(section->title->text(), "Before");

  f.page->reload();
  heading->text = "After";
  EXPECT_EQ(section->title->text(), "After");
}

TEST(ProxyMemberDecorator, EachListWrapperScopedToItsElement)
{
  Fixture f;
  for (const char * name : {"one", "two"}) {
    auto s = f.page->append(nullptr, "section", {{"class", "card"}});
    f.page->append(s, "h2", {}, name);
  }

  auto value = f.decorate<LazyList<std::shared_ptr<Section>>>({By::class_name("card")});
  auto sections = *convert_decorated<LazyList<std::shared_ptr<Section>>>(*value);

  std::vector<std::string> titles;
  for (const auto & s : sections) {
    titles.push_back(s->title->text());
  }
  EXPECT_EQ(titles, (std::vector<std::string>{"one", "two"}));
}

TEST(ProxyMemberDecorator, NestedUnsupportedMemberFollowsPolicy)
{
  auto page = std::make_shared<FakePage>();
  page->append(nullptr, "section", {{"id", "s"}});
  auto locator = std::make_shared<DefaultElementLocator>(page);

  auto strict = std::make_shared<ProxyMemberDecorator>(std::make_shared<DefaultElementActivator>());
  EXPECT_THROW(
    (void)strict->decorate(member_type_of<std::shared_ptr<Gauge>>(), {By::id("s")}, locator),
    UnsupportedMemberType);

  auto lenient = std::make_shared<ProxyMemberDecorator>(
    std::make_shared<DefaultElementActivator>(), UnsupportedMemberPolicy::Skip);
  auto value =
    lenient->decorate(member_type_of<std::shared_ptr<Gauge>>(), {By::id("s")}, locator);
  auto gauge = *convert_decorated<std::shared_ptr<Gauge>>(*value);
  EXPECT_EQ(gauge->reading, 3);
  EXPECT_NE(gauge->needle, nullptr);
}

TEST(ProxyMemberDecorator, DefaultActivatorCannotBuildAbstractWrapper)
{
  Fixture f;
  EXPECT_THROW((void)f.decorate<std::shared_ptr<Widget>>({By::id("x")}), DecorationError);
}

TEST(ProxyMemberDecorator, NullActivationIsAnError)
{
  Fixture f;
  f.activator->fail_with_null = true;
  EXPECT_THROW((void)f.decorate<std::shared_ptr<Button>>({By::id("x")}), DecorationError);
}

TEST(ProxyMemberDecorator, ActivatorFailurePropagatesUnchanged)
{
  class ThrowingActivator : public ElementActivator
  {
  public:
    [[nodiscard]] std::shared_ptr<WrapsElement> create(
      const MemberType &, std::shared_ptr<Element>) override
    {
      throw std::logic_error("constructor failed");
    }
  };

  auto page = std::make_shared<FakePage>();
  auto decorator = std::make_shared<ProxyMemberDecorator>(std::make_shared<ThrowingActivator>());

  EXPECT_THROW(
    (void)decorator->decorate(
      member_type_of<std::shared_ptr<Button>>(), {By::id("x")},
      std::make_shared<DefaultElementLocator>(page)),
    std::logic_error);
}

TEST(ProxyMemberDecorator, RequiresActivator)
{
  EXPECT_THROW((void)std::make_shared<ProxyMemberDecorator>(nullptr), std::invalid_argument);
}
