// tests/unit/proxy/test_element_list_proxy.cpp - Collections and LazyList
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "page_objects/basic/errors.hpp"
#include "page_objects/proxy/element_list_proxy.hpp"
#include "page_objects/proxy/lazy_list.hpp"
#include "page_objects/test_support/fake_page.hpp"
#include "page_objects/test_support/scripted.hpp"

using namespace page_objects;
using page_objects::test_support::CountingLocator;
using page_objects::test_support::FakePage;

static std::vector<std::string> texts(const LazyList<std::shared_ptr<Element>> & list)
{
  std::vector<std::string> out;
  for (const auto & e : list) {
    out.push_back(e->text());
  }
  return out;
}

// ============================================================================
// LazyList
// ============================================================================

TEST(LazyList, EveryEnumerationRunsProducer)
{
  int calls = 0;
  LazyList<int> list([&calls] {
    ++calls;
    return std::vector<int>{1, 2, 3};
  });
  EXPECT_EQ(calls, 0);

  int sum = 0;
  for (const int v : list) {
    sum += v;
  }
  EXPECT_EQ(sum, 6);
  EXPECT_EQ(calls, 1);

  EXPECT_EQ(list.size(), 3U);
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(list.to_vector(), (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(calls, 3);
}

TEST(LazyList, DefaultIsEmpty)
{
  const LazyList<int> list;
  EXPECT_TRUE(list.empty());
  EXPECT_TRUE(list.begin() == list.end());
}

TEST(LazyList, MapIsLazyAndPerEnumeration)
{
  int source_calls = 0;
  int fn_calls = 0;
  LazyList<int> numbers([&source_calls] {
    ++source_calls;
    return std::vector<int>{1, 2};
  });

  auto strings = numbers.map<std::string>([&fn_calls](int v) {
    ++fn_calls;
    return std::to_string(v * 10);
  });
  EXPECT_EQ(source_calls, 0);
  EXPECT_EQ(fn_calls, 0);

  EXPECT_EQ(strings.to_vector(), (std::vector<std::string>{"10", "20"}));
  EXPECT_EQ(strings.to_vector().size(), 2U);
  EXPECT_EQ(source_calls, 2);
  EXPECT_EQ(fn_calls, 4);
}

// ============================================================================
// ElementListProxy
// ============================================================================

TEST(ElementListProxy, RejectsNullLocatorAndEmptyCriteria)
{
  auto locator = std::make_shared<CountingLocator>();
  EXPECT_THROW((void)ElementListProxy(nullptr, {By::tag_name("li")}), std::invalid_argument);
  EXPECT_THROW((void)ElementListProxy(locator, {}), std::invalid_argument);
}

TEST(ElementListProxy, CreationDoesNotLocate)
{
  auto locator = std::make_shared<CountingLocator>();
  auto list = ElementListProxy::create(locator, {By::tag_name("li")});
  EXPECT_EQ(locator->locate_all_calls(), 0U);

  EXPECT_TRUE(list.empty());
  EXPECT_EQ(locator->locate_all_calls(), 1U);
}

TEST(ElementListProxy, EveryEnumerationReflectsCurrentPage)
{
  auto page = std::make_shared<FakePage>();
  auto ul = page->append(nullptr, "ul");
  auto first = page->append(ul, "li", {}, "one");
  page->append(ul, "li", {}, "two");

  auto list = ElementListProxy::create(
    std::make_shared<DefaultElementLocator>(page), {By::tag_name("li")});

  EXPECT_EQ(texts(list), (std::vector<std::string>{"one", "two"}));

  page->append(ul, "li", {}, "three");
  EXPECT_EQ(texts(list), (std::vector<std::string>{"one", "two", "three"}));

  page->remove(first);
  EXPECT_EQ(texts(list), (std::vector<std::string>{"two", "three"}));
  EXPECT_EQ(page->query_count(How::TagName), 3U);
}

TEST(ElementListProxy, ItemsAreProxiesThatRecover)
{
  auto page = std::make_shared<FakePage>();
  auto a = page->append(nullptr, "button", {{"class", "row"}}, "a");
  auto b = page->append(nullptr, "button", {{"class", "row"}}, "b");

  ElementListProxy proxy(std::make_shared<DefaultElementLocator>(page), {By::class_name("row")});
  auto items = proxy.elements();
  ASSERT_EQ(items.size(), 2U);
  ASSERT_NE(std::dynamic_pointer_cast<ElementProxy>(items[1]), nullptr);

  page->reload();
  items[1]->click();

  EXPECT_EQ(a->clicks, 0U);
  EXPECT_EQ(b->clicks, 1U);
}

TEST(ElementListProxy, ItemPastShrunkCollectionIsNotFound)
{
  auto page = std::make_shared<FakePage>();
  page->append(nullptr, "li", {}, "one");
  auto two = page->append(nullptr, "li", {}, "two");

  ElementListProxy proxy(std::make_shared<DefaultElementLocator>(page), {By::tag_name("li")});
  auto items = proxy.elements();
  ASSERT_EQ(items.size(), 2U);

  page->remove(two);
  EXPECT_THROW((void)items[1]->text(), ElementNotFound);
}
