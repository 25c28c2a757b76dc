// tests/unit/test_support/test_fake_page.cpp - In-memory page behavior
#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "page_objects/basic/errors.hpp"
#include "page_objects/test_support/fake_page.hpp"

using namespace page_objects;
using page_objects::test_support::FakeNode;
using page_objects::test_support::FakePage;

static FakeNode node_with(std::string tag, std::map<std::string, std::string> attributes)
{
  FakeNode n;
  n.tag = std::move(tag);
  n.attributes = std::move(attributes);
  return n;
}

// ============================================================================
// Matching
// ============================================================================

TEST(FakePageMatch, Strategies)
{
  const FakeNode input = node_with("input", {{"id", "q"}, {"name", "query"}, {"class", "big wide"}});

  EXPECT_TRUE(test_support::matches(input, By::id("q")));
  EXPECT_TRUE(test_support::matches(input, By::name("query")));
  EXPECT_TRUE(test_support::matches(input, By::tag_name("input")));
  EXPECT_TRUE(test_support::matches(input, By::class_name("wide")));
  EXPECT_FALSE(test_support::matches(input, By::class_name("bi")));
  EXPECT_FALSE(test_support::matches(input, By::xpath("//input")));
}

TEST(FakePageMatch, CssSubset)
{
  const FakeNode button = node_with("button", {{"id", "go"}, {"class", "btn primary"}});

  EXPECT_TRUE(test_support::matches(button, By::css_selector("button")));
  EXPECT_TRUE(test_support::matches(button, By::css_selector("#go")));
  EXPECT_TRUE(test_support::matches(button, By::css_selector(".btn.primary")));
  EXPECT_TRUE(test_support::matches(button, By::css_selector("button#go.btn")));
  EXPECT_FALSE(test_support::matches(button, By::css_selector("a.btn")));
  EXPECT_FALSE(test_support::matches(button, By::css_selector("form button")));
}

TEST(FakePageMatch, LinkText)
{
  FakeNode link = node_with("a", {});
  link.text = "  Read more  ";

  EXPECT_TRUE(test_support::matches(link, By::link_text("Read more")));
  EXPECT_TRUE(test_support::matches(link, By::partial_link_text("more")));
  EXPECT_FALSE(test_support::matches(link, By::link_text("Read")));
}

// ============================================================================
// Handles
// ============================================================================

TEST(FakePage, FindsInDocumentOrder)
{
  FakePage page;
  auto outer = page.append(nullptr, "div", {{"class", "x"}}, "outer");
  page.append(outer, "div", {{"class", "x"}}, "inner");
  page.append(nullptr, "div", {{"class", "x"}}, "last");

  auto all = page.find_elements(By::class_name("x"));
  ASSERT_EQ(all.size(), 3U);
  EXPECT_EQ(all[0]->text(), "outer");
  EXPECT_EQ(all[1]->text(), "inner");
  EXPECT_EQ(all[2]->text(), "last");

  EXPECT_EQ(page.find_element(By::class_name("x"))->text(), "outer");
  EXPECT_EQ(page.find_element(By::id("none")), nullptr);
  EXPECT_EQ(page.query_count(How::ClassName), 2U);
}

TEST(FakePage, ReloadMakesHandlesStale)
{
  FakePage page;
  page.append(nullptr, "p", {{"id", "msg"}}, "hello");
  auto handle = page.find_element(By::id("msg"));
  ASSERT_NE(handle, nullptr);

  page.reload();
  EXPECT_THROW((void)handle->text(), StaleReference);
  EXPECT_EQ(page.find_element(By::id("msg"))->text(), "hello");
}

TEST(FakePage, RemovedNodeIsStale)
{
  FakePage page;
  auto parent = page.append(nullptr, "ul");
  auto item = page.append(parent, "li", {}, "x");
  auto handle = page.find_element(By::tag_name("li"));

  page.remove(parent);
  EXPECT_THROW(handle->click(), StaleReference);
  EXPECT_EQ(item->clicks, 0U);
  EXPECT_THROW(page.remove(parent), std::invalid_argument);
}

TEST(FakePage, ElementState)
{
  FakePage page;
  auto box = page.append(nullptr, "input", {{"type", "checkbox"}, {"id", "c"}});
  box->styles["color"] = "red";
  auto handle = page.find_element(By::id("c"));

  EXPECT_FALSE(handle->is_selected());
  handle->click();
  EXPECT_TRUE(handle->is_selected());

  handle->send_keys("ab");
  EXPECT_EQ(handle->get_attribute("value"), std::optional<std::string>("ab"));
  handle->clear();
  EXPECT_EQ(handle->get_attribute("value"), std::optional<std::string>(""));

  EXPECT_EQ(handle->get_attribute("type"), std::optional<std::string>("checkbox"));
  EXPECT_FALSE(handle->get_attribute("missing").has_value());
  EXPECT_EQ(handle->get_dom_property("tagName"), std::optional<std::string>("INPUT"));
  EXPECT_EQ(handle->get_css_value("color"), "red");
  EXPECT_EQ(handle->tag_name(), "input");
}

TEST(FakePage, ScopedSearchOnlySeesDescendants)
{
  FakePage page;
  auto form = page.append(nullptr, "form", {{"id", "f"}});
  page.append(form, "input", {}, "inside");
  page.append(nullptr, "input", {}, "outside");

  auto form_handle = page.find_element(By::id("f"));
  auto inputs = form_handle->find_elements(By::tag_name("input"));
  ASSERT_EQ(inputs.size(), 1U);
  EXPECT_EQ(inputs[0]->text(), "inside");
}
