// page_objects/test_support/fake_page.hpp - In-memory page for unit/integration tests
//
// A small DOM-like tree that answers SearchContext queries. Element handles
// go stale when their node is detached or the page is reloaded, which lets
// tests drive the proxies' recovery paths without a browser.
//
// Supported criteria: Id, Name, TagName, ClassName, LinkText,
// PartialLinkText, and a CSS subset (`tag`, `#id`, `.class`, `tag.class`,
// `tag#id.a.b`). XPath never matches.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "page_objects/basic/by.hpp"
#include "page_objects/element/element.hpp"

namespace page_objects::test_support
{

struct FakeNode
{
  std::string tag;
  std::map<std::string, std::string> attributes;
  std::map<std::string, std::string> styles;
  std::string text;
  std::string value;

  bool enabled = true;
  bool selected = false;
  bool displayed = true;
  Point location;
  Size size;

  size_t clicks = 0;
  size_t submits = 0;

  /// Runs after every click on this node
  std::function<void(FakeNode &)> on_click;

  FakeNode * parent = nullptr;
  std::vector<std::shared_ptr<FakeNode>> children;
};

/// Shared page state (root + generation + query counters)
struct FakeDocument
{
  std::shared_ptr<FakeNode> root;
  uint64_t generation = 0;
  std::map<How, size_t> queries;

  [[nodiscard]] bool is_attached(const FakeNode & node) const noexcept;
  [[nodiscard]] size_t total_queries() const noexcept;
};

// ============================================================================
// FakeElement
// ============================================================================

class FakeElement : public Element
{
public:
  FakeElement(std::shared_ptr<FakeDocument> document, std::shared_ptr<FakeNode> node);

  [[nodiscard]] std::shared_ptr<Element> find_element(const By & by) override;
  [[nodiscard]] std::vector<std::shared_ptr<Element>> find_elements(const By & by) override;

  void click() override;
  void clear() override;
  void submit() override;
  void send_keys(std::string_view keys) override;

  [[nodiscard]] std::string tag_name() override;
  [[nodiscard]] std::string text() override;
  [[nodiscard]] bool is_enabled() override;
  [[nodiscard]] bool is_selected() override;
  [[nodiscard]] bool is_displayed() override;
  [[nodiscard]] Point location() override;
  [[nodiscard]] Size size() override;

  [[nodiscard]] std::optional<std::string> get_attribute(std::string_view name) override;
  [[nodiscard]] std::optional<std::string> get_dom_property(std::string_view name) override;
  [[nodiscard]] std::string get_css_value(std::string_view property) override;

  [[nodiscard]] const std::shared_ptr<FakeNode> & node() const noexcept { return node_; }

private:
  /// @throws StaleReference if the node left the page or the page reloaded
  FakeNode & live();

  std::shared_ptr<FakeDocument> document_;
  std::shared_ptr<FakeNode> node_;
  uint64_t generation_;
};

// ============================================================================
// FakePage
// ============================================================================

class FakePage : public SearchContext
{
public:
  FakePage();

  [[nodiscard]] std::shared_ptr<Element> find_element(const By & by) override;
  [[nodiscard]] std::vector<std::shared_ptr<Element>> find_elements(const By & by) override;

  [[nodiscard]] const std::shared_ptr<FakeNode> & root() const noexcept { return document_->root; }

  /**
   * Append a child node.
   *
   * @param parent Parent node (nullptr = page root)
   */
  std::shared_ptr<FakeNode> append(
    const std::shared_ptr<FakeNode> & parent, std::string tag,
    std::map<std::string, std::string> attributes = {}, std::string text = "");

  /// Detach `node` from the tree; its handles go stale
  void remove(const std::shared_ptr<FakeNode> & node);

  /// Invalidate every handle handed out so far (tree content is kept)
  void reload();

  [[nodiscard]] size_t query_count() const noexcept { return document_->total_queries(); }
  [[nodiscard]] size_t query_count(How how) const;
  void reset_query_counts() { document_->queries.clear(); }

private:
  std::shared_ptr<FakeDocument> document_;
};

/// True if `node` matches `by` (exposed for tests of the matcher itself)
[[nodiscard]] bool matches(const FakeNode & node, const By & by);

}  // namespace page_objects::test_support
