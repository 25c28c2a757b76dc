// page_objects/test_support/fake_page.cpp
#include "page_objects/test_support/fake_page.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "page_objects/basic/errors.hpp"

namespace page_objects::test_support
{

namespace
{

std::string trim(std::string_view s)
{
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
  return std::string(s.substr(b, e - b));
}

bool has_class(const FakeNode & node, std::string_view cls)
{
  const auto it = node.attributes.find("class");
  if (it == node.attributes.end()) return false;

  std::istringstream iss(it->second);
  std::string token;
  while (iss >> token) {
    if (token == cls) return true;
  }
  return false;
}

bool attribute_equals(const FakeNode & node, const std::string & name, std::string_view value)
{
  const auto it = node.attributes.find(name);
  return it != node.attributes.end() && it->second == value;
}

/// Compound selector: [tag][#id][.class]*
struct SimpleSelector
{
  std::string tag;
  std::string id;
  std::vector<std::string> classes;
};

std::optional<SimpleSelector> parse_selector(std::string_view text)
{
  SimpleSelector sel;
  const std::string s = trim(text);
  if (s.empty()) return std::nullopt;

  auto is_ident = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
  };

  size_t i = 0;
  while (i < s.size() && is_ident(s[i])) {
    sel.tag += s[i++];
  }

  while (i < s.size()) {
    const char kind = s[i++];
    std::string ident;
    while (i < s.size() && is_ident(s[i])) {
      ident += s[i++];
    }
    if (ident.empty()) return std::nullopt;

    if (kind == '#') {
      sel.id = ident;
    } else if (kind == '.') {
      sel.classes.push_back(ident);
    } else {
      return std::nullopt;
    }
  }

  return sel;
}

bool matches_selector(const FakeNode & node, const SimpleSelector & sel)
{
  if (!sel.tag.empty() && node.tag != sel.tag) return false;
  if (!sel.id.empty() && !attribute_equals(node, "id", sel.id)) return false;
  return std::all_of(sel.classes.begin(), sel.classes.end(), [&](const std::string & c) {
    return has_class(node, c);
  });
}

void collect(
  const std::shared_ptr<FakeNode> & node, const By & by,
  std::vector<std::shared_ptr<FakeNode>> & out, bool first_only)
{
  for (const auto & child : node->children) {
    if (first_only && !out.empty()) return;
    if (matches(*child, by)) {
      out.push_back(child);
    }
    collect(child, by, out, first_only);
  }
}

std::vector<std::shared_ptr<Element>> search(
  const std::shared_ptr<FakeDocument> & document, const std::shared_ptr<FakeNode> & scope,
  const By & by, bool first_only)
{
  ++document->queries[by.how()];

  std::vector<std::shared_ptr<FakeNode>> nodes;
  collect(scope, by, nodes, first_only);

  std::vector<std::shared_ptr<Element>> out;
  out.reserve(nodes.size());
  for (auto & n : nodes) {
    out.push_back(std::make_shared<FakeElement>(document, std::move(n)));
  }
  return out;
}

}  // namespace

bool matches(const FakeNode & node, const By & by)
{
  switch (by.how()) {
    case How::Id:
      return attribute_equals(node, "id", by.value());
    case How::Name:
      return attribute_equals(node, "name", by.value());
    case How::TagName:
      return node.tag == by.value();
    case How::ClassName:
      return has_class(node, by.value());
    case How::LinkText:
      return node.tag == "a" && trim(node.text) == by.value();
    case How::PartialLinkText:
      return node.tag == "a" && node.text.find(by.value()) != std::string::npos;
    case How::CssSelector: {
      const auto sel = parse_selector(by.value());
      return sel && matches_selector(node, *sel);
    }
    case How::XPath:
      return false;
  }
  return false;
}

// ============================================================================
// FakeDocument
// ============================================================================

bool FakeDocument::is_attached(const FakeNode & node) const noexcept
{
  const FakeNode * current = &node;
  while (current != nullptr) {
    if (current == root.get()) return true;
    current = current->parent;
  }
  return false;
}

size_t FakeDocument::total_queries() const noexcept
{
  size_t total = 0;
  for (const auto & [how, count] : queries) {
    total += count;
  }
  return total;
}

// ============================================================================
// FakeElement
// ============================================================================

FakeElement::FakeElement(std::shared_ptr<FakeDocument> document, std::shared_ptr<FakeNode> node)
: document_(std::move(document)), node_(std::move(node)), generation_(document_->generation)
{
}

FakeNode & FakeElement::live()
{
  if (document_->generation != generation_ || !document_->is_attached(*node_)) {
    throw StaleReference();
  }
  return *node_;
}

std::shared_ptr<Element> FakeElement::find_element(const By & by)
{
  live();
  auto found = search(document_, node_, by, true);
  return found.empty() ? nullptr : found.front();
}

std::vector<std::shared_ptr<Element>> FakeElement::find_elements(const By & by)
{
  live();
  return search(document_, node_, by, false);
}

void FakeElement::click()
{
  FakeNode & n = live();
  ++n.clicks;
  if (n.tag == "input" && attribute_equals(n, "type", "checkbox")) {
    n.selected = !n.selected;
  }
  if (n.on_click) {
    n.on_click(n);
  }
}

void FakeElement::clear() { live().value.clear(); }

void FakeElement::submit() { ++live().submits; }

void FakeElement::send_keys(std::string_view keys) { live().value.append(keys); }

std::string FakeElement::tag_name() { return live().tag; }

std::string FakeElement::text() { return live().text; }

bool FakeElement::is_enabled() { return live().enabled; }

bool FakeElement::is_selected() { return live().selected; }

bool FakeElement::is_displayed() { return live().displayed; }

Point FakeElement::location() { return live().location; }

Size FakeElement::size() { return live().size; }

std::optional<std::string> FakeElement::get_attribute(std::string_view name)
{
  const FakeNode & n = live();
  if (name == "value") return n.value;
  const auto it = n.attributes.find(std::string(name));
  if (it == n.attributes.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> FakeElement::get_dom_property(std::string_view name)
{
  const FakeNode & n = live();
  if (name == "value") return n.value;
  if (name == "textContent") return n.text;
  if (name == "tagName") {
    std::string upper = n.tag;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
      return static_cast<char>(std::toupper(c));
    });
    return upper;
  }
  const auto it = n.attributes.find(std::string(name));
  if (it == n.attributes.end()) return std::nullopt;
  return it->second;
}

std::string FakeElement::get_css_value(std::string_view property)
{
  const FakeNode & n = live();
  const auto it = n.styles.find(std::string(property));
  return it == n.styles.end() ? std::string() : it->second;
}

// ============================================================================
// FakePage
// ============================================================================

FakePage::FakePage() : document_(std::make_shared<FakeDocument>())
{
  document_->root = std::make_shared<FakeNode>();
  document_->root->tag = "html";
}

std::shared_ptr<Element> FakePage::find_element(const By & by)
{
  auto found = search(document_, document_->root, by, true);
  return found.empty() ? nullptr : found.front();
}

std::vector<std::shared_ptr<Element>> FakePage::find_elements(const By & by)
{
  return search(document_, document_->root, by, false);
}

std::shared_ptr<FakeNode> FakePage::append(
  const std::shared_ptr<FakeNode> & parent, std::string tag,
  std::map<std::string, std::string> attributes, std::string text)
{
  const auto & owner = parent ? parent : document_->root;

  auto node = std::make_shared<FakeNode>();
  node->tag = std::move(tag);
  node->attributes = std::move(attributes);
  node->text = std::move(text);
  node->parent = owner.get();
  owner->children.push_back(node);
  return node;
}

void FakePage::remove(const std::shared_ptr<FakeNode> & node)
{
  if (!node || node->parent == nullptr) {
    throw std::invalid_argument("FakePage::remove: node is not attached");
  }

  auto & siblings = node->parent->children;
  siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
  node->parent = nullptr;
}

void FakePage::reload() { ++document_->generation; }

size_t FakePage::query_count(How how) const
{
  const auto it = document_->queries.find(how);
  return it == document_->queries.end() ? 0 : it->second;
}

}  // namespace page_objects::test_support
