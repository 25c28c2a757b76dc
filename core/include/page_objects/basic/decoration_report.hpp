// page_objects/basic/decoration_report.hpp - Record of what the factory did per member
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "page_objects/decorate/member_type.hpp"

namespace page_objects
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

[[nodiscard]] std::string_view severity_name(Severity severity) noexcept;

struct DecorationEntry
{
  Severity severity = Severity::Info;
  std::string page;
  std::string member;
  MemberShape shape = MemberShape::Unsupported;
  std::string criteria;  // e.g. "By.Id: x, or: By.Name: y"
  std::string message;
};

// ============================================================================
// DecorationReport
// ============================================================================

class DecorationReport
{
public:
  DecorationReport() = default;

  // Add
  void add(DecorationEntry && entry);
  void add(const DecorationEntry & entry);

  // Accessors
  [[nodiscard]] const std::vector<DecorationEntry> & all() const { return entries_; }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] size_t size() const { return entries_.size(); }

  [[nodiscard]] std::vector<DecorationEntry> errors() const;
  [[nodiscard]] std::vector<DecorationEntry> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void clear() { entries_.clear(); }
  void merge(const DecorationReport & other);

  /**
   * Render as JSON: {"items": [{"severity", "page", "member", "shape",
   * "criteria", "message"}, ...]}
   */
  [[nodiscard]] std::string to_json(int indent = -1) const;

  [[nodiscard]] auto begin() const { return entries_.begin(); }
  [[nodiscard]] auto end() const { return entries_.end(); }

private:
  std::vector<DecorationEntry> entries_;
};

}  // namespace page_objects
