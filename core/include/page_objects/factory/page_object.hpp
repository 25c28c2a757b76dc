// page_objects/factory/page_object.hpp - Page objects and their member tables
//
// Page objects declare their bindable members explicitly instead of being
// introspected:
//
//   class LoginPage : public PageObject {
//   public:
//     std::shared_ptr<Element> user;
//     LazyList<std::shared_ptr<Element>> errors;
//
//     void declare_members(MemberTable & table) override {
//       table.find(user, "user", {By::id("user"), By::name("user")});
//       table.find(errors, "errors", {By::class_name("error")});
//     }
//   };
//
// A derived page object includes inherited members by calling its base's
// declare_members first.
//
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "page_objects/basic/by.hpp"
#include "page_objects/decorate/decorated_value.hpp"
#include "page_objects/decorate/member_type.hpp"

namespace page_objects
{

class MemberTable;

// ============================================================================
// PageObject
// ============================================================================

class PageObject
{
public:
  virtual ~PageObject() = default;

  virtual void declare_members(MemberTable & table) = 0;

  /// Name used in diagnostics; defaults to the dynamic type name
  [[nodiscard]] virtual std::string page_name() const;
};

// ============================================================================
// DeclaredMember
// ============================================================================

/**
 * Assigns a decorated value to the member. Returns false when the value does
 * not fit the member's declared type.
 */
using MemberAssigner = std::function<bool(const DecoratedValue &)>;

struct DeclaredMember
{
  std::string name;
  MemberType type;

  /// Deduplicated; a member without criteria is not decorated
  Criteria criteria;

  /// Empty for read-only members
  MemberAssigner assign;

  [[nodiscard]] bool is_writable() const noexcept { return static_cast<bool>(assign); }
};

// ============================================================================
// MemberTable
// ============================================================================

class MemberTable
{
public:
  explicit MemberTable(std::string page_name) : page_name_(std::move(page_name)) {}

  /**
   * Declare a field. The field must outlive decoration.
   */
  template <typename T>
  MemberTable & find(T & field, std::string name, const std::vector<By> & criteria)
  {
    DeclaredMember member;
    member.name = std::move(name);
    member.type = member_type_of<T>();
    member.criteria = make_criteria(criteria);
    member.assign = [&field](const DecoratedValue & value) {
      auto converted = convert_decorated<T>(value);
      if (!converted) return false;
      field = std::move(*converted);
      return true;
    };
    members_.push_back(std::move(member));
    return *this;
  }

  /**
   * Declare a setter-backed member. An empty setter makes the member
   * read-only; decorating it then fails with MemberNotWritable.
   */
  template <typename T>
  MemberTable & property(
    std::string name, const std::vector<By> & criteria, std::function<void(T)> setter)
  {
    DeclaredMember member;
    member.name = std::move(name);
    member.type = member_type_of<T>();
    member.criteria = make_criteria(criteria);
    if (setter) {
      member.assign = [setter = std::move(setter)](const DecoratedValue & value) {
        auto converted = convert_decorated<T>(value);
        if (!converted) return false;
        setter(std::move(*converted));
        return true;
      };
    }
    members_.push_back(std::move(member));
    return *this;
  }

  /// Declare a member with a prebuilt descriptor
  MemberTable & add(DeclaredMember member);

  [[nodiscard]] const std::string & page_name() const noexcept { return page_name_; }
  [[nodiscard]] const std::vector<DeclaredMember> & members() const noexcept { return members_; }
  [[nodiscard]] bool empty() const noexcept { return members_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return members_.size(); }

private:
  std::string page_name_;
  std::vector<DeclaredMember> members_;
};

}  // namespace page_objects
