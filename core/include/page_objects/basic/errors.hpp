// page_objects/basic/errors.hpp - Failure taxonomy
//
// The proxy layer recovers StaleReference (once per invocation) and nothing
// else. Every other failure reaches the caller unchanged.
//
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "page_objects/basic/by.hpp"

namespace page_objects
{

class PageObjectError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * No configured criterion matched.
 */
class ElementNotFound : public PageObjectError
{
public:
  explicit ElementNotFound(std::vector<By> criteria);
  ElementNotFound(std::string message, std::vector<By> criteria);

  /// Criteria that were attempted, in order
  [[nodiscard]] const std::vector<By> & criteria() const noexcept { return criteria_; }

private:
  std::vector<By> criteria_;
};

/**
 * A previously resolved element handle no longer refers to a live node.
 */
class StaleReference : public PageObjectError
{
public:
  StaleReference() : PageObjectError("stale element reference: element is not attached to the page")
  {
  }
  using PageObjectError::PageObjectError;
};

class DecorationError : public PageObjectError
{
public:
  using PageObjectError::PageObjectError;
};

/**
 * Declared member type matches none of the supported shapes.
 */
class UnsupportedMemberType : public DecorationError
{
public:
  explicit UnsupportedMemberType(std::string type_name);

  [[nodiscard]] const std::string & type_name() const noexcept { return type_name_; }

private:
  std::string type_name_;
};

/**
 * Decoration produced a value but the member cannot accept it.
 */
class MemberNotWritable : public DecorationError
{
public:
  MemberNotWritable(std::string page_name, std::string member_name);

  [[nodiscard]] const std::string & member_name() const noexcept { return member_name_; }

private:
  std::string member_name_;
};

}  // namespace page_objects
