// page_objects/basic/report_printer.hpp
//
// Prints decoration report entries in the same compact style as compiler
// diagnostics:
//   warning: Unable to decorate int, it is unsupported
//     --> LoginPage.count (unsupported)
//      = criteria: By.Id: count
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "page_objects/basic/decoration_report.hpp"

namespace page_objects
{

class ReportPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit ReportPrinter(std::ostream & os, bool use_color = true);

  void print(const DecorationEntry & entry);

  /// Print every entry at or above `min_severity` (Error is the highest)
  void print_all(const DecorationReport & report, Severity min_severity = Severity::Info);

private:
  void print_severity_header(const DecorationEntry & entry);
  void print_note(std::string_view label, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace page_objects
