// page_objects/basic/report_printer.cpp
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "page_objects/basic/report_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

namespace page_objects
{

namespace
{

/// Error < Warning < Info in enum order; lower is more severe
bool at_least(Severity severity, Severity min_severity)
{
  return static_cast<uint8_t>(severity) <= static_cast<uint8_t>(min_severity);
}

}  // namespace

ReportPrinter::ReportPrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ReportPrinter::print(const DecorationEntry & entry)
{
  print_severity_header(entry);

  fmt::print(
    os_, "{} {}.{} ({})\n", gutter_arrow(), entry.page, entry.member, shape_name(entry.shape));

  if (!entry.criteria.empty()) {
    print_note("criteria", entry.criteria);
  }
}

void ReportPrinter::print_all(const DecorationReport & report, Severity min_severity)
{
  for (const auto & entry : report) {
    if (at_least(entry.severity, min_severity)) {
      print(entry);
    }
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void ReportPrinter::print_severity_header(const DecorationEntry & entry)
{
  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", severity_name(entry.severity), entry.message);
    return;
  }

  os_ << rang::style::bold;
  switch (entry.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
  }
  os_ << severity_name(entry.severity) << rang::fg::reset << ": " << entry.message
      << rang::style::reset << "\n";
}

void ReportPrinter::print_note(std::string_view label, std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", label, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", label, message);
  }
}

std::string ReportPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

}  // namespace page_objects
