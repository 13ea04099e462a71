#pragma once

#include <bpcal/config.h>

#include <cstddef>
#include <string>
#include <vector>

/*! \cond PRIVATE */
namespace bpcal {
/*! \endcond */

enum class DiagnosticKind {
  /**
   * The report holds more than one solution.
   */
  MultipleSolutions,
  /**
   * Records of a single solution carry more than one distinct time.
   */
  MultipleTimes,
  /**
   * Records of a single solution carry more than one distinct field.
   */
  MultipleFields,
  /**
   * A solution table without any data line.
   */
  NoDataRecords
};

/**
 * A non-fatal observation made while parsing a report.
 */
struct Diagnostic {
  DiagnosticKind kind;
  std::string message;
};

/**
 * Count the diagnostics of a given kind.
 */
inline auto count_diagnostics(const std::vector<Diagnostic>& diagnostics, DiagnosticKind kind)
    -> std::size_t {
  std::size_t count = 0;
  for (const auto& d : diagnostics) {
    if (d.kind == kind) ++count;
  }
  return count;
}

BPCAL_EXPORT auto to_string(DiagnosticKind kind) -> const char*;

/*! \cond PRIVATE */
}  // namespace bpcal
/*! \endcond */
