#pragma once

#include <bpcal/config.h>

#include <bpcal/calibration_dataset.hpp>
#include <bpcal/diagnostics.hpp>
#include <bpcal/options.hpp>
#include <string>
#include <vector>

/*! \cond PRIVATE */
namespace bpcal {
/*! \endcond */

struct ParseResult {
  /**
   * One dataset per processed solution, in report order.
   */
  std::vector<CalibrationDataset> datasets;

  /**
   * Non-fatal observations made while parsing.
   */
  std::vector<Diagnostic> diagnostics;
};

/**
 * Read a report file. Line endings are removed.
 *
 * @param[in] fileName Path to the report.
 * @return Report lines.
 */
BPCAL_EXPORT auto read_report(const std::string& fileName) -> std::vector<std::string>;

/**
 * Parse a bandpass calibration report.
 *
 * Throws MalformedReportError if no solution or table section can be found,
 * SectionAlignmentError if the pages of a table do not describe the same rows and
 * RecordShapeError if a data line does not match the antenna and polarization count.
 *
 * @param[in] lines Report lines.
 * @param[in] opt Parser options.
 * @return Parsed datasets and diagnostics.
 */
BPCAL_EXPORT auto parse_bandpass_report(const std::vector<std::string>& lines,
                                        const ParserOptions& opt = ParserOptions())
    -> ParseResult;

/**
 * Read and parse a bandpass calibration report file.
 *
 * @param[in] fileName Path to the report.
 * @param[in] opt Parser options.
 * @return Parsed datasets and diagnostics.
 */
BPCAL_EXPORT auto parse_bandpass_report_file(const std::string& fileName,
                                             const ParserOptions& opt = ParserOptions())
    -> ParseResult;

/*! \cond PRIVATE */
}  // namespace bpcal
/*! \endcond */
