#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bpcal/calibration_dataset.hpp"
#include "bpcal/config.h"
#include "bpcal/diagnostics.hpp"
#include "bpcal/options.hpp"
#include "table/table_text.hpp"

namespace bpcal {
namespace table {

struct DataRecord {
  std::string time;
  std::string field;
  std::int64_t channel = 0;
  // (amplitude, phase in degrees) pairs, antenna major, polarization minor
  std::vector<double> values;
};

/*
 * Parse a single data line. Returns an empty optional for structural lines, that do not match
 * the data line pattern. Flag markers are removed from the values.
 * Throws RecordShapeError if a value is not a number.
 */
auto parse_data_line(const std::string& line) -> std::optional<DataRecord>;

/*
 * Parse a joined table into a dataset. The antenna names are taken from the first header line.
 * Multiple distinct times or fields are reported through the diagnostics, or thrown as
 * MultiplicityError in strict mode.
 * Throws RecordShapeError if a data line does not hold exactly
 * 2 * numAntenna * numPolarizations values.
 */
auto parse_records(const Lines& table, const ParserOptions& opt,
                   std::vector<Diagnostic>& diagnostics) -> CalibrationDataset;

}  // namespace table
}  // namespace bpcal
