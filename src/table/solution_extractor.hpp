#pragma once

#include <vector>

#include "bpcal/config.h"
#include "table/table_text.hpp"

namespace bpcal {
namespace table {

/*
 * Split a report into solutions. Each solution starts at a line containing the solution marker
 * and ends before the next one. Lines before the first marker are discarded.
 * Throws MalformedReportError if the report holds no marker.
 */
auto extract_solutions(const Lines& report) -> std::vector<Lines>;

}  // namespace table
}  // namespace bpcal
