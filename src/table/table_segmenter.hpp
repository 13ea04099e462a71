#pragma once

#include <vector>

#include "bpcal/config.h"
#include "table/table_text.hpp"

namespace bpcal {
namespace table {

/*
 * Split a deduplicated solution into its horizontal pages. A section starts at the header line
 * preceding each time marker and runs until the next section.
 * Throws MalformedReportError if the solution holds no time marker.
 */
auto split_into_sections(const Lines& solution) -> std::vector<Lines>;

}  // namespace table
}  // namespace bpcal
