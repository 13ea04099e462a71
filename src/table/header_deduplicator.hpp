#pragma once

#include <string>
#include <vector>

#include "bpcal/config.h"
#include "table/table_text.hpp"

namespace bpcal {
namespace table {

/*
 * Antenna names listed on a header line as "Ant = <name>", in order of appearance.
 */
auto antenna_names(const std::string& line) -> std::vector<std::string>;

/*
 * Remove antenna headers repeated by vertical pagination. A header is a duplicate if its
 * antenna names equal those of the header at the previous time marker. The header line, the
 * time marker line and a non-data rule line directly after it are removed, then scanning
 * restarts, until no duplicate is left.
 */
auto remove_duplicate_headers(Lines solution) -> Lines;

}  // namespace table
}  // namespace bpcal
