#pragma once

#include <vector>

#include "bpcal/config.h"
#include "table/table_text.hpp"

namespace bpcal {
namespace table {

/*
 * Join horizontal pages into a single table. Lines of later sections are appended to the lines
 * of the first one, skipping their leading "|" delimited field. Rows whose leading token in the
 * appended section is the no-data sentinel are dropped. The column rule (third line) of the
 * joined table is removed.
 *
 * Sections are paired line by line. Structural lines after the last data row may be missing
 * from a section. Throws SectionAlignmentError if the data rows of two sections end at different
 * lines, or if paired rows differ in position, time, field or channel.
 */
auto join_sections(const std::vector<Lines>& sections) -> Lines;

}  // namespace table
}  // namespace bpcal
