#include "table/section_joiner.hpp"

#include <cstddef>
#include <string>
#include <vector>

#include "bpcal/exceptions.hpp"
#include "logger.hpp"

namespace bpcal {
namespace table {

namespace {

// number of lines up to and including the last data line
auto data_extent(const Lines& section) -> std::size_t {
  for (std::size_t i = section.size(); i > 0; --i) {
    if (is_data_line(section[i - 1])) return i;
  }
  return 0;
}

auto join_pair(const Lines& left, const Lines& right, std::size_t rightIndex) -> Lines {
  const auto extent = data_extent(left);
  if (data_extent(right) != extent) {
    throw SectionAlignmentError("Section alignment error: data rows of section " +
                                std::to_string(rightIndex) + " end at line " +
                                std::to_string(data_extent(right)) + ", expected line " +
                                std::to_string(extent) + ".");
  }

  Lines joined;
  joined.reserve(left.size());

  for (std::size_t i = 0; i < left.size(); ++i) {
    const auto& l = left[i];
    // trailing structural lines missing from a later section
    if (i >= right.size()) {
      joined.emplace_back(l);
      continue;
    }
    const auto& m = right[i];

    if (leading_token(m) == noDataSentinel) continue;

    const auto leftRow = split_data_line(l);
    const auto rightRow = split_data_line(m);
    if (leftRow.has_value() != rightRow.has_value()) {
      throw SectionAlignmentError("Section alignment error: line " + std::to_string(i) +
                                  " of section " + std::to_string(rightIndex) + " is " +
                                  (rightRow ? "a data row" : "not a data row") +
                                  ", unlike the previous sections.");
    }
    if (leftRow && (leftRow->time != rightRow->time || leftRow->field != rightRow->field ||
                    leftRow->channel != rightRow->channel)) {
      throw SectionAlignmentError("Section alignment error: row (" + rightRow->time + ", " +
                                  rightRow->field + ", " + rightRow->channel + ") of section " +
                                  std::to_string(rightIndex) + " does not match row (" +
                                  leftRow->time + ", " + leftRow->field + ", " +
                                  leftRow->channel + ").");
    }

    const auto delim = m.find('|');
    if (delim == std::string::npos) {
      // header lines carry no delimiter
      joined.emplace_back(l + ' ' + m);
    } else {
      joined.emplace_back(l + m.substr(delim + 1));
    }
  }

  return joined;
}

}  // namespace

auto join_sections(const std::vector<Lines>& sections) -> Lines {
  if (sections.empty()) {
    throw InvalidParameterError("join_sections: no sections to join.");
  }

  Lines table = sections.front();
  for (std::size_t i = 1; i < sections.size(); ++i) {
    table = join_pair(table, sections[i], i);
  }

  globLogger.log(BPCAL_LOG_LEVEL_DEBUG, "joined {} sections into {} lines", sections.size(),
                 table.size());

  // drop the column rule below the time header
  if (table.size() > 2) table.erase(table.begin() + 2);

  return table;
}

}  // namespace table
}  // namespace bpcal
