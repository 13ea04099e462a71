#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bpcal/config.h"

namespace bpcal {

using Lines = std::vector<std::string>;

namespace table {

// substring marking the first header of every solution
inline constexpr std::string_view solutionMarker = "SpwID";

// substring marking the column header line of a table section
inline constexpr std::string_view timeMarker = "Time";

// flagged values are tagged with this character
inline constexpr char flagMarker = 'F';

// row dropped when the second section's leading token equals the no-data sentinel
inline constexpr std::string_view noDataSentinel = "-nbsdfbkj";

inline auto contains(std::string_view line, std::string_view marker) -> bool {
  return line.find(marker) != std::string_view::npos;
}

inline auto strip_line_ending(std::string line) -> std::string {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
  return line;
}

auto split_whitespace(std::string_view s) -> std::vector<std::string_view>;

auto leading_token(std::string_view s) -> std::string_view;

struct DataLineFields {
  std::string time;
  std::string field;
  std::string channel;
  // everything after the first "|"
  std::string values;
};

// split a line of the shape "<time> <field> <channel>|<values>", empty for any other line
auto split_data_line(const std::string& line) -> std::optional<DataLineFields>;

inline auto is_data_line(const std::string& line) -> bool {
  return split_data_line(line).has_value();
}

}  // namespace table
}  // namespace bpcal
