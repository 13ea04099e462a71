#include "table/header_deduplicator.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "logger.hpp"

namespace bpcal {
namespace table {

namespace {

// index of the first line of a duplicate header, if any
auto find_duplicate_header(const Lines& solution) -> std::optional<std::size_t> {
  std::optional<std::vector<std::string>> lastHeader;

  for (std::size_t i = 0; i < solution.size(); ++i) {
    if (!contains(solution[i], timeMarker)) continue;

    auto currentHeader = i > 0 ? antenna_names(solution[i - 1]) : std::vector<std::string>();
    if (lastHeader && !currentHeader.empty() && currentHeader == *lastHeader) {
      return i - 1;
    }
    lastHeader = std::move(currentHeader);
  }

  return std::nullopt;
}

}  // namespace

auto antenna_names(const std::string& line) -> std::vector<std::string> {
  static const std::regex antennaPattern(R"(Ant = ([a-zA-Z0-9]+))");

  std::vector<std::string> names;
  for (auto it = std::sregex_iterator(line.begin(), line.end(), antennaPattern);
       it != std::sregex_iterator(); ++it) {
    names.emplace_back((*it)[1].str());
  }
  return names;
}

auto remove_duplicate_headers(Lines solution) -> Lines {
  std::size_t numRemoved = 0;

  while (auto begin = find_duplicate_header(solution)) {
    // header line and time marker line
    auto end = *begin + 2;
    // column rule following the time marker
    if (end < solution.size() && !is_data_line(solution[end])) ++end;

    solution.erase(solution.begin() + *begin, solution.begin() + end);
    ++numRemoved;
  }

  if (numRemoved) {
    globLogger.log(BPCAL_LOG_LEVEL_DEBUG, "removed {} duplicate antenna headers", numRemoved);
  }

  return solution;
}

}  // namespace table
}  // namespace bpcal
