#include "table/solution_extractor.hpp"

#include <cstddef>
#include <vector>

#include "bpcal/exceptions.hpp"

namespace bpcal {
namespace table {

auto extract_solutions(const Lines& report) -> std::vector<Lines> {
  std::vector<std::size_t> boundaries;
  for (std::size_t i = 0; i < report.size(); ++i) {
    if (contains(report[i], solutionMarker)) boundaries.push_back(i);
  }

  if (boundaries.empty()) {
    throw MalformedReportError(
        "Malformed report: no solution header containing \"SpwID\" found.");
  }

  boundaries.push_back(report.size());

  std::vector<Lines> solutions;
  solutions.reserve(boundaries.size() - 1);
  for (std::size_t i = 0; i + 1 < boundaries.size(); ++i) {
    solutions.emplace_back(report.begin() + boundaries[i], report.begin() + boundaries[i + 1]);
  }

  return solutions;
}

}  // namespace table
}  // namespace bpcal
