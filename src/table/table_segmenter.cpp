#include "table/table_segmenter.hpp"

#include <cstddef>
#include <vector>

#include "bpcal/exceptions.hpp"

namespace bpcal {
namespace table {

auto split_into_sections(const Lines& solution) -> std::vector<Lines> {
  std::vector<std::size_t> starts;
  for (std::size_t i = 0; i < solution.size(); ++i) {
    if (contains(solution[i], timeMarker)) {
      // section starts at the header line
      const auto start = i > 0 ? i - 1 : 0;
      if (starts.empty() || starts.back() != start) starts.push_back(start);
    }
  }

  if (starts.empty()) {
    throw MalformedReportError(
        "Malformed report: solution holds no table section (no \"Time\" column header).");
  }

  starts.push_back(solution.size());

  std::vector<Lines> sections;
  sections.reserve(starts.size() - 1);
  for (std::size_t i = 0; i + 1 < starts.size(); ++i) {
    sections.emplace_back(solution.begin() + starts[i], solution.begin() + starts[i + 1]);
  }

  return sections;
}

}  // namespace table
}  // namespace bpcal
