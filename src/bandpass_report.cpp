#include "bpcal/bandpass_report.hpp"

#include <cstddef>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include "bpcal/config.h"
#include "bpcal/diagnostics.hpp"
#include "bpcal/exceptions.hpp"
#include "logger.hpp"
#include "table/header_deduplicator.hpp"
#include "table/record_parser.hpp"
#include "table/section_joiner.hpp"
#include "table/solution_extractor.hpp"
#include "table/table_segmenter.hpp"

namespace bpcal {

namespace {

auto parse_solution(Lines solution, const ParserOptions& opt,
                    std::vector<Diagnostic>& diagnostics) -> CalibrationDataset {
  for (auto& line : solution) {
    line = table::strip_line_ending(std::move(line));
  }

  // a second pass may uncover duplicates created by the first one
  solution = table::remove_duplicate_headers(std::move(solution));
  solution = table::remove_duplicate_headers(std::move(solution));

  const auto sections = table::split_into_sections(solution);
  globLogger.log(BPCAL_LOG_LEVEL_DEBUG, "solution split into {} sections", sections.size());

  const auto joined = table::join_sections(sections);

  return table::parse_records(joined, opt, diagnostics);
}

}  // namespace

auto to_string(DiagnosticKind kind) -> const char* {
  switch (kind) {
    case DiagnosticKind::MultipleSolutions:
      return "multiple solutions";
    case DiagnosticKind::MultipleTimes:
      return "multiple times";
    case DiagnosticKind::MultipleFields:
      return "multiple fields";
    case DiagnosticKind::NoDataRecords:
      return "no data records";
  }
  return "unknown";
}

auto read_report(const std::string& fileName) -> std::vector<std::string> {
  std::ifstream file(fileName);
  if (!file) {
    throw FileError("Failed to open report file \"" + fileName + "\".");
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    lines.emplace_back(table::strip_line_ending(std::move(line)));
  }

  if (file.bad()) {
    throw FileError("Failed to read report file \"" + fileName + "\".");
  }

  globLogger.log(BPCAL_LOG_LEVEL_INFO, "read {} lines from {}", lines.size(), fileName);

  return lines;
}

auto parse_bandpass_report(const std::vector<std::string>& lines, const ParserOptions& opt)
    -> ParseResult {
  if (opt.numPolarizations == 0) {
    throw InvalidParameterError("Number of polarizations must be larger than zero.");
  }

  ParseResult result;

  auto solutions = table::extract_solutions(lines);

  if (solutions.size() > 1) {
    std::string message = std::to_string(solutions.size()) + " solutions found. ";
    message += opt.allSolutions ? "Processing all solutions." : "First solution processing...";
    globLogger.log(BPCAL_LOG_LEVEL_WARN, "{}", message);
    result.diagnostics.push_back(Diagnostic{DiagnosticKind::MultipleSolutions, std::move(message)});
  }

  const std::size_t numProcessed = opt.allSolutions ? solutions.size() : 1;
  for (std::size_t i = 0; i < numProcessed; ++i) {
    result.datasets.emplace_back(parse_solution(std::move(solutions[i]), opt, result.diagnostics));
  }

  return result;
}

auto parse_bandpass_report_file(const std::string& fileName, const ParserOptions& opt)
    -> ParseResult {
  return parse_bandpass_report(read_report(fileName), opt);
}

}  // namespace bpcal
