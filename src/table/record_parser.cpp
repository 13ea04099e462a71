#include "table/record_parser.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <numeric>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "bpcal/exceptions.hpp"
#include "logger.hpp"
#include "table/header_deduplicator.hpp"

namespace bpcal {
namespace table {

namespace {

constexpr double pi = 3.14159265358979323846;

auto parse_value(const std::string& token, const std::string& line) -> double {
  char* end = nullptr;
  const double value = std::strtod(token.c_str(), &end);
  if (token.empty() || end != token.c_str() + token.size()) {
    throw RecordShapeError("Record shape error: value \"" + token +
                           "\" is not a number in line \"" + line + "\".");
  }
  return value;
}

auto report_multiplicity(const std::set<std::string>& values, const char* name,
                         DiagnosticKind kind, const ParserOptions& opt,
                         std::vector<Diagnostic>& diagnostics) -> void {
  if (values.size() <= 1) return;

  std::string message = "processing data from " + std::to_string(values.size()) + " distinct " +
                        name + " values:";
  for (const auto& v : values) message += " " + v;

  if (opt.strictMultiplicity) {
    throw MultiplicityError("Multiplicity error: " + message + ".");
  }

  globLogger.log(BPCAL_LOG_LEVEL_WARN, "{}", message);
  diagnostics.push_back(Diagnostic{kind, std::move(message)});
}

}  // namespace

auto parse_data_line(const std::string& line) -> std::optional<DataRecord> {
  auto fields = split_data_line(line);
  if (!fields) return std::nullopt;

  DataRecord record;
  record.time = std::move(fields->time);
  record.field = std::move(fields->field);
  try {
    record.channel = std::stoll(fields->channel);
  } catch (const std::out_of_range&) {
    throw RecordShapeError("Record shape error: channel index out of range in line \"" + line +
                           "\".");
  }

  // flag markers may be attached to a value
  auto rest = std::move(fields->values);
  std::replace(rest.begin(), rest.end(), flagMarker, ' ');

  for (const auto& token : split_whitespace(rest)) {
    record.values.push_back(parse_value(std::string(token), line));
  }

  return record;
}

auto parse_records(const Lines& table, const ParserOptions& opt,
                   std::vector<Diagnostic>& diagnostics) -> CalibrationDataset {
  const auto npol = opt.numPolarizations;
  if (npol == 0) {
    throw InvalidParameterError("Number of polarizations must be larger than zero.");
  }

  std::vector<std::string> antennas;
  for (const auto& line : table) {
    antennas = antenna_names(line);
    if (!antennas.empty()) break;
  }
  if (antennas.empty()) {
    throw MalformedReportError("Malformed report: table holds no antenna header line.");
  }

  const auto nAntenna = antennas.size();
  const auto expected = nAntenna * 2 * npol;

  std::vector<DataRecord> records;
  for (std::size_t i = 0; i < table.size(); ++i) {
    auto record = parse_data_line(table[i]);
    if (!record) continue;

    if (record->values.size() != expected) {
      throw RecordShapeError("Record shape error: expected " + std::to_string(expected) +
                             " values (" + std::to_string(nAntenna) + " antennas, " +
                             std::to_string(npol) + " polarizations), got " +
                             std::to_string(record->values.size()) + " in table line " +
                             std::to_string(i) + ": \"" + table[i] + "\".");
    }
    records.emplace_back(std::move(*record));
  }

  if (records.empty()) {
    std::string message = "no data records found for antennas";
    for (const auto& a : antennas) message += " " + a;
    globLogger.log(BPCAL_LOG_LEVEL_WARN, "{}", message);
    diagnostics.push_back(Diagnostic{DiagnosticKind::NoDataRecords, std::move(message)});
  }

  std::set<std::string> times, fields;
  for (const auto& r : records) {
    times.insert(r.time);
    fields.insert(r.field);
  }
  report_multiplicity(times, "time", DiagnosticKind::MultipleTimes, opt, diagnostics);
  report_multiplicity(fields, "field", DiagnosticKind::MultipleFields, opt, diagnostics);

  std::vector<std::size_t> order(records.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return records[a].channel < records[b].channel;
  });

  if (times.size() == 1 && fields.size() == 1) {
    for (std::size_t i = 1; i < order.size(); ++i) {
      const auto& record = records[order[i]];
      if (record.channel == records[order[i - 1]].channel) {
        throw RecordShapeError("Record shape error: channel " + std::to_string(record.channel) +
                               " listed more than once for time " + record.time + " and field " +
                               record.field + ".");
      }
    }
  }

  const auto nChannel = records.size();
  std::vector<CalibrationDataset::ChannelType> channels(nChannel);
  std::vector<std::complex<double>> gains(nAntenna * nChannel * npol);

  for (std::size_t c = 0; c < nChannel; ++c) {
    const auto& record = records[order[c]];
    channels[c] = record.channel;

    for (std::size_t a = 0; a < nAntenna; ++a) {
      for (std::size_t p = 0; p < npol; ++p) {
        const auto idx = (a * npol + p) * 2;
        const double amp = record.values[idx];
        const double phase = record.values[idx + 1] * pi / 180.0;
        gains[(a * nChannel + c) * npol + p] =
            amp * std::exp(std::complex<double>(0.0, phase));
      }
    }
  }

  globLogger.log(BPCAL_LOG_LEVEL_INFO, "parsed {} records for {} antennas", nChannel, nAntenna);
  globLogger.log_array(BPCAL_LOG_LEVEL_DEBUG, "gains", gains.size(), gains.data());

  return CalibrationDataset(std::move(antennas), std::move(channels), polarization_labels(npol),
                            std::vector<std::string>(times.begin(), times.end()),
                            std::vector<std::string>(fields.begin(), fields.end()),
                            std::move(gains));
}

}  // namespace table
}  // namespace bpcal
