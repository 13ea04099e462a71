#include "bpcal/calibration_dataset.hpp"

#include <complex>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "bpcal/config.h"
#include "bpcal/exceptions.hpp"

namespace bpcal {

CalibrationDataset::CalibrationDataset(std::vector<std::string> antennas,
                                       std::vector<ChannelType> channels,
                                       std::vector<std::string> polarizations,
                                       std::vector<std::string> times,
                                       std::vector<std::string> fields,
                                       std::vector<std::complex<double>> gains)
    : antennas_(std::move(antennas)),
      channels_(std::move(channels)),
      polarizations_(std::move(polarizations)),
      times_(std::move(times)),
      fields_(std::move(fields)),
      gains_(std::move(gains)) {
  if (gains_.size() != antennas_.size() * channels_.size() * polarizations_.size()) {
    throw InvalidParameterError(
        "CalibrationDataset: number of gains does not match antenna, channel and polarization "
        "count.");
  }
}

auto CalibrationDataset::gain(std::size_t antenna, std::size_t channel, std::size_t pol) const
    -> const std::complex<double>& {
  if (antenna >= antennas_.size() || channel >= channels_.size() ||
      pol >= polarizations_.size()) {
    throw InvalidParameterError("CalibrationDataset: gain index out of range.");
  }
  return gains_[(antenna * channels_.size() + channel) * polarizations_.size() + pol];
}

auto polarization_labels(std::size_t numPolarizations) -> std::vector<std::string> {
  std::vector<std::string> labels;
  labels.reserve(numPolarizations);
  for (std::size_t i = 0; i < numPolarizations; ++i) {
    labels.emplace_back("pol" + std::to_string(i));
  }
  return labels;
}

}  // namespace bpcal
