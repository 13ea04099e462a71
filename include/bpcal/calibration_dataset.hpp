#pragma once

#include <bpcal/config.h>

#include <array>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/*! \cond PRIVATE */
namespace bpcal {
/*! \endcond */

/**
 * Bandpass solution of one calibration solution. Complex gains are indexed by (antenna, channel,
 * polarization) and stored in row-major order.
 */
class BPCAL_EXPORT CalibrationDataset {
public:
  using ChannelType = std::int64_t;

  /**
   * Create a dataset. The number of gains must equal the product of the number of antennas,
   * channels and polarizations.
   *
   * @param[in] antennas Ordered antenna names.
   * @param[in] channels Channel index for each entry of the channel axis.
   * @param[in] polarizations Polarization labels.
   * @param[in] times Distinct time stamps.
   * @param[in] fields Distinct field identifiers.
   * @param[in] gains Complex gains of shape (antennas, channels, polarizations).
   */
  CalibrationDataset(std::vector<std::string> antennas, std::vector<ChannelType> channels,
                     std::vector<std::string> polarizations, std::vector<std::string> times,
                     std::vector<std::string> fields, std::vector<std::complex<double>> gains);

  auto antennas() const noexcept -> const std::vector<std::string>& { return antennas_; }

  auto channels() const noexcept -> const std::vector<ChannelType>& { return channels_; }

  auto polarizations() const noexcept -> const std::vector<std::string>& { return polarizations_; }

  auto times() const noexcept -> const std::vector<std::string>& { return times_; }

  auto fields() const noexcept -> const std::vector<std::string>& { return fields_; }

  auto gains() const noexcept -> const std::vector<std::complex<double>>& { return gains_; }

  auto num_antenna() const noexcept -> std::size_t { return antennas_.size(); }

  auto num_channel() const noexcept -> std::size_t { return channels_.size(); }

  auto num_polarization() const noexcept -> std::size_t { return polarizations_.size(); }

  /**
   * Shape of the gain array: {antennas, channels, polarizations}.
   */
  auto shape() const noexcept -> std::array<std::size_t, 3> {
    return {antennas_.size(), channels_.size(), polarizations_.size()};
  }

  /**
   * Access a single gain. Throws InvalidParameterError for indices out of range.
   */
  auto gain(std::size_t antenna, std::size_t channel, std::size_t pol) const
      -> const std::complex<double>&;

private:
  std::vector<std::string> antennas_;
  std::vector<ChannelType> channels_;
  std::vector<std::string> polarizations_;
  std::vector<std::string> times_;
  std::vector<std::string> fields_;
  std::vector<std::complex<double>> gains_;
};

/**
 * Default polarization labels "pol0" to "pol<n-1>".
 */
BPCAL_EXPORT auto polarization_labels(std::size_t numPolarizations) -> std::vector<std::string>;

/*! \cond PRIVATE */
}  // namespace bpcal
/*! \endcond */
