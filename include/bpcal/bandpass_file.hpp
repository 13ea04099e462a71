#pragma once

#include <bpcal/config.h>

#include <array>
#include <bpcal/calibration_dataset.hpp>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

/*! \cond PRIVATE */
namespace bpcal {
/*! \endcond */

struct BandpassFileSummary {
  /**
   * Names of all top level groups.
   */
  std::vector<std::string> groups;

  /**
   * Names of the members of the bandpass group.
   */
  std::vector<std::string> members;
};

/**
 * HDF5 container of a bandpass solution. The layout is
 *
 *   /CALIBRATION/BANDPASS/ANTENNA
 *   /CALIBRATION/BANDPASS/CHANNEL
 *   /CALIBRATION/BANDPASS/POLARIZATION
 *   /CALIBRATION/BANDPASS/TIME
 *   /CALIBRATION/BANDPASS/FIELD
 *   /CALIBRATION/BANDPASS/GAIN/CPARAM
 */
class BPCAL_EXPORT BandpassFile {
public:
  /**
   * Create a new file, overwriting any existing one, and write the dataset. If writing fails,
   * the file is removed.
   *
   * @param[in] fileName Output file name.
   * @param[in] dataset Dataset to store.
   */
  static BandpassFile create(const std::string& fileName, const CalibrationDataset& dataset);

  /**
   * Open an existing file read-only.
   *
   * @param[in] fileName File name.
   */
  static BandpassFile open(const std::string& fileName);

  const std::string& file_name() const;

  std::vector<std::string> groups() const;

  std::vector<std::string> members() const;

  std::vector<std::string> antennas() const;

  std::vector<std::int64_t> channels() const;

  std::vector<std::string> polarizations() const;

  std::vector<std::string> times() const;

  std::vector<std::string> fields() const;

  /**
   * Shape of the stored gain array.
   */
  std::array<std::size_t, 3> gain_shape() const;

  /**
   * Stored gains in row-major order.
   */
  std::vector<std::complex<double>> gains() const;

  /**
   * Read the complete content.
   */
  CalibrationDataset dataset() const;

  void close();

  bool is_open() const noexcept;

private:
  class BandpassFileImpl;
  struct BandpassFileImplDeleter {
    void operator()(BandpassFileImpl* p);
  };

  BandpassFile(BandpassFileImpl*);

  std::unique_ptr<BandpassFileImpl, BandpassFileImplDeleter> impl_;
};

/**
 * List the groups of a bandpass file and the members of its bandpass group.
 *
 * @param[in] fileName File name.
 */
BPCAL_EXPORT auto inspect_bandpass_file(const std::string& fileName) -> BandpassFileSummary;

/*! \cond PRIVATE */
}  // namespace bpcal
/*! \endcond */
