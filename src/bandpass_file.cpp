#include "bpcal/bandpass_file.hpp"

#include <hdf5.h>

#include <array>
#include <complex>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "bpcal/config.h"
#include "bpcal/exceptions.hpp"
#include "io/h5_util.hpp"
#include "logger.hpp"

namespace bpcal {

namespace {

constexpr const char* bandpassGroupName = "CALIBRATION/BANDPASS";
constexpr const char* gainGroupName = "GAIN";
constexpr const char* gainDatasetName = "CPARAM";

}  // namespace

class BandpassFile::BandpassFileImpl {
public:
  // create new file
  BandpassFileImpl(const std::string& fileName, const CalibrationDataset& dataset)
      : fileName_(fileName) {
    h5File_ = h5::check(H5Fcreate(fileName.data(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT));

    h5BandpassGroup_ = h5::create_group(h5File_.id(), bandpassGroupName);

    h5::create_string_dataset(h5BandpassGroup_.id(), "ANTENNA", dataset.antennas());

    {
      h5::DataSet dset = h5::create_fixed_space(h5BandpassGroup_.id(), "CHANNEL",
                                                H5T_STD_I64LE, {dataset.num_channel()});
      if (dataset.num_channel()) {
        h5::check(H5Dwrite(dset.id(), H5T_NATIVE_INT64, H5S_ALL, H5S_ALL,
                           H5P_DEFAULT, dataset.channels().data()));
      }
    }

    h5::create_string_dataset(h5BandpassGroup_.id(), "POLARIZATION", dataset.polarizations());
    h5::create_string_dataset(h5BandpassGroup_.id(), "TIME", dataset.times());
    h5::create_string_dataset(h5BandpassGroup_.id(), "FIELD", dataset.fields());

    {
      h5::Group gainGroup = h5::check(
          H5Gcreate(h5BandpassGroup_.id(), gainGroupName, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT));
      h5::DataType complexType = h5::create_complex_type();
      const auto shape = dataset.shape();
      h5::DataSet dset = h5::create_fixed_space(gainGroup.id(), gainDatasetName,
                                                complexType.id(), {shape[0], shape[1], shape[2]});
      if (!dataset.gains().empty()) {
        h5::check(H5Dwrite(dset.id(), complexType.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT,
                           dataset.gains().data()));
      }
    }

    h5::check(H5Fflush(h5File_.id(), H5F_SCOPE_GLOBAL));
  }

  // open existing file
  explicit BandpassFileImpl(const std::string& fileName) : fileName_(fileName) {
    if (!std::filesystem::is_regular_file(fileName)) {
      throw FileError("File " + fileName + " does not exist.");
    }
    h5File_ = h5::check(H5Fopen(fileName.data(), H5F_ACC_RDONLY, H5P_DEFAULT));

    if (H5Lexists(h5File_.id(), "CALIBRATION", H5P_DEFAULT) <= 0 ||
        H5Lexists(h5File_.id(), bandpassGroupName, H5P_DEFAULT) <= 0) {
      throw FileError("File " + fileName + " holds no " + bandpassGroupName + " group.");
    }

    h5BandpassGroup_ = h5::check(H5Gopen(h5File_.id(), bandpassGroupName, H5P_DEFAULT));
  }

  auto file_name() const noexcept -> const std::string& { return fileName_; }

  auto groups() const -> std::vector<std::string> { return h5::link_names(h5File_.id()); }

  auto members() const -> std::vector<std::string> {
    return h5::link_names(h5BandpassGroup_.id());
  }

  auto strings(const char* name) const -> std::vector<std::string> {
    return h5::read_string_dataset(h5BandpassGroup_.id(), name);
  }

  auto channels() const -> std::vector<std::int64_t> {
    h5::DataSet dset = h5::check(H5Dopen(h5BandpassGroup_.id(), "CHANNEL", H5P_DEFAULT));
    const auto dims = h5::dataset_dims(dset.id());
    if (dims.size() != 1) {
      throw FileError("Invalid rank of CHANNEL dataset. Expected one dimension.");
    }

    std::vector<std::int64_t> values(dims[0]);
    if (!values.empty()) {
      h5::check(H5Dread(dset.id(), H5T_NATIVE_INT64, H5S_ALL, H5S_ALL,
                        H5P_DEFAULT, values.data()));
    }
    return values;
  }

  auto gain_shape() const -> std::array<std::size_t, 3> {
    h5::DataSet dset = open_gains();
    const auto dims = h5::dataset_dims(dset.id());
    if (dims.size() != 3) {
      throw FileError("Invalid rank of gain dataset. Expected three dimensions.");
    }
    return {dims[0], dims[1], dims[2]};
  }

  auto gains() const -> std::vector<std::complex<double>> {
    const auto shape = gain_shape();
    std::vector<std::complex<double>> values(shape[0] * shape[1] * shape[2]);
    if (!values.empty()) {
      h5::DataSet dset = open_gains();
      h5::DataType complexType = h5::create_complex_type();
      h5::check(H5Dread(dset.id(), complexType.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT,
                        values.data()));
    }
    return values;
  }

private:
  auto open_gains() const -> h5::DataSet {
    h5::Group gainGroup = h5::check(H5Gopen(h5BandpassGroup_.id(), gainGroupName, H5P_DEFAULT));
    return h5::check(H5Dopen(gainGroup.id(), gainDatasetName, H5P_DEFAULT));
  }

  std::string fileName_;

  // file
  h5::File h5File_;

  // groups
  h5::Group h5BandpassGroup_;
};

void BandpassFile::BandpassFileImplDeleter::operator()(BandpassFileImpl* p) { delete p; }

BandpassFile::BandpassFile(BandpassFileImpl* impl) : impl_(impl) {}

BandpassFile BandpassFile::create(const std::string& fileName, const CalibrationDataset& dataset) {
  BandpassFileImpl* impl = nullptr;
  try {
    impl = new BandpassFileImpl(fileName, dataset);
  } catch (const GenericError& e) {
    // the partially written file is closed by the destructor of the implementation
    std::remove(fileName.c_str());
    globLogger.log(BPCAL_LOG_LEVEL_ERROR, "failed to write {}: {}", fileName, e.what());
    throw;
  }

  globLogger.log(BPCAL_LOG_LEVEL_INFO, "Saved: {}", fileName);
  return BandpassFile(impl);
}

BandpassFile BandpassFile::open(const std::string& fileName) {
  return BandpassFile(new BandpassFileImpl(fileName));
}

const std::string& BandpassFile::file_name() const {
  if (impl_)
    return impl_->file_name();
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::string> BandpassFile::groups() const {
  if (impl_)
    return impl_->groups();
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::string> BandpassFile::members() const {
  if (impl_)
    return impl_->members();
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::string> BandpassFile::antennas() const {
  if (impl_)
    return impl_->strings("ANTENNA");
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::int64_t> BandpassFile::channels() const {
  if (impl_)
    return impl_->channels();
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::string> BandpassFile::polarizations() const {
  if (impl_)
    return impl_->strings("POLARIZATION");
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::string> BandpassFile::times() const {
  if (impl_)
    return impl_->strings("TIME");
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::string> BandpassFile::fields() const {
  if (impl_)
    return impl_->strings("FIELD");
  else
    throw GenericError("BandpassFile: access after close");
}

std::array<std::size_t, 3> BandpassFile::gain_shape() const {
  if (impl_)
    return impl_->gain_shape();
  else
    throw GenericError("BandpassFile: access after close");
}

std::vector<std::complex<double>> BandpassFile::gains() const {
  if (impl_)
    return impl_->gains();
  else
    throw GenericError("BandpassFile: access after close");
}

CalibrationDataset BandpassFile::dataset() const {
  if (!impl_) throw GenericError("BandpassFile: access after close");

  auto antennas = impl_->strings("ANTENNA");
  auto channels = impl_->channels();
  auto polarizations = impl_->strings("POLARIZATION");

  const auto shape = impl_->gain_shape();
  if (shape[0] != antennas.size() || shape[1] != channels.size() ||
      shape[2] != polarizations.size()) {
    throw FileError("Gain dataset shape does not match the coordinate datasets in " +
                    impl_->file_name() + ".");
  }

  return CalibrationDataset(std::move(antennas), std::move(channels), std::move(polarizations),
                            impl_->strings("TIME"), impl_->strings("FIELD"), impl_->gains());
}

void BandpassFile::close() { impl_.reset(); }

bool BandpassFile::is_open() const noexcept { return bool(impl_); }

auto inspect_bandpass_file(const std::string& fileName) -> BandpassFileSummary {
  auto file = BandpassFile::open(fileName);

  BandpassFileSummary summary{file.groups(), file.members()};

  globLogger.log(BPCAL_LOG_LEVEL_INFO, "Groups in HDF5 file:");
  for (const auto& g : summary.groups) globLogger.log(BPCAL_LOG_LEVEL_INFO, " - {}", g);
  globLogger.log(BPCAL_LOG_LEVEL_INFO, "Datasets in BANDPASS group:");
  for (const auto& m : summary.members) globLogger.log(BPCAL_LOG_LEVEL_INFO, " - {}", m);

  return summary;
}

}  // namespace bpcal
