#include <hdf5.h>

#include <complex>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "bpcal/bandpass_file.hpp"
#include "bpcal/bandpass_report.hpp"
#include "bpcal/calibration_dataset.hpp"
#include "bpcal/exceptions.hpp"
#include "gtest/gtest.h"

class BandpassFileTest : public ::testing::Test {
protected:
  BandpassFileTest()
      : fileName_(::testing::TempDir() + "bpcal_" +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".h5") {}

  ~BandpassFileTest() override { std::remove(fileName_.c_str()); }

  static auto make_dataset() -> bpcal::CalibrationDataset {
    const std::size_t nAntenna = 2, nChannel = 3, nPol = 2;
    std::vector<std::complex<double>> gains(nAntenna * nChannel * nPol);
    for (std::size_t i = 0; i < gains.size(); ++i) {
      gains[i] = {0.5 * i, -0.25 * i};
    }
    return bpcal::CalibrationDataset({"ea01", "ea10long"}, {4, 5, 6}, {"pol0", "pol1"},
                                     {"10:00:00.0"}, {"J1229+0203"}, std::move(gains));
  }

  std::string fileName_;
};

TEST_F(BandpassFileTest, RoundTrip) {
  const auto dataset = make_dataset();
  bpcal::BandpassFile::create(fileName_, dataset).close();

  auto file = bpcal::BandpassFile::open(fileName_);
  EXPECT_EQ(file.file_name(), fileName_);
  EXPECT_EQ(file.antennas(), dataset.antennas());
  EXPECT_EQ(file.channels(), dataset.channels());
  EXPECT_EQ(file.polarizations(), dataset.polarizations());
  EXPECT_EQ(file.times(), dataset.times());
  EXPECT_EQ(file.fields(), dataset.fields());
  EXPECT_EQ(file.gain_shape(), dataset.shape());
  EXPECT_EQ(file.gains(), dataset.gains());

  const auto restored = file.dataset();
  EXPECT_EQ(restored.antennas(), dataset.antennas());
  EXPECT_EQ(restored.gains(), dataset.gains());

  file.close();
  EXPECT_FALSE(file.is_open());
  EXPECT_THROW(file.antennas(), bpcal::GenericError);
}

TEST_F(BandpassFileTest, Layout) {
  bpcal::BandpassFile::create(fileName_, make_dataset());

  const hid_t file = H5Fopen(fileName_.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
  ASSERT_GE(file, 0);

  // fixed length strings, width of the longest name
  const hid_t antenna = H5Dopen(file, "/CALIBRATION/BANDPASS/ANTENNA", H5P_DEFAULT);
  ASSERT_GE(antenna, 0);
  const hid_t antennaType = H5Dget_type(antenna);
  EXPECT_EQ(H5Tget_class(antennaType), H5T_STRING);
  EXPECT_FALSE(H5Tis_variable_str(antennaType) > 0);
  EXPECT_EQ(H5Tget_size(antennaType), 8);
  EXPECT_EQ(H5Tget_strpad(antennaType), H5T_STR_NULLPAD);
  H5Tclose(antennaType);
  H5Dclose(antenna);

  const hid_t channel = H5Dopen(file, "/CALIBRATION/BANDPASS/CHANNEL", H5P_DEFAULT);
  ASSERT_GE(channel, 0);
  const hid_t channelType = H5Dget_type(channel);
  EXPECT_GT(H5Tequal(channelType, H5T_STD_I64LE), 0);
  H5Tclose(channelType);
  H5Dclose(channel);

  const hid_t gain = H5Dopen(file, "/CALIBRATION/BANDPASS/GAIN/CPARAM", H5P_DEFAULT);
  ASSERT_GE(gain, 0);
  const hid_t gainType = H5Dget_type(gain);
  ASSERT_EQ(H5Tget_class(gainType), H5T_COMPOUND);
  ASSERT_EQ(H5Tget_nmembers(gainType), 2);
  char* real = H5Tget_member_name(gainType, 0);
  char* imag = H5Tget_member_name(gainType, 1);
  EXPECT_STREQ(real, "r");
  EXPECT_STREQ(imag, "i");
  H5free_memory(real);
  H5free_memory(imag);

  const hid_t space = H5Dget_space(gain);
  ASSERT_EQ(H5Sget_simple_extent_ndims(space), 3);
  hsize_t dims[3];
  H5Sget_simple_extent_dims(space, dims, nullptr);
  EXPECT_EQ(dims[0], 2);
  EXPECT_EQ(dims[1], 3);
  EXPECT_EQ(dims[2], 2);

  H5Sclose(space);
  H5Tclose(gainType);
  H5Dclose(gain);
  H5Fclose(file);
}

TEST_F(BandpassFileTest, Inspect) {
  bpcal::BandpassFile::create(fileName_, make_dataset());

  const auto summary = bpcal::inspect_bandpass_file(fileName_);

  EXPECT_EQ(summary.groups, (std::vector<std::string>{"CALIBRATION"}));
  EXPECT_EQ(summary.members, (std::vector<std::string>{"ANTENNA", "CHANNEL", "FIELD", "GAIN",
                                                       "POLARIZATION", "TIME"}));
}

TEST_F(BandpassFileTest, OverwritesExistingFile) {
  bpcal::BandpassFile::create(fileName_, make_dataset());

  const auto single = bpcal::CalibrationDataset({"A0"}, {0}, {"pol0"}, {"t"}, {"f"}, {{1.0, 2.0}});
  bpcal::BandpassFile::create(fileName_, single);

  const auto restored = bpcal::BandpassFile::open(fileName_).dataset();
  EXPECT_EQ(restored.antennas(), single.antennas());
  EXPECT_EQ(restored.gains(), single.gains());
}

TEST_F(BandpassFileTest, EmptyChannelAxis) {
  const auto empty = bpcal::CalibrationDataset({"A0", "A1"}, {}, {"pol0", "pol1"}, {}, {}, {});
  bpcal::BandpassFile::create(fileName_, empty);

  auto file = bpcal::BandpassFile::open(fileName_);
  EXPECT_TRUE(file.channels().empty());
  EXPECT_TRUE(file.times().empty());
  EXPECT_EQ(file.antennas(), empty.antennas());
  EXPECT_EQ(file.gain_shape(), empty.shape());
}

TEST_F(BandpassFileTest, FromReport) {
  const auto result = bpcal::parse_bandpass_report_file(std::string(BPCAL_TEST_DATA_DIR) +
                                                        "/bandpass_listcal.txt");
  ASSERT_EQ(result.datasets.size(), 1);

  bpcal::BandpassFile::create(fileName_, result.datasets[0]);
  const auto restored = bpcal::BandpassFile::open(fileName_).dataset();

  EXPECT_EQ(restored.antennas(), result.datasets[0].antennas());
  EXPECT_EQ(restored.channels(), result.datasets[0].channels());
  EXPECT_EQ(restored.gains(), result.datasets[0].gains());
}

TEST_F(BandpassFileTest, OpenMissingFile) {
  EXPECT_THROW(bpcal::BandpassFile::open(fileName_), bpcal::FileError);
}

TEST_F(BandpassFileTest, OpenWithoutBandpassGroup) {
  const hid_t file = H5Fcreate(fileName_.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
  ASSERT_GE(file, 0);
  H5Fclose(file);

  EXPECT_THROW(bpcal::BandpassFile::open(fileName_), bpcal::FileError);
}

TEST_F(BandpassFileTest, FailedCreateLeavesNoFile) {
  const auto fileName = ::testing::TempDir() + "bpcal_missing_dir/out.h5";

  EXPECT_THROW(bpcal::BandpassFile::create(fileName, make_dataset()), bpcal::HDF5Error);
  EXPECT_FALSE(std::filesystem::exists(fileName));
}
