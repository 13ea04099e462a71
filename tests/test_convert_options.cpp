#include <cstdio>
#include <fstream>
#include <string>

#include "apps/convert_options.hpp"
#include "bpcal/exceptions.hpp"
#include "gtest/gtest.h"

class ConvertOptionsTest : public ::testing::Test {
protected:
  ConvertOptionsTest() : fileName_(::testing::TempDir() + "bpcal_options.json") {}

  ~ConvertOptionsTest() override { std::remove(fileName_.c_str()); }

  auto write_config(const std::string& content) const -> void {
    std::ofstream file(fileName_);
    file << content;
  }

  std::string fileName_;
};

TEST_F(ConvertOptionsTest, LoadAllKeys) {
  write_config(R"({"num_polarizations": 1, "all_solutions": true, "strict_multiplicity": true})");

  const auto opt = bpcal::apps::load_options(fileName_);

  EXPECT_EQ(opt.numPolarizations, 1);
  EXPECT_TRUE(opt.allSolutions);
  EXPECT_TRUE(opt.strictMultiplicity);
}

TEST_F(ConvertOptionsTest, MissingKeysKeepDefaults) {
  write_config(R"({"all_solutions": true})");

  const auto opt = bpcal::apps::load_options(fileName_);

  EXPECT_EQ(opt.numPolarizations, 2);
  EXPECT_TRUE(opt.allSolutions);
  EXPECT_FALSE(opt.strictMultiplicity);
}

TEST_F(ConvertOptionsTest, FlagsOverrideFile) {
  write_config(R"({"num_polarizations": 1, "all_solutions": true, "strict_multiplicity": true})");

  bpcal::apps::CommandLineOptions cmdOptions;
  cmdOptions.configFileName = fileName_;
  cmdOptions.numPolarizations = 4;
  cmdOptions.strictMultiplicity = false;

  const auto opt = bpcal::apps::resolve_options(cmdOptions);

  EXPECT_EQ(opt.numPolarizations, 4);
  EXPECT_TRUE(opt.allSolutions);
  EXPECT_FALSE(opt.strictMultiplicity);
}

TEST_F(ConvertOptionsTest, NoConfigFile) {
  bpcal::apps::CommandLineOptions cmdOptions;
  cmdOptions.allSolutions = true;

  const auto opt = bpcal::apps::resolve_options(cmdOptions);

  EXPECT_EQ(opt.numPolarizations, 2);
  EXPECT_TRUE(opt.allSolutions);
  EXPECT_FALSE(opt.strictMultiplicity);
}

TEST_F(ConvertOptionsTest, InvalidConfig) {
  write_config(R"({"num_polarizations": "two"})");
  EXPECT_THROW(bpcal::apps::load_options(fileName_), bpcal::FileError);

  write_config("{ not json");
  EXPECT_THROW(bpcal::apps::load_options(fileName_), bpcal::FileError);

  EXPECT_THROW(bpcal::apps::load_options(fileName_ + ".missing"), bpcal::FileError);
}

TEST(SolutionFileName, FirstSolutionKeepsName) {
  EXPECT_EQ(bpcal::apps::solution_file_name("out/bandpass.h5", 0), "out/bandpass.h5");
}

TEST(SolutionFileName, LaterSolutionsGetSuffix) {
  EXPECT_EQ(bpcal::apps::solution_file_name("out/bandpass.h5", 1), "out/bandpass_sol1.h5");
  EXPECT_EQ(bpcal::apps::solution_file_name("bandpass.h5", 12), "bandpass_sol12.h5");
  EXPECT_EQ(bpcal::apps::solution_file_name("bandpass", 2), "bandpass_sol2");
}
