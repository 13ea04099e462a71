#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "table/header_deduplicator.hpp"

namespace {

const bpcal::Lines paginatedSolution = {
    "SpwID = 0",
    "     Ant = ea01     Ant = ea02",
    "Time     Field  Chn| Amp Phs",
    "-------- ------ ---|--------",
    "10:00:00 J1229    0| 1.0 10.0 2.0 20.0",
    "",
    "     Ant = ea01     Ant = ea02",
    "Time     Field  Chn| Amp Phs",
    "-------- ------ ---|--------",
    "10:00:00 J1229    1| 1.1 11.0 2.1 21.0",
    "",
    "     Ant = ea03",
    "Time     Field  Chn| Amp Phs",
    "-------- ------ ---|--------",
    "10:00:00 J1229    0| 3.0 30.0",
    "",
    "     Ant = ea03",
    "Time     Field  Chn| Amp Phs",
    "-------- ------ ---|--------",
    "10:00:00 J1229    1| 3.1 31.0",
};

}  // namespace

TEST(AntennaNames, InOrder) {
  EXPECT_EQ(bpcal::table::antenna_names("   Ant = ea01   Ant = ea02  Ant = W3"),
            (std::vector<std::string>{"ea01", "ea02", "W3"}));
}

TEST(AntennaNames, NoHeader) {
  EXPECT_TRUE(bpcal::table::antenna_names("Time Field Chn|").empty());
  EXPECT_TRUE(bpcal::table::antenna_names("Ant=ea01").empty());
}

TEST(HeaderDeduplicator, RemovesRepeatedPages) {
  const auto result = bpcal::table::remove_duplicate_headers(paginatedSolution);

  ASSERT_EQ(result.size(), paginatedSolution.size() - 6);

  std::size_t numTime = 0;
  for (const auto& line : result) {
    if (line.find("Time") != std::string::npos) ++numTime;
  }
  EXPECT_EQ(numTime, 2);

  EXPECT_EQ(result[4], "10:00:00 J1229    0| 1.0 10.0 2.0 20.0");
  EXPECT_EQ(result[5], "");
  EXPECT_EQ(result[6], "10:00:00 J1229    1| 1.1 11.0 2.1 21.0");
  EXPECT_EQ(result[8], "     Ant = ea03");
  EXPECT_EQ(result.back(), "10:00:00 J1229    1| 3.1 31.0");
}

TEST(HeaderDeduplicator, Idempotent) {
  const auto once = bpcal::table::remove_duplicate_headers(paginatedSolution);
  const auto twice = bpcal::table::remove_duplicate_headers(once);

  EXPECT_EQ(once, twice);
}

TEST(HeaderDeduplicator, KeepsDistinctHeaders) {
  const bpcal::Lines solution = {
      "SpwID = 0",
      "     Ant = ea01",
      "Time     Field  Chn| Amp Phs",
      "10:00:00 J1229    0| 1.0 10.0",
      "     Ant = ea02",
      "Time     Field  Chn| Amp Phs",
      "10:00:00 J1229    0| 2.0 20.0",
  };

  EXPECT_EQ(bpcal::table::remove_duplicate_headers(solution), solution);
}

TEST(HeaderDeduplicator, KeepsDataDirectlyAfterMarker) {
  const bpcal::Lines solution = {
      "SpwID = 0",
      "     Ant = ea01",
      "Time     Field  Chn| Amp Phs",
      "10:00:00 J1229    0| 1.0 10.0",
      "     Ant = ea01",
      "Time     Field  Chn| Amp Phs",
      "10:00:00 J1229    1| 1.1 11.0",
  };

  const auto result = bpcal::table::remove_duplicate_headers(solution);

  EXPECT_EQ(result, (bpcal::Lines{solution[0], solution[1], solution[2], solution[3],
                                  solution[6]}));
}

TEST(HeaderDeduplicator, MarkerOnFirstLine) {
  const bpcal::Lines solution = {"Time     Field  Chn| Amp Phs",
                                 "10:00:00 J1229    0| 1.0 10.0"};

  EXPECT_EQ(bpcal::table::remove_duplicate_headers(solution), solution);
}
