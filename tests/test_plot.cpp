#include <QtCharts/QChart>
#include <QtCharts/QLegend>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>
#include <QtGui/QColor>
#include <QtGui/QImage>
#include <complex>
#include <cstddef>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "bpcal/bandpass_file.hpp"
#include "bpcal/calibration_dataset.hpp"
#include "bpcal/exceptions.hpp"
#include "bpcal/plot.hpp"
#include "gtest/gtest.h"
#include "plot/bandpass_chart.hpp"

namespace {

// "strong" has the larger gain magnitude on every channel
auto make_dataset() -> bpcal::CalibrationDataset {
  std::vector<std::complex<double>> gains;
  for (double amp : {5.0, 1.0}) {
    for (std::size_t c = 0; c < 4; ++c) {
      gains.push_back(std::polar(amp + 0.1 * c, 0.1 * c));
      gains.push_back(std::polar(amp, -0.1 * c));
    }
  }
  return bpcal::CalibrationDataset({"strong", "weak"}, {0, 1, 2, 3}, {"pol0", "pol1"},
                                   {"10:00:00.0"}, {"J1229+0203"}, gains);
}

}  // namespace

class PlotTest : public ::testing::Test {
protected:
  PlotTest()
      : h5FileName_(::testing::TempDir() + "bpcal_plot.h5"),
        svgFileName_(::testing::TempDir() + "bpcal_plot.svg"),
        pngFileName_(::testing::TempDir() + "bpcal_plot.png") {
    bpcal::BandpassFile::create(h5FileName_, make_dataset());
  }

  ~PlotTest() override {
    std::remove(h5FileName_.c_str());
    std::remove(svgFileName_.c_str());
    std::remove(pngFileName_.c_str());
  }

  std::string h5FileName_;
  std::string svgFileName_;
  std::string pngFileName_;
};

TEST_F(PlotTest, WritesSvg) {
  bpcal::plot_bandpass(h5FileName_, svgFileName_, 1);

  std::ifstream file(svgFileName_);
  std::stringstream buffer;
  buffer << file.rdbuf();
  const auto svg = buffer.str();

  ASSERT_FALSE(svg.empty());
  EXPECT_NE(svg.find("<svg"), std::string::npos);
  EXPECT_NE(svg.find("</svg>"), std::string::npos);
}

TEST_F(PlotTest, WritesPng) {
  bpcal::plot_bandpass(h5FileName_, pngFileName_);

  QImage image;
  ASSERT_TRUE(image.load(QString::fromStdString(pngFileName_)));
  EXPECT_EQ(image.width(), 1200);
  EXPECT_EQ(image.height(), 500);
}

TEST_F(PlotTest, PolarizationOutOfRange) {
  EXPECT_THROW(bpcal::plot_bandpass(h5FileName_, svgFileName_, 2), bpcal::InvalidParameterError);
}

TEST_F(PlotTest, MissingInput) {
  EXPECT_THROW(bpcal::plot_bandpass(h5FileName_ + ".missing", svgFileName_), bpcal::FileError);
}

TEST_F(PlotTest, UnwritableOutput) {
  const auto dir = ::testing::TempDir() + "bpcal_no_such_dir/";
  EXPECT_THROW(bpcal::plot_bandpass(h5FileName_, dir + "plot.png"), bpcal::FileError);
  EXPECT_THROW(bpcal::plot_bandpass(h5FileName_, dir + "plot.svg"), bpcal::FileError);
}

TEST(BandpassChart, AntennasOrderedByMeanMagnitude) {
  const auto dataset = make_dataset();

  EXPECT_EQ(bpcal::plot::antenna_order(dataset, 0), (std::vector<std::size_t>{1, 0}));
  EXPECT_EQ(bpcal::plot::antenna_order(dataset, 1), (std::vector<std::size_t>{1, 0}));
}

TEST(BandpassChart, SeriesAndLegend) {
  bpcal::plot::ensure_application();
  const auto dataset = make_dataset();
  const auto order = bpcal::plot::antenna_order(dataset, 0);

  const auto amplitude = bpcal::plot::create_bandpass_chart(
      dataset, 0, order, bpcal::plot::BandpassQuantity::Amplitude);
  const auto phase =
      bpcal::plot::create_bandpass_chart(dataset, 0, order, bpcal::plot::BandpassQuantity::Phase);

  const auto series = amplitude->series();
  ASSERT_EQ(series.size(), 2);
  EXPECT_EQ(series[0]->name().toStdString(), "weak");
  EXPECT_EQ(series[1]->name().toStdString(), "strong");

  const auto* strong = qobject_cast<QLineSeries*>(series[1]);
  ASSERT_NE(strong, nullptr);
  ASSERT_EQ(strong->count(), 4);
  EXPECT_DOUBLE_EQ(strong->at(3).x(), 3.0);
  EXPECT_NEAR(strong->at(3).y(), 5.3, 1e-12);

  EXPECT_EQ(amplitude->title().toStdString(), "Amplitude");
  EXPECT_EQ(phase->title().toStdString(), "Phase (degrees)");
  EXPECT_TRUE(amplitude->legend()->isVisible());
  EXPECT_FALSE(phase->legend()->isVisible());

  const auto axes = amplitude->axes(Qt::Horizontal);
  ASSERT_EQ(axes.size(), 1);
  EXPECT_EQ(axes[0]->titleText().toStdString(), "Channel Index");
}

TEST(BandpassChart, RampEndpoints) {
  const auto low = bpcal::plot::ramp_color(0.0);
  const auto high = bpcal::plot::ramp_color(1.0);
  const auto clamped = bpcal::plot::ramp_color(2.0);

  EXPECT_EQ(low, QColor(68, 1, 84));
  EXPECT_EQ(high, QColor(253, 231, 37));
  EXPECT_EQ(clamped, high);
}
