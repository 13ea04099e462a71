#include "plot/bandpass_chart.hpp"

#include <QtCharts/QChart>
#include <QtCharts/QLegend>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>
#include <QtCore/QCoreApplication>
#include <QtCore/QString>
#include <QtCore/QtGlobal>
#include <QtGui/QPen>
#include <QtWidgets/QApplication>
#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <cstddef>
#include <limits>
#include <memory>
#include <numeric>
#include <utility>
#include <vector>

#include "bpcal/exceptions.hpp"

namespace bpcal {
namespace plot {

namespace {
constexpr double pi = 3.14159265358979323846;

constexpr std::array<std::array<int, 3>, 5> rampAnchors = {{
    {68, 1, 84},
    {59, 82, 139},
    {33, 145, 140},
    {94, 201, 98},
    {253, 231, 37},
}};

auto make_pen(const QColor& color) -> QPen {
  QPen pen(color, 1.6);
  pen.setCosmetic(true);
  return pen;
}

auto padded_range(double min, double max) -> std::pair<double, double> {
  if (min > max) return {0.0, 1.0};
  if (min == max) return {min - 1.0, max + 1.0};
  const double margin = 0.05 * (max - min);
  return {min - margin, max + margin};
}
}  // namespace

auto ensure_application() -> void {
  auto* instance = QCoreApplication::instance();
  if (instance) {
    if (!qobject_cast<QApplication*>(instance)) {
      throw InternalError("plot: running Qt application does not support widgets.");
    }
    return;
  }
  if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
  }
  static int argc = 1;
  static char appName[] = "bpcal";
  static char* argv[] = {appName, nullptr};
  // lives until the process exits
  static auto* app = new QApplication(argc, argv);
  static_cast<void>(app);
}

auto antenna_order(const CalibrationDataset& dataset, std::size_t pol)
    -> std::vector<std::size_t> {
  const auto nAntenna = dataset.num_antenna();
  const auto nChannel = dataset.num_channel();

  std::vector<double> meanAmplitude(nAntenna, 0.0);
  for (std::size_t a = 0; a < nAntenna; ++a) {
    for (std::size_t c = 0; c < nChannel; ++c) {
      meanAmplitude[a] += std::abs(dataset.gain(a, c, pol));
    }
    if (nChannel) meanAmplitude[a] /= static_cast<double>(nChannel);
  }

  std::vector<std::size_t> order(nAntenna);
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t l, std::size_t r) {
    return meanAmplitude[l] < meanAmplitude[r];
  });
  return order;
}

auto ramp_color(double t) -> QColor {
  t = std::min(1.0, std::max(0.0, t));
  const double pos = t * (rampAnchors.size() - 1);
  const auto i = std::min<std::size_t>(static_cast<std::size_t>(pos), rampAnchors.size() - 2);
  const double f = pos - static_cast<double>(i);

  std::array<int, 3> rgb;
  for (std::size_t k = 0; k < 3; ++k) {
    rgb[k] = static_cast<int>(
        std::lround(rampAnchors[i][k] + f * (rampAnchors[i + 1][k] - rampAnchors[i][k])));
  }
  return QColor(rgb[0], rgb[1], rgb[2]);
}

auto create_bandpass_chart(const CalibrationDataset& dataset, std::size_t pol,
                           const std::vector<std::size_t>& order, BandpassQuantity quantity)
    -> std::unique_ptr<QChart> {
  const bool isAmplitude = quantity == BandpassQuantity::Amplitude;

  auto chart = std::make_unique<QChart>();
  chart->setTitle(isAmplitude ? "Amplitude" : "Phase (degrees)");

  auto* axisX = new QValueAxis;
  axisX->setTitleText("Channel Index");
  auto* axisY = new QValueAxis;
  axisY->setTitleText(isAmplitude ? "Amplitude" : "Phase (degrees)");
  chart->addAxis(axisX, Qt::AlignBottom);
  chart->addAxis(axisY, Qt::AlignLeft);

  double xMin = std::numeric_limits<double>::max();
  double xMax = std::numeric_limits<double>::lowest();
  double yMin = xMin;
  double yMax = xMax;

  const auto nSeries = order.size();
  for (std::size_t i = 0; i < nSeries; ++i) {
    const auto a = order[i];
    auto* series = new QLineSeries;
    series->setName(QString::fromStdString(dataset.antennas()[a]));
    const double t = nSeries > 1 ? static_cast<double>(i) / (nSeries - 1) : 0.0;
    series->setPen(make_pen(ramp_color(t)));

    for (std::size_t c = 0; c < dataset.num_channel(); ++c) {
      const auto& g = dataset.gain(a, c, pol);
      const double x = static_cast<double>(dataset.channels()[c]);
      const double y = isAmplitude ? std::abs(g) : std::arg(g) * 180.0 / pi;
      series->append(x, y);
      xMin = std::min(xMin, x);
      xMax = std::max(xMax, x);
      yMin = std::min(yMin, y);
      yMax = std::max(yMax, y);
    }

    chart->addSeries(series);
    series->attachAxis(axisX);
    series->attachAxis(axisY);
  }

  const auto xRange = padded_range(xMin, xMax);
  const auto yRange = padded_range(yMin, yMax);
  axisX->setRange(xRange.first, xRange.second);
  axisY->setRange(yRange.first, yRange.second);

  if (isAmplitude) {
    chart->legend()->setVisible(true);
    chart->legend()->setAlignment(Qt::AlignRight);
  } else {
    chart->legend()->hide();
  }
  return chart;
}

}  // namespace plot
}  // namespace bpcal
