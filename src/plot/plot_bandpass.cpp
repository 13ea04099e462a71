#include <QtCharts/QChartView>
#include <QtCore/QString>
#include <QtGui/QImage>
#include <QtGui/QPainter>
#include <QtSvg/QSvgGenerator>
#include <QtWidgets/QApplication>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QWidget>
#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <string>

#include "bpcal/bandpass_file.hpp"
#include "bpcal/config.h"
#include "bpcal/exceptions.hpp"
#include "bpcal/plot.hpp"
#include "logger.hpp"
#include "plot/bandpass_chart.hpp"

namespace bpcal {

namespace {
constexpr int imageWidth = 1200;
constexpr int imageHeight = 500;

auto is_svg(const std::string& fileName) -> bool {
  auto ext = std::filesystem::path(fileName).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".svg";
}

auto render_svg(QWidget& canvas, const std::string& imageFileName) -> void {
  QSvgGenerator generator;
  generator.setFileName(QString::fromStdString(imageFileName));
  generator.setSize(canvas.size());
  generator.setViewBox(canvas.rect());
  generator.setTitle("Bandpass");

  QPainter painter;
  if (!painter.begin(&generator)) {
    throw FileError("Failed to write plot file \"" + imageFileName + "\".");
  }
  canvas.render(&painter);
  painter.end();

  if (!std::filesystem::is_regular_file(imageFileName)) {
    throw FileError("Failed to write plot file \"" + imageFileName + "\".");
  }
}

auto render_image(QWidget& canvas, const std::string& imageFileName) -> void {
  QImage image(canvas.size(), QImage::Format_ARGB32);
  image.fill(Qt::white);

  QPainter painter(&image);
  painter.setRenderHint(QPainter::Antialiasing);
  canvas.render(&painter);
  painter.end();

  if (!image.save(QString::fromStdString(imageFileName))) {
    throw FileError("Failed to write plot file \"" + imageFileName + "\".");
  }
}
}  // namespace

auto plot_bandpass(const std::string& fileName, const std::string& imageFileName,
                   std::size_t pol) -> void {
  const auto dataset = BandpassFile::open(fileName).dataset();

  if (pol >= dataset.num_polarization()) {
    throw InvalidParameterError("plot_bandpass: polarization index " + std::to_string(pol) +
                                " out of range.");
  }

  plot::ensure_application();
  const auto order = plot::antenna_order(dataset, pol);

  QWidget canvas;
  canvas.setAttribute(Qt::WA_DontShowOnScreen);
  auto* layout = new QHBoxLayout(&canvas);
  layout->setContentsMargins(0, 0, 0, 0);
  for (auto quantity : {plot::BandpassQuantity::Amplitude, plot::BandpassQuantity::Phase}) {
    auto* view = new QChartView(
        plot::create_bandpass_chart(dataset, pol, order, quantity).release(), &canvas);
    view->setRenderHint(QPainter::Antialiasing);
    layout->addWidget(view);
  }
  canvas.resize(imageWidth, imageHeight);
  canvas.show();
  QApplication::processEvents();

  if (is_svg(imageFileName)) {
    render_svg(canvas, imageFileName);
  } else {
    render_image(canvas, imageFileName);
  }

  globLogger.log(BPCAL_LOG_LEVEL_INFO, "bandpass plot of {} antennas written to {}",
                 dataset.num_antenna(), imageFileName);
}

}  // namespace bpcal
