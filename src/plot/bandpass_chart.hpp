#pragma once

#include <QtCharts/QChart>
#include <QtGui/QColor>
#include <cstddef>
#include <memory>
#include <vector>

#include "bpcal/calibration_dataset.hpp"

namespace bpcal {
namespace plot {

enum class BandpassQuantity { Amplitude, Phase };

// Creates the QApplication used for offscreen rendering if none exists yet.
auto ensure_application() -> void;

// Antenna indices ordered by ascending mean gain magnitude of polarization pol.
auto antenna_order(const CalibrationDataset& dataset, std::size_t pol) -> std::vector<std::size_t>;

// Viridis-like color ramp, t in [0, 1].
auto ramp_color(double t) -> QColor;

/**
 * Line chart of one quantity versus channel index, one series per antenna in the given order.
 * The amplitude chart carries the legend.
 */
auto create_bandpass_chart(const CalibrationDataset& dataset, std::size_t pol,
                           const std::vector<std::size_t>& order, BandpassQuantity quantity)
    -> std::unique_ptr<QChart>;

}  // namespace plot
}  // namespace bpcal
