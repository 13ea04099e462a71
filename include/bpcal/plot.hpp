#pragma once

#include <bpcal/config.h>

#include <cstddef>
#include <string>

/*! \cond PRIVATE */
namespace bpcal {
/*! \endcond */

/**
 * Render amplitude and phase versus channel for every antenna of a bandpass file into an image
 * of 1200 x 500 pixels. Antennas are ordered by their mean gain magnitude. A ".svg" extension
 * writes SVG, any other extension a raster format supported by Qt (PNG, JPEG, ...).
 * Rendering is offscreen, no display is required.
 *
 * @param[in] fileName Bandpass file.
 * @param[in] imageFileName Output image file.
 * @param[in] pol Polarization index.
 */
BPCAL_EXPORT auto plot_bandpass(const std::string& fileName, const std::string& imageFileName,
                                std::size_t pol = 0) -> void;

/*! \cond PRIVATE */
}  // namespace bpcal
/*! \endcond */
