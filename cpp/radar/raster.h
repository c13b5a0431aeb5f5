// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Overhead (plan position) projection of a radar sweep onto a regular
// latitude/longitude grid and conversion of the grid into an image.

#pragma once

#include <common/eigen.h>

namespace seedtrack {

class ColorScale;
struct VolumeScan;

// Geographic area covered by a radar image, degrees
struct GeoBounds
{
    double lat_min {};
    double lon_min {};
    double lat_max {};
    double lon_max {};
};

// RGBA image, row-major. Row 0 is the northern edge.
struct Image
{
    int width {};
    int height {};
    // height x (4 * width)
    ArrayXXu8 rgba {};
};

// Project a sweep onto a grid of height x width pixels spanning the
// bounds. Row 0 corresponds to lat_max and column 0 to lon_min. Each
// pixel takes the value of the nearest ray in azimuth and the gate
// containing its ground range. Pixels outside radar coverage are NaN.
[[nodiscard]] auto rasterizePPI(const VolumeScan& scan,
                                const GeoBounds& bounds,
                                const int width,
                                const int height) -> ArrayXXd;

// Color a grid. NaN pixels are fully transparent, all others opaque.
[[nodiscard]] auto colorize(const ArrayXXd& grid,
                            const ColorScale& scale) -> Image;

} // namespace seedtrack
