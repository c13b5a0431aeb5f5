// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "raster.h"

#include "color_scale.h"
#include "volume_scan.h"

#include <algorithm>
#include <cmath>
#include <common/constants.h>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace seedtrack {

// Number of channels in an RGBA image
constexpr int n_channels { 4 };

// Angular distance between two azimuths, degrees in [0, 180]
static auto azimuthDistance(const double a, const double b) -> double
{
    const double diff { std::fmod(std::abs(a - b), 360.0) };
    return std::min(diff, 360.0 - diff);
}

[[nodiscard]] auto rasterizePPI(const VolumeScan& scan,
                                const GeoBounds& bounds,
                                const int width,
                                const int height) -> ArrayXXd
{
    if (width < 1 || height < 1) {
        throw std::invalid_argument { "image dimensions must be positive" };
    }
    const auto n_rays { static_cast<int>(scan.azimuth.size()) };
    const auto n_gates { static_cast<int>(scan.range.size()) };
    ArrayXXd grid { ArrayXXd::Constant(
      height, width, std::numeric_limits<double>::quiet_NaN()) };
    if (n_rays == 0 || n_gates == 0) {
        return grid;
    }

    // Rays sorted by azimuth for the nearest ray search
    std::vector<int> order(n_rays);
    std::iota(order.begin(), order.end(), 0);
    Eigen::ArrayXd azimuth { scan.azimuth.unaryExpr(
      [](const double az) { return std::fmod(std::fmod(az, 360.0) + 360.0,
                                             360.0); }) };
    std::ranges::sort(order,
                      [&](const int i, const int j) {
                          return azimuth(i) < azimuth(j);
                      });
    std::vector<double> sorted_az(n_rays);
    for (int i {}; i < n_rays; ++i) {
        sorted_az[i] = azimuth(order[i]);
    }
    // Pixels farther than the typical ray spacing from the nearest
    // ray are outside a sector scan.
    std::vector<double> spacing {};
    for (int i { 1 }; i < n_rays; ++i) {
        spacing.push_back(sorted_az[i] - sorted_az[i - 1]);
    }
    double max_az_distance { 360.0 };
    if (!spacing.empty()) {
        std::ranges::nth_element(spacing,
                                 spacing.begin() + spacing.size() / 2);
        max_az_distance = std::max(spacing[spacing.size() / 2], 0.5);
    }
    // Gates are assumed equidistant
    const double gate_spacing { n_gates > 1
                                  ? scan.range(1) - scan.range(0)
                                  : 2.0 * scan.range(0) };
    if (gate_spacing <= 0.0) {
        throw std::runtime_error { "gate ranges must be increasing" };
    }

    const double dlat { (bounds.lat_max - bounds.lat_min) / height };
    const double dlon { (bounds.lon_max - bounds.lon_min) / width };
    const double cos_site_lat { std::cos(scan.site_lat * math::deg_to_rad) };
    for (int i_row {}; i_row < height; ++i_row) {
        const double lat { bounds.lat_max - (i_row + 0.5) * dlat };
        const double y { earth::a * (lat - scan.site_lat) * math::deg_to_rad };
        for (int i_col {}; i_col < width; ++i_col) {
            const double lon { bounds.lon_min + (i_col + 0.5) * dlon };
            const double x { earth::a * cos_site_lat * (lon - scan.site_lon)
                             * math::deg_to_rad };
            const double ground_range { std::hypot(x, y) };
            double az { std::atan2(x, y) * math::rad_to_deg };
            if (az < 0.0) {
                az += 360.0;
            }
            // Nearest ray, taking the wrap-around at 360 into account
            const auto it { std::ranges::lower_bound(sorted_az, az) };
            const int i_upper { static_cast<int>(it - sorted_az.begin())
                                % n_rays };
            const int i_lower { (i_upper + n_rays - 1) % n_rays };
            const int i_sorted { azimuthDistance(az, sorted_az[i_lower])
                                     < azimuthDistance(az, sorted_az[i_upper])
                                   ? i_lower
                                   : i_upper };
            if (azimuthDistance(az, sorted_az[i_sorted]) > max_az_distance) {
                continue;
            }
            const int i_ray { order[i_sorted] };
            const double slant_range {
                ground_range
                / std::cos(scan.elevation(i_ray) * math::deg_to_rad)
            };
            const auto i_gate { static_cast<int>(std::lround(
              (slant_range - scan.range(0)) / gate_spacing)) };
            if (i_gate < 0 || i_gate >= n_gates) {
                continue;
            }
            grid(i_row, i_col) = scan.field(i_ray, i_gate);
        }
    }
    return grid;
}

[[nodiscard]] auto colorize(const ArrayXXd& grid,
                            const ColorScale& scale) -> Image
{
    Image image { static_cast<int>(grid.cols()),
                  static_cast<int>(grid.rows()),
                  ArrayXXu8::Zero(grid.rows(), n_channels * grid.cols()) };
    for (int i_row {}; i_row < image.height; ++i_row) {
        for (int i_col {}; i_col < image.width; ++i_col) {
            if (const auto color { scale.lookup(grid(i_row, i_col)) }) {
                image.rgba(i_row, n_channels * i_col) = color->r;
                image.rgba(i_row, n_channels * i_col + 1) = color->g;
                image.rgba(i_row, n_channels * i_col + 2) = color->b;
                image.rgba(i_row, n_channels * i_col + 3) = 255;
            }
        }
    }
    return image;
}

} // namespace seedtrack
