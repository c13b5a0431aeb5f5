// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// One sweep of a radar volume scan stored in CF/Radial NetCDF
// format. Only what is needed for plan position imagery is read: the
// site location, ray geometry, gate ranges, and one moment.

#pragma once

#include <common/eigen.h>
#include <string>
#include <vector>

namespace seedtrack {

struct VolumeScan
{
    // Radar site, degrees
    double site_lat {};
    double site_lon {};
    // Ray azimuths and elevations, degrees
    Eigen::ArrayXd azimuth {};
    Eigen::ArrayXd elevation {};
    // Distance from the radar to the center of each gate, m
    Eigen::ArrayXd range {};
    // Moment data (rays x gates) with scale and offset applied.
    // Missing values are NaN.
    ArrayXXd field {};
    // Name of the NetCDF variable the field was read from
    std::string field_name {};
};

// Read one sweep of a CF/Radial file. The first variable of
// field_names present in the file is read. Throws if the file cannot
// be opened, a required variable is missing, or the sweep does not
// exist. Not thread-safe: calls from parallel regions must be
// serialized (omp critical section named netcdf).
[[nodiscard]] auto readVolumeScan(const std::string& filename,
                                  const std::vector<std::string>& field_names,
                                  const int sweep) -> VolumeScan;

} // namespace seedtrack
