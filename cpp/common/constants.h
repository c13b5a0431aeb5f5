// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

namespace seedtrack {

namespace math {

// Multiply with this factor to convert from degrees to radians
constexpr double deg_to_rad { 0.017453292519943295 };
// Multiply with this factor to convert from radians to degrees
constexpr double rad_to_deg { 57.29577951308232 };

} // namespace math

// Geolocation related
namespace earth {

// WGS84 equatorial radius [m]
constexpr double a { 6378137.0 };

} // namespace earth

// Column layout of a sensor log row. The logs are headerless and
// fields are identified by position only.
namespace log_col {

constexpr int time { 0 };
constexpr int tail_number { 1 };
constexpr int lat { 2 };
constexpr int lon { 3 };
constexpr int ground_speed { 4 };
constexpr int warning { 5 };
constexpr int altitude { 6 };
constexpr int temperature { 7 };
constexpr int lwc { 8 };
constexpr int bip_active { 9 };
constexpr int bip_count { 10 };
constexpr int eject_active { 11 };
constexpr int eject_count { 12 };
constexpr int right_gen { 13 };
constexpr int left_gen { 14 };
constexpr int ice { 15 };
constexpr int spare { 16 };
constexpr int n { 17 }; // number of fields in a row

} // namespace log_col

// Namespace for indexing the geographic bounds of a radar image
// stored as a flat list
namespace bound {

constexpr int lat_min { 0 };
constexpr int lon_min { 1 };
constexpr int lat_max { 2 };
constexpr int lon_max { 3 };
constexpr int n { 4 };

} // namespace bound

} // namespace seedtrack
