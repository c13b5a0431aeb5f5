// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Flight identification from the file name of a sensor log. The
// first 11 characters of the name (without extension) hold the date,
// e.g. "Jun 01 2024", and characters 13-20 hold the start time with
// dashes instead of colons, e.g. "23-50-00". The canonical flight ID
// is then 2024-06-01_23-50-00.

#pragma once

#include <chrono>
#include <string>

namespace seedtrack {

struct FlightName
{
    // YYYY-MM-DD_HH-MM-SS
    std::string id {};
    // Date of the flight, used to complete the time of day of each
    // sample
    std::chrono::sys_days date {};
};

// Throws std::invalid_argument if the name does not follow the
// convention.
[[nodiscard]] auto parseFlightFilename(const std::string& stem) -> FlightName;

// Label shown to the user, e.g. "Flight from 2024-06-01 at 23-50-00"
[[nodiscard]] auto displayName(const std::string& flight_id) -> std::string;

} // namespace seedtrack
