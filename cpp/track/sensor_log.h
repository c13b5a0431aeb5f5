// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Reading of onboard sensor logs. A log is a headerless delimited
// text file with one sample per row and 17 positional fields (see
// log_col in constants.h). Rows that cannot be used are dropped
// without aborting the flight:
//   - rows with more than 17 fields,
//   - rows whose time of day does not form a valid timestamp with
//     the flight date,
//   - rows where latitude, longitude, or either seeding counter is
//     not a number,
//   - rows with latitude or longitude exactly zero (no GPS fix).
// Missing trailing fields are treated as empty.

#pragma once

#include <common/constants.h>
#include <common/time.h>

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace seedtrack {

struct RawSample
{
    Timestamp timestamp {};
    double lat {};
    double lon {};
    // Cumulative number of burn-in-place flares dropped
    double bip_count {};
    // Cumulative number of ejectable flares dropped
    double eject_count {};
    bool right_generator {};
    bool left_generator {};
    // Original text of every field, including those not interpreted
    // here (tail number, ground speed, altitude, temperature, ...)
    std::array<std::string, log_col::n> fields {};
};

struct SensorLog
{
    // Valid samples sorted by timestamp. Rows with equal timestamps
    // keep their order from the file.
    std::vector<RawSample> samples {};
    // Number of non-empty rows read from the file
    int n_rows {};
    // Number of rows dropped during cleaning
    int n_dropped {};
};

// Coerce a field to a number. Returns nothing if the field is not a
// number.
[[nodiscard]] auto parseNumber(const std::string& field)
  -> std::optional<double>;

// Convert one row into a sample. flight_date is the date of the
// flight which is combined with the time of day field. Returns
// nothing if the row is dropped.
[[nodiscard]] auto parseSensorRow(const std::string& row,
                                  const std::chrono::sys_days flight_date,
                                  const char delimiter = ',')
  -> std::optional<RawSample>;

// Read and clean all rows of a log file. An empty list of samples is
// a valid outcome (no data). Throws std::runtime_error if the file
// cannot be read.
[[nodiscard]] auto readSensorLog(const std::string& filename,
                                 const std::chrono::sys_days flight_date,
                                 const char delimiter = ',') -> SensorLog;

} // namespace seedtrack
