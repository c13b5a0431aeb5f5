// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "sensor_log.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <common/io.h>
#include <fstream>
#include <spdlog/spdlog.h>

namespace seedtrack {

[[nodiscard]] auto parseNumber(const std::string& field)
  -> std::optional<double>
{
    std::string str { trim(field) };
    // from_chars does not accept a leading plus sign
    if (!str.empty() && str.front() == '+') {
        str.erase(0, 1);
    }
    if (str.empty()) {
        return {};
    }
    double value {};
    const auto [ptr, ec] { std::from_chars(
      str.data(), str.data() + str.size(), value) };
    if (ec != std::errc {} || ptr != str.data() + str.size()) {
        return {};
    }
    return value;
}

[[nodiscard]] auto parseSensorRow(const std::string& row,
                                  const std::chrono::sys_days flight_date,
                                  const char delimiter)
  -> std::optional<RawSample>
{
    const std::vector<std::string> fields { splitString(row, delimiter) };
    if (static_cast<int>(fields.size()) > log_col::n) {
        return {};
    }
    RawSample sample {};
    std::ranges::copy(fields, sample.fields.begin());

    const auto time_of_day { parseTimeOfDay(
      trim(sample.fields[log_col::time])) };
    if (!time_of_day) {
        return {};
    }
    sample.timestamp = flight_date + time_of_day.value();

    const auto lat { parseNumber(sample.fields[log_col::lat]) };
    const auto lon { parseNumber(sample.fields[log_col::lon]) };
    const auto bip { parseNumber(sample.fields[log_col::bip_count]) };
    const auto eject { parseNumber(sample.fields[log_col::eject_count]) };
    for (const auto& value : { lat, lon, bip, eject }) {
        if (!value || !std::isfinite(value.value())) {
            return {};
        }
    }
    // Zero is what the logger writes without a GPS fix
    if (lat.value() == 0.0 || lon.value() == 0.0) {
        return {};
    }
    sample.lat = lat.value();
    sample.lon = lon.value();
    sample.bip_count = bip.value();
    sample.eject_count = eject.value();
    // Generator flags are not essential. Anything other than 1 is off.
    sample.right_generator =
      parseNumber(sample.fields[log_col::right_gen]).value_or(0.0) == 1.0;
    sample.left_generator =
      parseNumber(sample.fields[log_col::left_gen]).value_or(0.0) == 1.0;
    return sample;
}

[[nodiscard]] auto readSensorLog(const std::string& filename,
                                 const std::chrono::sys_days flight_date,
                                 const char delimiter) -> SensorLog
{
    std::ifstream in { filename };
    if (!in) {
        throw std::runtime_error { "could not open " + filename };
    }
    SensorLog log {};
    std::string line {};
    while (std::getline(in, line)) {
        if (trim(line).empty()) {
            continue;
        }
        ++log.n_rows;
        if (auto sample { parseSensorRow(line, flight_date, delimiter) }) {
            log.samples.push_back(std::move(sample.value()));
        } else {
            ++log.n_dropped;
        }
    }
    if (in.bad()) {
        throw std::runtime_error { "error while reading " + filename };
    }
    std::ranges::stable_sort(log.samples, {}, &RawSample::timestamp);
    spdlog::info("Rows read: {}, dropped: {}", log.n_rows, log.n_dropped);
    return log;
}

} // namespace seedtrack
