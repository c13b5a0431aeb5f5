// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Time and date related functions. All timestamps are UTC.

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace seedtrack {

using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

auto getDate() -> std::string;

// Parse a calendar date YYYY-MM-DD. Throws std::invalid_argument.
[[nodiscard]] auto parseDate(const std::string& str) -> std::chrono::sys_days;

// Parse a compact calendar date YYYYMMDD. Throws std::invalid_argument.
[[nodiscard]] auto parseCompactDate(const std::string& str)
  -> std::chrono::sys_days;

// Parse a time of day H:MM, H:MM:SS, or H:MM:SS.ffffff. Returns
// nothing if the string is not a valid time of day.
[[nodiscard]] auto parseTimeOfDay(const std::string& str)
  -> std::optional<std::chrono::microseconds>;

// Parse a compact time of day HHMMSS. Throws std::invalid_argument.
[[nodiscard]] auto parseCompactTime(const std::string& str)
  -> std::chrono::seconds;

// Format YYYY-mm-ddTHH:MM:SSZ, or YYYY-mm-ddTHH:MM:SS.ffffffZ if the
// timestamp has a fractional second.
[[nodiscard]] auto formatIso(const Timestamp time) -> std::string;

// Inverse of formatIso. A missing Z or an explicit +00:00 offset are
// accepted. Throws std::invalid_argument.
[[nodiscard]] auto parseIso(const std::string& str) -> Timestamp;

// Format YYYYmmdd
[[nodiscard]] auto dateKey(const std::chrono::sys_days day) -> std::string;

// Format YYYY-mm-dd
[[nodiscard]] auto formatDate(const std::chrono::sys_days day) -> std::string;

} // namespace seedtrack
