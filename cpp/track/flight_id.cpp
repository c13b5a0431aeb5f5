// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "flight_id.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <common/io.h>
#include <common/time.h>
#include <cstdio>
#include <stdexcept>

namespace seedtrack {

constexpr std::array<std::string_view, 12> month_abbreviations {
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"
};

constexpr size_t date_length { 11 };
constexpr size_t time_begin { 13 };
constexpr size_t time_length { 8 };

[[nodiscard]] auto parseFlightFilename(const std::string& stem) -> FlightName
{
    const std::string error_msg { "cannot parse date and time from " + stem };
    if (stem.size() < time_begin + time_length) {
        throw std::invalid_argument { error_msg };
    }
    // Date, e.g. Jun 01 2024
    std::vector<std::string> date_tokens {};
    for (const auto& token : splitString(stem.substr(0, date_length), ' ')) {
        if (!token.empty()) {
            date_tokens.push_back(token);
        }
    }
    if (date_tokens.size() != 3 || date_tokens[0].size() != 3) {
        throw std::invalid_argument { error_msg };
    }
    std::string month_str { date_tokens[0] };
    for (char& c : month_str) {
        c = static_cast<char>(std::tolower(c));
    }
    const auto month_it { std::ranges::find(month_abbreviations, month_str) };
    if (month_it == month_abbreviations.end()) {
        throw std::invalid_argument { error_msg };
    }
    const int month { static_cast<int>(
                        std::distance(month_abbreviations.begin(), month_it))
                      + 1 };
    std::string day_str { date_tokens[1] };
    if (day_str.size() == 1) {
        day_str.insert(0, "0");
    }
    if (day_str.size() != 2 || date_tokens[2].size() != 4) {
        throw std::invalid_argument { error_msg };
    }
    char date_iso[16] {};
    std::snprintf(date_iso,
                  sizeof(date_iso),
                  "%s-%02d-%s",
                  date_tokens[2].c_str(),
                  month,
                  day_str.c_str());
    std::chrono::sys_days date {};
    try {
        date = parseDate(date_iso);
    } catch (const std::invalid_argument&) {
        throw std::invalid_argument { error_msg };
    }
    // Time, e.g. 23-50-00
    std::string time_str { stem.substr(time_begin, time_length) };
    std::ranges::replace(time_str, '-', ':');
    const auto time_of_day { parseTimeOfDay(time_str) };
    if (!time_of_day) {
        throw std::invalid_argument { error_msg };
    }
    const std::chrono::hh_mm_ss tod { std::chrono::duration_cast<
      std::chrono::seconds>(time_of_day.value()) };
    char id_time[32] {};
    std::snprintf(id_time,
                  sizeof(id_time),
                  "%02ld-%02ld-%02ld",
                  static_cast<long>(tod.hours().count()),
                  static_cast<long>(tod.minutes().count()),
                  static_cast<long>(tod.seconds().count()));
    return { formatDate(date) + '_' + id_time, date };
}

[[nodiscard]] auto displayName(const std::string& flight_id) -> std::string
{
    std::string label { flight_id };
    if (const auto pos { label.find('_') }; pos != std::string::npos) {
        label.replace(pos, 1, " at ");
    }
    return "Flight from " + label;
}

} // namespace seedtrack
