// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "time.h"

#include <charconv>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace seedtrack {

constexpr int date_size { 100 };

auto getDate() -> std::string
{
    std::time_t t { std::time(nullptr) };
    char date[date_size] {};
    std::strftime(
      date, date_size * sizeof(char), "%Y %B %d %a UTC%z", std::localtime(&t));
    return date;
}

// Convert a string consisting of digits only into an integer
static auto parseDigits(const std::string_view str, int& value) -> bool
{
    if (str.empty()) {
        return false;
    }
    for (const char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    const auto [ptr, ec] { std::from_chars(
      str.data(), str.data() + str.size(), value) };
    return ec == std::errc {};
}

static auto makeDay(const int year,
                    const int month,
                    const int day,
                    const std::string& str) -> std::chrono::sys_days
{
    const std::chrono::year_month_day ymd {
        std::chrono::year { year },
        std::chrono::month { static_cast<unsigned>(month) },
        std::chrono::day { static_cast<unsigned>(day) }
    };
    if (!ymd.ok()) {
        throw std::invalid_argument { "invalid date: " + str };
    }
    return std::chrono::sys_days { ymd };
}

[[nodiscard]] auto parseDate(const std::string& str) -> std::chrono::sys_days
{
    const std::string_view s { str };
    int year {};
    int month {};
    int day {};
    if (s.size() != 10 || s[4] != '-' || s[7] != '-'
        || !parseDigits(s.substr(0, 4), year)
        || !parseDigits(s.substr(5, 2), month)
        || !parseDigits(s.substr(8, 2), day)) {
        throw std::invalid_argument { "invalid date: " + str };
    }
    return makeDay(year, month, day, str);
}

[[nodiscard]] auto parseCompactDate(const std::string& str)
  -> std::chrono::sys_days
{
    const std::string_view s { str };
    int year {};
    int month {};
    int day {};
    if (s.size() != 8 || !parseDigits(s.substr(0, 4), year)
        || !parseDigits(s.substr(4, 2), month)
        || !parseDigits(s.substr(6, 2), day)) {
        throw std::invalid_argument { "invalid date: " + str };
    }
    return makeDay(year, month, day, str);
}

[[nodiscard]] auto parseTimeOfDay(const std::string& str)
  -> std::optional<std::chrono::microseconds>
{
    std::string_view s { str };
    // Fractional seconds
    std::chrono::microseconds subsec {};
    if (const auto dot { s.find('.') }; dot != std::string_view::npos) {
        const auto frac { s.substr(dot + 1) };
        int digit {};
        int scale { 100000 };
        if (frac.empty()) {
            return {};
        }
        for (const char c : frac) {
            if (!parseDigits(std::string_view { &c, 1 }, digit)) {
                return {};
            }
            subsec += std::chrono::microseconds { digit * scale };
            scale /= 10;
        }
        s = s.substr(0, dot);
    }
    const auto colon1 { s.find(':') };
    if (colon1 == std::string_view::npos) {
        return {};
    }
    const auto colon2 { s.find(':', colon1 + 1) };
    int hours {};
    int minutes {};
    int seconds {};
    const auto h_str { s.substr(0, colon1) };
    const auto m_str { s.substr(
      colon1 + 1,
      colon2 == std::string_view::npos ? std::string_view::npos
                                       : colon2 - colon1 - 1) };
    if (h_str.size() > 2 || m_str.size() != 2 || !parseDigits(h_str, hours)
        || !parseDigits(m_str, minutes)) {
        return {};
    }
    if (colon2 != std::string_view::npos) {
        const auto s_str { s.substr(colon2 + 1) };
        if (s_str.size() != 2 || !parseDigits(s_str, seconds)) {
            return {};
        }
    } else if (subsec.count() > 0) {
        // Fraction of a minute is not a valid time
        return {};
    }
    if (hours > 23 || minutes > 59 || seconds > 59) {
        return {};
    }
    return std::chrono::hours { hours } + std::chrono::minutes { minutes }
           + std::chrono::seconds { seconds } + subsec;
}

[[nodiscard]] auto parseCompactTime(const std::string& str)
  -> std::chrono::seconds
{
    const std::string_view s { str };
    int hours {};
    int minutes {};
    int seconds {};
    if (s.size() != 6 || !parseDigits(s.substr(0, 2), hours)
        || !parseDigits(s.substr(2, 2), minutes)
        || !parseDigits(s.substr(4, 2), seconds) || hours > 23 || minutes > 59
        || seconds > 59) {
        throw std::invalid_argument { "invalid time: " + str };
    }
    return std::chrono::hours { hours } + std::chrono::minutes { minutes }
           + std::chrono::seconds { seconds };
}

[[nodiscard]] auto formatIso(const Timestamp time) -> std::string
{
    const auto day { std::chrono::floor<std::chrono::days>(time) };
    const std::chrono::hh_mm_ss tod { time - day };
    const std::chrono::year_month_day ymd { day };
    char buf[date_size] {};
    int n { std::snprintf(buf,
                          date_size,
                          "%04d-%02u-%02uT%02ld:%02ld:%02ld",
                          static_cast<int>(ymd.year()),
                          static_cast<unsigned>(ymd.month()),
                          static_cast<unsigned>(ymd.day()),
                          static_cast<long>(tod.hours().count()),
                          static_cast<long>(tod.minutes().count()),
                          static_cast<long>(tod.seconds().count())) };
    if (tod.subseconds().count() > 0) {
        n += std::snprintf(buf + n,
                           date_size - n,
                           ".%06ld",
                           static_cast<long>(tod.subseconds().count()));
    }
    return std::string { buf, static_cast<size_t>(n) } + 'Z';
}

[[nodiscard]] auto parseIso(const std::string& str) -> Timestamp
{
    const auto t_pos { str.find('T') };
    if (t_pos == std::string::npos) {
        throw std::invalid_argument { "invalid timestamp: " + str };
    }
    std::string time_str { str.substr(t_pos + 1) };
    if (time_str.ends_with('Z')) {
        time_str.pop_back();
    } else if (time_str.ends_with("+00:00")) {
        time_str.resize(time_str.size() - 6);
    }
    const auto tod { parseTimeOfDay(time_str) };
    if (!tod) {
        throw std::invalid_argument { "invalid timestamp: " + str };
    }
    return parseDate(str.substr(0, t_pos)) + tod.value();
}

[[nodiscard]] auto dateKey(const std::chrono::sys_days day) -> std::string
{
    const std::chrono::year_month_day ymd { day };
    char buf[date_size] {};
    std::snprintf(buf,
                  date_size,
                  "%04d%02u%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

[[nodiscard]] auto formatDate(const std::chrono::sys_days day) -> std::string
{
    const std::chrono::year_month_day ymd { day };
    char buf[date_size] {};
    std::snprintf(buf,
                  date_size,
                  "%04d-%02u-%02u",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()));
    return buf;
}

} // namespace seedtrack
