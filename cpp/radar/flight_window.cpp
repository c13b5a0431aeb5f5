// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "flight_window.h"

namespace seedtrack {

[[nodiscard]] auto flightDateKeys(const Timestamp first,
                                  const Timestamp last)
  -> std::vector<std::string>
{
    const auto first_day { std::chrono::floor<std::chrono::days>(first) };
    const auto last_day { std::chrono::floor<std::chrono::days>(last) };
    std::vector<std::string> keys {};
    for (auto day { first_day }; day <= last_day; day += std::chrono::days { 1 }) {
        keys.push_back(dateKey(day));
    }
    return keys;
}

} // namespace seedtrack
