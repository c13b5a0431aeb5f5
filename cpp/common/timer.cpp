// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "timer.h"

#include <numeric>

namespace seedtrack {

auto Timer::start(const std::string& lap_label) -> void
{
    label = lap_label;
    running = true;
    wall_timestamp = std::chrono::steady_clock::now();
}

auto Timer::stop() -> void
{
    if (!running) {
        return;
    }
    running = false;
    lap_times.emplace_back(
      label,
      std::chrono::duration<double> { std::chrono::steady_clock::now()
                                      - wall_timestamp }
        .count());
}

[[nodiscard]] auto Timer::time() const -> double
{
    return std::accumulate(
      lap_times.cbegin(),
      lap_times.cend(),
      0.0,
      [](const double sum, const auto& lap) { return sum + lap.second; });
}

} // namespace seedtrack
