// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Wall clock timer for the processing stages. Each start/stop pair
// records one lap under the label given to start.

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace seedtrack {

class Timer
{
private:
    std::chrono::steady_clock::time_point wall_timestamp {};
    std::string label {};
    bool running {};
    std::vector<std::pair<std::string, double>> lap_times {};

public:
    Timer() = default;
    auto start(const std::string& lap_label) -> void;
    // Does nothing if the timer is not running
    auto stop() -> void;
    // Label and wall time in seconds of every completed lap
    [[nodiscard]] auto laps() const
      -> const std::vector<std::pair<std::string, double>>&
    {
        return lap_times;
    }
    // Return total wall time of all laps
    [[nodiscard]] auto time() const -> double;
};

} // namespace seedtrack
