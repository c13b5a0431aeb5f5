// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "color_scale.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace seedtrack {

ColorScale::ColorScale(std::vector<ColorBin> bins) : bins { std::move(bins) }
{
    if (this->bins.empty()) {
        throw std::invalid_argument { "color scale needs at least one bin" };
    }
    for (size_t i { 1 }; i < this->bins.size(); ++i) {
        if (this->bins[i].lower <= this->bins[i - 1].lower) {
            throw std::invalid_argument {
                "color scale bounds must be strictly increasing"
            };
        }
    }
}

[[nodiscard]] auto ColorScale::nws() -> const ColorScale&
{
    static const ColorScale scale { {
      { -25.0, { 29, 46, 46 } },    { -20.0, { 68, 99, 99 } },
      { -15.0, { 117, 161, 161 } }, { -10.0, { 219, 219, 219 } },
      { -5.0, { 177, 242, 242 } },  { 0.0, { 124, 247, 247 } },
      { 5.0, { 0, 198, 242 } },     { 10.0, { 0, 82, 245 } },
      { 15.0, { 0, 128, 123 } },    { 20.0, { 0, 227, 0 } },
      { 25.0, { 0, 171, 0 } },      { 30.0, { 219, 219, 219 } },
      { 35.0, { 242, 222, 0 } },    { 40.0, { 245, 163, 0 } },
      { 45.0, { 255, 72, 0 } },     { 50.0, { 232, 0, 0 } },
      { 55.0, { 201, 0, 0 } },      { 60.0, { 227, 0, 148 } },
      { 65.0, { 202, 41, 227 } },   { 70.0, { 192, 158, 217 } },
      { 75.0, { 255, 255, 255 } },
    } };
    return scale;
}

[[nodiscard]] auto ColorScale::lookup(const double value) const
  -> std::optional<RGB>
{
    if (std::isnan(value)) {
        return {};
    }
    // First bin whose lower bound is above the value
    const auto it { std::ranges::upper_bound(
      bins, value, {}, &ColorBin::lower) };
    if (it == bins.begin()) {
        return bins.front().color;
    }
    return std::prev(it)->color;
}

} // namespace seedtrack
