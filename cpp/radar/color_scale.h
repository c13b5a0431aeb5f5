// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Discrete color scale for radar reflectivity. The scale is an
// ordered list of (lower bound, color) pairs. A value takes the color
// of the last entry whose lower bound does not exceed it. Values
// below the first bound take the first color and values above the
// last bound the last color. The scale is read-only once constructed
// and can be shared between threads.

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace seedtrack {

struct RGB
{
    uint8_t r {};
    uint8_t g {};
    uint8_t b {};
    auto operator==(const RGB&) const -> bool = default;
};

struct ColorBin
{
    // Lower bound, dBZ
    double lower {};
    RGB color {};
};

class ColorScale
{
private:
    std::vector<ColorBin> bins {};

public:
    // Bins must be non-empty and strictly increasing in lower bound
    explicit ColorScale(std::vector<ColorBin> bins);
    // The 21-bin NWS reflectivity scale from -25 to 75 dBZ
    [[nodiscard]] static auto nws() -> const ColorScale&;
    // Color of a value. NaN has no color.
    [[nodiscard]] auto lookup(const double value) const -> std::optional<RGB>;
    [[nodiscard]] auto size() const -> size_t { return bins.size(); }
    [[nodiscard]] auto operator[](const size_t i) const -> const ColorBin&
    {
        return bins[i];
    }
};

} // namespace seedtrack
