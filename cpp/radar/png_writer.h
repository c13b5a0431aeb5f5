// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <string>

namespace seedtrack {

struct Image;

// Write an RGBA image as an 8-bit PNG file. Throws std::runtime_error
// on failure.
auto writePng(const std::string& filename, const Image& image) -> void;

} // namespace seedtrack
