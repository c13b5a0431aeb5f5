// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Per-flight radar metadata artifact:
//
//   { "bounds": [[lat_min, lon_min], [lat_max, lon_max]],
//     "frames": [{ "time": ISO-8601, "file": name }, ...] }
//
// Frames are sorted by time. The artifact only exists if at least one
// frame was rendered and its presence marks the radar stage of the
// flight as complete.

#pragma once

#include "raster.h"

#include <common/time.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace seedtrack {

// One rendered radar image
struct RenderedFrame
{
    // Acquisition time of the volume scan
    Timestamp time {};
    // Image file name relative to the frames directory
    std::string file {};
};

struct RadarMetadata
{
    GeoBounds bounds {};
    std::vector<RenderedFrame> frames {};
};

// Drop failed renders and sort the rest by time (then file name), the
// order of the metadata artifact. Warns about file names that occur
// more than once.
[[nodiscard]] auto orderFrames(
  const std::vector<std::optional<RenderedFrame>>& results)
  -> std::vector<RenderedFrame>;

auto writeRadarMetadata(const std::filesystem::path& filename,
                        const RadarMetadata& metadata) -> void;

[[nodiscard]] auto readRadarMetadata(const std::filesystem::path& filename)
  -> RadarMetadata;

// Frame to display together with a track point at the given time: the
// latest frame not after that time, or the first frame if the time
// precedes all frames. Frames must be sorted. Returns nothing if there
// are no frames.
[[nodiscard]] auto frameAt(const RadarMetadata& metadata,
                           const Timestamp time)
  -> std::optional<RenderedFrame>;

} // namespace seedtrack
