// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Flight track assembly and the track artifact. The artifact is a
// GeoJSON feature collection whose first feature is the flight path
// (LineString through all points in time order) and whose remaining
// features are the points in the same order, each with the
// properties
//
//   { "timestamp": ISO-8601, "seeding_type": string, "seeding_count": int }
//
// so that the feature index doubles as the playback order.

#pragma once

#include "seeding.h"

#include <common/time.h>
#include <filesystem>
#include <vector>

namespace seedtrack {

struct TrackPoint
{
    double lat {};
    double lon {};
    Timestamp timestamp {};
    SeedingEvent event {};
};

struct FlightTrack
{
    std::string flight_id {};
    // Non-decreasing in timestamp
    std::vector<TrackPoint> points {};
};

// First and last point timestamps of a track
struct TimeSpan
{
    Timestamp first {};
    Timestamp last {};
};

// Combine the samples with their seeding events into a track. The
// samples must be sorted by time. At least two samples are required
// to form a path, otherwise std::invalid_argument is thrown.
[[nodiscard]] auto assembleTrack(const std::string& flight_id,
                                 const std::vector<RawSample>& samples,
                                 const std::vector<SeedingEvent>& events)
  -> FlightTrack;

// Write the track artifact (GeoJSON)
auto writeTrack(const std::filesystem::path& filename,
                const FlightTrack& track) -> void;

// Read the timestamps of the first and last point features of a track
// artifact. Throws std::runtime_error if the artifact has no points.
[[nodiscard]] auto readTrackTimeSpan(const std::filesystem::path& filename)
  -> TimeSpan;

} // namespace seedtrack
