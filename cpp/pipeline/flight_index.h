// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Track stage and master index. Every raw log is turned into a track
// artifact in <processed_data>/<flight id>/ and each flight that has
// a track artifact gets one entry in the master index:
//
//   [{ "id": ..., "displayName": ..., "dataPath": "<id>/<track file>" }]

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace seedtrack {

struct IndexEntry
{
    std::string id {};
    std::string display_name {};
    // Track artifact relative to the output root
    std::string data_path {};
    auto operator==(const IndexEntry&) const -> bool = default;
};

struct TrackStageConfig
{
    char delimiter { ',' };
    std::string track_file { "flight_data.geojson" };
    bool skip_existing {};
};

// Run the track stage on one raw log. Throws std::invalid_argument if
// the file name does not encode a flight date and time and
// std::runtime_error if the log cannot be read or has fewer than two
// valid samples.
[[nodiscard]] auto processFlight(const std::filesystem::path& log_file,
                                 const std::filesystem::path& processed_dir,
                                 const TrackStageConfig& config)
  -> IndexEntry;

// Process the logs in the order given, one after the other. A flight
// that fails is logged and left out of the index.
[[nodiscard]] auto buildFlightIndex(
  const std::vector<std::filesystem::path>& log_files,
  const std::filesystem::path& processed_dir,
  const TrackStageConfig& config) -> std::vector<IndexEntry>;

// Overwrite the master index
auto writeFlightIndex(const std::filesystem::path& filename,
                      const std::vector<IndexEntry>& entries) -> void;

[[nodiscard]] auto readFlightIndex(const std::filesystem::path& filename)
  -> std::vector<IndexEntry>;

} // namespace seedtrack
