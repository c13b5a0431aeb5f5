// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Class for storing all configuration parameters of the flight
// processor

#pragma once

#include <common/settings.h>

namespace seedtrack {

class SettingsPipeline : public Settings
{
private:
    auto checkParameters() -> void override;

public:
    struct
    {
        Setting<std::string> raw_data {
            { "io_files", "raw_data" },
            "raw_data",
            "directory with the raw sensor logs, one file per flight"
        };
        Setting<std::string> processed_data {
            { "io_files", "processed_data" },
            "processed_data",
            "output root. Each flight gets a subdirectory named after its\n"
            "flight ID."
        };
        Setting<std::string> radar_archive {
            { "io_files", "radar_archive" },
            "processed_data/raw_grid_data",
            "shared archive of radar volume scans"
        };
        Setting<std::string> index {
            { "io_files", "index" },
            "flights.json",
            "master index of all flights, relative to\n"
            "[io_files][processed_data]"
        };
    } io_files;

    struct
    {
        Setting<bool> enabled { { "tracks", "enabled" },
                                true,
                                "whether to run the track stage" };
        Setting<std::string> log_extension { { "tracks", "log_extension" },
                                             ".txt",
                                             "extension of raw sensor logs" };
        Setting<std::string> delimiter { { "tracks", "delimiter" },
                                         ",",
                                         "field delimiter of the sensor logs" };
        Setting<bool> skip_existing {
            { "tracks", "skip_existing" },
            false,
            "whether to leave flights whose track file already exists\n"
            "untouched. They are still listed in the index."
        };
        Setting<std::string> track_file { { "tracks", "track_file" },
                                          "flight_data.geojson",
                                          "name of the track artifact" };
    } tracks;

    struct
    {
        Setting<bool> enabled { { "radar", "enabled" },
                                true,
                                "whether to run the radar stage" };
        Setting<int> n_workers {
            { "radar", "n_workers" },
            3,
            "number of volume scans rendered concurrently"
        };
        Setting<std::string> archive_extension {
            { "radar", "archive_extension" },
            ".nc",
            "extension of volume scans in the archive"
        };
        Setting<std::vector<std::string>> fields {
            { "radar", "fields" },
            { "reflectivity", "DBZ", "DBZH", "REF" },
            "candidate names of the reflectivity variable. The first one\n"
            "present in a volume scan is used."
        };
        Setting<int> sweep { { "radar", "sweep" },
                             0,
                             "sweep to render, counting starts at 0" };
        Setting<int> date_token {
            { "radar", "date_token" },
            2,
            "position of the YYYYMMDD token in an underscore separated\n"
            "archive file name (counting starts at 0)"
        };
        Setting<int> time_token {
            { "radar", "time_token" },
            3,
            "position of the HHMMSS token in an archive file name"
        };
        Setting<std::vector<double>> bounds {
            { "radar", "bounds" },
            { 36.35, -123.78, 41.0, -118.84 },
            "geographic extent of the frames: lat_min, lon_min, lat_max,\n"
            "lon_max in degrees"
        };
        Setting<int> image_width { { "radar", "image_width" },
                                   960,
                                   "frame width, pixels" };
        Setting<int> image_height { { "radar", "image_height" },
                                    960,
                                    "frame height, pixels" };
        Setting<std::string> frames_dir {
            { "radar", "frames_dir" },
            "radar_frames",
            "directory for frame images, relative to the flight directory"
        };
        Setting<std::string> metadata_file {
            { "radar", "metadata_file" },
            "radar_meta.json",
            "name of the radar metadata artifact. Its presence marks the\n"
            "radar stage of a flight as complete."
        };
    } radar;

    SettingsPipeline() = default;
    SettingsPipeline(const std::string& yaml_file) : Settings { yaml_file } {}
    auto scanKeys() -> void override;
    ~SettingsPipeline() = default;
};

} // namespace seedtrack
