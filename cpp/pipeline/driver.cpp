// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"

#include "flight_index.h"
#include "settings_pipeline.h"

#include <common/constants.h>
#include <common/io.h>
#include <common/timer.h>
#include <algorithm>
#include <map>
#include <radar/color_scale.h>
#include <radar/frame_renderer.h>
#include <spdlog/spdlog.h>

namespace seedtrack {

// Track stage. Returns the number of flights in the master index.
static auto trackStage(const SettingsPipeline& settings) -> int
{
    const std::filesystem::path processed_dir {
        std::string { settings.io_files.processed_data }
    };
    const std::vector<std::filesystem::path> log_files { listFiles(
      std::string { settings.io_files.raw_data }, settings.tracks.log_extension) };
    spdlog::info("Found {} flight log{} in {}",
                 log_files.size(),
                 log_files.size() == 1 ? "" : "s",
                 settings.io_files.raw_data);
    if (log_files.empty()) {
        spdlog::warn("Nothing to process, master index not written");
        return 0;
    }
    const TrackStageConfig config { settings.tracks.delimiter.front(),
                                    settings.tracks.track_file,
                                    settings.tracks.skip_existing };
    const std::vector<IndexEntry> entries { buildFlightIndex(
      log_files, processed_dir, config) };
    const std::filesystem::path index_file { processed_dir
                                             / std::string { settings.io_files.index } };
    writeFlightIndex(index_file, entries);
    spdlog::info("Master index with {} of {} flights written to {}",
                 entries.size(),
                 log_files.size(),
                 index_file.string());
    return static_cast<int>(entries.size());
}

// Radar stage over every flight directory under the output root
static auto radarStage(const SettingsPipeline& settings)
  -> std::map<RenderState, int>
{
    const std::filesystem::path processed_dir {
        std::string { settings.io_files.processed_data }
    };
    const std::filesystem::path archive_dir {
        std::string { settings.io_files.radar_archive }
    };
    FrameRenderConfig config {};
    config.bounds = { settings.radar.bounds[bound::lat_min],
                      settings.radar.bounds[bound::lon_min],
                      settings.radar.bounds[bound::lat_max],
                      settings.radar.bounds[bound::lon_max] };
    config.image_width = settings.radar.image_width;
    config.image_height = settings.radar.image_height;
    config.fields = settings.radar.fields;
    config.sweep = settings.radar.sweep;
    config.name_format = { settings.radar.date_token,
                           settings.radar.time_token };
    config.n_workers = settings.radar.n_workers;
    config.archive_extension = settings.radar.archive_extension;
    config.track_file = settings.tracks.track_file;
    config.frames_dir = settings.radar.frames_dir;
    config.metadata_file = settings.radar.metadata_file;
    FrameRenderer renderer { config, ColorScale::nws() };

    std::vector<std::filesystem::path> flight_dirs {};
    std::error_code ec {};
    for (const auto& entry :
         std::filesystem::directory_iterator { processed_dir }) {
        // The archive may live inside the output root
        if (entry.is_directory()
            && !std::filesystem::equivalent(entry.path(), archive_dir, ec)) {
            flight_dirs.push_back(entry.path());
        }
    }
    std::ranges::sort(flight_dirs);

    std::map<RenderState, int> states {};
    for (const auto& flight_dir : flight_dirs) {
        try {
            ++states[renderer.renderFlight(flight_dir, archive_dir).state];
        } catch (const std::exception& e) {
            spdlog::error("{}: radar stage failed: {}",
                          flight_dir.filename().string(),
                          e.what());
        }
    }
    return states;
}

auto driver(const SettingsPipeline& settings) -> void
{
    // Set up loggers and print general information
    initLogging();
    printHeading("Cloud seeding flight processor", false);
    printSystemInfo(SEEDTRACK_PROJECT_VERSION,
                    SEEDTRACK_GIT_COMMIT_ABBREV,
                    SEEDTRACK_CMAKE_HOST_SYSTEM,
                    SEEDTRACK_EXECUTABLE,
                    SEEDTRACK_CXX_COMPILER,
                    SEEDTRACK_CXX_COMPILER_FLAGS,
                    SEEDTRACK_LIBRARIES);
    printHeading("Configuration");
    spdlog::get("plain")->info(settings.getConfig());
    Timer timer {};

    int n_indexed {};
    if (settings.tracks.enabled) {
        printHeading("Tracks");
        timer.start("tracks");
        try {
            n_indexed = trackStage(settings);
        } catch (const std::exception& e) {
            spdlog::error("Track stage halted: {}", e.what());
        }
        timer.stop();
    }

    std::map<RenderState, int> states {};
    if (settings.radar.enabled) {
        printHeading("Radar frames");
        timer.start("radar frames");
        try {
            states = radarStage(settings);
        } catch (const std::exception& e) {
            spdlog::error("Radar stage halted: {}", e.what());
        }
        timer.stop();
    }

    printHeading("Summary");
    if (settings.tracks.enabled) {
        spdlog::info("Flights in master index: {}", n_indexed);
    }
    for (const auto& [state, count] : states) {
        spdlog::info("Radar {:<10}: {}", renderStateToString(state), count);
    }
    for (const auto& [label, seconds] : timer.laps()) {
        spdlog::info("Wall time {:<12}: {:.3f} s", label, seconds);
    }
    spdlog::info("Total wall time: {:.3f} s", timer.time());
    printHeading("Success");
}

} // namespace seedtrack
