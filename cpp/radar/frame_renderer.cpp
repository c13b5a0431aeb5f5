// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "frame_renderer.h"

#include "color_scale.h"
#include "flight_window.h"
#include "png_writer.h"
#include "volume_scan.h"

#include <array>
#include <chrono>
#include <common/worker_pool.h>
#include <cstdio>
#include <exception>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <track/track.h>
#include <unordered_set>

namespace seedtrack {

[[nodiscard]] auto renderStateToString(const RenderState state)
  -> std::string
{
    switch (state) {
    case RenderState::pending:
        return "pending";
    case RenderState::rendering:
        return "rendering";
    case RenderState::done:
        return "done";
    case RenderState::skipped:
        return "skipped";
    case RenderState::no_track:
        return "no track";
    case RenderState::no_archive:
        return "no archive";
    case RenderState::no_data:
        return "no data";
    case RenderState::no_frames:
        return "no frames";
    }
    return "unknown";
}

[[nodiscard]] auto frameFileName(const Timestamp time) -> std::string
{
    const auto day { std::chrono::floor<std::chrono::days>(time) };
    const std::chrono::hh_mm_ss hms { std::chrono::floor<std::chrono::seconds>(
      time - day) };
    std::array<char, 8> buf {};
    std::snprintf(buf.data(),
                  buf.size(),
                  "%02d%02d%02d",
                  static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()),
                  static_cast<int>(hms.seconds().count()));
    return "radar_" + dateKey(day) + '_' + buf.data() + ".png";
}

[[nodiscard]] auto renderFrame(const std::filesystem::path& scan_file,
                               const std::filesystem::path& frames_dir,
                               const FrameRenderConfig& config,
                               const ColorScale& scale) -> RenderedFrame
{
    const Timestamp time { parseScanTime(scan_file, config.name_format) };
    // The NetCDF library is not thread-safe. Exceptions must not leave
    // the critical section.
    VolumeScan scan {};
    std::exception_ptr read_error {};
#pragma omp critical(netcdf)
    {
        try {
            scan = readVolumeScan(
              scan_file.string(), config.fields, config.sweep);
        } catch (...) {
            read_error = std::current_exception();
        }
    }
    if (read_error) {
        std::rethrow_exception(read_error);
    }
    const ArrayXXd grid { rasterizePPI(
      scan, config.bounds, config.image_width, config.image_height) };
    const std::string file { frameFileName(time) };
    writePng((frames_dir / file).string(), colorize(grid, scale));
    return { time, file };
}

// Drop scans that map onto an image name already taken by an earlier
// scan. Scans whose time cannot be parsed are kept. The render task
// reports them as failed.
static auto dropDuplicateFrames(const std::vector<std::filesystem::path>& scans,
                                const ScanNameFormat& format,
                                const std::string& flight_id)
  -> std::vector<std::filesystem::path>
{
    std::vector<std::filesystem::path> unique {};
    std::unordered_set<std::string> names {};
    for (const auto& scan_file : scans) {
        try {
            const std::string name { frameFileName(
              parseScanTime(scan_file, format)) };
            if (!names.insert(name).second) {
                spdlog::warn("{}: {} has the same time as an earlier scan, "
                             "{} is not rendered twice",
                             flight_id,
                             scan_file.filename().string(),
                             name);
                continue;
            }
        } catch (const std::invalid_argument& e) {
            spdlog::debug("{}: {}", flight_id, e.what());
        }
        unique.push_back(scan_file);
    }
    return unique;
}

FrameRenderer::FrameRenderer(const FrameRenderConfig& config,
                             const ColorScale& scale)
  : config { config }
{
    task = [config, &scale](const std::filesystem::path& scan_file,
                            const std::filesystem::path& frames_dir) {
        return renderFrame(scan_file, frames_dir, config, scale);
    };
}

FrameRenderer::FrameRenderer(const FrameRenderConfig& config, FrameTask task)
  : config { config }, task { std::move(task) }
{}

auto FrameRenderer::renderFlight(const std::filesystem::path& flight_dir,
                                 const std::filesystem::path& archive_dir)
  -> RenderOutcome
{
    RenderOutcome outcome {};
    const std::string flight_id { flight_dir.filename().string() };
    const std::filesystem::path metadata_file { flight_dir
                                                / config.metadata_file };
    if (std::filesystem::exists(metadata_file)) {
        spdlog::info("{}: radar metadata exists, skipping", flight_id);
        outcome.state = RenderState::skipped;
        return outcome;
    }
    const std::filesystem::path track_file { flight_dir / config.track_file };
    if (!std::filesystem::exists(track_file)) {
        spdlog::warn("{}: no track data, skipping", flight_id);
        outcome.state = RenderState::no_track;
        return outcome;
    }

    const TimeSpan span { readTrackTimeSpan(track_file) };
    const std::vector<std::string> date_keys { flightDateKeys(span.first,
                                                              span.last) };
    spdlog::info("{}: flight window {} to {}",
                 flight_id,
                 formatIso(span.first),
                 formatIso(span.last));

    std::vector<std::filesystem::path> archive_files {};
    try {
        archive_files = listArchive(archive_dir, config.archive_extension);
    } catch (const std::runtime_error& e) {
        spdlog::error("{}: {}", flight_id, e.what());
        outcome.state = RenderState::no_archive;
        return outcome;
    }
    const std::vector<std::filesystem::path> matched { matchArchive(
      date_keys, archive_files) };
    outcome.n_matched = static_cast<int>(matched.size());
    if (matched.empty()) {
        spdlog::warn("{}: no radar data for this flight", flight_id);
        outcome.state = RenderState::no_data;
        return outcome;
    }

    outcome.state = RenderState::rendering;
    spdlog::info("{}: rendering {} radar volume{}",
                 flight_id,
                 matched.size(),
                 matched.size() == 1 ? "" : "s");
    const std::vector<std::filesystem::path> scans { dropDuplicateFrames(
      matched, config.name_format, flight_id) };
    outcome.n_duplicates = outcome.n_matched - static_cast<int>(scans.size());
    const std::filesystem::path frames_dir { flight_dir / config.frames_dir };
    std::filesystem::create_directories(frames_dir);
    WorkerPool<RenderedFrame> pool { config.n_workers, "Rendering frames" };
    for (const auto& scan_file : scans) {
        pool.submit(scan_file.filename().string(),
                    [this, scan_file, frames_dir]() {
                        return task(scan_file, frames_dir);
                    });
    }
    const std::vector<std::optional<RenderedFrame>> results { pool.run() };

    RadarMetadata metadata { config.bounds, orderFrames(results) };
    outcome.n_rendered = static_cast<int>(metadata.frames.size());
    outcome.n_failed = static_cast<int>(scans.size()) - outcome.n_rendered;
    if (metadata.frames.empty()) {
        spdlog::warn("{}: no frame could be rendered", flight_id);
        outcome.state = RenderState::no_frames;
        return outcome;
    }
    writeRadarMetadata(metadata_file, metadata);
    spdlog::info("{}: {} frame{} rendered, {} failed",
                 flight_id,
                 outcome.n_rendered,
                 outcome.n_rendered == 1 ? "" : "s",
                 outcome.n_failed);
    outcome.state = RenderState::done;
    return outcome;
}

} // namespace seedtrack
