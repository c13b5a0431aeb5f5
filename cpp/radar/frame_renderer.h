// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Rendering stage of one flight. The flight's time window selects
// volume scans from the shared archive, each scan is rendered into
// one PNG image by the worker pool, and the successful frames are
// packaged into the radar metadata artifact.
//
// State of a flight: pending -> rendering -> done, or skipped if the
// metadata artifact already exists. A flight can also end without
// frames: no_track (track artifact missing), no_archive (archive
// directory missing), no_data (no scan matches the window) and
// no_frames (every render failed). No artifact is written for these.

#pragma once

#include "archive.h"
#include "radar_metadata.h"

#include <functional>

namespace seedtrack {

class ColorScale;

struct FrameRenderConfig
{
    GeoBounds bounds {};
    int image_width { 960 };
    int image_height { 960 };
    // Candidate names of the moment variable, first present one wins
    std::vector<std::string> fields {};
    int sweep {};
    ScanNameFormat name_format {};
    int n_workers { 3 };
    std::string archive_extension { ".nc" };
    std::string track_file { "flight_data.geojson" };
    std::string frames_dir { "radar_frames" };
    std::string metadata_file { "radar_meta.json" };
};

enum class RenderState
{
    pending,
    rendering,
    done,
    skipped,
    no_track,
    no_archive,
    no_data,
    no_frames,
};

[[nodiscard]] auto renderStateToString(const RenderState state)
  -> std::string;

struct RenderOutcome
{
    RenderState state { RenderState::pending };
    // Number of archive files matching the flight window
    int n_matched {};
    // Number of frames in the metadata artifact
    int n_rendered {};
    int n_failed {};
    // Matched files not rendered because an earlier file has the same
    // acquisition time and would write the same image
    int n_duplicates {};
};

// Work done by one pool task: render one archive file into the
// frames directory.
using FrameTask = std::function<RenderedFrame(
  const std::filesystem::path& scan_file,
  const std::filesystem::path& frames_dir)>;

// Decode, rasterize and colorize one volume scan and write it as
// radar_YYYYMMDD_HHMMSS.png. Throws on any failure.
[[nodiscard]] auto renderFrame(const std::filesystem::path& scan_file,
                               const std::filesystem::path& frames_dir,
                               const FrameRenderConfig& config,
                               const ColorScale& scale) -> RenderedFrame;

// Image file name of a scan taken at the given time
[[nodiscard]] auto frameFileName(const Timestamp time) -> std::string;

class FrameRenderer
{
private:
    FrameRenderConfig config {};
    FrameTask task {};

public:
    // Render with renderFrame using the given color scale. The scale
    // must outlive the renderer.
    FrameRenderer(const FrameRenderConfig& config, const ColorScale& scale);
    // Render with a custom task
    FrameRenderer(const FrameRenderConfig& config, FrameTask task);
    // Run the rendering stage of the flight whose artifacts are in
    // flight_dir. Archive files are looked up in archive_dir.
    auto renderFlight(const std::filesystem::path& flight_dir,
                      const std::filesystem::path& archive_dir)
      -> RenderOutcome;
};

} // namespace seedtrack
