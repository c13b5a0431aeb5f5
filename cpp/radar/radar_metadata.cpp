// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "radar_metadata.h"

#include <algorithm>
#include <common/io.h>
#include <iterator>
#include <spdlog/spdlog.h>
#include <unordered_set>

namespace seedtrack {

[[nodiscard]] auto orderFrames(
  const std::vector<std::optional<RenderedFrame>>& results)
  -> std::vector<RenderedFrame>
{
    std::vector<RenderedFrame> frames {};
    for (const auto& result : results) {
        if (result) {
            frames.push_back(result.value());
        }
    }
    std::ranges::sort(frames, [](const auto& a, const auto& b) {
        return a.time == b.time ? a.file < b.file : a.time < b.time;
    });
    std::unordered_set<std::string> names {};
    for (const RenderedFrame& frame : frames) {
        if (!names.insert(frame.file).second) {
            spdlog::warn("Frame {} is listed more than once", frame.file);
        }
    }
    return frames;
}

auto writeRadarMetadata(const std::filesystem::path& filename,
                        const RadarMetadata& metadata) -> void
{
    YAML::Emitter out {};
    setJsonFormat(out);
    out << YAML::BeginMap;
    out << YAML::Key << "bounds" << YAML::Value << YAML::BeginSeq;
    out << YAML::BeginSeq << metadata.bounds.lat_min << metadata.bounds.lon_min
        << YAML::EndSeq;
    out << YAML::BeginSeq << metadata.bounds.lat_max << metadata.bounds.lon_max
        << YAML::EndSeq;
    out << YAML::EndSeq;
    out << YAML::Key << "frames" << YAML::Value << YAML::BeginSeq;
    for (const auto& frame : metadata.frames) {
        out << YAML::BeginMap;
        out << YAML::Key << "time" << YAML::Value << formatIso(frame.time);
        out << YAML::Key << "file" << YAML::Value << frame.file;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq << YAML::EndMap;
    writeJson(filename, out);
}

[[nodiscard]] auto readRadarMetadata(const std::filesystem::path& filename)
  -> RadarMetadata
{
    const YAML::Node node { YAML::LoadFile(filename.string()) };
    RadarMetadata metadata {};
    const YAML::Node bounds { node["bounds"] };
    metadata.bounds = { bounds[0][0].as<double>(),
                        bounds[0][1].as<double>(),
                        bounds[1][0].as<double>(),
                        bounds[1][1].as<double>() };
    for (const auto& frame : node["frames"]) {
        metadata.frames.push_back({ parseIso(frame["time"].as<std::string>()),
                                    frame["file"].as<std::string>() });
    }
    return metadata;
}

[[nodiscard]] auto frameAt(const RadarMetadata& metadata,
                           const Timestamp time)
  -> std::optional<RenderedFrame>
{
    if (metadata.frames.empty()) {
        return {};
    }
    // First frame after the given time
    const auto it { std::ranges::upper_bound(
      metadata.frames, time, {}, &RenderedFrame::time) };
    if (it == metadata.frames.begin()) {
        return metadata.frames.front();
    }
    return *std::prev(it);
}

} // namespace seedtrack
