// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "flight_index.h"

#include <common/io.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <track/flight_id.h>
#include <track/sensor_log.h>
#include <track/track.h>

namespace seedtrack {

[[nodiscard]] auto processFlight(const std::filesystem::path& log_file,
                                 const std::filesystem::path& processed_dir,
                                 const TrackStageConfig& config)
  -> IndexEntry
{
    const FlightName name { parseFlightFilename(log_file.stem().string()) };
    const IndexEntry entry { name.id,
                             displayName(name.id),
                             name.id + '/' + config.track_file };
    const std::filesystem::path track_file { processed_dir / name.id
                                             / config.track_file };
    if (config.skip_existing && std::filesystem::exists(track_file)) {
        spdlog::info("{}: track exists, skipping", name.id);
        return entry;
    }
    const SensorLog log { readSensorLog(
      log_file.string(), name.date, config.delimiter) };
    if (log.samples.size() < 2) {
        throw std::runtime_error {
            "no track can be formed from "
            + std::to_string(log.samples.size()) + " valid sample"
            + (log.samples.size() == 1 ? "" : "s")
        };
    }
    const SeedingSequence seeding { classifySamples(log.samples) };
    if (seeding.n_resets > 0) {
        spdlog::warn("{}: {} seeding counter reset{}",
                     name.id,
                     seeding.n_resets,
                     seeding.n_resets == 1 ? "" : "s");
    }
    writeTrack(track_file, assembleTrack(name.id, log.samples, seeding.events));
    spdlog::info("{}: track with {} points written", name.id, log.samples.size());
    return entry;
}

[[nodiscard]] auto buildFlightIndex(
  const std::vector<std::filesystem::path>& log_files,
  const std::filesystem::path& processed_dir,
  const TrackStageConfig& config) -> std::vector<IndexEntry>
{
    std::vector<IndexEntry> entries {};
    for (const auto& log_file : log_files) {
        try {
            entries.push_back(processFlight(log_file, processed_dir, config));
        } catch (const std::exception& e) {
            spdlog::warn("{}: skipped: {}", log_file.filename().string(), e.what());
        }
    }
    return entries;
}

auto writeFlightIndex(const std::filesystem::path& filename,
                      const std::vector<IndexEntry>& entries) -> void
{
    YAML::Emitter out {};
    setJsonFormat(out);
    out << YAML::BeginSeq;
    for (const auto& entry : entries) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << entry.id;
        out << YAML::Key << "displayName" << YAML::Value << entry.display_name;
        out << YAML::Key << "dataPath" << YAML::Value << entry.data_path;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    writeJson(filename, out);
}

[[nodiscard]] auto readFlightIndex(const std::filesystem::path& filename)
  -> std::vector<IndexEntry>
{
    std::vector<IndexEntry> entries {};
    for (const auto& node : YAML::LoadFile(filename.string())) {
        entries.push_back({ node["id"].as<std::string>(),
                            node["displayName"].as<std::string>(),
                            node["dataPath"].as<std::string>() });
    }
    return entries;
}

} // namespace seedtrack
