// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "track.h"

#include "sensor_log.h"

#include <common/io.h>
#include <spdlog/spdlog.h>

namespace seedtrack {

[[nodiscard]] auto assembleTrack(const std::string& flight_id,
                                 const std::vector<RawSample>& samples,
                                 const std::vector<SeedingEvent>& events)
  -> FlightTrack
{
    if (samples.size() < 2) {
        throw std::invalid_argument {
            "at least two samples are required to form a flight path"
        };
    }
    if (samples.size() != events.size()) {
        throw std::invalid_argument {
            "number of seeding events does not match number of samples"
        };
    }
    FlightTrack track { flight_id, {} };
    track.points.reserve(samples.size());
    for (size_t i {}; i < samples.size(); ++i) {
        if (i > 0 && samples[i].timestamp < samples[i - 1].timestamp) {
            throw std::invalid_argument { "samples are not sorted by time" };
        }
        track.points.push_back({ samples[i].lat,
                                 samples[i].lon,
                                 samples[i].timestamp,
                                 events[i] });
    }
    return track;
}

// GeoJSON position, longitude first
static auto emitPosition(YAML::Emitter& out, const TrackPoint& point) -> void
{
    out << YAML::BeginSeq << point.lon << point.lat << YAML::EndSeq;
}

auto writeTrack(const std::filesystem::path& filename,
                const FlightTrack& track) -> void
{
    YAML::Emitter out {};
    setJsonFormat(out);
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << "FeatureCollection";
    out << YAML::Key << "features" << YAML::Value << YAML::BeginSeq;
    // Flight path
    out << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << "0";
    out << YAML::Key << "type" << YAML::Value << "Feature";
    out << YAML::Key << "properties" << YAML::Value << YAML::BeginMap
        << YAML::EndMap;
    out << YAML::Key << "geometry" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << "LineString";
    out << YAML::Key << "coordinates" << YAML::Value << YAML::BeginSeq;
    for (const TrackPoint& point : track.points) {
        emitPosition(out, point);
    }
    out << YAML::EndSeq << YAML::EndMap << YAML::EndMap;
    // Points
    for (size_t i {}; i < track.points.size(); ++i) {
        const TrackPoint& point { track.points[i] };
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << std::to_string(i + 1);
        out << YAML::Key << "type" << YAML::Value << "Feature";
        out << YAML::Key << "properties" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "timestamp" << YAML::Value
            << formatIso(point.timestamp);
        out << YAML::Key << "seeding_type" << YAML::Value
            << seedingTypeToString(point.event.type);
        out << YAML::Key << "seeding_count" << YAML::Value
            << point.event.count;
        out << YAML::EndMap;
        out << YAML::Key << "geometry" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "type" << YAML::Value << "Point";
        out << YAML::Key << "coordinates" << YAML::Value;
        emitPosition(out, point);
        out << YAML::EndMap << YAML::EndMap;
    }
    out << YAML::EndSeq << YAML::EndMap;
    writeJson(filename, out);
}

[[nodiscard]] auto readTrackTimeSpan(const std::filesystem::path& filename)
  -> TimeSpan
{
    const YAML::Node geojson { YAML::LoadFile(filename.string()) };
    std::vector<std::string> timestamps {};
    for (const auto& feature : geojson["features"]) {
        if (feature["geometry"]["type"].as<std::string>() == "Point") {
            timestamps.push_back(
              feature["properties"]["timestamp"].as<std::string>());
        }
    }
    if (timestamps.empty()) {
        throw std::runtime_error { "no points found in "
                                   + filename.string() };
    }
    return { parseIso(timestamps.front()), parseIso(timestamps.back()) };
}

} // namespace seedtrack
