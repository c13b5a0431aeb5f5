// Integration tests for the flight processor

#include "../testing.h"

#include <pipeline/driver.h>
#include <pipeline/flight_index.h>
#include <pipeline/settings_pipeline.h>
#include <radar/radar_metadata.h>
#include <yaml-cpp/yaml.h>

using Catch::Matchers::WithinAbs;

const std::string fixture_dir { std::string(FIXTURE_DIR) };
const std::string fixture_log { "Jun 01 2024, 23-50-00.txt" };

auto countFiles(const std::filesystem::path& dir) -> int
{
    if (!std::filesystem::is_directory(dir)) {
        return 0;
    }
    int n {};
    for (const auto& entry : std::filesystem::directory_iterator { dir }) {
        n += entry.is_regular_file() ? 1 : 0;
    }
    return n;
}

TEST_CASE("integration tests")
{
    // Input data: raw logs, some of which cannot be processed, and an
    // archive with one corrupt volume scan
    const auto root { makeTmpDir("pipeline") };
    const auto raw_dir { root / "raw_data" };
    const auto processed_dir { root / "processed_data" };
    const auto archive_dir { processed_dir / "raw_grid_data" };
    std::filesystem::create_directories(raw_dir);
    std::filesystem::copy_file(std::filesystem::path { fixture_dir }
                                 / fixture_log,
                               raw_dir / fixture_log);
    writeText(raw_dir / "Jun 02 2024, 10-00-00.txt",
              sensorRow("10:00:00", "39.10", "-120.20") + '\n'
                + sensorRow("10:20:00", "39.20", "-120.10", 0, 0, 1) + '\n');
    writeText(raw_dir / "Jun 03 2024, 08-00-00.txt",
              sensorRow("8:00:00", "0", "0") + '\n'
                + sensorRow("xx", "39.2", "-120.1") + '\n');
    writeText(raw_dir / "Jun 04 2024, 09-00-00.txt",
              sensorRow("9:00:00", "39.0", "-120.0") + '\n');
    writeText(raw_dir / "flight notes.txt", sampleFlightLog());
    writeText(raw_dir / "readme.md", "not a log");
    writeVolumeScan(archive_dir / "KDAX_V06_20240601_235512.nc");
    writeVolumeScan(archive_dir / "KDAX_V06_20240602_101000.nc");
    writeText(archive_dir / "KDAX_V06_20240601_235900.nc", "corrupt");
    writeVolumeScan(archive_dir / "KDAX_V06_20240610_120000.nc");

    // For the settings class to work properly the config should be
    // read from a file even if it's mostly empty.
    const auto config_filename { root / "config.yaml" };
    writeText(config_filename,
              "radar:\n  image_width: 48\n  image_height: 32\n  n_workers: 2\n");
    seedtrack::SettingsPipeline settings { config_filename.string() };
    settings.io_files.raw_data = raw_dir.string();
    settings.io_files.processed_data = processed_dir.string();
    settings.io_files.radar_archive = archive_dir.string();
    settings.init();

    const auto flight_1 { processed_dir / "2024-06-01_23-50-00" };
    const auto flight_2 { processed_dir / "2024-06-02_10-00-00" };

    SECTION("Full chain")
    {
        seedtrack::driver(settings);

        // Master index
        const auto index { seedtrack::readFlightIndex(processed_dir
                                                      / "flights.json") };
        REQUIRE(index.size() == 2);
        CHECK(index[0]
              == seedtrack::IndexEntry {
                "2024-06-01_23-50-00",
                "Flight from 2024-06-01 at 23-50-00",
                "2024-06-01_23-50-00/flight_data.geojson" });
        CHECK(index[1].id == "2024-06-02_10-00-00");
        CHECK(!std::filesystem::exists(processed_dir / "2024-06-03_08-00-00"));
        CHECK(!std::filesystem::exists(processed_dir / "2024-06-04_09-00-00"));

        // Track of the fixture flight
        const YAML::Node track { YAML::LoadFile(
          (flight_1 / "flight_data.geojson").string()) };
        const YAML::Node features { track["features"] };
        REQUIRE(features.size() == 10);
        CHECK(features[0]["geometry"]["coordinates"].size() == 9);
        std::vector<std::string> types {};
        std::vector<int> counts {};
        for (size_t i { 1 }; i < features.size(); ++i) {
            types.push_back(
              features[i]["properties"]["seeding_type"].as<std::string>());
            counts.push_back(features[i]["properties"]["seeding_count"].as<int>());
        }
        CHECK(types
              == std::vector<std::string> { "None",
                                            "None",
                                            "BIP",
                                            "Eject",
                                            "Generator",
                                            "None",
                                            "None",
                                            "BIP",
                                            "None" });
        CHECK(counts == std::vector<int> { 0, 0, 2, 1, 1, 0, 0, 1, 0 });
        CHECK(features[4]["properties"]["timestamp"].as<std::string>()
              == "2024-06-01T23:53:30Z");

        // Radar frames. The corrupt scan is left out.
        const auto metadata_1 { seedtrack::readRadarMetadata(
          flight_1 / "radar_meta.json") };
        REQUIRE(metadata_1.frames.size() == 1);
        CHECK(metadata_1.frames[0].file == "radar_20240601_235512.png");
        CHECK(std::filesystem::exists(flight_1 / "radar_frames"
                                      / "radar_20240601_235512.png"));
        CHECK_THAT(metadata_1.bounds.lat_max, WithinAbs(41.0, 1e-12));
        const auto metadata_2 { seedtrack::readRadarMetadata(
          flight_2 / "radar_meta.json") };
        REQUIRE(metadata_2.frames.size() == 1);
        CHECK(seedtrack::formatIso(metadata_2.frames[0].time)
              == "2024-06-02T10:10:00Z");
    }

    SECTION("Second run")
    {
        seedtrack::driver(settings);
        const std::string index_before { readText(processed_dir
                                                  / "flights.json") };
        const std::string metadata_before { readText(flight_1
                                                     / "radar_meta.json") };
        // A new scan in the archive does not change a completed flight
        writeVolumeScan(archive_dir / "KDAX_V06_20240601_235800.nc");
        seedtrack::driver(settings);
        CHECK(readText(processed_dir / "flights.json") == index_before);
        CHECK(readText(flight_1 / "radar_meta.json") == metadata_before);
        CHECK(countFiles(flight_1 / "radar_frames") == 1);
    }

    SECTION("Existing tracks are kept in the index")
    {
        seedtrack::driver(settings);
        std::filesystem::remove(raw_dir / "Jun 02 2024, 10-00-00.txt");
        settings.tracks.skip_existing = true;
        settings.radar.enabled = false;
        seedtrack::driver(settings);
        const auto index { seedtrack::readFlightIndex(processed_dir
                                                      / "flights.json") };
        // Only flights attempted in this run are listed
        REQUIRE(index.size() == 1);
        CHECK(index[0].id == "2024-06-01_23-50-00");
    }

    SECTION("Flights without a track get no frames")
    {
        std::filesystem::create_directories(processed_dir / "orphan");
        settings.tracks.enabled = false;
        seedtrack::driver(settings);
        CHECK(!std::filesystem::exists(processed_dir / "flights.json"));
        CHECK(!std::filesystem::exists(processed_dir / "orphan"
                                       / "radar_meta.json"));
    }

    SECTION("Only invalid logs")
    {
        for (const auto& name : { fixture_log,
                                  std::string { "Jun 02 2024, 10-00-00.txt" } }) {
            std::filesystem::remove(raw_dir / name);
        }
        seedtrack::driver(settings);
        const auto index_file { processed_dir / "flights.json" };
        REQUIRE(std::filesystem::exists(index_file));
        CHECK(seedtrack::readFlightIndex(index_file).empty());
    }

    SECTION("Missing input directories")
    {
        settings.io_files.raw_data = (root / "missing_raw").string();
        settings.io_files.radar_archive = (root / "missing_archive").string();
        std::filesystem::create_directories(flight_1);
        seedtrack::driver(settings);
        CHECK(!std::filesystem::exists(processed_dir / "flights.json"));
    }
}

TEST_CASE("configuration")
{
    const auto root { makeTmpDir("configuration") };
    const auto config_filename { root / "config.yaml" };

    SECTION("Defaults")
    {
        writeText(config_filename, "tracks:\n  enabled: yes\n");
        seedtrack::SettingsPipeline settings { config_filename.string() };
        settings.init();
        CHECK(settings.radar.n_workers == 3);
        CHECK(settings.radar.fields.size() == 4);
        CHECK(settings.io_files.index == "flights.json");
    }

    SECTION("Default configuration can be printed")
    {
        const std::string config { seedtrack::SettingsPipeline {}.c_str() };
        CHECK(config.find("n_workers") != std::string::npos);
        CHECK(config.find("radar_meta.json") != std::string::npos);
    }

    SECTION("Invalid values")
    {
        writeText(config_filename, "radar:\n  n_workers: 0\n");
        seedtrack::SettingsPipeline workers { config_filename.string() };
        CHECK_THROWS_AS(workers.init(), std::invalid_argument);

        writeText(config_filename,
                  "radar:\n  bounds: [41.0, -123.78, 36.35, -118.84]\n");
        seedtrack::SettingsPipeline bounds { config_filename.string() };
        CHECK_THROWS_AS(bounds.init(), std::invalid_argument);

        writeText(config_filename, "tracks:\n  delimiter: \";;\"\n");
        seedtrack::SettingsPipeline delimiter { config_filename.string() };
        CHECK_THROWS_AS(delimiter.init(), std::invalid_argument);

        writeText(config_filename, "radar:\n  sweep: first\n");
        seedtrack::SettingsPipeline sweep { config_filename.string() };
        CHECK_THROWS_AS(sweep.init(), std::runtime_error);
    }
}
