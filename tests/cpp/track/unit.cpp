// Unit tests for the track stage

#include "../testing.h"

#include <algorithm>
#include <limits>
#include <track/flight_id.h>
#include <track/seeding.h>
#include <track/sensor_log.h>
#include <track/track.h>
#include <yaml-cpp/yaml.h>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using namespace std::chrono;

constexpr sys_days flight_date { year { 2024 } / June / 1 };

// Sample with only the fields used by the classifier
auto counterSample(const double bip,
                   const double eject,
                   const bool generator = false) -> seedtrack::RawSample
{
    seedtrack::RawSample sample {};
    sample.bip_count = bip;
    sample.eject_count = eject;
    sample.right_generator = generator;
    return sample;
}

TEST_CASE("sensor log parsing")
{
    SECTION("Valid row")
    {
        const auto sample { seedtrack::parseSensorRow(
          sensorRow("23:55:00", "38.55", "-121.40", 4, 2, 0, 1), flight_date) };
        REQUIRE(sample);
        CHECK(seedtrack::formatIso(sample->timestamp)
              == "2024-06-01T23:55:00Z");
        CHECK_THAT(sample->lat, WithinRel(38.55, 1e-12));
        CHECK_THAT(sample->lon, WithinRel(-121.40, 1e-12));
        CHECK(sample->bip_count == 4.0);
        CHECK(sample->eject_count == 2.0);
        CHECK(!sample->right_generator);
        CHECK(sample->left_generator);
        CHECK(sample->fields[seedtrack::log_col::tail_number] == "N512SE");
    }

    SECTION("Short time of day and fractional seconds")
    {
        const auto sample { seedtrack::parseSensorRow(
          sensorRow("7:05:30.25", "38.5", "-121.5"), flight_date) };
        REQUIRE(sample);
        CHECK(seedtrack::formatIso(sample->timestamp)
              == "2024-06-01T07:05:30.250000Z");
    }

    SECTION("Dropped rows")
    {
        CHECK(!seedtrack::parseSensorRow(sensorRow("25:61:00", "38.5", "-121.5"),
                                         flight_date));
        CHECK(!seedtrack::parseSensorRow(sensorRow("noon", "38.5", "-121.5"),
                                         flight_date));
        CHECK(!seedtrack::parseSensorRow(sensorRow("12:00:00", "abc", "-121.5"),
                                         flight_date));
        CHECK(!seedtrack::parseSensorRow(sensorRow("12:00:00", "nan", "-121.5"),
                                         flight_date));
        CHECK(!seedtrack::parseSensorRow(sensorRow("12:00:00", "0", "-121.5"),
                                         flight_date));
        CHECK(!seedtrack::parseSensorRow(sensorRow("12:00:00", "38.5", "0.0"),
                                         flight_date));
        CHECK(!seedtrack::parseSensorRow(sensorRow("12:00:00", "inf", "-121.5"),
                                         flight_date));
        CHECK(!seedtrack::parseSensorRow(
          "12:00:00,N512SE,38.5,-121.5,152,0,2870,-8.5,0.31,1,-inf,0,0,0,0,0,0",
          flight_date));
        CHECK(!seedtrack::parseSensorRow("12:00:00,N512SE,38.5", flight_date));
        CHECK(!seedtrack::parseSensorRow(
          sensorRow("12:00:00", "38.5", "-121.5") + ",extra", flight_date));
    }

    SECTION("Custom delimiter")
    {
        std::string row { sensorRow("12:00:00", "38.5", "-121.5") };
        std::ranges::replace(row, ',', ';');
        CHECK(seedtrack::parseSensorRow(row, flight_date, ';'));
        CHECK(!seedtrack::parseSensorRow(row, flight_date, ','));
    }

    SECTION("Whole log")
    {
        const auto dir { makeTmpDir("sensor_log") };
        writeText(dir / "log.txt", sampleFlightLog() + "\n  \n");
        const auto log { seedtrack::readSensorLog((dir / "log.txt").string(),
                                                  flight_date) };
        CHECK(log.n_rows == 7);
        CHECK(log.n_dropped == 3);
        REQUIRE(log.samples.size() == 4);
        for (size_t i { 1 }; i < log.samples.size(); ++i) {
            CHECK(log.samples[i - 1].timestamp <= log.samples[i].timestamp);
        }
        CHECK(seedtrack::formatIso(log.samples.back().timestamp)
              == "2024-06-01T23:59:30Z");
    }

    SECTION("Equal timestamps keep their order")
    {
        const auto dir { makeTmpDir("sensor_log_ties") };
        writeText(dir / "log.txt",
                  sensorRow("10:00:05", "38.3", "-121.3") + '\n'
                    + sensorRow("10:00:00", "38.1", "-121.1") + '\n'
                    + sensorRow("10:00:00", "38.2", "-121.2") + '\n');
        const auto log { seedtrack::readSensorLog((dir / "log.txt").string(),
                                                  flight_date) };
        REQUIRE(log.samples.size() == 3);
        CHECK_THAT(log.samples[0].lat, WithinRel(38.1, 1e-12));
        CHECK_THAT(log.samples[1].lat, WithinRel(38.2, 1e-12));
        CHECK_THAT(log.samples[2].lat, WithinRel(38.3, 1e-12));
    }

    SECTION("Missing file")
    {
        CHECK_THROWS_AS(
          seedtrack::readSensorLog("/nonexistent/seedtrack.txt", flight_date),
          std::runtime_error);
    }
}

TEST_CASE("seeding classification")
{
    using seedtrack::SeedingEvent;
    using seedtrack::SeedingType;

    SECTION("BIP counter increments")
    {
        std::vector<seedtrack::RawSample> samples {};
        for (const double bip : { 5.0, 5.0, 7.0, 7.0, 9.0 }) {
            samples.push_back(counterSample(bip, 0.0));
        }
        const auto sequence { seedtrack::classifySamples(samples) };
        const std::vector<SeedingEvent> expected {
            { SeedingType::none, 0 },
            { SeedingType::none, 0 },
            { SeedingType::bip, 2 },
            { SeedingType::none, 0 },
            { SeedingType::bip, 2 },
        };
        CHECK(sequence.events == expected);
        CHECK(sequence.n_resets == 0);
    }

    SECTION("Priorities")
    {
        const seedtrack::CounterState previous { 3.0, 1.0 };
        // Both counters and a generator active
        CHECK(seedtrack::classifySeeding(previous,
                                         counterSample(4.0, 3.0, true))
              == SeedingEvent { SeedingType::bip, 1 });
        // Eject over generator
        CHECK(seedtrack::classifySeeding(previous,
                                         counterSample(3.0, 3.0, true))
              == SeedingEvent { SeedingType::eject, 2 });
        // Generator only
        CHECK(seedtrack::classifySeeding(previous,
                                         counterSample(3.0, 1.0, true))
              == SeedingEvent { SeedingType::generator, 1 });
        CHECK(seedtrack::classifySeeding(previous, counterSample(3.0, 1.0))
              == SeedingEvent { SeedingType::none, 0 });
        // Fractional increments below one are no drop
        CHECK(seedtrack::classifySeeding(previous, counterSample(3.5, 1.0))
              == SeedingEvent { SeedingType::none, 0 });
    }

    SECTION("Counter jump beyond the int range")
    {
        const seedtrack::CounterState previous { 5.0, 0.0 };
        CHECK(seedtrack::classifySeeding(previous, counterSample(1e12, 0.0))
              == SeedingEvent { SeedingType::bip,
                                std::numeric_limits<int>::max() });
        CHECK(seedtrack::classifySeeding(previous, counterSample(5.0, 3e10))
              == SeedingEvent { SeedingType::eject,
                                std::numeric_limits<int>::max() });
        CHECK(seedtrack::classifySeeding(previous, counterSample(-1e12, 0.0))
              == SeedingEvent { SeedingType::none, 0 });
    }

    SECTION("Left generator")
    {
        auto sample { counterSample(0.0, 0.0) };
        sample.left_generator = true;
        CHECK(seedtrack::classifySeeding({}, sample).type
              == SeedingType::generator);
    }

    SECTION("Counter reset")
    {
        std::vector<seedtrack::RawSample> samples {};
        for (const double bip : { 10.0, 12.0, 0.0, 1.0 }) {
            samples.push_back(counterSample(bip, 0.0));
        }
        const auto sequence { seedtrack::classifySamples(samples) };
        const std::vector<SeedingEvent> expected {
            { SeedingType::none, 0 },
            { SeedingType::bip, 2 },
            { SeedingType::none, 0 },
            { SeedingType::bip, 1 },
        };
        CHECK(sequence.events == expected);
        CHECK(sequence.n_resets == 1);
    }

    SECTION("Empty input")
    {
        CHECK(seedtrack::classifySamples({}).events.empty());
    }

    SECTION("Type names")
    {
        CHECK(seedtrack::seedingTypeToString(SeedingType::bip) == "BIP");
        CHECK(seedtrack::seedingTypeToString(SeedingType::eject) == "Eject");
        CHECK(seedtrack::seedingTypeToString(SeedingType::generator)
              == "Generator");
        CHECK(seedtrack::seedingTypeToString(SeedingType::none) == "None");
    }
}

TEST_CASE("flight names")
{
    SECTION("Filename with date and time")
    {
        const auto name { seedtrack::parseFlightFilename(
          "Jun 01 2024, 23-50-00") };
        CHECK(name.id == "2024-06-01_23-50-00");
        CHECK(name.date == flight_date);
    }

    SECTION("Month is case insensitive and trailing text is ignored")
    {
        const auto name { seedtrack::parseFlightFilename(
          "DEC 24 2023, 07-05-09 N512SE") };
        CHECK(name.id == "2023-12-24_07-05-09");
    }

    SECTION("Invalid names")
    {
        CHECK_THROWS_AS(seedtrack::parseFlightFilename("flight_log"),
                        std::invalid_argument);
        CHECK_THROWS_AS(seedtrack::parseFlightFilename("Jux 01 2024, 23-50-00"),
                        std::invalid_argument);
        CHECK_THROWS_AS(seedtrack::parseFlightFilename("Feb 30 2024, 23-50-00"),
                        std::invalid_argument);
        CHECK_THROWS_AS(seedtrack::parseFlightFilename("Jun 01 2024, 24-50-00"),
                        std::invalid_argument);
    }

    SECTION("Display name")
    {
        CHECK(seedtrack::displayName("2024-06-01_23-50-00")
              == "Flight from 2024-06-01 at 23-50-00");
    }
}

TEST_CASE("track assembly")
{
    std::vector<seedtrack::RawSample> samples {};
    for (int i {}; i < 3; ++i) {
        auto sample { counterSample(i, 0.0) };
        sample.timestamp = flight_date + hours { 12 } + minutes { i };
        sample.lat = 38.0 + 0.1 * i;
        sample.lon = -121.0 - 0.1 * i;
        samples.push_back(sample);
    }
    const auto sequence { seedtrack::classifySamples(samples) };

    SECTION("Points follow the samples")
    {
        const auto track { seedtrack::assembleTrack(
          "2024-06-01_12-00-00", samples, sequence.events) };
        REQUIRE(track.points.size() == 3);
        CHECK(track.flight_id == "2024-06-01_12-00-00");
        CHECK_THAT(track.points[2].lat, WithinRel(38.2, 1e-12));
        CHECK(track.points[1].event.type == seedtrack::SeedingType::bip);
    }

    SECTION("Too few samples")
    {
        samples.resize(1);
        CHECK_THROWS_AS(seedtrack::assembleTrack(
                          "x", samples, { seedtrack::SeedingEvent {} }),
                        std::invalid_argument);
    }

    SECTION("Unsorted samples")
    {
        std::swap(samples[0], samples[2]);
        CHECK_THROWS_AS(
          seedtrack::assembleTrack("x", samples, sequence.events),
          std::invalid_argument);
    }

    SECTION("Artifact")
    {
        const auto dir { makeTmpDir("track") };
        const auto filename { dir / "2024-06-01_12-00-00"
                              / "flight_data.geojson" };
        const auto track { seedtrack::assembleTrack(
          "2024-06-01_12-00-00", samples, sequence.events) };
        seedtrack::writeTrack(filename, track);

        const YAML::Node node { YAML::LoadFile(filename.string()) };
        CHECK(node["type"].as<std::string>() == "FeatureCollection");
        const YAML::Node features { node["features"] };
        REQUIRE(features.size() == 4);
        CHECK(features[0]["geometry"]["type"].as<std::string>()
              == "LineString");
        CHECK(features[0]["geometry"]["coordinates"].size() == 3);
        // Coordinates are lon, lat
        CHECK_THAT(features[0]["geometry"]["coordinates"][1][0].as<double>(),
                   WithinAbs(-121.1, 1e-9));
        // Path first, then the points numbered from one
        CHECK(features[0]["id"].as<std::string>() == "0");
        for (size_t i { 1 }; i < features.size(); ++i) {
            CHECK(features[i]["geometry"]["type"].as<std::string>() == "Point");
            CHECK(features[i]["id"].as<std::string>() == std::to_string(i));
        }
        CHECK(features[2]["properties"]["seeding_type"].as<std::string>()
              == "BIP");
        CHECK(features[2]["properties"]["seeding_count"].as<int>() == 1);
        CHECK(features[3]["properties"]["timestamp"].as<std::string>()
              == "2024-06-01T12:02:00Z");

        const auto span { seedtrack::readTrackTimeSpan(filename) };
        CHECK(span.first == samples.front().timestamp);
        CHECK(span.last == samples.back().timestamp);
    }
}
