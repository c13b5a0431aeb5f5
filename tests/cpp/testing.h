#pragma once

#include <common/eigen.h>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>
#include <netcdf>
#include <sstream>
#include <string>
#include <vector>

// Empty directory in temporary space. Anything left over from a
// previous run is removed.
auto makeTmpDir(const std::string& name) -> std::filesystem::path
{
    const std::filesystem::path dir { std::filesystem::temp_directory_path()
                                      / ("seedtrack_" + name) };
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

auto writeText(const std::filesystem::path& filename,
               const std::string& text) -> void
{
    std::filesystem::create_directories(filename.parent_path());
    std::ofstream out { filename };
    out << text;
}

auto readText(const std::filesystem::path& filename) -> std::string
{
    std::ifstream in { filename };
    std::stringstream ss {};
    ss << in.rdbuf();
    return ss.str();
}

// One row of a sensor log with all 17 fields. Fields not interpreted
// by the processor get plausible constant values.
auto sensorRow(const std::string& time,
               const std::string& lat,
               const std::string& lon,
               const int bip_count = 0,
               const int eject_count = 0,
               const int right_gen = 0,
               const int left_gen = 0) -> std::string
{
    std::stringstream row {};
    row << time << ",N512SE," << lat << ',' << lon << ",152,0,2870,-8.5,0.31,"
        << (bip_count > 0 ? 1 : 0) << ',' << bip_count << ','
        << (eject_count > 0 ? 1 : 0) << ',' << eject_count << ',' << right_gen
        << ',' << left_gen << ",0,0";
    return row.str();
}

// Sensor log of a short flight over the Sierra Nevada with one BIP
// drop, one eject drop and generator activity
auto sampleFlightLog() -> std::string
{
    return sensorRow("23:50:00", "38.50", "-121.50") + '\n'
           + sensorRow("23:55:00", "38.55", "-121.40", 2) + '\n'
           + sensorRow("0:00:00", "", "-121.30", 2) + '\n'
           + sensorRow("23:58:00", "38.60", "-121.30", 2, 1) + '\n'
           + sensorRow("23:59:30", "38.65", "-121.20", 2, 1, 1) + '\n'
           + sensorRow("bad", "38.70", "-121.10", 2, 1) + '\n'
           + sensorRow("23:59:45", "0", "0", 2, 1) + '\n';
}

struct SyntheticScan
{
    double site_lat { 38.5 };
    double site_lon { -121.0 };
    int n_rays { 360 };
    int n_gates { 200 };
    // m
    double gate_spacing { 500.0 };
    double elevation { 0.5 };
    // Physical value everywhere except the gates set to fill
    double value { 32.0 };
    // Gates beyond this index are missing
    int n_valid_gates { 200 };
    std::string field_name { "reflectivity" };
    // Sweeps stacked along the time dimension. Only sweep 0 has the
    // value above, all others are at -20 dBZ.
    int n_sweeps { 1 };
};

// Write a CF/Radial volume scan. Moment data are stored as packed
// shorts with scale_factor, add_offset and _FillValue like in real
// archive files.
auto writeVolumeScan(const std::filesystem::path& filename,
                     const SyntheticScan& scan = {}) -> void
{
    std::filesystem::create_directories(filename.parent_path());
    netCDF::NcFile nc { filename.string(), netCDF::NcFile::replace };
    const int n_rays_total { scan.n_rays * scan.n_sweeps };
    const auto nc_time { nc.addDim("time", n_rays_total) };
    const auto nc_range { nc.addDim("range", scan.n_gates) };
    const auto nc_sweep { nc.addDim("sweep", scan.n_sweeps) };
    nc.putAtt("Conventions", "CF/Radial");
    nc.addVar("latitude", netCDF::ncDouble).putVar(&scan.site_lat);
    nc.addVar("longitude", netCDF::ncDouble).putVar(&scan.site_lon);
    std::vector<float> azimuth(n_rays_total);
    std::vector<float> elevation(n_rays_total);
    for (int i {}; i < n_rays_total; ++i) {
        azimuth[i] = static_cast<float>((i % scan.n_rays) * 360.0 / scan.n_rays);
        elevation[i] = static_cast<float>(scan.elevation
                                          + 1.0 * (i / scan.n_rays));
    }
    nc.addVar("azimuth", netCDF::ncFloat, nc_time).putVar(azimuth.data());
    nc.addVar("elevation", netCDF::ncFloat, nc_time).putVar(elevation.data());
    std::vector<float> range(scan.n_gates);
    for (int i {}; i < scan.n_gates; ++i) {
        range[i] = static_cast<float>((i + 0.5) * scan.gate_spacing);
    }
    nc.addVar("range", netCDF::ncFloat, nc_range).putVar(range.data());
    std::vector<int> sweep_beg(scan.n_sweeps);
    std::vector<int> sweep_end(scan.n_sweeps);
    for (int i {}; i < scan.n_sweeps; ++i) {
        sweep_beg[i] = i * scan.n_rays;
        sweep_end[i] = (i + 1) * scan.n_rays - 1;
    }
    nc.addVar("sweep_start_ray_index", netCDF::ncInt, nc_sweep)
      .putVar(sweep_beg.data());
    nc.addVar("sweep_end_ray_index", netCDF::ncInt, nc_sweep)
      .putVar(sweep_end.data());
    constexpr double scale_factor { 0.5 };
    constexpr double add_offset { -32.0 };
    constexpr short fill_value { -32768 };
    std::vector<short> data(static_cast<size_t>(n_rays_total) * scan.n_gates);
    for (int i_ray {}; i_ray < n_rays_total; ++i_ray) {
        const double value { i_ray < scan.n_rays ? scan.value : -20.0 };
        for (int i_gate {}; i_gate < scan.n_gates; ++i_gate) {
            data[i_ray * scan.n_gates + i_gate] =
              i_gate < scan.n_valid_gates
                ? static_cast<short>((value - add_offset) / scale_factor)
                : fill_value;
        }
    }
    auto var { nc.addVar(scan.field_name, netCDF::ncShort, { nc_time, nc_range }) };
    var.putAtt("scale_factor", netCDF::ncDouble, scale_factor);
    var.putAtt("add_offset", netCDF::ncDouble, add_offset);
    var.putAtt("_FillValue", netCDF::ncShort, fill_value);
    var.putVar(data.data());
}
