// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "volume_scan.h"

#include <cmath>
#include <limits>
#include <netcdf>
#include <optional>
#include <stdexcept>

namespace seedtrack {

// Value of a numeric variable attribute if present
static auto getAttDouble(const netCDF::NcVar& var,
                         const std::string& name) -> std::optional<double>
{
    const auto atts { var.getAtts() };
    const auto it { atts.find(name) };
    if (it == atts.end()) {
        return {};
    }
    double value {};
    it->second.getValues(&value);
    return value;
}

static auto requireVar(const netCDF::NcFile& nc,
                       const std::string& name) -> netCDF::NcVar
{
    const auto var { nc.getVar(name) };
    if (var.isNull()) {
        throw std::runtime_error { "variable " + name + " not found" };
    }
    return var;
}

[[nodiscard]] auto readVolumeScan(const std::string& filename,
                                  const std::vector<std::string>& field_names,
                                  const int sweep) -> VolumeScan
{
    const netCDF::NcFile nc { filename, netCDF::NcFile::read };
    VolumeScan scan {};
    requireVar(nc, "latitude").getVar(&scan.site_lat);
    requireVar(nc, "longitude").getVar(&scan.site_lon);

    const size_t n_rays_total { nc.getDim("time").getSize() };
    const size_t n_gates { nc.getDim("range").getSize() };
    if (n_rays_total == 0 || n_gates == 0) {
        throw std::runtime_error { "empty volume scan" };
    }

    // Ray range of the sweep. Without sweep information the whole
    // file is one sweep.
    size_t ray_beg {};
    size_t n_rays { n_rays_total };
    if (const auto var_beg { nc.getVar("sweep_start_ray_index") };
        !var_beg.isNull()) {
        const size_t n_sweeps { nc.getDim("sweep").getSize() };
        if (sweep < 0 || static_cast<size_t>(sweep) >= n_sweeps) {
            throw std::runtime_error { "sweep " + std::to_string(sweep)
                                       + " not found, number of sweeps is "
                                       + std::to_string(n_sweeps) };
        }
        int beg {};
        int end {};
        var_beg.getVar({ static_cast<size_t>(sweep) }, &beg);
        requireVar(nc, "sweep_end_ray_index")
          .getVar({ static_cast<size_t>(sweep) }, &end);
        if (beg < 0 || end < beg || static_cast<size_t>(end) >= n_rays_total) {
            throw std::runtime_error { "invalid ray indices for sweep "
                                       + std::to_string(sweep) };
        }
        ray_beg = static_cast<size_t>(beg);
        n_rays = static_cast<size_t>(end - beg + 1);
    } else if (sweep != 0) {
        throw std::runtime_error { "sweep " + std::to_string(sweep)
                                   + " not found, file has no sweep data" };
    }

    scan.azimuth.resize(static_cast<Eigen::Index>(n_rays));
    scan.elevation.resize(static_cast<Eigen::Index>(n_rays));
    scan.range.resize(static_cast<Eigen::Index>(n_gates));
    requireVar(nc, "azimuth").getVar({ ray_beg }, { n_rays },
                                     scan.azimuth.data());
    if (const auto var { nc.getVar("elevation") }; var.isNull()) {
        scan.elevation = 0.0;
    } else {
        var.getVar({ ray_beg }, { n_rays }, scan.elevation.data());
    }
    requireVar(nc, "range").getVar(scan.range.data());

    // Moment
    netCDF::NcVar field_var {};
    for (const auto& name : field_names) {
        if (field_var = nc.getVar(name); !field_var.isNull()) {
            scan.field_name = name;
            break;
        }
    }
    if (field_var.isNull()) {
        std::string names {};
        for (const auto& name : field_names) {
            names += ' ' + name;
        }
        throw std::runtime_error { "none of the fields" + names + " found" };
    }
    scan.field.resize(static_cast<Eigen::Index>(n_rays),
                      static_cast<Eigen::Index>(n_gates));
    field_var.getVar({ ray_beg, 0 }, { n_rays, n_gates }, scan.field.data());
    const auto fill_value { getAttDouble(field_var, "_FillValue") };
    const double scale_factor {
        getAttDouble(field_var, "scale_factor").value_or(1.0)
    };
    const double add_offset { getAttDouble(field_var, "add_offset").value_or(
      0.0) };
    for (Eigen::Index i {}; i < scan.field.size(); ++i) {
        double& value { scan.field.data()[i] };
        if (fill_value && value == fill_value.value()) {
            value = std::numeric_limits<double>::quiet_NaN();
        } else {
            value = value * scale_factor + add_offset;
        }
    }
    return scan;
}

} // namespace seedtrack
