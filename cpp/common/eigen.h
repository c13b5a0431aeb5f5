// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <Eigen/Dense>

// Row-major access is the natural layout for radar moments (rays x
// gates) and raster images (rows x columns). It also matches the
// layout of NetCDF variables so that they can be read directly into
// the array buffer.
using ArrayXXd =
  Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using ArrayXXu8 =
  Eigen::Array<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
