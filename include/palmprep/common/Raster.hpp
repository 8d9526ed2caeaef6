// Copyright (c) 2024-2025 palmprep contributors

// This file is part of palmprep

// palmprep is free software: you can redistribute it and/or modify it under
// the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. palmprep is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with palmprep. If not, see
// <https://www.gnu.org/licenses/>.

#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <palmprep/common/datastructures.hpp>
#include <string>
#include <utility>
#include <vector>

namespace palmprep {

  // North-up regular grid. The origin is the upper left corner, rows run
  // from north to south.
  struct GridSpec {
    double origin_x = 0;
    double origin_y = 0;
    double res_x = 1;
    double res_y = 1;
    size_t nx = 0;
    size_t ny = 0;
    ReferenceSystem crs;

    double min_x() const { return origin_x; }
    double max_x() const { return origin_x + nx * res_x; }
    double min_y() const { return origin_y - ny * res_y; }
    double max_y() const { return origin_y; }
    Box extent() const { return Box{min_x(), min_y(), max_x(), max_y()}; }
    Box cell_box(size_t col, size_t row) const {
      return Box{origin_x + col * res_x, origin_y - (row + 1) * res_y,
                 origin_x + (col + 1) * res_x, origin_y - row * res_y};
    }
    arr2d cell_center(size_t col, size_t row) const {
      return {origin_x + (col + 0.5) * res_x, origin_y - (row + 0.5) * res_y};
    }
    size_t cell_count() const { return nx * ny; }

    // Same origin, resolution, dimensions and CRS identifier.
    bool same_grid(const GridSpec& other, double tolerance = 1e-9) const {
      return std::abs(origin_x - other.origin_x) <= tolerance &&
             std::abs(origin_y - other.origin_y) <= tolerance &&
             std::abs(res_x - other.res_x) <= tolerance &&
             std::abs(res_y - other.res_y) <= tolerance && nx == other.nx &&
             ny == other.ny && crs.user_input() == other.crs.user_input();
    }

    static GridSpec from_extent(const Box& extent, double resolution,
                                const ReferenceSystem& crs) {
      GridSpec grid;
      grid.origin_x = extent.pmin[0];
      grid.origin_y = extent.pmax[1];
      grid.res_x = resolution;
      grid.res_y = resolution;
      grid.nx = static_cast<size_t>(std::llround(extent.size_x() / resolution));
      grid.ny = static_cast<size_t>(std::llround(extent.size_y() / resolution));
      grid.crs = crs;
      return grid;
    }
  };

  // Single band raster held in memory, row major.
  struct RasterLayer {
    GridSpec grid;
    std::vector<double> values;
    double nodata = -9999;

    RasterLayer() = default;
    RasterLayer(GridSpec g, double nodataval)
        : grid(std::move(g)),
          values(grid.cell_count(), nodataval),
          nodata(nodataval){};

    double& at(size_t col, size_t row) { return values[row * grid.nx + col]; }
    double at(size_t col, size_t row) const {
      return values[row * grid.nx + col];
    }
    bool is_nodata(double v) const { return std::isnan(v) || v == nodata; }
    bool is_nodata(size_t col, size_t row) const {
      return is_nodata(at(col, row));
    }
    bool all_nodata() const {
      for (auto v : values) {
        if (!is_nodata(v)) return false;
      }
      return true;
    }
  };

  // Rasters keyed by layer name, kept in insertion order.
  typedef std::vector<std::pair<std::string, RasterLayer>> NamedRasters;

}  // namespace palmprep
