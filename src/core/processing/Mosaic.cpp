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

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <iterator>
#include <palmprep/common/GeometryPredicates.hpp>
#include <palmprep/logger/logger.h>
#include <palmprep/processing/Mosaic.hpp>

namespace palmprep::processing {

  namespace {
    bool nearly_equal(double a, double b) {
      return std::abs(a - b) <= 1e-9 * std::max(std::abs(a), std::abs(b));
    }

    // Cell index of coordinate offset `d`, tolerant to rounding noise.
    long long cell_offset(double d, double res) {
      return std::llround(d / res);
    }
  }  // namespace

  RasterLayer mosaic_rasters(const std::vector<RasterLayer>& tiles) {
    if (tiles.empty()) {
      throw EmptyResultError("No raster tiles to mosaic.");
    }
    const auto& first = tiles.front();
    Box extent;
    for (const auto& tile : tiles) {
      if (!nearly_equal(tile.grid.res_x, first.grid.res_x) ||
          !nearly_equal(tile.grid.res_y, first.grid.res_y)) {
        throw ValidationError(fmt::format(
            "Raster tiles differ in resolution ({} x {} vs {} x {}).",
            tile.grid.res_x, tile.grid.res_y, first.grid.res_x,
            first.grid.res_y));
      }
      if (tile.grid.crs.user_input() != first.grid.crs.user_input()) {
        throw ValidationError("Raster tiles differ in CRS.");
      }
      extent.add(tile.grid.extent());
    }

    GridSpec grid = first.grid;
    grid.origin_x = extent.pmin[0];
    grid.origin_y = extent.pmax[1];
    grid.nx = static_cast<size_t>(cell_offset(extent.size_x(), grid.res_x));
    grid.ny = static_cast<size_t>(cell_offset(extent.size_y(), grid.res_y));
    RasterLayer result(grid, first.nodata);

    for (const auto& tile : tiles) {
      auto col0 = cell_offset(tile.grid.origin_x - grid.origin_x, grid.res_x);
      auto row0 = cell_offset(grid.origin_y - tile.grid.origin_y, grid.res_y);
      for (size_t row = 0; row < tile.grid.ny; ++row) {
        auto r = row0 + static_cast<long long>(row);
        if (r < 0 || r >= static_cast<long long>(grid.ny)) continue;
        for (size_t col = 0; col < tile.grid.nx; ++col) {
          auto c = col0 + static_cast<long long>(col);
          if (c < 0 || c >= static_cast<long long>(grid.nx)) continue;
          double v = tile.at(col, row);
          if (tile.is_nodata(v)) continue;
          double& cell =
              result.at(static_cast<size_t>(c), static_cast<size_t>(r));
          if (result.is_nodata(cell)) cell = v;
        }
      }
    }
    return result;
  }

  RasterLayer crop_to_box(const RasterLayer& raster, const Box& box) {
    const auto& g = raster.grid;
    if (box.isEmpty() || !g.extent().intersects(box)) {
      throw EmptyResultError("Crop extent does not overlap the raster.");
    }
    const double eps = 1e-9;
    auto first = [&](double d, double res, size_t n) -> size_t {
      double k = std::floor(d / res + eps);
      if (k < 0) return 0;
      return std::min(static_cast<size_t>(k), n - 1);
    };
    auto last = [&](double d, double res, size_t n) -> size_t {
      double k = std::ceil(d / res - eps) - 1;
      if (k < 0) return 0;
      return std::min(static_cast<size_t>(k), n - 1);
    };
    size_t c0 = first(box.pmin[0] - g.origin_x, g.res_x, g.nx);
    size_t c1 = last(box.pmax[0] - g.origin_x, g.res_x, g.nx);
    size_t r0 = first(g.origin_y - box.pmax[1], g.res_y, g.ny);
    size_t r1 = last(g.origin_y - box.pmin[1], g.res_y, g.ny);
    c1 = std::max(c0, c1);
    r1 = std::max(r0, r1);

    GridSpec cropped = g;
    cropped.origin_x = g.origin_x + c0 * g.res_x;
    cropped.origin_y = g.origin_y - r0 * g.res_y;
    cropped.nx = c1 - c0 + 1;
    cropped.ny = r1 - r0 + 1;
    RasterLayer result(cropped, raster.nodata);
    for (size_t row = 0; row < cropped.ny; ++row) {
      for (size_t col = 0; col < cropped.nx; ++col) {
        result.at(col, row) = raster.at(c0 + col, r0 + row);
      }
    }
    return result;
  }

  void mask_outside(RasterLayer& raster, const MultiPolygon& mp) {
    std::vector<bool> inside(raster.grid.cell_count(), false);
    for_each_touched_cell(raster.grid, mp, [&](size_t col, size_t row) {
      inside[row * raster.grid.nx + col] = true;
    });
    for (size_t i = 0; i < inside.size(); ++i) {
      if (!inside[i]) raster.values[i] = raster.nodata;
    }
  }

  RasterLayer mosaic_and_clip(const std::vector<RasterLayer>& tiles,
                              const MultiPolygon& aoi) {
    auto& logger = logger::Logger::get_logger();
    auto merged = mosaic_rasters(tiles);
    logger.debug("Mosaic of {} tiles has {} x {} cells", tiles.size(),
                 merged.grid.nx, merged.grid.ny);
    auto clipped = crop_to_box(merged, compute_box(aoi));
    mask_outside(clipped, aoi);
    if (clipped.all_nodata()) {
      throw EmptyResultError(
          "Raster mosaic contains only nodata inside the AOI.");
    }
    return clipped;
  }

  FeatureSet merge_feature_sets(std::vector<FeatureSet>&& sets) {
    FeatureSet merged;
    if (sets.empty()) return merged;
    merged.crs = sets.front().crs;
    size_t total = 0;
    for (const auto& set : sets) {
      if (set.crs.user_input() != merged.crs.user_input()) {
        throw ValidationError(fmt::format(
            "Cannot merge feature sets in {} and {}.",
            merged.crs.user_input(), set.crs.user_input()));
      }
      total += set.size();
    }
    merged.features.reserve(total);
    for (auto& set : sets) {
      std::move(set.features.begin(), set.features.end(),
                std::back_inserter(merged.features));
    }
    sets.clear();
    return merged;
  }

}  // namespace palmprep::processing
