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

#include <cmath>
#include <fmt/format.h>
#include <palmprep/logger/logger.h>
#include <palmprep/processing/GridAligner.hpp>
#include <palmprep/processing/Mosaic.hpp>

namespace palmprep::processing {

  namespace {
    // x / res, with values within rounding noise of an integer taken as that
    // integer so that snapping is idempotent.
    double grid_units(double x, double res) {
      double k = x / res;
      double nearest = std::round(k);
      if (std::abs(k - nearest) < 1e-9) return nearest;
      return k;
    }
  }  // namespace

  Box snap_extent(const Box& extent, double resolution) {
    if (!(resolution > 0)) {
      throw ValidationError(
          fmt::format("Resolution must be positive, got {}.", resolution));
    }
    return Box{std::floor(grid_units(extent.pmin[0], resolution)) * resolution,
               std::floor(grid_units(extent.pmin[1], resolution)) * resolution,
               std::ceil(grid_units(extent.pmax[0], resolution)) * resolution,
               std::ceil(grid_units(extent.pmax[1], resolution)) * resolution};
  }

  misc::ResamplingKernel select_kernel(const std::string& layer_name,
                                       const vec1s& categorical_markers) {
    auto name = to_lower(layer_name);
    for (const auto& marker : categorical_markers) {
      if (!marker.empty() && name.find(to_lower(marker)) != std::string::npos)
        return misc::ResamplingKernel::Nearest;
    }
    return misc::ResamplingKernel::Bilinear;
  }

  GridSpec GridAligner::reference_grid(const AreaOfInterest& aoi,
                                       const AlignmentConfig& cfg) {
    auto region = pjHelper_.transform(aoi, cfg.target_crs);
    auto extent = snap_extent(region.box(), cfg.resolution);
    return GridSpec::from_extent(extent, cfg.resolution, cfg.target_crs);
  }

  AlignedRasters GridAligner::align(const NamedRasters& layers,
                                    const AreaOfInterest& aoi,
                                    const AlignmentConfig& cfg) {
    auto& logger = logger::Logger::get_logger();
    auto region = pjHelper_.transform(aoi, cfg.target_crs);

    AlignedRasters result;
    result.grid = reference_grid(aoi, cfg);
    logger.info("Reference grid {} x {} cells at {} m, origin ({}, {})",
                result.grid.nx, result.grid.ny, cfg.resolution,
                result.grid.origin_x, result.grid.origin_y);

    for (const auto& [name, raster] : layers) {
      auto kernel = select_kernel(name, cfg.categorical_markers);
      logger.info("Aligning layer {} with {} resampling", name,
                  misc::to_string(kernel));
      auto warped = warper_.warp(raster, result.grid, kernel);
      auto aligned = crop_to_box(warped, region.box());
      mask_outside(aligned, region.geometry);
      if (!aligned.grid.same_grid(result.grid)) {
        throw palmprepException(fmt::format(
            "Layer {} does not match the reference grid after alignment.",
            name));
      }
      if (aligned.all_nodata()) {
        logger.warning("Layer {} has no data inside the AOI", name);
      }
      result.layers.emplace_back(name, std::move(aligned));
    }
    return result;
  }

}  // namespace palmprep::processing
