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
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/datastructures.hpp>
#include <vector>

namespace palmprep::processing {

  // Merges same CRS, same resolution tiles into one raster spanning their
  // union. Each cell takes the first non-nodata value in tile order.
  RasterLayer mosaic_rasters(const std::vector<RasterLayer>& tiles);

  // Smallest sub-grid whose cells cover `box`. Throws EmptyResultError if the
  // box misses the raster.
  RasterLayer crop_to_box(const RasterLayer& raster, const Box& box);

  // Sets every cell that `mp` does not touch to nodata. A cell counts as
  // touched when it intersects `mp` anywhere, its boundary included.
  void mask_outside(RasterLayer& raster, const MultiPolygon& mp);

  // mosaic_rasters, crop_to_box and mask_outside in sequence. `aoi` must be
  // in the tile CRS. Throws EmptyResultError if nothing but nodata is left.
  RasterLayer mosaic_and_clip(const std::vector<RasterLayer>& tiles,
                              const MultiPolygon& aoi);

  // Concatenates the tile feature sets once, in tile order. All sets must
  // share one CRS.
  FeatureSet merge_feature_sets(std::vector<FeatureSet>&& sets);

}  // namespace palmprep::processing
