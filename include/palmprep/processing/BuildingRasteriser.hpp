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
#include <string>

namespace palmprep::processing {

  struct RasterisationConfig {
    std::string type_attribute = "palm_type";
    std::string id_attribute = "ID";
    std::string height_attribute = "measuredHeight";
    double nodata = -9999;
  };

  // Burns `attribute` onto `grid`. Every cell touching a footprint receives
  // the largest value among the features touching it. Null values are
  // skipped.
  RasterLayer rasterise_max(const FeatureSet& features,
                            const std::string& attribute,
                            const GridSpec& grid, double nodata);

  // building_type, building_id and building_height from the buildings,
  // bridges_id and bridges_height from the bridges. Throws ValidationError
  // listing the missing columns.
  NamedRasters rasterise_buildings(const FeatureSet& buildings,
                                   const FeatureSet& bridges,
                                   const GridSpec& grid,
                                   const RasterisationConfig& cfg = {});

}  // namespace palmprep::processing
