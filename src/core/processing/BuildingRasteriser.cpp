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
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <palmprep/common/GeometryPredicates.hpp>
#include <palmprep/logger/logger.h>
#include <palmprep/processing/BuildingRasteriser.hpp>

namespace palmprep::processing {

  namespace {
    void require_columns(const FeatureSet& features, const vec1s& columns) {
      if (features.empty()) return;
      vec1s missing;
      for (const auto& column : columns) {
        if (!features.has_attribute(column)) missing.push_back(column);
      }
      if (!missing.empty()) {
        throw ValidationError(fmt::format("Missing required columns: {}",
                                          fmt::join(missing, ", ")));
      }
    }
  }  // namespace

  RasterLayer rasterise_max(const FeatureSet& features,
                            const std::string& attribute,
                            const GridSpec& grid, double nodata) {
    RasterLayer raster(grid, nodata);
    for (const auto& f : features.features) {
      auto value = f.attributes.get_as_double(attribute);
      if (!value) continue;
      double v = *value;
      for_each_touched_cell(grid, f.geometry.polygons,
                            [&](size_t col, size_t row) {
                              double& cell = raster.at(col, row);
                              if (raster.is_nodata(cell) || v > cell) cell = v;
                            });
    }
    return raster;
  }

  NamedRasters rasterise_buildings(const FeatureSet& buildings,
                                   const FeatureSet& bridges,
                                   const GridSpec& grid,
                                   const RasterisationConfig& cfg) {
    auto& logger = logger::Logger::get_logger();
    require_columns(buildings, {cfg.type_attribute, cfg.id_attribute,
                                cfg.height_attribute});
    require_columns(bridges, {cfg.id_attribute, cfg.height_attribute});

    NamedRasters layers;
    if (!buildings.empty()) {
      layers.emplace_back("building_type",
                          rasterise_max(buildings, cfg.type_attribute, grid,
                                        cfg.nodata));
      layers.emplace_back("building_id", rasterise_max(buildings,
                                                       cfg.id_attribute, grid,
                                                       cfg.nodata));
      layers.emplace_back("building_height",
                          rasterise_max(buildings, cfg.height_attribute, grid,
                                        cfg.nodata));
    }
    if (!bridges.empty()) {
      layers.emplace_back("bridges_id", rasterise_max(bridges, cfg.id_attribute,
                                                      grid, cfg.nodata));
      layers.emplace_back("bridges_height",
                          rasterise_max(bridges, cfg.height_attribute, grid,
                                        cfg.nodata));
    } else {
      logger.info("No bridges to rasterise");
    }
    logger.info("Rasterised {} buildings and {} bridges into {} layers",
                buildings.size(), bridges.size(), layers.size());
    return layers;
  }

}  // namespace palmprep::processing
