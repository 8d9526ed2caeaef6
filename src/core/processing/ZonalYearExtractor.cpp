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
#include <palmprep/common/GeometryPredicates.hpp>
#include <palmprep/logger/logger.h>
#include <palmprep/processing/ZonalYearExtractor.hpp>

namespace palmprep::processing {

  std::optional<double> zonal_max(const RasterLayer& raster,
                                  const MultiPolygon& mp) {
    std::optional<double> result;
    for_each_touched_cell(raster.grid, mp, [&](size_t col, size_t row) {
      double v = raster.at(col, row);
      if (raster.is_nodata(v)) return;
      result = result ? std::max(*result, v) : v;
    });
    return result;
  }

  void ZonalYearExtractor::extract(FeatureSet& buildings,
                                   const RasterLayer& years) {
    auto& logger = logger::Logger::get_logger();
    bool reproject = !pjHelper_.is_same(buildings.crs, years.grid.crs);
    size_t without_data = 0;
    for (auto& f : buildings.features) {
      auto footprint =
          reproject ? pjHelper_.transform(f.geometry.polygons, buildings.crs,
                                          years.grid.crs)
                    : f.geometry.polygons;
      auto year = zonal_max(years, footprint);
      if (!year) ++without_data;
      f.attributes.insert(attribute_,
                          year ? static_cast<int>(std::lround(*year)) : 0);
    }
    logger.info("Extracted {} for {} buildings, {} without settlement data",
                attribute_, buildings.size(), without_data);
  }

}  // namespace palmprep::processing
