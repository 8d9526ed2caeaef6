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
#include <palmprep/logger/logger.h>
#include <palmprep/processing/LandCoverReclassifier.hpp>
#include <unordered_map>

namespace palmprep::processing {

  const std::vector<ReclassTable>& palm_surface_tables() {
    static const std::vector<ReclassTable> tables = {
        {"vegetation_type",
         {{4, 3}, {5, 1}, {8, 1}, {9, 16}, {10, 17}, {11, 7}}},
        {"water_type", {{2, 1}}},
        {"pavement_type", {{12, 1}, {6, 13}}},
    };
    return tables;
  }

  RasterLayer reclassify(const RasterLayer& raster, const ReclassTable& table,
                         double nodata_out) {
    std::unordered_map<long long, int> lookup(table.mapping.begin(),
                                              table.mapping.end());
    RasterLayer result(raster.grid, nodata_out);
    for (size_t i = 0; i < raster.values.size(); ++i) {
      double v = raster.values[i];
      if (raster.is_nodata(v)) continue;
      auto it = lookup.find(std::llround(v));
      if (it != lookup.end()) result.values[i] = it->second;
    }
    return result;
  }

  NamedRasters reclassify_landcover(const RasterLayer& landcover,
                                    double nodata_out) {
    auto& logger = logger::Logger::get_logger();
    NamedRasters layers;
    for (const auto& table : palm_surface_tables()) {
      layers.emplace_back(table.name,
                          reclassify(landcover, table, nodata_out));
      logger.debug("Reclassified land cover into {}", table.name);
    }
    return layers;
  }

}  // namespace palmprep::processing
