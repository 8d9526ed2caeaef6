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
#include <string>
#include <utility>
#include <vector>

namespace palmprep::processing {

  struct ReclassTable {
    std::string name;
    std::vector<std::pair<int, int>> mapping;
  };

  // Land cover classes to PALM vegetation, water and pavement types.
  const std::vector<ReclassTable>& palm_surface_tables();

  // Values without a mapping, nodata included, become `nodata_out`.
  RasterLayer reclassify(const RasterLayer& raster, const ReclassTable& table,
                         double nodata_out = 255);

  NamedRasters reclassify_landcover(const RasterLayer& landcover,
                                    double nodata_out = 255);

}  // namespace palmprep::processing
