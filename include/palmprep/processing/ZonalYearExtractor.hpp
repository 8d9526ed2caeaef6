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
#include <optional>
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/misc/projHelper.hpp>
#include <string>

namespace palmprep::processing {

  // Largest valid cell value among the cells touching `mp`.
  std::optional<double> zonal_max(const RasterLayer& raster,
                                  const MultiPolygon& mp);

  class ZonalYearExtractor {
    misc::projHelperInterface& pjHelper_;

   public:
    std::string attribute_ = "year_max";

    explicit ZonalYearExtractor(misc::projHelperInterface& pjHelper)
        : pjHelper_(pjHelper){};

    // Sets `attribute_` on every feature, 0 where no valid cell touches it.
    void extract(FeatureSet& buildings, const RasterLayer& years);
  };

}  // namespace palmprep::processing
