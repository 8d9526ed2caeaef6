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
#include <palmprep/misc/RasterWarper.hpp>
#include <palmprep/misc/projHelper.hpp>
#include <string>

namespace palmprep::processing {

  struct AlignmentConfig {
    ReferenceSystem target_crs = ReferenceSystem::epsg(25832);
    double resolution = 10;
    // Layers whose name contains one of these (case insensitive) are
    // categorical and resampled with nearest neighbour.
    vec1s categorical_markers = {"LC", "WSF"};
  };

  struct AlignedRasters {
    GridSpec grid;
    NamedRasters layers;
  };

  // Expands `extent` outward to multiples of `resolution`.
  Box snap_extent(const Box& extent, double resolution);

  misc::ResamplingKernel select_kernel(const std::string& layer_name,
                                       const vec1s& categorical_markers);

  class GridAligner {
    misc::RasterWarperInterface& warper_;
    misc::projHelperInterface& pjHelper_;

   public:
    GridAligner(misc::RasterWarperInterface& warper,
                misc::projHelperInterface& pjHelper)
        : warper_(warper), pjHelper_(pjHelper){};

    // Pixel aligned grid covering the AOI in the target CRS.
    GridSpec reference_grid(const AreaOfInterest& aoi,
                            const AlignmentConfig& cfg);

    // Every output layer shares the returned grid exactly.
    AlignedRasters align(const NamedRasters& layers, const AreaOfInterest& aoi,
                         const AlignmentConfig& cfg);
  };

}  // namespace palmprep::processing
