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
#include <palmprep/common/datastructures.hpp>
#include <palmprep/misc/Vector2DOps.hpp>
#include <palmprep/misc/projHelper.hpp>
#include <string>

namespace palmprep::processing {

  struct EnricherConfig {
    std::string function_attribute = "function";
    std::string bridge_code = "53001_1800";
    std::string id_attribute = "ID";
  };

  struct EnrichedFeatures {
    FeatureSet buildings;
    FeatureSet bridges;
  };

  // Writes 1..N into `attribute` following the iteration order.
  void assign_ids(FeatureSet& features, const std::string& attribute);

  // Features whose function code equals `bridge_code` go to bridges, the
  // rest, null codes included, to buildings. Order is kept within each part.
  EnrichedFeatures split_bridges(FeatureSet&& features,
                                 const std::string& function_attribute,
                                 const std::string& bridge_code);

  class FeatureEnricher {
    misc::Vector2DOpsInterface& ops_;
    misc::projHelperInterface& pjHelper_;
    EnricherConfig cfg_;

   public:
    FeatureEnricher(misc::Vector2DOpsInterface& ops,
                    misc::projHelperInterface& pjHelper,
                    EnricherConfig cfg = {})
        : ops_(ops), pjHelper_(pjHelper), cfg_(std::move(cfg)){};

    // Clips to the AOI in `working_crs`, numbers the survivors and splits off
    // the bridges. Throws EmptyResultError if no feature intersects the AOI.
    EnrichedFeatures enrich(const FeatureSet& features,
                            const AreaOfInterest& aoi,
                            const ReferenceSystem& working_crs);
  };

}  // namespace palmprep::processing
