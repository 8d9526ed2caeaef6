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

#include <fmt/format.h>
#include <palmprep/logger/logger.h>
#include <palmprep/processing/FeatureEnricher.hpp>

namespace palmprep::processing {

  void assign_ids(FeatureSet& features, const std::string& attribute) {
    int id = 1;
    for (auto& f : features.features) {
      f.attributes.insert(attribute, id++);
    }
  }

  EnrichedFeatures split_bridges(FeatureSet&& features,
                                 const std::string& function_attribute,
                                 const std::string& bridge_code) {
    EnrichedFeatures result;
    result.buildings.crs = features.crs;
    result.bridges.crs = features.crs;
    for (auto& f : features.features) {
      auto code = f.attributes.get_as_string(function_attribute);
      if (code && *code == bridge_code) {
        result.bridges.features.push_back(std::move(f));
      } else {
        result.buildings.features.push_back(std::move(f));
      }
    }
    features.features.clear();
    return result;
  }

  EnrichedFeatures FeatureEnricher::enrich(const FeatureSet& features,
                                           const AreaOfInterest& aoi,
                                           const ReferenceSystem& working_crs) {
    auto& logger = logger::Logger::get_logger();
    if (!features.empty() && !features.has_attribute(cfg_.function_attribute)) {
      throw ValidationError(fmt::format("Missing required columns: {}",
                                        cfg_.function_attribute));
    }

    auto projected = pjHelper_.transform(features, working_crs);
    auto region = pjHelper_.transform(aoi, working_crs);
    auto region_box = region.box();

    FeatureSet clipped;
    clipped.crs = working_crs;
    for (auto& f : projected.features) {
      if (!f.geometry.box().intersects(region_box)) continue;
      if (!ops_.intersects(f.geometry.polygons, region.geometry)) continue;
      auto part = ops_.intersection(f.geometry.polygons, region.geometry);
      if (part.empty() || area(part) <= 0) continue;
      clipped.features.push_back(Feature{
          Geometry::from_multipolygon(std::move(part)), std::move(f.attributes)});
    }
    logger.info("{} of {} features intersect the AOI", clipped.size(),
                projected.size());
    if (clipped.empty()) {
      throw EmptyResultError("No buildings intersect AOI.");
    }

    assign_ids(clipped, cfg_.id_attribute);
    auto result = split_bridges(std::move(clipped), cfg_.function_attribute,
                                cfg_.bridge_code);
    logger.info("Split into {} buildings and {} bridges",
                result.buildings.size(), result.bridges.size());
    return result;
  }

}  // namespace palmprep::processing
