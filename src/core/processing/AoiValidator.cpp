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
#include <palmprep/processing/AoiValidator.hpp>
#include <palmprep/processing/GeometryNormalizer.hpp>

namespace palmprep::processing {

  AreaOfInterest validate_aoi(const FeatureSet& layer) {
    if (!layer.crs.is_defined()) {
      throw ValidationError("AOI has no coordinate reference system.");
    }
    if (layer.empty()) {
      throw ValidationError("AOI layer contains no features.");
    }
    AreaOfInterest aoi;
    aoi.crs = layer.crs;
    for (size_t i = 0; i < layer.size(); ++i) {
      const auto& geometry = layer.features[i].geometry;
      if (!geometry.is_polygonal()) {
        throw ValidationError(
            fmt::format("AOI feature {} is a {}, expected Polygon or "
                        "MultiPolygon.",
                        i, to_string(geometry.type)));
      }
      auto flat = drop_z(geometry);
      for (auto& poly : flat.polygons) {
        if (!poly.empty()) aoi.geometry.push_back(std::move(poly));
      }
    }
    if (aoi.geometry.empty() || area(aoi.geometry) <= 0) {
      throw ValidationError("AOI geometry is empty.");
    }
    logger::Logger::get_logger().info(
        "AOI with {} polygon(s) in {}", aoi.geometry.size(),
        aoi.crs.user_input());
    return aoi;
  }

  void require_projected(const ReferenceSystem& crs,
                         misc::projHelperInterface& pjHelper) {
    if (!crs.is_defined() || pjHelper.is_geographic(crs)) {
      throw ValidationError(fmt::format(
          "A projected CRS is required, got {}.", crs.user_input()));
    }
  }

}  // namespace palmprep::processing
