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
#include <memory>
#include <palmprep/common/common.hpp>
#include <palmprep/common/datastructures.hpp>

namespace palmprep::misc {

  // Coordinate transformation between reference systems. Only x and y are
  // transformed, z is carried along unchanged.
  struct projHelperInterface {
    virtual ~projHelperInterface() = default;

    virtual Geometry transform(const Geometry& geometry,
                               const ReferenceSystem& source,
                               const ReferenceSystem& target) = 0;

    virtual bool is_same(const ReferenceSystem& a,
                         const ReferenceSystem& b) = 0;
    virtual bool is_geographic(const ReferenceSystem& crs) = 0;

    MultiPolygon transform(const MultiPolygon& mp,
                           const ReferenceSystem& source,
                           const ReferenceSystem& target) {
      return transform(Geometry::from_multipolygon(mp), source, target)
          .polygons;
    }

    FeatureSet transform(const FeatureSet& features,
                         const ReferenceSystem& target) {
      if (is_same(features.crs, target)) return features;
      FeatureSet result;
      result.crs = target;
      result.features.reserve(features.size());
      for (const auto& f : features.features) {
        result.features.push_back(
            Feature{transform(f.geometry, features.crs, target), f.attributes});
      }
      return result;
    }

    AreaOfInterest transform(const AreaOfInterest& aoi,
                             const ReferenceSystem& target) {
      if (is_same(aoi.crs, target)) return aoi;
      return AreaOfInterest{transform(aoi.geometry, aoi.crs, target), target};
    }
  };

  std::unique_ptr<projHelperInterface> createProjHelperOGR();
}  // namespace palmprep::misc
