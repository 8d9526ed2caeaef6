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

#include <ogr_geometry.h>
#include <ogr_spatialref.h>
#include <palmprep/common/datastructures.hpp>

namespace palmprep::io::ogr {

  // Curves are linearised, the original type tag is kept.
  Geometry from_ogr(const OGRGeometry* geometry);

  // nullptr for geometries of unknown type.
  OGRGeometryUniquePtr to_ogr(const Geometry& geometry);

  ReferenceSystem to_reference_system(const OGRSpatialReference* srs);

  // Axis order is always x = easting/longitude, y = northing/latitude.
  OGRSpatialReference to_ogr_srs(const ReferenceSystem& crs);

}  // namespace palmprep::io::ogr
