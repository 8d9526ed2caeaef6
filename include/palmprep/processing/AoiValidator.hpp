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
#include <palmprep/misc/projHelper.hpp>

namespace palmprep::processing {

  // Dissolves the AOI layer into one polygonal area. Throws ValidationError
  // for empty layers, non polygonal geometry or an undefined CRS.
  AreaOfInterest validate_aoi(const FeatureSet& layer);

  // Throws ValidationError if `crs` is geographic.
  void require_projected(const ReferenceSystem& crs,
                         misc::projHelperInterface& pjHelper);

}  // namespace palmprep::processing
