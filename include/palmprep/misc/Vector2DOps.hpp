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
#include <optional>
#include <palmprep/common/common.hpp>
#include <palmprep/common/datastructures.hpp>
#include <vector>

namespace palmprep::misc {

  // Planar polygon operations. Results only contain polygonal parts.
  struct Vector2DOpsInterface {
    virtual ~Vector2DOpsInterface() = default;

    virtual bool intersects(const MultiPolygon& a, const MultiPolygon& b) = 0;

    virtual MultiPolygon intersection(const MultiPolygon& a,
                                      const MultiPolygon& b) = 0;

    // Dissolving union, nullopt if the operation failed.
    virtual std::optional<MultiPolygon> union_polygons(
        const MultiPolygon& polygons) = 0;
  };

  std::unique_ptr<Vector2DOpsInterface> createVector2DOpsGEOS();
}  // namespace palmprep::misc
