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

#include <array>
#include <functional>
#include <optional>
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/common.hpp>

namespace palmprep {

  // Even-odd test against a single ring, points on the boundary count as
  // inside.
  bool point_in_ring(const Ring& ring, double x, double y);
  bool point_in_polygon(const Polygon& polygon, double x, double y);
  bool point_in_multipolygon(const MultiPolygon& mp, double x, double y);

  bool segments_intersect(const arr2d& p1, const arr2d& p2, const arr2d& q1,
                          const arr2d& q2);

  // Closed intersection test between a polygon and an axis aligned
  // rectangle. Touching boundaries count as intersecting.
  bool polygon_intersects_box(const Polygon& polygon, const Box& box);
  bool multipolygon_intersects_box(const MultiPolygon& mp, const Box& box);

  // Inclusive cell index window {col_min, row_min, col_max, row_max} of the
  // cells of `grid` overlapping `box`. nullopt if the box misses the grid.
  std::optional<std::array<size_t, 4>> cell_window(const GridSpec& grid,
                                                   const Box& box);

  using CellVisitor = std::function<void(size_t col, size_t row)>;

  // Visits every cell whose area intersects `mp` (touches semantics). A cell
  // is visited once per polygon of `mp` it intersects.
  void for_each_touched_cell(const GridSpec& grid, const MultiPolygon& mp,
                             const CellVisitor& visit);

}  // namespace palmprep
