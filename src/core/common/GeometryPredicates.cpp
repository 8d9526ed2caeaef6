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

#include <algorithm>
#include <cmath>
#include <palmprep/common/GeometryPredicates.hpp>

namespace palmprep {

  namespace {
    double orient(const arr2d& a, const arr2d& b, const arr2d& c) {
      return (b[0] - a[0]) * (c[1] - a[1]) - (b[1] - a[1]) * (c[0] - a[0]);
    }

    bool on_segment(const arr2d& a, const arr2d& b, const arr2d& p) {
      return std::min(a[0], b[0]) <= p[0] && p[0] <= std::max(a[0], b[0]) &&
             std::min(a[1], b[1]) <= p[1] && p[1] <= std::max(a[1], b[1]);
    }

    bool point_on_ring_boundary(const Ring& ring, double x, double y) {
      const size_t n = ring.size();
      arr2d p{x, y};
      for (size_t i = 0; i < n; ++i) {
        arr2d a{ring[i][0], ring[i][1]};
        arr2d b{ring[(i + 1) % n][0], ring[(i + 1) % n][1]};
        if (orient(a, b, p) == 0 && on_segment(a, b, p)) return true;
      }
      return false;
    }

    bool ring_intersects_box_edges(const Ring& ring, const Box& box) {
      const arr2d c0{box.pmin[0], box.pmin[1]};
      const arr2d c1{box.pmax[0], box.pmin[1]};
      const arr2d c2{box.pmax[0], box.pmax[1]};
      const arr2d c3{box.pmin[0], box.pmax[1]};
      const std::array<std::array<arr2d, 2>, 4> edges{
          {{c0, c1}, {c1, c2}, {c2, c3}, {c3, c0}}};
      const size_t n = ring.size();
      for (size_t i = 0; i < n; ++i) {
        arr2d a{ring[i][0], ring[i][1]};
        arr2d b{ring[(i + 1) % n][0], ring[(i + 1) % n][1]};
        for (const auto& e : edges) {
          if (segments_intersect(a, b, e[0], e[1])) return true;
        }
      }
      return false;
    }
  }  // namespace

  bool point_in_ring(const Ring& ring, double x, double y) {
    if (ring.size() < 3) return false;
    if (point_on_ring_boundary(ring, x, y)) return true;
    bool inside = false;
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
      const auto& pi = ring[i];
      const auto& pj = ring[j];
      if (((pi[1] > y) != (pj[1] > y)) &&
          (x < (pj[0] - pi[0]) * (y - pi[1]) / (pj[1] - pi[1]) + pi[0])) {
        inside = !inside;
      }
    }
    return inside;
  }

  bool point_in_polygon(const Polygon& polygon, double x, double y) {
    if (!point_in_ring(polygon.exterior, x, y)) return false;
    for (const auto& hole : polygon.interiors) {
      // the hole boundary still belongs to the polygon
      if (point_in_ring(hole, x, y) && !point_on_ring_boundary(hole, x, y))
        return false;
    }
    return true;
  }

  bool point_in_multipolygon(const MultiPolygon& mp, double x, double y) {
    for (const auto& poly : mp) {
      if (point_in_polygon(poly, x, y)) return true;
    }
    return false;
  }

  bool segments_intersect(const arr2d& p1, const arr2d& p2, const arr2d& q1,
                          const arr2d& q2) {
    double d1 = orient(q1, q2, p1);
    double d2 = orient(q1, q2, p2);
    double d3 = orient(p1, p2, q1);
    double d4 = orient(p1, p2, q2);
    if (((d1 > 0 && d2 < 0) || (d1 < 0 && d2 > 0)) &&
        ((d3 > 0 && d4 < 0) || (d3 < 0 && d4 > 0)))
      return true;
    if (d1 == 0 && on_segment(q1, q2, p1)) return true;
    if (d2 == 0 && on_segment(q1, q2, p2)) return true;
    if (d3 == 0 && on_segment(p1, p2, q1)) return true;
    if (d4 == 0 && on_segment(p1, p2, q2)) return true;
    return false;
  }

  bool polygon_intersects_box(const Polygon& polygon, const Box& box) {
    if (polygon.empty() || box.isEmpty()) return false;
    if (!polygon.box().intersects(box)) return false;

    // a polygon vertex inside the box
    for (const auto& p : polygon.exterior) {
      if (box.contains(p[0], p[1])) return true;
    }
    // a box corner inside the polygon, this covers a box inside the polygon
    // but not inside one of its holes
    const std::array<arr2d, 4> corners{{{box.pmin[0], box.pmin[1]},
                                        {box.pmax[0], box.pmin[1]},
                                        {box.pmax[0], box.pmax[1]},
                                        {box.pmin[0], box.pmax[1]}}};
    for (const auto& c : corners) {
      if (point_in_polygon(polygon, c[0], c[1])) return true;
    }
    // crossing edges
    if (ring_intersects_box_edges(polygon.exterior, box)) return true;
    for (const auto& hole : polygon.interiors) {
      if (ring_intersects_box_edges(hole, box)) return true;
    }
    return false;
  }

  bool multipolygon_intersects_box(const MultiPolygon& mp, const Box& box) {
    for (const auto& poly : mp) {
      if (polygon_intersects_box(poly, box)) return true;
    }
    return false;
  }

  std::optional<std::array<size_t, 4>> cell_window(const GridSpec& grid,
                                                   const Box& box) {
    if (box.isEmpty() || grid.nx == 0 || grid.ny == 0) return std::nullopt;
    if (!grid.extent().intersects(box)) return std::nullopt;
    auto clamp_index = [](double v, size_t n) -> size_t {
      if (v < 0) return 0;
      if (v > double(n - 1)) return n - 1;
      return static_cast<size_t>(v);
    };
    double c0 = std::floor((box.pmin[0] - grid.origin_x) / grid.res_x);
    double c1 = std::floor((box.pmax[0] - grid.origin_x) / grid.res_x);
    double r0 = std::floor((grid.origin_y - box.pmax[1]) / grid.res_y);
    double r1 = std::floor((grid.origin_y - box.pmin[1]) / grid.res_y);
    return std::array<size_t, 4>{clamp_index(c0, grid.nx),
                                 clamp_index(r0, grid.ny),
                                 clamp_index(c1, grid.nx),
                                 clamp_index(r1, grid.ny)};
  }

  void for_each_touched_cell(const GridSpec& grid, const MultiPolygon& mp,
                             const CellVisitor& visit) {
    for (const auto& poly : mp) {
      auto window = cell_window(grid, poly.box());
      if (!window) continue;
      auto [c0, r0, c1, r1] = *window;
      for (size_t row = r0; row <= r1; ++row) {
        for (size_t col = c0; col <= c1; ++col) {
          if (polygon_intersects_box(poly, grid.cell_box(col, row))) {
            visit(col, row);
          }
        }
      }
    }
  }

}  // namespace palmprep
