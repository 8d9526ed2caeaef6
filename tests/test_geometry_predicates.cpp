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


#include <palmprep/common/GeometryPredicates.hpp>
#include <set>

#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::testing;

TEST_CASE("Point in polygon") {
  auto square = rect(0, 0, 10, 10);
  CHECK(point_in_ring(square.exterior, 5, 5));
  CHECK(point_in_ring(square.exterior, 0, 5));
  CHECK(point_in_ring(square.exterior, 10, 10));
  CHECK_FALSE(point_in_ring(square.exterior, 11, 5));

  auto holed = square;
  holed.interiors.push_back(rect(4, 4, 6, 6).exterior);
  CHECK_FALSE(point_in_polygon(holed, 5, 5));
  CHECK(point_in_polygon(holed, 2, 2));

  MultiPolygon mp{rect(0, 0, 1, 1), rect(5, 5, 6, 6)};
  CHECK(point_in_multipolygon(mp, 5.5, 5.5));
  CHECK_FALSE(point_in_multipolygon(mp, 3, 3));
}

TEST_CASE("Polygon and box intersection is closed") {
  auto square = rect(0, 0, 10, 10);
  CHECK(polygon_intersects_box(square, Box{2, 2, 3, 3}));
  CHECK(polygon_intersects_box(square, Box{-5, -5, 20, 20}));
  CHECK(polygon_intersects_box(square, Box{10, 0, 20, 10}));
  CHECK_FALSE(polygon_intersects_box(square, Box{10.5, 0, 20, 10}));

  Polygon triangle;
  triangle.exterior = {{0, 0, 0}, {10, 0, 0}, {0, 10, 0}};
  CHECK_FALSE(polygon_intersects_box(triangle, Box{8, 8, 9, 9}));
  CHECK(polygon_intersects_box(triangle, Box{4, 4, 9, 9}));
}

TEST_CASE("Cell windows") {
  auto grid = make_grid(0, 30, 10, 3, 3);
  auto window = cell_window(grid, Box{5, 5, 15, 15});
  REQUIRE(window);
  CHECK(*window == std::array<size_t, 4>{0, 1, 1, 2});
  CHECK_FALSE(cell_window(grid, Box{40, 40, 50, 50}));

  auto clamped = cell_window(grid, Box{-100, -100, 100, 100});
  REQUIRE(clamped);
  CHECK(*clamped == std::array<size_t, 4>{0, 0, 2, 2});
}

TEST_CASE("Touched cells") {
  auto grid = make_grid(0, 30, 10, 3, 3);
  MultiPolygon mp{rect(2, 22, 12, 28)};

  std::set<std::pair<size_t, size_t>> touched;
  for_each_touched_cell(grid, mp, [&](size_t col, size_t row) {
    touched.insert({col, row});
  });

  // (1, 0) is touched although its centre lies outside
  CHECK(touched == std::set<std::pair<size_t, size_t>>{{0, 0}, {1, 0}});
}
