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

#include <algorithm>
#include <array>
#include <cmath>
#include <initializer_list>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace palmprep {

  // Axis aligned 2D box. pmin/pmax hold [x, y].
  template <typename T>
  struct TBox {
    std::array<T, 2> pmin, pmax;
    bool just_cleared;

    TBox() { clear(); };

    TBox(std::initializer_list<T> initList) {
      clear();
      auto it = initList.begin();
      pmin[0] = *it++;
      pmin[1] = *it++;
      pmax[0] = *it++;
      pmax[1] = *it;
      just_cleared = false;
    }

    std::array<T, 2> min() const { return pmin; };
    std::array<T, 2> max() const { return pmax; };
    T size_x() const { return pmax[0] - pmin[0]; };
    T size_y() const { return pmax[1] - pmin[1]; };

    void add(T x, T y) {
      if (just_cleared) {
        pmin = {x, y};
        pmax = {x, y};
        just_cleared = false;
        return;
      }
      pmin[0] = std::min(x, pmin[0]);
      pmin[1] = std::min(y, pmin[1]);
      pmax[0] = std::max(x, pmax[0]);
      pmax[1] = std::max(y, pmax[1]);
    };
    template <typename P>
    void add(const P& p) {
      add(static_cast<T>(p[0]), static_cast<T>(p[1]));
    };
    void add(const TBox& otherBox) {
      if (otherBox.isEmpty()) return;
      add(otherBox.pmin[0], otherBox.pmin[1]);
      add(otherBox.pmax[0], otherBox.pmax[1]);
    };

    std::optional<TBox> intersect(const TBox& otherBox) const {
      TBox result;
      result.pmin[0] = std::max(pmin[0], otherBox.pmin[0]);
      result.pmin[1] = std::max(pmin[1], otherBox.pmin[1]);
      result.pmax[0] = std::min(pmax[0], otherBox.pmax[0]);
      result.pmax[1] = std::min(pmax[1], otherBox.pmax[1]);
      result.just_cleared = false;
      if (result.pmin[0] > result.pmax[0] || result.pmin[1] > result.pmax[1]) {
        return std::nullopt;
      }
      return result;
    };

    // Closed box semantics: boxes that share an edge or a corner intersect.
    bool intersects(const TBox& otherBox) const {
      if (isEmpty() || otherBox.isEmpty()) return false;
      bool intersect_x =
          (pmin[0] <= otherBox.pmax[0]) && (pmax[0] >= otherBox.pmin[0]);
      bool intersect_y =
          (pmin[1] <= otherBox.pmax[1]) && (pmax[1] >= otherBox.pmin[1]);
      return intersect_x && intersect_y;
    };
    bool contains(T x, T y) const {
      return (pmin[0] <= x) && (x <= pmax[0]) && (pmin[1] <= y) &&
             (y <= pmax[1]);
    };

    void clear() {
      pmin.fill(0);
      pmax.fill(0);
      just_cleared = true;
    };
    bool isEmpty() const { return just_cleared; };
    std::array<T, 2> center() const {
      return {(pmax[0] + pmin[0]) / 2, (pmax[1] + pmin[1]) / 2};
    };

    bool operator==(const TBox& other) const {
      return just_cleared == other.just_cleared && pmin == other.pmin &&
             pmax == other.pmax;
    };

    std::string wkt() const {
      if (isEmpty()) return "POLYGON EMPTY";
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(2);
      oss << "POLYGON((";
      oss << pmin[0] << " " << pmin[1] << ", ";
      oss << pmax[0] << " " << pmin[1] << ", ";
      oss << pmax[0] << " " << pmax[1] << ", ";
      oss << pmin[0] << " " << pmax[1] << ", ";
      oss << pmin[0] << " " << pmin[1];
      oss << "))";
      return oss.str();
    }
  };

  typedef TBox<double> Box;
}  // namespace palmprep
