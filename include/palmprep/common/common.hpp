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
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "box.hpp"

namespace palmprep {

  typedef std::array<double, 2> arr2d;
  typedef std::array<double, 3> arr3d;

  typedef std::vector<int> vec1i;
  typedef std::vector<size_t> vec1ui;
  typedef std::vector<std::string> vec1s;

  typedef std::unordered_map<std::string, std::string> StrMap;

  // Vertex ring without a repeated closing vertex.
  typedef std::vector<arr3d> Ring;

  struct Polygon {
    Ring exterior;
    std::vector<Ring> interiors;

    Box box() const;
    // Planar area of the exterior minus the interiors, ignores z.
    double area() const;
    bool empty() const { return exterior.size() < 3; }
  };
  typedef std::vector<Polygon> MultiPolygon;

  Box compute_box(const MultiPolygon& mp);
  double area(const MultiPolygon& mp);

  // Geometry type tags as reported by the vector source.
  enum class GeometryType {
    Unknown = 0,
    Point,
    LineString,
    Polygon,
    MultiPoint,
    MultiLineString,
    MultiPolygon,
    MultiSurface,
    GeometryCollection,
    Triangle,
    TIN,
    PolyhedralSurface
  };

  std::string to_string(GeometryType type);

  // Generic geometry container able to hold the exotic inputs found in
  // CityGML derived layers. Polygonal content (polygon, multipolygon
  // components, surface patches, triangles) lives in `polygons`, linear content
  // in `lines`, point content in `points` and collection members in
  // `members`.
  struct Geometry {
    GeometryType type = GeometryType::Unknown;
    bool has_z = false;
    MultiPolygon polygons;
    std::vector<Ring> lines;
    std::vector<arr3d> points;
    std::vector<Geometry> members;

    static Geometry from_multipolygon(MultiPolygon mp);
    bool is_polygonal() const {
      return type == GeometryType::Polygon ||
             type == GeometryType::MultiPolygon;
    }
    Box box() const;
  };

  // Attribute values. std::monostate marks a null value.
  typedef std::variant<std::monostate, bool, int, double, std::string>
      AttributeValue;

  class AttributeRow {
    using amrmap = std::unordered_map<std::string, AttributeValue>;
    amrmap _attributes;

   public:
    AttributeRow(){};

    amrmap::iterator begin();
    amrmap::iterator end();
    amrmap::const_iterator begin() const;
    amrmap::const_iterator end() const;

    template <typename T>
    void insert(const std::string& name, T value) {
      _attributes[name] = value;
    };
    template <typename T>
    void insert_optional(const std::string& name, std::optional<T> opt) {
      if (opt.has_value())
        _attributes[name] = opt.value();
      else
        _attributes[name] = std::monostate();
    };

    void set_null(const std::string& name);
    bool is_null(const std::string& name) const;
    bool has_name(const std::string& name) const;
    size_t size() const { return _attributes.size(); }

    template <typename T>
    bool holds_alternative(const std::string& name) const {
      auto it = _attributes.find(name);
      return it != _attributes.end() && std::holds_alternative<T>(it->second);
    };
    template <typename T>
    const T* get_if(const std::string& name) const {
      auto it = _attributes.find(name);
      if (it == _attributes.end()) return nullptr;
      return std::get_if<T>(&it->second);
    };

    // Text representation of the value, nullopt when missing or null.
    std::optional<std::string> get_as_string(const std::string& name) const;
    // Numeric representation of the value, nullopt when missing, null or
    // not convertible.
    std::optional<double> get_as_double(const std::string& name) const;
  };

  struct Feature {
    Geometry geometry;
    AttributeRow attributes;
  };

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter);
  std::string to_lower(std::string s);

}  // namespace palmprep
