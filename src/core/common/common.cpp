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
#include <cctype>
#include <cmath>
#include <palmprep/common/common.hpp>
#include <palmprep/common/datastructures.hpp>
#include <sstream>

namespace palmprep {

  namespace {
    double ring_signed_area(const Ring& ring) {
      double a = 0;
      const size_t n = ring.size();
      for (size_t i = 0; i < n; ++i) {
        const auto& p = ring[i];
        const auto& q = ring[(i + 1) % n];
        a += p[0] * q[1] - q[0] * p[1];
      }
      return a / 2;
    }
  }  // namespace

  Box Polygon::box() const {
    Box box;
    for (const auto& p : exterior) box.add(p);
    return box;
  }

  double Polygon::area() const {
    double a = std::abs(ring_signed_area(exterior));
    for (const auto& hole : interiors) {
      a -= std::abs(ring_signed_area(hole));
    }
    return a;
  }

  Box compute_box(const MultiPolygon& mp) {
    Box box;
    for (const auto& poly : mp) box.add(poly.box());
    return box;
  }

  double area(const MultiPolygon& mp) {
    double a = 0;
    for (const auto& poly : mp) a += poly.area();
    return a;
  }

  std::string to_string(GeometryType type) {
    switch (type) {
      case GeometryType::Point:
        return "POINT";
      case GeometryType::LineString:
        return "LINESTRING";
      case GeometryType::Polygon:
        return "POLYGON";
      case GeometryType::MultiPoint:
        return "MULTIPOINT";
      case GeometryType::MultiLineString:
        return "MULTILINESTRING";
      case GeometryType::MultiPolygon:
        return "MULTIPOLYGON";
      case GeometryType::MultiSurface:
        return "MULTISURFACE";
      case GeometryType::GeometryCollection:
        return "GEOMETRYCOLLECTION";
      case GeometryType::Triangle:
        return "TRIANGLE";
      case GeometryType::TIN:
        return "TIN";
      case GeometryType::PolyhedralSurface:
        return "POLYHEDRALSURFACE";
      case GeometryType::Unknown:
        break;
    }
    return "UNKNOWN";
  }

  Geometry Geometry::from_multipolygon(MultiPolygon mp) {
    Geometry g;
    g.type = GeometryType::MultiPolygon;
    g.polygons = std::move(mp);
    return g;
  }

  Box Geometry::box() const {
    Box box = compute_box(polygons);
    for (const auto& line : lines) {
      for (const auto& p : line) box.add(p);
    }
    for (const auto& p : points) box.add(p);
    for (const auto& m : members) box.add(m.box());
    return box;
  }

  AttributeRow::amrmap::iterator AttributeRow::begin() {
    return _attributes.begin();
  }
  AttributeRow::amrmap::iterator AttributeRow::end() {
    return _attributes.end();
  }
  AttributeRow::amrmap::const_iterator AttributeRow::begin() const {
    return _attributes.cbegin();
  }
  AttributeRow::amrmap::const_iterator AttributeRow::end() const {
    return _attributes.cend();
  }

  void AttributeRow::set_null(const std::string& name) {
    _attributes[name] = std::monostate();
  }

  bool AttributeRow::is_null(const std::string& name) const {
    auto it = _attributes.find(name);
    return it == _attributes.end() ||
           std::holds_alternative<std::monostate>(it->second);
  }

  bool AttributeRow::has_name(const std::string& name) const {
    return _attributes.find(name) != _attributes.end();
  }

  std::optional<std::string> AttributeRow::get_as_string(
      const std::string& name) const {
    auto it = _attributes.find(name);
    if (it == _attributes.end()) return std::nullopt;
    return std::visit(
        [](const auto& v) -> std::optional<std::string> {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::monostate>) {
            return std::nullopt;
          } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
          } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
          } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
          } else {
            std::ostringstream oss;
            oss << v;
            return oss.str();
          }
        },
        it->second);
  }

  std::optional<double> AttributeRow::get_as_double(
      const std::string& name) const {
    auto it = _attributes.find(name);
    if (it == _attributes.end()) return std::nullopt;
    if (auto v = std::get_if<double>(&it->second)) return *v;
    if (auto v = std::get_if<int>(&it->second)) return double(*v);
    if (auto v = std::get_if<bool>(&it->second)) return *v ? 1. : 0.;
    if (auto v = std::get_if<std::string>(&it->second)) {
      try {
        size_t pos = 0;
        double d = std::stod(*v, &pos);
        if (pos == v->size()) return d;
      } catch (const std::logic_error&) {
        // not numeric
      }
    }
    return std::nullopt;
  }

  bool FeatureSet::has_attribute(const std::string& name) const {
    return std::any_of(
        features.begin(), features.end(),
        [&name](const Feature& f) { return f.attributes.has_name(name); });
  }

  std::vector<std::string> split_string(const std::string& s,
                                        std::string delimiter) {
    std::vector<std::string> parts;
    size_t last = 0;
    size_t next = 0;
    while ((next = s.find(delimiter, last)) != std::string::npos) {
      parts.push_back(s.substr(last, next - last));
      last = next + delimiter.size();
    }
    parts.push_back(s.substr(last));
    return parts;
  }

  std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
  }

}  // namespace palmprep
