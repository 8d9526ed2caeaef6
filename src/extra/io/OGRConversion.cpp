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

#include "OGRConversion.hpp"

#include <cpl_conv.h>
#include <fmt/format.h>

namespace palmprep::io::ogr {

  namespace {
    GeometryType map_type(OGRwkbGeometryType type) {
      switch (wkbFlatten(type)) {
        case wkbPoint:
          return GeometryType::Point;
        case wkbLineString:
        case wkbCircularString:
        case wkbCompoundCurve:
          return GeometryType::LineString;
        case wkbPolygon:
        case wkbCurvePolygon:
          return GeometryType::Polygon;
        case wkbMultiPoint:
          return GeometryType::MultiPoint;
        case wkbMultiLineString:
        case wkbMultiCurve:
          return GeometryType::MultiLineString;
        case wkbMultiPolygon:
          return GeometryType::MultiPolygon;
        case wkbMultiSurface:
          return GeometryType::MultiSurface;
        case wkbGeometryCollection:
          return GeometryType::GeometryCollection;
        case wkbTriangle:
          return GeometryType::Triangle;
        case wkbTIN:
          return GeometryType::TIN;
        case wkbPolyhedralSurface:
          return GeometryType::PolyhedralSurface;
        default:
          return GeometryType::Unknown;
      }
    }

    Ring ring_from_ogr(const OGRSimpleCurve* curve) {
      Ring ring;
      int n = curve->getNumPoints();
      // OGR rings repeat the first vertex at the end.
      if (n > 1 && curve->getX(0) == curve->getX(n - 1) &&
          curve->getY(0) == curve->getY(n - 1)) {
        --n;
      }
      ring.reserve(n);
      for (int i = 0; i < n; ++i) {
        ring.push_back({curve->getX(i), curve->getY(i), curve->getZ(i)});
      }
      return ring;
    }

    Ring line_from_ogr(const OGRSimpleCurve* curve) {
      Ring line;
      line.reserve(curve->getNumPoints());
      for (int i = 0; i < curve->getNumPoints(); ++i) {
        line.push_back({curve->getX(i), curve->getY(i), curve->getZ(i)});
      }
      return line;
    }

    Polygon polygon_from_ogr(const OGRPolygon* ogr_polygon) {
      Polygon polygon;
      if (auto* exterior = ogr_polygon->getExteriorRing()) {
        polygon.exterior = ring_from_ogr(exterior);
      }
      for (int i = 0; i < ogr_polygon->getNumInteriorRings(); ++i) {
        polygon.interiors.push_back(
            ring_from_ogr(ogr_polygon->getInteriorRing(i)));
      }
      return polygon;
    }

    // `geometry` is linear here.
    void fill(const OGRGeometry* geometry, Geometry& g) {
      switch (wkbFlatten(geometry->getGeometryType())) {
        case wkbPoint: {
          auto* p = geometry->toPoint();
          if (!p->IsEmpty()) g.points.push_back({p->getX(), p->getY(), p->getZ()});
          break;
        }
        case wkbLineString:
          g.lines.push_back(line_from_ogr(geometry->toLineString()));
          break;
        case wkbPolygon:
        case wkbTriangle:
          if (!geometry->IsEmpty())
            g.polygons.push_back(polygon_from_ogr(geometry->toPolygon()));
          break;
        case wkbMultiPoint:
        case wkbMultiLineString:
        case wkbMultiPolygon:
        case wkbMultiSurface:
        case wkbMultiCurve: {
          auto* collection = geometry->toGeometryCollection();
          for (int i = 0; i < collection->getNumGeometries(); ++i) {
            fill(collection->getGeometryRef(i), g);
          }
          break;
        }
        case wkbTIN:
        case wkbPolyhedralSurface: {
          auto* surface = geometry->toPolyhedralSurface();
          for (int i = 0; i < surface->getNumGeometries(); ++i) {
            fill(surface->getGeometryRef(i), g);
          }
          break;
        }
        case wkbGeometryCollection: {
          auto* collection = geometry->toGeometryCollection();
          for (int i = 0; i < collection->getNumGeometries(); ++i) {
            g.members.push_back(from_ogr(collection->getGeometryRef(i)));
          }
          break;
        }
        default:
          break;
      }
    }

    OGRLinearRing* ring_to_ogr(const Ring& ring, bool has_z) {
      auto* ogr_ring = new OGRLinearRing();
      for (const auto& p : ring) {
        if (has_z)
          ogr_ring->addPoint(p[0], p[1], p[2]);
        else
          ogr_ring->addPoint(p[0], p[1]);
      }
      ogr_ring->closeRings();
      return ogr_ring;
    }

    template <typename T>
    T* polygon_to_ogr(const Polygon& polygon, bool has_z) {
      auto* ogr_polygon = new T();
      ogr_polygon->addRingDirectly(ring_to_ogr(polygon.exterior, has_z));
      for (const auto& hole : polygon.interiors) {
        ogr_polygon->addRingDirectly(ring_to_ogr(hole, has_z));
      }
      return ogr_polygon;
    }

    OGRLineString* line_to_ogr(const Ring& line, bool has_z) {
      auto* ogr_line = new OGRLineString();
      for (const auto& p : line) {
        if (has_z)
          ogr_line->addPoint(p[0], p[1], p[2]);
        else
          ogr_line->addPoint(p[0], p[1]);
      }
      return ogr_line;
    }

    OGRPoint* point_to_ogr(const arr3d& p, bool has_z) {
      return has_z ? new OGRPoint(p[0], p[1], p[2]) : new OGRPoint(p[0], p[1]);
    }

    template <typename Collection, typename Part>
    OGRGeometryUniquePtr polygons_to_ogr(const MultiPolygon& polygons,
                                         bool has_z) {
      auto collection = std::make_unique<Collection>();
      for (const auto& polygon : polygons) {
        collection->addGeometryDirectly(polygon_to_ogr<Part>(polygon, has_z));
      }
      return OGRGeometryUniquePtr(collection.release());
    }
  }  // namespace

  Geometry from_ogr(const OGRGeometry* geometry) {
    Geometry g;
    if (!geometry) return g;
    g.type = map_type(geometry->getGeometryType());
    g.has_z = geometry->Is3D();
    auto flat_type = wkbFlatten(geometry->getGeometryType());
    if (OGR_GT_IsNonLinear(flat_type) || geometry->hasCurveGeometry()) {
      OGRGeometryUniquePtr linear(geometry->getLinearGeometry());
      if (linear) fill(linear.get(), g);
    } else {
      fill(geometry, g);
    }
    return g;
  }

  OGRGeometryUniquePtr to_ogr(const Geometry& g) {
    switch (g.type) {
      case GeometryType::Point:
        if (g.points.empty()) return OGRGeometryUniquePtr(new OGRPoint());
        return OGRGeometryUniquePtr(point_to_ogr(g.points.front(), g.has_z));
      case GeometryType::LineString:
        if (g.lines.empty()) return OGRGeometryUniquePtr(new OGRLineString());
        return OGRGeometryUniquePtr(line_to_ogr(g.lines.front(), g.has_z));
      case GeometryType::Polygon:
        if (g.polygons.empty()) return OGRGeometryUniquePtr(new OGRPolygon());
        return OGRGeometryUniquePtr(
            polygon_to_ogr<OGRPolygon>(g.polygons.front(), g.has_z));
      case GeometryType::Triangle:
        if (g.polygons.empty()) return OGRGeometryUniquePtr(new OGRTriangle());
        return OGRGeometryUniquePtr(
            polygon_to_ogr<OGRTriangle>(g.polygons.front(), g.has_z));
      case GeometryType::MultiPolygon:
        return polygons_to_ogr<OGRMultiPolygon, OGRPolygon>(g.polygons,
                                                            g.has_z);
      case GeometryType::MultiSurface:
        return polygons_to_ogr<OGRMultiSurface, OGRPolygon>(g.polygons,
                                                            g.has_z);
      case GeometryType::PolyhedralSurface:
        return polygons_to_ogr<OGRPolyhedralSurface, OGRPolygon>(g.polygons,
                                                                 g.has_z);
      case GeometryType::TIN:
        return polygons_to_ogr<OGRTriangulatedSurface, OGRTriangle>(
            g.polygons, g.has_z);
      case GeometryType::MultiPoint: {
        auto mp = std::make_unique<OGRMultiPoint>();
        for (const auto& p : g.points)
          mp->addGeometryDirectly(point_to_ogr(p, g.has_z));
        return OGRGeometryUniquePtr(mp.release());
      }
      case GeometryType::MultiLineString: {
        auto ml = std::make_unique<OGRMultiLineString>();
        for (const auto& line : g.lines)
          ml->addGeometryDirectly(line_to_ogr(line, g.has_z));
        return OGRGeometryUniquePtr(ml.release());
      }
      case GeometryType::GeometryCollection: {
        auto gc = std::make_unique<OGRGeometryCollection>();
        for (const auto& member : g.members) {
          if (auto ogr_member = to_ogr(member))
            gc->addGeometryDirectly(ogr_member.release());
        }
        return OGRGeometryUniquePtr(gc.release());
      }
      default:
        return nullptr;
    }
  }

  ReferenceSystem to_reference_system(const OGRSpatialReference* srs) {
    ReferenceSystem crs;
    if (!srs) return crs;
    OGRSpatialReference identified(*srs);
    identified.AutoIdentifyEPSG();
    if (auto* name = identified.GetAuthorityName(nullptr)) crs.auth_name = name;
    if (auto* code = identified.GetAuthorityCode(nullptr)) crs.code = code;
    char* wkt = nullptr;
    if (identified.exportToWkt(&wkt) == OGRERR_NONE && wkt) crs.wkt = wkt;
    CPLFree(wkt);
    return crs;
  }

  OGRSpatialReference to_ogr_srs(const ReferenceSystem& crs) {
    OGRSpatialReference srs;
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    if (!crs.is_defined()) return srs;
    auto input = crs.user_input();
    if (srs.SetFromUserInput(input.c_str()) != OGRERR_NONE) {
      throw ValidationError(
          fmt::format("Unrecognised coordinate reference system {}", input));
    }
    return srs;
  }

}  // namespace palmprep::io::ogr
