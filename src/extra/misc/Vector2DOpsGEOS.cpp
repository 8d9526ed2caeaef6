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

#include <fmt/format.h>
#include <geos_c.h>
#include <palmprep/logger/logger.h>
#include <palmprep/misc/Vector2DOps.hpp>

namespace palmprep::misc {

  namespace {
    void geos_message(const char* message, void*) {
      logger::Logger::get_logger().debug("GEOS: {}", message);
    }
  }  // namespace

  struct Vector2DOpsGEOS : public Vector2DOpsInterface {
    struct GeomDeleter {
      GEOSContextHandle_t ctx;
      void operator()(GEOSGeometry* g) const {
        if (g) GEOSGeom_destroy_r(ctx, g);
      }
    };
    using GeomPtr = std::unique_ptr<GEOSGeometry, GeomDeleter>;

    GEOSContextHandle_t ctx_;

    Vector2DOpsGEOS() {
      ctx_ = GEOS_init_r();
      GEOSContext_setNoticeMessageHandler_r(ctx_, geos_message, nullptr);
      GEOSContext_setErrorMessageHandler_r(ctx_, geos_message, nullptr);
    }
    ~Vector2DOpsGEOS() override { GEOS_finish_r(ctx_); }

    Vector2DOpsGEOS(const Vector2DOpsGEOS&) = delete;
    Vector2DOpsGEOS& operator=(const Vector2DOpsGEOS&) = delete;

    bool intersects(const MultiPolygon& a, const MultiPolygon& b) override {
      auto ga = to_geos(a);
      auto gb = to_geos(b);
      char result = GEOSIntersects_r(ctx_, ga.get(), gb.get());
      if (result == 2) {
        ga = make_valid(std::move(ga));
        gb = make_valid(std::move(gb));
        result = GEOSIntersects_r(ctx_, ga.get(), gb.get());
      }
      if (result == 2) {
        throw palmprepException("GEOS intersects test failed.");
      }
      return result == 1;
    }

    MultiPolygon intersection(const MultiPolygon& a,
                              const MultiPolygon& b) override {
      auto ga = to_geos(a);
      auto gb = to_geos(b);
      GeomPtr result(GEOSIntersection_r(ctx_, ga.get(), gb.get()),
                     GeomDeleter{ctx_});
      if (!result) {
        ga = make_valid(std::move(ga));
        gb = make_valid(std::move(gb));
        result.reset(GEOSIntersection_r(ctx_, ga.get(), gb.get()));
      }
      if (!result) {
        throw palmprepException("GEOS intersection failed.");
      }
      MultiPolygon polygons;
      from_geos(result.get(), polygons);
      return polygons;
    }

    std::optional<MultiPolygon> union_polygons(
        const MultiPolygon& polygons) override {
      auto collection = to_geos(polygons);
      GeomPtr result(GEOSUnaryUnion_r(ctx_, collection.get()),
                     GeomDeleter{ctx_});
      if (!result) {
        collection = make_valid(std::move(collection));
        result.reset(GEOSUnaryUnion_r(ctx_, collection.get()));
      }
      if (!result) return std::nullopt;
      MultiPolygon merged;
      from_geos(result.get(), merged);
      return merged;
    }

   private:
    GEOSGeometry* ring_to_geos(const Ring& ring) {
      auto n = static_cast<unsigned int>(ring.size());
      GEOSCoordSequence* seq = GEOSCoordSeq_create_r(ctx_, n + 1, 2);
      for (unsigned int i = 0; i <= n; ++i) {
        const auto& p = ring[i % n];
        GEOSCoordSeq_setX_r(ctx_, seq, i, p[0]);
        GEOSCoordSeq_setY_r(ctx_, seq, i, p[1]);
      }
      return GEOSGeom_createLinearRing_r(ctx_, seq);
    }

    GeomPtr to_geos(const MultiPolygon& mp) {
      std::vector<GEOSGeometry*> parts;
      for (const auto& polygon : mp) {
        if (polygon.empty()) continue;
        GEOSGeometry* shell = ring_to_geos(polygon.exterior);
        std::vector<GEOSGeometry*> holes;
        for (const auto& hole : polygon.interiors) {
          if (hole.size() >= 3) holes.push_back(ring_to_geos(hole));
        }
        parts.push_back(GEOSGeom_createPolygon_r(
            ctx_, shell, holes.data(), static_cast<unsigned int>(holes.size())));
      }
      GeomPtr collection(
          GEOSGeom_createCollection_r(ctx_, GEOS_MULTIPOLYGON, parts.data(),
                                      static_cast<unsigned int>(parts.size())),
          GeomDeleter{ctx_});
      if (!collection) {
        throw palmprepException("Cannot build GEOS geometry.");
      }
      return collection;
    }

    GeomPtr make_valid(GeomPtr geometry) {
      GeomPtr valid(GEOSMakeValid_r(ctx_, geometry.get()), GeomDeleter{ctx_});
      if (!valid) return geometry;
      return valid;
    }

    Ring ring_from_geos(const GEOSGeometry* ring) {
      Ring result;
      const GEOSCoordSequence* seq = GEOSGeom_getCoordSeq_r(ctx_, ring);
      unsigned int n = 0;
      GEOSCoordSeq_getSize_r(ctx_, seq, &n);
      // drop the closing vertex
      if (n > 0) --n;
      result.reserve(n);
      for (unsigned int i = 0; i < n; ++i) {
        double x = 0, y = 0;
        GEOSCoordSeq_getX_r(ctx_, seq, i, &x);
        GEOSCoordSeq_getY_r(ctx_, seq, i, &y);
        result.push_back({x, y, 0});
      }
      return result;
    }

    void from_geos(const GEOSGeometry* geometry, MultiPolygon& polygons) {
      switch (GEOSGeomTypeId_r(ctx_, geometry)) {
        case GEOS_POLYGON: {
          if (GEOSisEmpty_r(ctx_, geometry)) return;
          Polygon polygon;
          polygon.exterior =
              ring_from_geos(GEOSGetExteriorRing_r(ctx_, geometry));
          int holes = GEOSGetNumInteriorRings_r(ctx_, geometry);
          for (int i = 0; i < holes; ++i) {
            polygon.interiors.push_back(
                ring_from_geos(GEOSGetInteriorRingN_r(ctx_, geometry, i)));
          }
          polygons.push_back(std::move(polygon));
          break;
        }
        case GEOS_MULTIPOLYGON:
        case GEOS_GEOMETRYCOLLECTION: {
          int n = GEOSGetNumGeometries_r(ctx_, geometry);
          for (int i = 0; i < n; ++i) {
            from_geos(GEOSGetGeometryN_r(ctx_, geometry, i), polygons);
          }
          break;
        }
        default:
          // points and lines from touching boundaries
          break;
      }
    }
  };

  std::unique_ptr<Vector2DOpsInterface> createVector2DOpsGEOS() {
    return std::make_unique<Vector2DOpsGEOS>();
  };
}  // namespace palmprep::misc
