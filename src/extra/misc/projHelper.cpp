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
#include <map>
#include <memory>
#include <ogr_spatialref.h>
#include <palmprep/logger/logger.h>
#include <palmprep/misc/projHelper.hpp>

#include "../io/OGRConversion.hpp"

namespace palmprep::misc {

  namespace {
    struct TransformationDeleter {
      void operator()(OGRCoordinateTransformation* ct) const {
        OGRCoordinateTransformation::DestroyCT(ct);
      }
    };
    using TransformationPtr =
        std::unique_ptr<OGRCoordinateTransformation, TransformationDeleter>;
  }  // namespace

  struct projHelperOGR : public projHelperInterface {
    std::map<std::pair<std::string, std::string>, TransformationPtr> cache_;

    using projHelperInterface::transform;

    Geometry transform(const Geometry& geometry, const ReferenceSystem& source,
                       const ReferenceSystem& target) override {
      if (is_same(source, target)) return geometry;
      auto* ct = transformation(source, target);
      Geometry result = geometry;
      apply(*ct, result);
      return result;
    }

    bool is_same(const ReferenceSystem& a, const ReferenceSystem& b) override {
      if (a.user_input() == b.user_input()) return true;
      if (!a.is_defined() || !b.is_defined()) return false;
      auto srs_a = io::ogr::to_ogr_srs(a);
      auto srs_b = io::ogr::to_ogr_srs(b);
      return srs_a.IsSame(&srs_b);
    }

    bool is_geographic(const ReferenceSystem& crs) override {
      return io::ogr::to_ogr_srs(crs).IsGeographic();
    }

   private:
    OGRCoordinateTransformation* transformation(const ReferenceSystem& source,
                                                const ReferenceSystem& target) {
      if (!source.is_defined() || !target.is_defined()) {
        throw ValidationError(
            "Cannot transform between undefined reference systems.");
      }
      auto key = std::make_pair(source.user_input(), target.user_input());
      auto it = cache_.find(key);
      if (it != cache_.end()) return it->second.get();

      auto srs_source = io::ogr::to_ogr_srs(source);
      auto srs_target = io::ogr::to_ogr_srs(target);
      TransformationPtr ct(
          OGRCreateCoordinateTransformation(&srs_source, &srs_target));
      if (!ct) {
        throw ValidationError(fmt::format("No transformation from {} to {}",
                                          key.first, key.second));
      }
      logger::Logger::get_logger().debug("Transforming from {} to {}",
                                         key.first, key.second);
      return cache_.emplace(key, std::move(ct)).first->second.get();
    }

    void apply(OGRCoordinateTransformation& ct, Ring& ring) {
      if (ring.empty()) return;
      std::vector<double> xs, ys;
      xs.reserve(ring.size());
      ys.reserve(ring.size());
      for (const auto& p : ring) {
        xs.push_back(p[0]);
        ys.push_back(p[1]);
      }
      if (!ct.Transform(static_cast<int>(ring.size()), xs.data(), ys.data())) {
        throw palmprepException("Coordinate transformation failed.");
      }
      for (size_t i = 0; i < ring.size(); ++i) {
        ring[i][0] = xs[i];
        ring[i][1] = ys[i];
      }
    }

    void apply(OGRCoordinateTransformation& ct, Geometry& g) {
      for (auto& polygon : g.polygons) {
        apply(ct, polygon.exterior);
        for (auto& hole : polygon.interiors) apply(ct, hole);
      }
      for (auto& line : g.lines) apply(ct, line);
      apply(ct, g.points);
      for (auto& member : g.members) apply(ct, member);
    }
  };

  std::unique_ptr<projHelperInterface> createProjHelperOGR() {
    return std::make_unique<projHelperOGR>();
  };
}  // namespace palmprep::misc
