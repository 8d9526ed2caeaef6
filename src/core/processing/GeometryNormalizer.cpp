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
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <palmprep/logger/logger.h>
#include <palmprep/processing/GeometryNormalizer.hpp>

namespace palmprep::processing {

  namespace {
    constexpr size_t kMaxReportedIndices = 10;
    const char* kDefaultRemediation =
        "ogr2ogr -f GPKG lod2_multipolygon.gpkg lod2.gpkg -nlt MULTIPOLYGON";

    void flatten_ring(Ring& ring) {
      for (auto& p : ring) p[2] = 0;
    }

    void flatten_polygons(MultiPolygon& mp) {
      for (auto& poly : mp) {
        flatten_ring(poly.exterior);
        for (auto& hole : poly.interiors) flatten_ring(hole);
      }
    }

    bool is_surface(GeometryType type) {
      return type == GeometryType::PolyhedralSurface ||
             type == GeometryType::TIN;
    }

    std::string index_list(const vec1ui& indices) {
      std::vector<size_t> head(
          indices.begin(),
          indices.begin() + std::min(indices.size(), kMaxReportedIndices));
      auto text = fmt::format("{}", fmt::join(head, ", "));
      if (indices.size() > kMaxReportedIndices) text += " ...";
      return text;
    }

    void append_faces(const MultiPolygon& source, MultiPolygon& target) {
      for (const auto& poly : source) {
        if (!poly.empty() && poly.area() > 0) target.push_back(poly);
      }
    }
  }  // namespace

  const char* to_string(NormalizerState state) {
    switch (state) {
      case NormalizerState::Raw:
        return "RAW";
      case NormalizerState::DimReduced:
        return "DIM_REDUCED";
      case NormalizerState::TypeCheck:
        return "TYPE_CHECK";
      case NormalizerState::DirectCast:
        return "DIRECT_CAST";
      case NormalizerState::PerFeatureRepair:
        return "PER_FEATURE_REPAIR";
      case NormalizerState::ExternalConversion:
        return "EXTERNAL_CONVERSION";
      case NormalizerState::Failed:
        return "FAILED";
      case NormalizerState::Normalized:
        return "NORMALIZED";
    }
    return "UNKNOWN";
  }

  Geometry drop_z(const Geometry& geometry) {
    Geometry flat = geometry;
    flat.has_z = false;
    flatten_polygons(flat.polygons);
    for (auto& line : flat.lines) flatten_ring(line);
    for (auto& p : flat.points) p[2] = 0;
    for (auto& member : flat.members) member = drop_z(member);
    return flat;
  }

  std::set<GeometryType> distinct_types(const FeatureSet& features) {
    std::set<GeometryType> types;
    for (const auto& f : features.features) types.insert(f.geometry.type);
    return types;
  }

  std::optional<MultiPolygon> strict_cast(const Geometry& geometry) {
    switch (geometry.type) {
      case GeometryType::Polygon:
      case GeometryType::MultiPolygon:
      case GeometryType::MultiSurface:
      case GeometryType::Triangle:
        return geometry.polygons;
      case GeometryType::GeometryCollection: {
        MultiPolygon parts;
        for (const auto& member : geometry.members) {
          auto cast = strict_cast(member);
          if (!cast) return std::nullopt;
          parts.insert(parts.end(), cast->begin(), cast->end());
        }
        return parts;
      }
      default:
        return std::nullopt;
    }
  }

  MultiPolygon extract_polygons(const Geometry& geometry) {
    MultiPolygon parts;
    append_faces(geometry.polygons, parts);
    for (const auto& member : geometry.members) {
      append_faces(extract_polygons(member), parts);
    }
    return parts;
  }

  bool is_translated_type_accepted(GeometryType type) {
    return type == GeometryType::Polygon ||
           type == GeometryType::MultiPolygon ||
           type == GeometryType::MultiSurface;
  }

  RepairOutcome GeometryNormalizer::repair_surface(const Geometry& geometry) {
    auto& logger = logger::Logger::get_logger();
    MultiPolygon faces;
    append_faces(geometry.polygons, faces);
    if (faces.empty()) {
      for (const auto& member : geometry.members) {
        append_faces(extract_polygons(member), faces);
      }
    }
    if (faces.empty()) {
      return Unrepaired{fmt::format("{} without polygonal faces",
                                    to_string(geometry.type))};
    }
    if (faces.size() == 1) return Repaired{std::move(faces)};

    auto merged = ops_.union_polygons(faces);
    if (merged && !merged->empty()) return Repaired{std::move(*merged)};
    logger.debug("Union of {} faces failed, combining them instead",
                 faces.size());
    return Repaired{std::move(faces)};
  }

  RepairOutcome GeometryNormalizer::repair_feature(const Geometry& geometry) {
    if (is_surface(geometry.type)) return repair_surface(geometry);
    if (auto cast = strict_cast(geometry)) return Repaired{std::move(*cast)};
    auto parts = extract_polygons(geometry);
    if (!parts.empty()) return Repaired{std::move(parts)};
    return Unrepaired{fmt::format("cannot cast {} to MultiPolygon",
                                  to_string(geometry.type))};
  }

  NormalizationReport GeometryNormalizer::normalize(
      const FeatureSet& features) {
    auto& logger = logger::Logger::get_logger();
    NormalizationReport report;
    report.states.push_back(NormalizerState::Raw);

    FeatureSet& working = report.features;
    working.crs = features.crs;
    working.features.reserve(features.size());
    for (const auto& f : features.features) {
      working.features.push_back(Feature{drop_z(f.geometry), f.attributes});
    }
    report.states.push_back(NormalizerState::DimReduced);

    auto types = distinct_types(working);
    report.states.push_back(NormalizerState::TypeCheck);
    std::vector<std::string> type_names;
    for (auto t : types) type_names.push_back(to_string(t));
    logger.info("Normalizing {} features with geometry types {}",
                working.size(), fmt::join(type_names, ", "));

    // Uniform cast of the whole set.
    std::vector<MultiPolygon> cast;
    cast.reserve(working.size());
    for (const auto& f : working.features) {
      auto mp = strict_cast(f.geometry);
      if (!mp) break;
      cast.push_back(std::move(*mp));
    }
    if (cast.size() == working.size()) {
      bool polygonal = std::all_of(types.begin(), types.end(), [](auto t) {
        return t == GeometryType::Polygon || t == GeometryType::MultiPolygon;
      });
      if (!polygonal) report.states.push_back(NormalizerState::DirectCast);
      for (size_t i = 0; i < cast.size(); ++i) {
        working.features[i].geometry =
            Geometry::from_multipolygon(std::move(cast[i]));
      }
      report.states.push_back(NormalizerState::Normalized);
      return report;
    }

    report.states.push_back(NormalizerState::PerFeatureRepair);
    vec1ui unrepaired;
    for (size_t i = 0; i < working.size(); ++i) {
      auto& geometry = working.features[i].geometry;
      auto outcome = repair_feature(geometry);
      if (auto* fixed = std::get_if<Repaired>(&outcome)) {
        if (!geometry.is_polygonal()) report.repaired.push_back(i);
        geometry = Geometry::from_multipolygon(std::move(fixed->geometry));
      } else {
        logger.debug("Feature {} left unrepaired: {}", i,
                     std::get<Unrepaired>(outcome).reason);
        unrepaired.push_back(i);
      }
    }
    logger.info("Per-feature repair fixed {} features, {} remain",
                report.repaired.size(), unrepaired.size());
    if (unrepaired.empty()) {
      report.states.push_back(NormalizerState::Normalized);
      return report;
    }

    std::string remediation = kDefaultRemediation;
    if (translator_) {
      report.states.push_back(NormalizerState::ExternalConversion);
      remediation = translator_->remediation_command();
      auto translated = translator_->force_multipolygon(working);
      bool accepted = translated && translated->size() == working.size();
      if (accepted) {
        for (const auto& f : translated->features) {
          if (!is_translated_type_accepted(f.geometry.type)) {
            accepted = false;
            break;
          }
        }
      }
      if (accepted) {
        for (size_t i = 0; i < working.size(); ++i) {
          auto& geometry = translated->features[i].geometry;
          working.features[i] = Feature{
              Geometry::from_multipolygon(drop_z(geometry).polygons),
              std::move(translated->features[i].attributes)};
        }
        logger.info("External conversion produced {} MultiPolygon features",
                    working.size());
        report.states.push_back(NormalizerState::Normalized);
        return report;
      }
      logger.warning("External conversion to MultiPolygon failed");
    }

    report.states.push_back(NormalizerState::Failed);
    throw GeometryRepairFailed(
        fmt::format("Could not convert {} feature(s) to MultiPolygon "
                    "(indices: {}). Please convert the layer externally "
                    "(e.g. `{}`) or supply pre-cast (multi)polygons.",
                    unrepaired.size(), index_list(unrepaired), remediation),
        unrepaired, remediation);
  }

}  // namespace palmprep::processing
