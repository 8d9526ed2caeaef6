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
#include <palmprep/common/datastructures.hpp>
#include <palmprep/io/VectorTranslator.hpp>
#include <palmprep/misc/Vector2DOps.hpp>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace palmprep::processing {

  enum class NormalizerState {
    Raw,
    DimReduced,
    TypeCheck,
    DirectCast,
    PerFeatureRepair,
    ExternalConversion,
    Failed,
    Normalized
  };

  const char* to_string(NormalizerState state);

  struct Repaired {
    MultiPolygon geometry;
  };
  struct Unrepaired {
    std::string reason;
  };
  typedef std::variant<Repaired, Unrepaired> RepairOutcome;

  struct NormalizationReport {
    FeatureSet features;
    // States visited, starting with Raw.
    std::vector<NormalizerState> states;
    // Features fixed by per-feature repair.
    vec1ui repaired;

    NormalizerState state() const { return states.back(); }
  };

  // Reduces to 2D, keeping the geometry type.
  Geometry drop_z(const Geometry& geometry);

  std::set<GeometryType> distinct_types(const FeatureSet& features);

  // Cast that only accepts geometry that is polygonal as a whole: polygons,
  // multipolygons, multisurfaces, triangles and collections of those.
  std::optional<MultiPolygon> strict_cast(const Geometry& geometry);

  // Polygonal parts found anywhere in the geometry, including collection
  // members. Degenerate faces with zero area are left out.
  MultiPolygon extract_polygons(const Geometry& geometry);

  // Turns an arbitrary feature set into one where every geometry is a
  // MultiPolygon. Tries, in order, a uniform cast of the whole set, repair
  // feature by feature and finally the external translator. Throws
  // GeometryRepairFailed with the offending feature indices when all of them
  // fail.
  class GeometryNormalizer {
    misc::Vector2DOpsInterface& ops_;
    io::VectorTranslatorInterface* translator_;

   public:
    GeometryNormalizer(misc::Vector2DOpsInterface& ops,
                       io::VectorTranslatorInterface* translator = nullptr)
        : ops_(ops), translator_(translator){};

    NormalizationReport normalize(const FeatureSet& features);

    RepairOutcome repair_feature(const Geometry& geometry);

   private:
    RepairOutcome repair_surface(const Geometry& geometry);
  };

  // Accepted geometry types after external conversion.
  bool is_translated_type_accepted(GeometryType type);

}  // namespace palmprep::processing
