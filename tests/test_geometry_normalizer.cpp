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


#include <palmprep/processing/GeometryNormalizer.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::processing;
using namespace palmprep::testing;

namespace {
  Geometry polyhedral_surface(std::vector<Polygon> faces) {
    Geometry g;
    g.type = GeometryType::PolyhedralSurface;
    g.has_z = true;
    g.polygons = std::move(faces);
    for (auto& face : g.polygons) {
      for (auto& p : face.exterior) p[2] = 520;
    }
    return g;
  }

  Geometry line(double x0, double y0, double x1, double y1) {
    Geometry g;
    g.type = GeometryType::LineString;
    g.lines.push_back({{x0, y0, 0}, {x1, y1, 0}});
    return g;
  }

  FeatureSet features_of(std::vector<Geometry> geometries) {
    FeatureSet fs;
    fs.crs = ReferenceSystem::epsg(25832);
    for (auto& g : geometries) fs.features.push_back(make_feature(g));
    return fs;
  }

  std::vector<NormalizerState> states(std::initializer_list<NormalizerState> l) {
    return l;
  }
}  // namespace

TEST_CASE("drop_z flattens nested geometries") {
  Geometry collection;
  collection.type = GeometryType::GeometryCollection;
  collection.has_z = true;
  collection.members.push_back(polyhedral_surface({rect(0, 0, 1, 1)}));
  auto flat = drop_z(collection);
  CHECK_FALSE(flat.has_z);
  CHECK(flat.members[0].polygons[0].exterior[0][2] == 0);
}

TEST_CASE("Polygonal input is already normalized") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  Geometry poly = rect_geometry(0, 0, 10, 10);
  poly.type = GeometryType::Polygon;
  auto report = normalizer.normalize(features_of({poly, rect_geometry(20, 20, 30, 30)}));

  using S = NormalizerState;
  CHECK(report.states ==
        states({S::Raw, S::DimReduced, S::TypeCheck, S::Normalized}));
  CHECK(report.state() == S::Normalized);
  CHECK(report.repaired.empty());
  for (const auto& f : report.features.features) {
    CHECK(f.geometry.type == GeometryType::MultiPolygon);
    CHECK(*f.attributes.get_as_string("function") == "31001_1000");
  }
  CHECK(ops.unions == 0);
}

TEST_CASE("Multi surfaces are cast directly") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  Geometry surface = rect_geometry(0, 0, 10, 10);
  surface.type = GeometryType::MultiSurface;
  auto report =
      normalizer.normalize(features_of({surface, rect_geometry(20, 20, 30, 30)}));

  using S = NormalizerState;
  CHECK(report.states == states({S::Raw, S::DimReduced, S::TypeCheck,
                                 S::DirectCast, S::Normalized}));
  CHECK(report.features.features[0].geometry.type == GeometryType::MultiPolygon);
  CHECK(report.repaired.empty());
}

TEST_CASE("Polyhedral surfaces are repaired per feature") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  auto solid = polyhedral_surface({rect(0, 0, 5, 10), rect(5, 0, 10, 10)});
  auto report =
      normalizer.normalize(features_of({rect_geometry(20, 20, 30, 30), solid}));

  using S = NormalizerState;
  CHECK(report.states == states({S::Raw, S::DimReduced, S::TypeCheck,
                                 S::PerFeatureRepair, S::Normalized}));
  CHECK(report.repaired == vec1ui{1});
  const auto& repaired = report.features.features[1].geometry;
  CHECK(repaired.type == GeometryType::MultiPolygon);
  CHECK(area(repaired.polygons) == 100);
  CHECK(ops.unions == 1);
}

TEST_CASE("Zero area faces are dropped during repair") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  Polygon wall;
  wall.exterior = {{0, 0, 0}, {10, 0, 0}, {10, 0, 5}, {0, 0, 5}};
  auto outcome =
      normalizer.repair_feature(polyhedral_surface({rect(0, 0, 10, 10), wall}));
  auto* fixed = std::get_if<Repaired>(&outcome);
  REQUIRE(fixed != nullptr);
  CHECK(fixed->geometry.size() == 1);
}

TEST_CASE("A failed union falls back to combining the faces") {
  BoxVector2DOps ops;
  ops.fail_union = true;
  GeometryNormalizer normalizer(ops);
  auto outcome = normalizer.repair_feature(
      polyhedral_surface({rect(0, 0, 5, 10), rect(5, 0, 10, 10)}));
  auto* fixed = std::get_if<Repaired>(&outcome);
  REQUIRE(fixed != nullptr);
  CHECK(fixed->geometry.size() == 2);
}

TEST_CASE("A line can not be repaired") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  auto outcome = normalizer.repair_feature(line(0, 0, 1, 1));
  REQUIRE(std::holds_alternative<Unrepaired>(outcome));
  CHECK_THAT(std::get<Unrepaired>(outcome).reason,
             Catch::Matchers::ContainsSubstring("LINESTRING"));
}

TEST_CASE("Collections with polygons keep their polygonal parts") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  Geometry collection;
  collection.type = GeometryType::GeometryCollection;
  collection.members.push_back(rect_geometry(0, 0, 1, 1));
  collection.members.push_back(line(0, 0, 1, 1));
  auto outcome = normalizer.repair_feature(collection);
  auto* fixed = std::get_if<Repaired>(&outcome);
  REQUIRE(fixed != nullptr);
  CHECK(fixed->geometry.size() == 1);
}

TEST_CASE("Unrepairable features without converter fail with indices") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  auto features = features_of(
      {rect_geometry(0, 0, 1, 1), line(0, 0, 1, 1), rect_geometry(2, 2, 3, 3),
       line(5, 5, 6, 6)});
  try {
    normalizer.normalize(features);
    FAIL("expected GeometryRepairFailed");
  } catch (const GeometryRepairFailed& e) {
    CHECK(e.indices() == vec1ui{1, 3});
    CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("2 feature(s)"));
    CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("indices: 1, 3"));
    CHECK_THAT(e.remediation(),
               Catch::Matchers::ContainsSubstring("MULTIPOLYGON"));
  }
}

TEST_CASE("External conversion rescues unrepairable features") {
  BoxVector2DOps ops;
  FakeVectorTranslator translator;
  auto features = features_of({rect_geometry(0, 0, 1, 1), line(0, 0, 1, 1)});
  FeatureSet converted = features_of(
      {rect_geometry(0, 0, 1, 1), rect_geometry(0, 0, 1, 1)});
  translator.result = converted;
  GeometryNormalizer normalizer(ops, &translator);

  auto report = normalizer.normalize(features);
  using S = NormalizerState;
  CHECK(report.states ==
        states({S::Raw, S::DimReduced, S::TypeCheck, S::PerFeatureRepair,
                S::ExternalConversion, S::Normalized}));
  CHECK(translator.calls == 1);
  CHECK(report.features.size() == 2);
}

TEST_CASE("External conversion with non-polygonal output fails") {
  BoxVector2DOps ops;
  FakeVectorTranslator translator;
  auto features = features_of({line(0, 0, 1, 1)});
  translator.result = features;
  GeometryNormalizer normalizer(ops, &translator);
  CHECK_THROWS_AS(normalizer.normalize(features), GeometryRepairFailed);
}

TEST_CASE("Only the first ten failing indices are listed") {
  BoxVector2DOps ops;
  GeometryNormalizer normalizer(ops);
  std::vector<Geometry> lines;
  for (int i = 0; i < 12; ++i) lines.push_back(line(i, 0, i + 1, 1));
  try {
    normalizer.normalize(features_of(lines));
    FAIL("expected GeometryRepairFailed");
  } catch (const GeometryRepairFailed& e) {
    CHECK(e.indices().size() == 12);
    CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("0, 1, 2"));
    CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("9 ..."));
    CHECK_THAT(e.what(),
               !Catch::Matchers::ContainsSubstring("10, 11"));
  }
}

TEST_CASE("Normalizer state names") {
  CHECK(std::string(to_string(NormalizerState::PerFeatureRepair)) ==
        "PER_FEATURE_REPAIR");
  CHECK(std::string(to_string(NormalizerState::Normalized)) == "NORMALIZED");
}
