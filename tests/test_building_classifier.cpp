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


#include <palmprep/processing/BuildingClassifier.hpp>

#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::processing;

namespace {
  const std::string kResidential = "31001_1000";
  const std::string kBridge = "53001_1800";
  const std::string kOffice = "31001_2020";
}  // namespace

TEST_CASE("Year cohorts") {
  CHECK(year_cohort(-1) == YearCohort::Before1986);
  CHECK(year_cohort(1985) == YearCohort::Before1986);
  CHECK(year_cohort(1986) == YearCohort::From1986To2000);
  CHECK(year_cohort(2000) == YearCohort::From1986To2000);
  CHECK(year_cohort(2001) == YearCohort::After2000);
  CHECK(year_cohort(2015) == YearCohort::After2000);
  CHECK(year_cohort(0) == YearCohort::Unknown);
  CHECK(year_cohort(1970) == YearCohort::Unknown);
}

TEST_CASE("Residential buildings by construction period") {
  BuildingClassifier classifier;
  CHECK(classifier.classify(kResidential, 1985) == 1);
  CHECK(classifier.classify(kResidential, -1) == 1);
  CHECK(classifier.classify(kResidential, 1995) == 2);
  CHECK(classifier.classify(kResidential, 2010) == 3);
  CHECK(classifier.classify(kResidential, 0) == 1);
  CHECK(classifier.classify(kResidential, std::nullopt) == 1);
}

TEST_CASE("Non-residential buildings by construction period") {
  BuildingClassifier classifier;
  CHECK(classifier.classify(kOffice, 1985) == 4);
  CHECK(classifier.classify(kOffice, 1990) == 5);
  CHECK(classifier.classify(kOffice, 2001) == 6);
  CHECK(classifier.classify(kOffice, 0) == 4);
  CHECK(classifier.classify(std::nullopt, 2005) == 6);
}

TEST_CASE("Bridges are type 7 regardless of year") {
  BuildingClassifier classifier;
  for (int year : {-1, 0, 1985, 1990, 2020}) {
    CHECK(classifier.classify(kBridge, year) == 7);
  }
}

TEST_CASE("Every feature gets a type between 1 and 7") {
  FeatureSet features;
  for (auto [code, year] : std::vector<std::pair<std::string, int>>{
           {kResidential, 1985},
           {kOffice, 1999},
           {kBridge, 2003},
           {"unknown", 2050}}) {
    auto f = palmprep::testing::make_feature(
        palmprep::testing::rect_geometry(0, 0, 1, 1), code);
    f.attributes.insert("year_max", year);
    features.features.push_back(std::move(f));
  }
  // a feature without year
  features.features.push_back(palmprep::testing::make_feature(
      palmprep::testing::rect_geometry(0, 0, 1, 1), kOffice));

  BuildingClassifier classifier;
  classifier.classify(features);
  std::vector<int> types;
  for (const auto& f : features.features) {
    auto t = f.attributes.get_if<int>("palm_type");
    REQUIRE(t != nullptr);
    CHECK(*t >= 1);
    CHECK(*t <= 7);
    types.push_back(*t);
  }
  CHECK(types == std::vector<int>{1, 5, 7, 6, 4});
}

TEST_CASE("Classification codes are configurable") {
  BuildingClassifier classifier(
      {.bridge_code = "BR", .residential_code = "RES"});
  CHECK(classifier.classify(std::string("BR"), 1990) == 7);
  CHECK(classifier.classify(std::string("RES"), 1990) == 2);
  CHECK(classifier.classify(kResidential, 1990) == 5);
}
