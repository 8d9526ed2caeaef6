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
#include <optional>
#include <palmprep/common/datastructures.hpp>
#include <string>
#include <vector>

namespace palmprep::processing {

  enum class FunctionClass { Bridge, Residential, Other };

  enum class YearCohort {
    // -1 sentinel and 1985, the first year of the settlement record.
    Before1986,
    From1986To2000,
    After2000,
    Unknown
  };

  YearCohort year_cohort(int year);

  struct ClassificationRule {
    FunctionClass function;
    // Matches any cohort when empty.
    std::optional<YearCohort> cohort;
    int palm_type;
  };

  // Rules in precedence order, first match wins.
  const std::vector<ClassificationRule>& classification_rules();

  struct ClassifierConfig {
    std::string function_attribute = "function";
    std::string year_attribute = "year_max";
    std::string type_attribute = "palm_type";
    std::string bridge_code = "53001_1800";
    std::string residential_code = "31001_1000";
  };

  class BuildingClassifier {
    ClassifierConfig cfg_;

   public:
    explicit BuildingClassifier(ClassifierConfig cfg = {})
        : cfg_(std::move(cfg)){};

    FunctionClass function_class(const std::optional<std::string>& code) const;

    // A missing year counts as 0.
    int classify(const std::optional<std::string>& code,
                 std::optional<int> year) const;

    void classify(FeatureSet& features) const;
  };

}  // namespace palmprep::processing
