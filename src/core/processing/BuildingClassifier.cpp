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

#include <array>
#include <palmprep/logger/logger.h>
#include <palmprep/processing/BuildingClassifier.hpp>

namespace palmprep::processing {

  YearCohort year_cohort(int year) {
    if (year == -1 || year == 1985) return YearCohort::Before1986;
    if (year >= 1986 && year <= 2000) return YearCohort::From1986To2000;
    if (year > 2000) return YearCohort::After2000;
    return YearCohort::Unknown;
  }

  const std::vector<ClassificationRule>& classification_rules() {
    static const std::vector<ClassificationRule> rules = {
        {FunctionClass::Bridge, std::nullopt, 7},
        {FunctionClass::Residential, YearCohort::Before1986, 1},
        {FunctionClass::Residential, YearCohort::From1986To2000, 2},
        {FunctionClass::Residential, YearCohort::After2000, 3},
        {FunctionClass::Residential, std::nullopt, 1},
        {FunctionClass::Other, YearCohort::Before1986, 4},
        {FunctionClass::Other, YearCohort::From1986To2000, 5},
        {FunctionClass::Other, YearCohort::After2000, 6},
        {FunctionClass::Other, std::nullopt, 4},
    };
    return rules;
  }

  FunctionClass BuildingClassifier::function_class(
      const std::optional<std::string>& code) const {
    if (!code) return FunctionClass::Other;
    if (*code == cfg_.bridge_code) return FunctionClass::Bridge;
    if (*code == cfg_.residential_code) return FunctionClass::Residential;
    return FunctionClass::Other;
  }

  int BuildingClassifier::classify(const std::optional<std::string>& code,
                                   std::optional<int> year) const {
    auto function = function_class(code);
    auto cohort = year_cohort(year.value_or(0));
    for (const auto& rule : classification_rules()) {
      if (rule.function != function) continue;
      if (rule.cohort && *rule.cohort != cohort) continue;
      return rule.palm_type;
    }
    // Every function class ends with a catch-all rule.
    return 4;
  }

  void BuildingClassifier::classify(FeatureSet& features) const {
    auto& logger = logger::Logger::get_logger();
    std::array<size_t, 8> counts{};
    for (auto& f : features.features) {
      auto code = f.attributes.get_as_string(cfg_.function_attribute);
      std::optional<int> year;
      if (auto y = f.attributes.get_as_double(cfg_.year_attribute)) {
        year = static_cast<int>(*y);
      }
      int type = classify(code, year);
      f.attributes.insert(cfg_.type_attribute, type);
      ++counts[type];
    }
    for (int type = 1; type < 8; ++type) {
      if (counts[type]) logger.debug("palm_type {}: {}", type, counts[type]);
    }
    logger.info("Classified {} features", features.size());
  }

}  // namespace palmprep::processing
