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
#include <algorithm>
#include <format>
#include <functional>
#include <optional>
#include <palmprep/common/common.hpp>
#include <string>
#include <vector>

template <typename T>
using Validator = std::function<std::optional<std::string>(const T&)>;

namespace palmprep::validators {
  // Concept to ensure types are comparable
  template <typename T>
  concept Comparable = requires(T a, T b) {
    { a < b } -> std::convertible_to<bool>;
    { a > b } -> std::convertible_to<bool>;
  };

  // Generator function for range validators
  template <typename T>
    requires Comparable<T>
  auto InRange(T min, T max) {
    return [min, max](const T& val) -> std::optional<std::string> {
      if (val < min || val > max) {
        return std::format("Value {} is out of range <{}, {}>.", val, min, max);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if a value is higher than a given
  // value
  template <typename T>
    requires Comparable<T>
  auto HigherThan(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val <= min) {
        return std::format("Value must be higher than {}.", min);
      }
      return std::nullopt;
    };
  };

  template <typename T>
    requires Comparable<T>
  auto HigherOrEqualTo(T min) {
    return [min](const T& val) -> std::optional<std::string> {
      if (val < min) {
        return std::format(
            "Value must be higher than or equal to {}. But is {}.", min, val);
      }
      return std::nullopt;
    };
  };

  // Generator function for validator to check if the value is one of the given
  // values
  template <typename T>
  auto OneOf(std::vector<T> values) {
    return [values](const T& val) -> std::optional<std::string> {
      if (std::find(values.begin(), values.end(), val) == values.end()) {
        return std::format("Value {} is not one of the allowed values.", val);
      }
      return std::nullopt;
    };
  };

  // Every entry of a list must be non-empty
  inline std::optional<std::string> NonEmptyEntries(const vec1s& values) {
    for (const auto& v : values) {
      if (v.empty()) return "List contains an empty value.";
    }
    return std::nullopt;
  };

  // Url must use http(s) and end with a slash so tile names can be appended
  inline std::optional<std::string> BaseUrl(const std::string& url) {
    if (!(url.starts_with("http://") || url.starts_with("https://"))) {
      return std::format("Url {} must start with http:// or https://.", url);
    }
    if (!url.ends_with("/")) {
      return std::format("Url {} must end with '/'.", url);
    }
    return std::nullopt;
  };
}  // namespace palmprep::validators
