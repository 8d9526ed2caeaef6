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

#include <format>
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/common.hpp>

// Formatter for palmprep::TBox<double>
template <typename T>
struct std::formatter<palmprep::TBox<T>> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const palmprep::TBox<T>& box, std::format_context& ctx) const {
    return std::format_to(ctx.out(), "[{},{},{},{}]", box.pmin[0], box.pmin[1],
                          box.pmax[0], box.pmax[1]);
  }
};

// Formatter for palmprep::vec1s, as a TOML array of strings
template <>
struct std::formatter<palmprep::vec1s> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const palmprep::vec1s& values, std::format_context& ctx) const {
    std::string result = "[";
    for (size_t i = 0; i < values.size(); ++i) {
      if (i) result += ", ";
      result += std::format("\"{}\"", values[i]);
    }
    result += "]";
    return std::format_to(ctx.out(), "{}", result);
  }
};

// Formatter for palmprep::StrMap. With the `t` specifier a TOML inline table
// is written, otherwise a comma separated list of key=value pairs.
template <>
struct std::formatter<palmprep::StrMap> {
  bool as_toml = false;
  constexpr auto parse(std::format_parse_context& ctx) {
    auto it = ctx.begin();
    if (it != ctx.end() && *it == 't') {
      as_toml = true;
      ++it;
    }
    return it;
  }

  auto format(const palmprep::StrMap& map, std::format_context& ctx) const {
    std::string result;
    for (const auto& [key, value] : map) {
      if (as_toml) {
        result += std::format("{}{} = \"{}\"", result.empty() ? "" : ", ", key,
                              value);
      } else {
        result += std::format("{}={},", key, value);
      }
    }
    if (as_toml) {
      return std::format_to(ctx.out(), "{{ {} }}", result);
    }
    if (!result.empty()) {
      result.pop_back();
    }
    return std::format_to(ctx.out(), "{}", result);
  }
};

// Formatter for palmprep::GridSpec
template <>
struct std::formatter<palmprep::GridSpec> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const palmprep::GridSpec& grid, std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{}x{} cells of {}x{} at ({}, {}) [{}]",
                          grid.nx, grid.ny, grid.res_x, grid.res_y,
                          grid.origin_x, grid.origin_y, grid.crs.user_input());
  }
};
