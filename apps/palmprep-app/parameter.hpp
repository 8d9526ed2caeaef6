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
#include <list>
#include <memory>
#include <optional>
#include <palmprep/common/common.hpp>
#include <palmprep/common/formatters.hpp>
#include <palmprep/logger/logger.h>
#include <stdexcept>
#include <string>
#include <toml++/toml.h>
#include <unordered_map>
#include <vector>

#include "validators.hpp"

// Formatter for palmprep::logger::LogLevel
template <>
struct std::formatter<palmprep::logger::LogLevel> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const palmprep::logger::LogLevel& level,
              std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{}", palmprep::logger::level_name(level));
  }
};

struct ConfigParameter {
  std::string help_;
  std::string longname_;
  std::string example_;
  std::optional<char> shortname_;
  ConfigParameter(std::string longname, char shortname, std::string help)
      : help_(help), longname_(longname), shortname_(shortname){};
  ConfigParameter(std::string longname, std::string help)
      : help_(help), longname_(longname){};
  virtual ~ConfigParameter() = default;

  virtual std::optional<std::string> validate() = 0;

  virtual std::list<std::string>::iterator set(
      std::list<std::string>& args, std::list<std::string>::iterator it) = 0;
  virtual void unset() = 0;

  virtual void set_from_toml(const toml::table& table,
                             const std::string& name) = 0;

  virtual std::string description() = 0;
  virtual std::string type_description() = 0;
  virtual std::string to_string() = 0;
  virtual std::string default_to_string() = 0;
  virtual std::string cli_flag() = 0;
};

template <typename T>
struct ConfigParameterByReference : public ConfigParameter {
  T& value_;
  T default_value_;
  std::vector<Validator<T>> _validators;

  ConfigParameterByReference(std::string longname, std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, help),
        value_(value),
        default_value_(value),
        _validators(validators){};
  ConfigParameterByReference(std::string longname, char shortname,
                             std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, shortname, help),
        value_(value),
        default_value_(value),
        _validators(validators){};

  std::optional<std::string> validate() override {
    for (auto& validator : _validators) {
      if (auto error_msg = validator(value_)) {
        return error_msg;
      }
    }
    return std::nullopt;
  }

  std::string to_string() override { return std::format("{}", value_); }

  std::string default_to_string() override {
    std::string s = std::format("{}", default_value_);
    if (s.size() == 0) {
      return "<no value>";
    } else {
      return s;
    }
  }

  std::string cli_flag() override {
    if (shortname_.has_value()) {
      return std::format("-{}, --{}", shortname_.value(), longname_);
    } else {
      if constexpr (std::is_same_v<T, bool>) {
        return std::format("--[no-]{}", longname_);
      } else {
        return std::format("--{}", longname_);
      }
    }
  }

  void unset() override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = false;
    } else {
      value_ = default_value_;
    }
  }

  std::list<std::string>::iterator set(
      std::list<std::string>& args,
      std::list<std::string>::iterator it) override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = true;
      return it;
    } else {
      if (it == args.end()) {
        throw std::runtime_error("Missing argument for parameter");
      } else if constexpr (std::is_same_v<T, int>) {
        value_ = std::stoi(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, double>) {
        value_ = std::stod(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, std::string>) {
        value_ = *it;
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, palmprep::logger::LogLevel>) {
        if (auto level = palmprep::logger::parse_level(*it)) {
          value_ = *level;
        } else {
          throw std::runtime_error("Invalid argument for LogLevel");
        }
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, palmprep::vec1s>) {
        // comma separated list, replaces the current value
        value_ = palmprep::split_string(*it, ",");
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, palmprep::StrMap>) {
        // key=value pairs separated by comma, added to the current value
        for (auto& keyval : palmprep::split_string(*it, ",")) {
          auto kv = palmprep::split_string(keyval, "=");
          if (kv.size() != 2 || kv[0].empty()) {
            throw std::runtime_error("Invalid argument for key=value list");
          }
          value_[kv[0]] = kv[1];
        }
        return args.erase(it);
      } else {
        static_assert(!std::is_same_v<T, T>,
                      "Unsupported type for ConfigParameterByReference::set()");
      }
    }
  }

  void set_from_toml(const toml::table& table,
                     const std::string& name) override {
    if constexpr (std::is_same_v<T, palmprep::logger::LogLevel>) {
      if (const toml::value<std::string>* s = table[name].as_string()) {
        if (auto level = palmprep::logger::parse_level(s->get())) {
          value_ = *level;
        } else {
          throw std::runtime_error("Failed to read value for " + name +
                                   " from config file.");
        }
      }
    } else if constexpr (std::is_same_v<T, palmprep::vec1s>) {
      if (const toml::array* a = table[name].as_array()) {
        if (!a->is_homogeneous(toml::node_type::string)) {
          throw std::runtime_error("Failed to read value for " + name +
                                   " from config file. Expected a list of "
                                   "strings.");
        }
        value_.clear();
        for (const auto& el : *a) {
          value_.push_back(*el.value<std::string>());
        }
      }
    } else if constexpr (std::is_same_v<T, palmprep::StrMap>) {
      if (const toml::table* tb = table[name].as_table()) {
        for (const auto& [key, value] : *tb) {
          auto value_str = value.template value<std::string>();
          if (!value_str.has_value()) {
            throw std::runtime_error(
                std::format("Failed to read value for {}.{} from config file. "
                            "Expected a string.",
                            name, key.str()));
          }
          value_[std::string(key.str())] = *value_str;
        }
      }
    } else if constexpr (std::is_same_v<T, double>) {
      // toml integers are accepted for floating point parameters
      if (auto value = table[name].template value<double>();
          value.has_value()) {
        value_ = *value;
      }
    } else {
      if (auto value = table[name].template value<T>(); value.has_value()) {
        value_ = *value;
      }
    }
  }

  std::string description() override { return std::format("{}", help_); }

  std::string type_description() override {
    if constexpr (std::is_same_v<T, bool>) {
      return "";
    } else if constexpr (std::is_same_v<T, int>) {
      return "<int>";
    } else if constexpr (std::is_same_v<T, double>) {
      return "<double>";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return "<string>";
    } else if constexpr (std::is_same_v<T, palmprep::logger::LogLevel>) {
      return "(trace|debug|info|warning|error)";
    } else if constexpr (std::is_same_v<T, palmprep::vec1s>) {
      return "value[,...]";
    } else if constexpr (std::is_same_v<T, palmprep::StrMap>) {
      return "key=value[,...]";
    } else {
      static_assert(!std::is_same_v<T, T>,
                    "Unsupported type for "
                    "ConfigParameterByReference::type_description()");
    }
  }
};

class ParameterVector {
 public:
  std::vector<std::unique_ptr<ConfigParameter>> params_;

  ParameterVector(){};
  ~ParameterVector() = default;

  ParameterVector(ParameterVector&&) = default;
  ParameterVector& operator=(ParameterVector&&) = default;

  ParameterVector(const ParameterVector&) = delete;
  ParameterVector& operator=(const ParameterVector&) = delete;

  template <typename T>
  ConfigParameter& add(const std::string& longname, const std::string& help,
                       T& value, std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, help, value, std::move(validators)));
    return *params_.back();
  }

  template <typename T>
  ConfigParameter& add(const std::string& longname, const char shortname,
                       const std::string& help, T& value,
                       std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, shortname, help, value, std::move(validators)));
    return *params_.back();
  }

  void add_to_index(std::unordered_map<std::string, ConfigParameter*>& index) {
    for (auto& param : params_) {
      index[param->longname_] = param.get();
      if (param->shortname_.has_value()) {
        index[std::string(1, param->shortname_.value())] = param.get();
      }
    }
  }

  auto begin() { return params_.begin(); }
  auto end() { return params_.end(); }
  auto begin() const { return params_.begin(); }
  auto end() const { return params_.end(); }
  auto size() const { return params_.size(); }
  auto empty() const { return params_.empty(); }
};
