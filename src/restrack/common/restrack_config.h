// Copyright 2025 The Restrack Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>

#include "absl/strings/ascii.h"
#include "restrack/util/logging.h"

namespace restrack {

template <typename T>
T ConvertValue(const std::string &type_string, const std::string &value) {
  std::istringstream stream(value);
  T parsed_value;
  stream >> parsed_value;
  RESTRACK_CHECK(!value.empty() && stream.eof())
      << "Cannot parse \"" << value << "\" to " << type_string;
  return parsed_value;
}

template <>
inline std::string ConvertValue<std::string>(const std::string &type_string,
                                             const std::string &value) {
  return value;
}

template <>
inline bool ConvertValue<bool>(const std::string &type_string, const std::string &value) {
  auto new_value = absl::AsciiStrToLower(value);
  return new_value == "true" || new_value == "1";
}

class RestrackConfig {
/// -----------Include restrack_config_def.h to define config items.-----------
/// A helper macro that defines a config item.
/// In particular, this generates a private field called `name_` and a public getter
/// method called `name()` for a given config item.
///
/// Configs defined in this way can be overridden by setting the env variable
/// RESTRACK_{name}=value where {name} is the variable name.
///
/// \param type Type of the config item.
/// \param name Name of the config item.
/// \param default_value Default value of the config item.
#define RESTRACK_CONFIG(type, name, default_value)                            \
 private:                                                                     \
  type name##_ = ReadEnv<type>("RESTRACK_" #name, #type, default_value);      \
                                                                              \
 public:                                                                      \
  inline type &name() { return name##_; }

#include "restrack/common/restrack_config_def.h"

#undef RESTRACK_CONFIG

 public:
  static RestrackConfig &instance();

  /// Re-read every item from the environment, then apply the overrides in
  /// `config_list`, a JSON object mapping item names to values. An unknown item
  /// name or a malformed document is fatal.
  void initialize(const std::string &config_list);

  /// Serialize every item into the JSON form accepted by initialize().
  std::string ToJson() const;

 private:
  template <typename T>
  T ReadEnv(const std::string &name, const std::string &type_string, T default_value) {
    auto value = std::getenv(name.c_str());
    if (value == nullptr) {
      return default_value;
    } else {
      return ConvertValue<T>(type_string, value);
    }
  }
};

}  // namespace restrack
