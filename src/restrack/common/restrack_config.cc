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

#include "restrack/common/restrack_config.h"

#include <sstream>

#include "nlohmann/json.hpp"

using json = nlohmann::json;

namespace restrack {

RestrackConfig &RestrackConfig::instance() {
  static RestrackConfig config;
  return config;
}

void RestrackConfig::initialize(const std::string &config_list) {
#define RESTRACK_CONFIG(type, name, default_value) \
  name##_ = ReadEnv<type>("RESTRACK_" #name, #type, default_value);

#include "restrack/common/restrack_config_def.h"
#undef RESTRACK_CONFIG

  if (config_list.empty()) {
    return;
  }

  try {
    // Parse the configuration list.
    json config_map = json::parse(config_list);

/// -----------Include restrack_config_def.h to set config items.---------------
/// A helper macro that helps to set a value to a config item.
#define RESTRACK_CONFIG(type, name, default_value) \
  if (pair.key() == #name) {                       \
    name##_ = pair.value().get<type>();            \
    continue;                                      \
  }

    for (const auto &pair : config_map.items()) {
      // We use a big chain of if else statements because C++ doesn't allow
      // switch statements on strings.
#include "restrack/common/restrack_config_def.h"
      RESTRACK_LOG(FATAL) << "Received unexpected config parameter " << pair.key();
    }

/// ---------------------------------------------------------------------
#undef RESTRACK_CONFIG

    if (RESTRACK_LOG_ENABLED(DEBUG)) {
      std::ostringstream oss;
      oss << "RestrackConfig is initialized with: ";
      for (auto const &pair : config_map.items()) {
        oss << pair.key() << "=" << pair.value() << ",";
      }
      RESTRACK_LOG(DEBUG) << oss.str();
    }
  } catch (json::exception &ex) {
    RESTRACK_LOG(FATAL) << "Failed to initialize RestrackConfig: " << ex.what()
                        << " The config string is: " << config_list;
  }
}

std::string RestrackConfig::ToJson() const {
  json config_map = json::object();
#define RESTRACK_CONFIG(type, name, default_value) config_map[#name] = name##_;

#include "restrack/common/restrack_config_def.h"
#undef RESTRACK_CONFIG

  return config_map.dump();
}

}  // namespace restrack
