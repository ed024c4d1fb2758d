//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "geometry/geometry_engine.hpp"
#include "type/type.hpp"

namespace exodus {
// Returns the value of an environment variable, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

auto SystemEnvironment(const char* name) -> std::optional<std::string>;

struct ExportConfig {
  RotationPolicy             rotation_policy_     = RotationPolicy::CATALOG_ONLY;
  bool                       recompute_from_crop_ = false;
  // Only versions with a model id >= start_id_ are processed
  model_id_t                 start_id_            = 0;
  // ECMAScript pattern, only matching captions are processed
  std::optional<std::string> caption_pattern_;
  bool                       verbose_             = false;
  bool                       write_sidecars_      = true;
  bool                       scan_orphans_        = true;
  std::string                no_event_folder_     = "00_ImagesWithoutEvents";

  static constexpr const char* kEnvDebug          = "EXODUS_DEBUG";
  static constexpr const char* kEnvStartId        = "EXODUS_START_ID";
  static constexpr const char* kEnvCaption        = "EXODUS_CAPTION";
  static constexpr const char* kEnvConfig         = "EXODUS_CONFIG";

  auto        ToJson() const -> nlohmann::json;
  auto        GetGeometryOptions() const -> GeometryOptions;

  // Keys missing from the document keep their defaults
  static auto FromJson(const nlohmann::json& document) -> ExportConfig;
  static auto LoadFromFile(const file_path_t& path) -> ExportConfig;

  /**
   * @brief Defaults, then the file named by EXODUS_CONFIG, then the individual switches.
   *
   * @param lookup
   * @return ExportConfig
   */
  static auto Resolve(const EnvLookup& lookup = SystemEnvironment) -> ExportConfig;
  static auto ApplyEnvironment(ExportConfig config, const EnvLookup& lookup) -> ExportConfig;
};
};  // namespace exodus
