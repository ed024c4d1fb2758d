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

#include "app/export_config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace exodus {
namespace {
auto IsTruthy(const std::string& value) -> bool {
  return !value.empty() && value != "0" && value != "false" && value != "FALSE";
}

auto ParseStartId(const std::string& value) -> model_id_t {
  size_t     consumed = 0;
  model_id_t id       = 0;
  try {
    id = static_cast<model_id_t>(std::stoll(value, &consumed));
  } catch (const std::exception&) {
    throw std::invalid_argument("ExportConfig: EXODUS_START_ID is not a number: " + value);
  }
  if (consumed != value.size()) {
    throw std::invalid_argument("ExportConfig: EXODUS_START_ID is not a number: " + value);
  }
  return id;
}
}  // namespace

auto SystemEnvironment(const char* name) -> std::optional<std::string> {
  const char* value = std::getenv(name);
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

auto ExportConfig::ToJson() const -> nlohmann::json {
  nlohmann::json document;
  document["rotation_policy"]     = RotationPolicyToString(rotation_policy_);
  document["recompute_from_crop"] = recompute_from_crop_;
  document["start_id"]            = start_id_;
  document["caption_pattern"] =
      caption_pattern_.has_value() ? nlohmann::json(*caption_pattern_) : nlohmann::json();
  document["verbose"]         = verbose_;
  document["write_sidecars"]  = write_sidecars_;
  document["scan_orphans"]    = scan_orphans_;
  document["no_event_folder"] = no_event_folder_;
  return document;
}

auto ExportConfig::GetGeometryOptions() const -> GeometryOptions {
  GeometryOptions options;
  options.rotation_policy_     = rotation_policy_;
  options.recompute_from_crop_ = recompute_from_crop_;
  return options;
}

auto ExportConfig::FromJson(const nlohmann::json& document) -> ExportConfig {
  if (!document.is_object()) {
    throw std::runtime_error("ExportConfig: Configuration must be a JSON object");
  }
  ExportConfig config;
  try {
    if (document.contains("rotation_policy")) {
      config.rotation_policy_ =
          RotationPolicyFromString(document.at("rotation_policy").get<std::string>());
    }
    config.recompute_from_crop_ =
        document.value("recompute_from_crop", config.recompute_from_crop_);
    config.start_id_ = document.value("start_id", config.start_id_);
    if (document.contains("caption_pattern") && !document.at("caption_pattern").is_null()) {
      config.caption_pattern_ = document.at("caption_pattern").get<std::string>();
    }
    config.verbose_         = document.value("verbose", config.verbose_);
    config.write_sidecars_  = document.value("write_sidecars", config.write_sidecars_);
    config.scan_orphans_    = document.value("scan_orphans", config.scan_orphans_);
    config.no_event_folder_ = document.value("no_event_folder", config.no_event_folder_);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("ExportConfig: ") + e.what());
  }
  return config;
}

auto ExportConfig::LoadFromFile(const file_path_t& path) -> ExportConfig {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("ExportConfig: Failed to open " + path.string());
  }
  nlohmann::json document;
  try {
    file >> document;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("ExportConfig: Malformed " + path.string() + ": " + e.what());
  }
  return FromJson(document);
}

auto ExportConfig::Resolve(const EnvLookup& lookup) -> ExportConfig {
  ExportConfig config;
  if (auto path = lookup(kEnvConfig); path.has_value() && !path->empty()) {
    config = LoadFromFile(*path);
  }
  return ApplyEnvironment(std::move(config), lookup);
}

auto ExportConfig::ApplyEnvironment(ExportConfig config, const EnvLookup& lookup)
    -> ExportConfig {
  if (auto debug = lookup(kEnvDebug)) {
    config.verbose_ = IsTruthy(*debug);
  }
  if (auto start_id = lookup(kEnvStartId); start_id.has_value() && !start_id->empty()) {
    config.start_id_ = ParseStartId(*start_id);
  }
  if (auto caption = lookup(kEnvCaption); caption.has_value() && !caption->empty()) {
    config.caption_pattern_ = *caption;
  }
  return config;
}
};  // namespace exodus
