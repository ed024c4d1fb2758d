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

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace exodus {
// Crop window in master pixels. The origin is the bottom-left corner of the master.
struct CropOperation {
  double x_      = 0.0;
  double y_      = 0.0;
  double width_  = 0.0;
  double height_ = 0.0;
};

// Straighten angle in degrees
struct StraightenOperation {
  double angle_ = 0.0;
};

// Any edit that does not move face regions, or whose blob could not be read
struct OtherOperation {
  std::string name_;
};

using EditOperation = std::variant<CropOperation, StraightenOperation, OtherOperation>;

struct DecodedEdit {
  std::string   name_;
  int64_t       adj_index_ = 0;
  EditOperation operation_;
};

class EditOperationDecoder {
 public:
  static constexpr const char* kCropOperation           = "RKCropOperation";
  static constexpr const char* kStraightenCropOperation = "RKStraightenCropOperation";

  static constexpr const char* kTagXOrigin              = "inputXOrigin";
  static constexpr const char* kTagYOrigin              = "inputYOrigin";
  static constexpr const char* kTagWidth                = "inputWidth";
  static constexpr const char* kTagHeight               = "inputHeight";
  static constexpr const char* kTagRotation             = "inputRotation";

  /**
   * @brief Decode one RKImageAdjustment row. Never throws: unreadable blobs and missing tags
   * produce an OtherOperation and a diagnostic on stderr.
   *
   * @param name adjustment name, e.g. RKCropOperation
   * @param blob binary plist stored in the data column
   * @return EditOperation
   */
  static auto Decode(const std::string& name, std::span<const uint8_t> blob) -> EditOperation;

  /**
   * @brief Decode from an already materialized mapping
   */
  static auto FromMapping(const std::string& name, const nlohmann::json& mapping)
      -> EditOperation;

  /**
   * @brief Depth-first search for a numeric value stored under tag anywhere in the mapping
   */
  static auto FindNumber(const nlohmann::json& mapping, const std::string& tag)
      -> std::optional<double>;

  // The last crop of an edit stack wins
  static auto LastCrop(const std::vector<DecodedEdit>& edits) -> std::optional<CropOperation>;
};
};  // namespace exodus
