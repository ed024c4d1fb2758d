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

#include "edit/edit_operation.hpp"

#include <iostream>

#include "decoders/plist/bplist_reader.hpp"
#include "decoders/plist/keyed_archive.hpp"

namespace exodus {
namespace {
constexpr int kMaxSearchDepth = 64;

auto FindNumberImpl(const nlohmann::json& node, const std::string& tag, int depth)
    -> std::optional<double> {
  if (depth > kMaxSearchDepth) return std::nullopt;
  if (node.is_object()) {
    auto it = node.find(tag);
    if (it != node.end() && it->is_number()) return it->get<double>();
    for (const auto& item : node) {
      if (auto found = FindNumberImpl(item, tag, depth + 1)) return found;
    }
  } else if (node.is_array()) {
    for (const auto& item : node) {
      if (auto found = FindNumberImpl(item, tag, depth + 1)) return found;
    }
  }
  return std::nullopt;
}

void ReportMissingTags(const std::string& name) {
  std::cerr << "EditOperationDecoder: " << name
            << " carries no usable region tags, treated as a no-op edit" << std::endl;
}
}  // namespace

auto EditOperationDecoder::Decode(const std::string& name, std::span<const uint8_t> blob)
    -> EditOperation {
  if (name != kCropOperation && name != kStraightenCropOperation) {
    return OtherOperation{name};
  }
  try {
    return FromMapping(name, KeyedArchive::Decode(blob));
  } catch (const PlistError& e) {
    std::cerr << "EditOperationDecoder: " << name << " blob unreadable: " << e.what()
              << std::endl;
    return OtherOperation{name};
  }
}

auto EditOperationDecoder::FromMapping(const std::string& name, const nlohmann::json& mapping)
    -> EditOperation {
  if (name == kCropOperation) {
    auto x = FindNumber(mapping, kTagXOrigin);
    auto y = FindNumber(mapping, kTagYOrigin);
    auto w = FindNumber(mapping, kTagWidth);
    auto h = FindNumber(mapping, kTagHeight);
    if (x && y && w && h && *w > 0.0 && *h > 0.0) {
      return CropOperation{*x, *y, *w, *h};
    }
    ReportMissingTags(name);
    return OtherOperation{name};
  }
  if (name == kStraightenCropOperation) {
    if (auto angle = FindNumber(mapping, kTagRotation)) {
      return StraightenOperation{*angle};
    }
    ReportMissingTags(name);
    return OtherOperation{name};
  }
  return OtherOperation{name};
}

auto EditOperationDecoder::FindNumber(const nlohmann::json& mapping, const std::string& tag)
    -> std::optional<double> {
  return FindNumberImpl(mapping, tag, 0);
}

auto EditOperationDecoder::LastCrop(const std::vector<DecodedEdit>& edits)
    -> std::optional<CropOperation> {
  std::optional<CropOperation> crop;
  for (const auto& edit : edits) {
    if (auto op = std::get_if<CropOperation>(&edit.operation_)) crop = *op;
  }
  return crop;
}
};  // namespace exodus
