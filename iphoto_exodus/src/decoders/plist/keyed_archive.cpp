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

#include "decoders/plist/keyed_archive.hpp"

#include <string>

#include "decoders/plist/bplist_reader.hpp"

namespace exodus {
namespace {
using json = nlohmann::json;

class ArchiveResolver {
 public:
  explicit ArchiveResolver(const json& objects) : objects_(objects) {}

  auto Resolve(const json& value, int depth) const -> json {
    if (depth > KeyedArchive::kMaxDepth) return nullptr;

    if (BinaryPlistReader::IsUid(value)) {
      const auto index = BinaryPlistReader::UidOf(value);
      if (index >= objects_.size()) {
        throw PlistError("KeyedArchive: UID " + std::to_string(index) + " out of range");
      }
      return Resolve(objects_[index], depth + 1);
    }
    if (value.is_string() && value.get_ref<const std::string&>() == "$null") return nullptr;
    if (value.is_array()) {
      json array = json::array();
      for (const auto& item : value) array.push_back(Resolve(item, depth + 1));
      return array;
    }
    if (!value.is_object()) return value;

    if (value.contains("NS.keys") && value.contains("NS.objects")) {
      const auto& keys   = value["NS.keys"];
      const auto& values = value["NS.objects"];
      if (!keys.is_array() || !values.is_array() || keys.size() != values.size()) {
        throw PlistError("KeyedArchive: NS.keys and NS.objects do not pair up");
      }
      json dict = json::object();
      for (size_t i = 0; i < keys.size(); ++i) {
        json key = Resolve(keys[i], depth + 1);
        dict[key.is_string() ? key.get<std::string>() : key.dump()] =
            Resolve(values[i], depth + 1);
      }
      return dict;
    }
    if (value.contains("NS.objects")) return Resolve(value["NS.objects"], depth + 1);
    if (value.contains("NS.string")) return Resolve(value["NS.string"], depth + 1);
    if (value.contains("NS.bytes")) return Resolve(value["NS.bytes"], depth + 1);

    json object = json::object();
    for (const auto& [key, item] : value.items()) {
      if (key == "$class") continue;
      object[key] = Resolve(item, depth + 1);
    }
    return object;
  }

 private:
  const json& objects_;
};
}  // namespace

auto KeyedArchive::IsKeyedArchive(const nlohmann::json& plist) -> bool {
  return plist.is_object() && plist.contains("$objects") && plist["$objects"].is_array() &&
         plist.contains("$top");
}

auto KeyedArchive::Materialize(const nlohmann::json& archive) -> nlohmann::json {
  if (!IsKeyedArchive(archive)) {
    throw PlistError("KeyedArchive: not a keyed archive");
  }
  ArchiveResolver resolver(archive["$objects"]);
  const auto&     top = archive["$top"];
  if (top.is_object() && top.contains("root")) {
    return resolver.Resolve(top["root"], 0);
  }
  return resolver.Resolve(top, 0);
}

auto KeyedArchive::Decode(std::span<const uint8_t> bytes) -> nlohmann::json {
  auto plist = BinaryPlistReader::Parse(bytes);
  if (IsKeyedArchive(plist)) return Materialize(plist);
  return plist;
}
};  // namespace exodus
