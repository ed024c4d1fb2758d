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

#include "decoders/plist/bplist_reader.hpp"

#include <cstring>
#include <string>

#include "utils/string/convert.hpp"

namespace exodus {
namespace {
constexpr size_t kHeaderSize  = 8;
constexpr size_t kTrailerSize = 32;

struct Trailer {
  uint8_t  offset_int_size_;
  uint8_t  object_ref_size_;
  uint64_t num_objects_;
  uint64_t top_object_;
  uint64_t offset_table_offset_;
};

/**
 * @brief Walks one bplist00 buffer. Offsets are validated before every read.
 */
class PlistParser {
 public:
  explicit PlistParser(std::span<const uint8_t> bytes) : bytes_(bytes) {}

  auto Run() -> nlohmann::json {
    if (!BinaryPlistReader::IsBinaryPlist(bytes_)) {
      throw PlistError("BinaryPlistReader: missing bplist00 header");
    }
    if (bytes_.size() < kHeaderSize + kTrailerSize) {
      throw PlistError("BinaryPlistReader: buffer too small for a trailer");
    }
    ReadTrailer();
    return ParseObject(trailer_.top_object_, 0);
  }

 private:
  std::span<const uint8_t> bytes_;
  Trailer                  trailer_{};

  void Require(uint64_t offset, uint64_t length) const {
    if (offset > bytes_.size() || length > bytes_.size() - offset) {
      throw PlistError("BinaryPlistReader: read past end of buffer at offset " +
                       std::to_string(offset));
    }
  }

  auto ReadUInt(uint64_t offset, size_t width) const -> uint64_t {
    if (width == 0 || width > 8) {
      throw PlistError("BinaryPlistReader: unsupported integer width " + std::to_string(width));
    }
    Require(offset, width);
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
      value = (value << 8) | bytes_[offset + i];
    }
    return value;
  }

  void ReadTrailer() {
    const uint64_t base           = bytes_.size() - kTrailerSize;
    trailer_.offset_int_size_     = bytes_[base + 6];
    trailer_.object_ref_size_     = bytes_[base + 7];
    trailer_.num_objects_         = ReadUInt(base + 8, 8);
    trailer_.top_object_          = ReadUInt(base + 16, 8);
    trailer_.offset_table_offset_ = ReadUInt(base + 24, 8);

    if (trailer_.offset_int_size_ == 0 || trailer_.object_ref_size_ == 0) {
      throw PlistError("BinaryPlistReader: corrupt trailer");
    }
    if (trailer_.top_object_ >= trailer_.num_objects_) {
      throw PlistError("BinaryPlistReader: top object out of range");
    }
    if (trailer_.num_objects_ > bytes_.size()) {
      throw PlistError("BinaryPlistReader: object count exceeds buffer size");
    }
    Require(trailer_.offset_table_offset_,
            trailer_.num_objects_ * static_cast<uint64_t>(trailer_.offset_int_size_));
  }

  auto ObjectOffset(uint64_t ref) const -> uint64_t {
    if (ref >= trailer_.num_objects_) {
      throw PlistError("BinaryPlistReader: object reference out of range: " +
                       std::to_string(ref));
    }
    uint64_t offset = ReadUInt(trailer_.offset_table_offset_ + ref * trailer_.offset_int_size_,
                               trailer_.offset_int_size_);
    if (offset < kHeaderSize || offset >= trailer_.offset_table_offset_) {
      throw PlistError("BinaryPlistReader: object offset out of range");
    }
    return offset;
  }

  // Low nibble 0xF means the real count follows as an int object
  auto ReadCount(uint64_t& cursor, uint8_t info) const -> uint64_t {
    if (info != 0x0F) return info;
    Require(cursor, 1);
    uint8_t marker = bytes_[cursor];
    if ((marker & 0xF0) != 0x10) {
      throw PlistError("BinaryPlistReader: malformed length marker");
    }
    size_t   width = size_t{1} << (marker & 0x0F);
    uint64_t count = ReadUInt(cursor + 1, width);
    cursor += 1 + width;
    return count;
  }

  auto ReadRef(uint64_t offset) const -> uint64_t {
    return ReadUInt(offset, trailer_.object_ref_size_);
  }

  auto ParseObject(uint64_t ref, int depth) -> nlohmann::json {
    if (depth > BinaryPlistReader::kMaxDepth) {
      throw PlistError("BinaryPlistReader: nesting too deep");
    }
    uint64_t cursor = ObjectOffset(ref);
    Require(cursor, 1);
    const uint8_t marker = bytes_[cursor++];
    const uint8_t type   = marker >> 4;
    const uint8_t info   = marker & 0x0F;

    switch (type) {
      case 0x0:
        if (info == 0x8) return false;
        if (info == 0x9) return true;
        return nullptr;
      case 0x1: {
        size_t width = size_t{1} << info;
        if (width == 16) {
          // 128-bit ints only carry values that fit the low 8 bytes in practice
          return static_cast<int64_t>(ReadUInt(cursor + 8, 8));
        }
        uint64_t raw = ReadUInt(cursor, width);
        // 8-byte ints are signed, shorter widths are unsigned
        if (width == 8) return static_cast<int64_t>(raw);
        return raw;
      }
      case 0x2: {
        size_t width = size_t{1} << info;
        if (width == 4) {
          uint32_t bits = static_cast<uint32_t>(ReadUInt(cursor, 4));
          float    value;
          std::memcpy(&value, &bits, sizeof(value));
          return static_cast<double>(value);
        }
        if (width == 8) return ReadDouble(cursor);
        throw PlistError("BinaryPlistReader: unsupported real width " + std::to_string(width));
      }
      case 0x3:
        if (info != 0x3) throw PlistError("BinaryPlistReader: malformed date");
        return ReadDouble(cursor);
      case 0x4: {
        uint64_t count = ReadCount(cursor, info);
        Require(cursor, count);
        std::vector<uint8_t> data(bytes_.begin() + cursor, bytes_.begin() + cursor + count);
        return nlohmann::json::binary(std::move(data));
      }
      case 0x5: {
        uint64_t count = ReadCount(cursor, info);
        Require(cursor, count);
        std::string ascii(reinterpret_cast<const char*>(bytes_.data() + cursor), count);
        return conv::SanitizeUtf8(std::move(ascii));
      }
      case 0x6: {
        uint64_t count = ReadCount(cursor, info);
        Require(cursor, count * 2);
        std::u16string units;
        units.reserve(count);
        for (uint64_t i = 0; i < count; ++i) {
          units.push_back(static_cast<char16_t>(ReadUInt(cursor + i * 2, 2)));
        }
        return conv::FromUtf16(units);
      }
      case 0x8: {
        nlohmann::json uid = nlohmann::json::object();
        uid[BinaryPlistReader::kUidKey] = ReadUInt(cursor, static_cast<size_t>(info) + 1);
        return uid;
      }
      case 0xA:
      case 0xC: {
        uint64_t count = ReadCount(cursor, info);
        Require(cursor, count * trailer_.object_ref_size_);
        nlohmann::json array = nlohmann::json::array();
        for (uint64_t i = 0; i < count; ++i) {
          array.push_back(ParseObject(ReadRef(cursor + i * trailer_.object_ref_size_), depth + 1));
        }
        return array;
      }
      case 0xD: {
        uint64_t count = ReadCount(cursor, info);
        Require(cursor, count * 2 * trailer_.object_ref_size_);
        const uint64_t values = cursor + count * trailer_.object_ref_size_;
        nlohmann::json dict   = nlohmann::json::object();
        for (uint64_t i = 0; i < count; ++i) {
          auto key   = ParseObject(ReadRef(cursor + i * trailer_.object_ref_size_), depth + 1);
          auto value = ParseObject(ReadRef(values + i * trailer_.object_ref_size_), depth + 1);
          dict[key.is_string() ? key.get<std::string>() : key.dump()] = std::move(value);
        }
        return dict;
      }
      default:
        throw PlistError("BinaryPlistReader: unknown object marker " + std::to_string(marker));
    }
  }

  auto ReadDouble(uint64_t offset) const -> double {
    uint64_t bits = ReadUInt(offset, 8);
    double   value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
  }
};
}  // namespace

auto BinaryPlistReader::IsBinaryPlist(std::span<const uint8_t> bytes) -> bool {
  static constexpr char kMagic[] = "bplist00";
  return bytes.size() >= kHeaderSize && std::memcmp(bytes.data(), kMagic, kHeaderSize) == 0;
}

auto BinaryPlistReader::Parse(std::span<const uint8_t> bytes) -> nlohmann::json {
  PlistParser parser(bytes);
  return parser.Run();
}

auto BinaryPlistReader::IsUid(const nlohmann::json& value) -> bool {
  return value.is_object() && value.size() == 1 && value.contains(kUidKey) &&
         value[kUidKey].is_number_unsigned();
}

auto BinaryPlistReader::UidOf(const nlohmann::json& value) -> uint64_t {
  return value.at(kUidKey).get<uint64_t>();
}
};  // namespace exodus
