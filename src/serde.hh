#pragma once

#include "chunk_extractor.hh"
#include "outcome.hh"

#include <boost/endian/conversion.hpp>
#include <boost/pfr.hpp>

#include <concepts>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

namespace chunkspan {

/// Little endian, variable width framing for chunk records. Unsigned values
/// below 0xFD take one byte; larger ones are a marker byte followed by a
/// 2, 4 or 8 byte integer. Strings are a length followed by raw bytes.
struct Serializer {
  std::string buffer;

  std::string take() {
    return std::move(buffer);
  }

  void write_uint(uint64_t value) {
    if (value < 0xFF - 2) {
      pack_int<uint8_t>(value);
    } else if (value <= std::numeric_limits<uint16_t>::max()) {
      pack_int<uint8_t>(0xFF - 2);
      pack_int<uint16_t>(value);
    } else if (value <= std::numeric_limits<uint32_t>::max()) {
      pack_int<uint8_t>(0xFF - 1);
      pack_int<uint32_t>(value);
    } else {
      pack_int<uint8_t>(0xFF);
      pack_int<uint64_t>(value);
    }
  }

  void write_str(std::string_view str) {
    write_uint(str.size());
    auto size = buffer.size();
    buffer.resize(size + str.size());
    std::memcpy(buffer.data() + size, str.data(), str.size());  // NOLINT
  }

private:
  template <typename T>
  void pack_int(uint64_t value) {
    T v = boost::endian::native_to_little(static_cast<T>(value));
    auto size = buffer.size();
    buffer.resize(size + sizeof(v));
    std::memcpy(buffer.data() + size, &v, sizeof(v));  // NOLINT
  }
};

/// Reads what Serializer wrote. Input that ends in the middle of a value
/// yields ChunkErrc::truncated_frame and leaves `pos` where the value began.
struct Deserializer {
  std::string_view buffer;
  std::size_t pos = 0;

  bool done() const {
    return pos >= buffer.size();
  }

  Result<uint64_t> read_uint() {
    auto start = pos;
    auto tag = TRYX(pick_int<uint8_t>());
    if (tag < 0xFF - 2) {
      return static_cast<uint64_t>(tag);
    }
    auto ret = read_wide_uint(tag);
    if (!ret) {
      pos = start;
    }
    return ret;
  }

  Result<std::string_view> read_str() {
    auto start = pos;
    auto length = TRYX(read_uint());
    if (length > buffer.size() - pos) {
      auto left = buffer.size() - pos;
      pos = start;
      return truncated(length, left);
    }
    auto str = buffer.substr(pos, length);
    pos += length;
    return str;
  }

private:
  Result<uint64_t> read_wide_uint(uint8_t tag) {
    if (tag == 0xFF - 2) {
      return static_cast<uint64_t>(TRYX(pick_int<uint16_t>()));
    }
    if (tag == 0xFF - 1) {
      return static_cast<uint64_t>(TRYX(pick_int<uint32_t>()));
    }
    return TRYX(pick_int<uint64_t>());
  }

  template <typename T>
  Result<T> pick_int() {
    if (buffer.size() - pos < sizeof(T)) {
      return truncated(sizeof(T), buffer.size() - pos);
    }
    T value;
    std::memcpy(&value, buffer.data() + pos, sizeof(value));  // NOLINT
    pos += sizeof(value);
    return boost::endian::little_to_native(value);
  }

  SYSTEM_ERROR2_NAMESPACE::EnumPayloadError<ChunkErrc, ErrorInfo> truncated(
      uint64_t wanted, uint64_t left) const {
    return make_error(ChunkErrc::truncated_frame,
                      ErrorInfo{
                          .offset = pos,
                          .detail = fmt::format("need {} bytes, {} left",
                                                wanted, left),
                      });
  }
};

template <std::unsigned_integral T>
void serialize(Serializer &serializer, T value) {
  serializer.write_uint(uint64_t(value));
}

inline void serialize(Serializer &serializer, const std::string &str) {
  serializer.write_str(str);
}

template <typename T>
  requires std::is_aggregate_v<T>
void serialize(Serializer &serializer, const T &value) {
  boost::pfr::for_each_field(
      value, [&](const auto &field) { serialize(serializer, field); });
}

template <std::unsigned_integral T>
Result<void> deserialize(Deserializer &deserializer, T &value) {
  auto v = TRYX(deserializer.read_uint());
  if (v > std::numeric_limits<T>::max()) {
    return make_error(ChunkErrc::truncated_frame,
                      ErrorInfo{
                          .offset = deserializer.pos,
                          .detail = fmt::format("{} does not fit {} bytes", v,
                                                sizeof(T)),
                      });
  }
  value = static_cast<T>(v);
  return outcome::success();
}

inline Result<void> deserialize(Deserializer &deserializer,
                                std::string &value) {
  auto str = TRYX(deserializer.read_str());
  value = std::string(str);
  return outcome::success();
}

template <typename T>
  requires std::is_aggregate_v<T>
Result<void> deserialize(Deserializer &deserializer, T &value) {
  Result<void> ret = outcome::success();
  boost::pfr::for_each_field(value, [&](auto &field) {
    if (ret) {
      ret = deserialize(deserializer, field);
    }
  });
  return ret;
}

/// One frame per record: file id, chunk index, chunk bytes.
inline std::string encode_record(const ChunkRecord &record) {
  Serializer serializer;
  serialize(serializer, record);
  return serializer.take();
}

/// On failure the deserializer is rewound to the start of the frame, so a
/// caller streaming frames in can retry once more bytes have arrived.
inline Result<ChunkRecord> decode_record(Deserializer &deserializer) {
  auto start = deserializer.pos;
  ChunkRecord record{};
  if (auto ret = deserialize(deserializer, record); !ret) {
    deserializer.pos = start;
    return std::move(ret).error();
  }
  return record;
}

}  // namespace chunkspan
