#pragma once

#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <vector>

namespace chunkspan {

/// 1-based position of a chunk inside its file.
using ChunkIndex = uint64_t;

/// Half-open interval [from_, to_) of chunk indices, 0 < from_ <= to_.
struct OffsetRange {
  ChunkIndex from_;
  ChunkIndex to_;

  uint64_t size() const {
    return to_ - from_;
  }

  bool empty() const {
    return from_ == to_;
  }

  bool contains(ChunkIndex i) const {
    return from_ <= i && i < to_;
  }

  /// Cuts the range into consecutive pieces of `desired_per_split` indices.
  /// A tail shorter than `min_per_split`, or than a quarter of
  /// `desired_per_split`, is folded into the piece before it.
  std::vector<OffsetRange> split(uint64_t desired_per_split,
                                 uint64_t min_per_split) const;

  std::strong_ordering operator<=>(const OffsetRange &) const = default;
};

/// Number of chunk slots reserved for a file of `total_bytes`. Always one
/// more than the number of full chunks, so an exact multiple of `chunk_size`
/// ends with an empty chunk.
inline uint64_t chunk_count(uint64_t total_bytes, uint32_t chunk_size) {
  return 1 + total_bytes / chunk_size;
}

/// Restriction covering every chunk of a file: [1, 1 + chunk_count).
OffsetRange initial_restriction(uint64_t total_bytes, uint32_t chunk_size);

constexpr uint64_t chunk_byte_offset(ChunkIndex index, uint32_t chunk_size) {
  return static_cast<uint64_t>(chunk_size) * (index - 1);
}

std::vector<OffsetRange> split_into_unit_restrictions(OffsetRange range);

}  // namespace chunkspan

template <>
struct fmt::formatter<chunkspan::OffsetRange>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const chunkspan::OffsetRange &r, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "[{}, {})", r.from_, r.to_);
  }
};
