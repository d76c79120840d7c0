#include "chunk_range.hh"

#include <algorithm>
#include <cassert>

namespace chunkspan {

std::vector<OffsetRange> OffsetRange::split(uint64_t desired_per_split,
                                            uint64_t min_per_split) const {
  desired_per_split = std::max<uint64_t>(desired_per_split, 1);

  std::vector<OffsetRange> ret;
  auto start = from_;
  while (start < to_) {
    auto end = std::min(start + desired_per_split, to_);
    auto remaining = to_ - end;
    if (remaining < desired_per_split / 4 || remaining < min_per_split) {
      end = to_;
    }
    ret.push_back(OffsetRange{
        .from_ = start,
        .to_ = end,
    });
    start = end;
  }
  return ret;
}

OffsetRange initial_restriction(uint64_t total_bytes, uint32_t chunk_size) {
  assert(chunk_size != 0);
  return OffsetRange{
      .from_ = 1,
      .to_ = 1 + chunk_count(total_bytes, chunk_size),
  };
}

std::vector<OffsetRange> split_into_unit_restrictions(OffsetRange range) {
  return range.split(1, 1);
}

}  // namespace chunkspan
