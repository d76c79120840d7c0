#include "range_tracker.hh"
#include "log.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace chunkspan {

OffsetRangeTracker::OffsetRangeTracker(OffsetRange range)
    : range_(range), cursor_(range.from_ - 1) {
  if (range.from_ == 0 || range.from_ > range.to_) {
    throw std::invalid_argument(
        fmt::format("invalid restriction {}, chunk indices start at 1", range));
  }
}

bool OffsetRangeTracker::try_claim(ChunkIndex i) {
  if (done_) {
    return false;
  }
  if (i != cursor_ + 1 || i >= range_.to_) {
    TRACEF("claim {} rejected, live range {}", i, current_restriction());
    done_ = true;
    return false;
  }
  cursor_ = i;
  return true;
}

OffsetRange OffsetRangeTracker::release() {
  auto residual = current_restriction();
  range_.to_ = cursor_ + 1;
  done_ = true;
  DEBUGF("released {}, keeping {}", residual, range_);
  return residual;
}

std::optional<OffsetRangeTracker::SplitResult> OffsetRangeTracker::try_split(
    double fraction_of_remainder) {
  if (done_) {
    return std::nullopt;
  }
  fraction_of_remainder = std::clamp(fraction_of_remainder, 0.0, 1.0);

  auto rest = current_restriction();
  auto keep = static_cast<uint64_t>(
      std::ceil(static_cast<double>(rest.size()) * fraction_of_remainder));
  auto split_pos = rest.from_ + keep;
  if (split_pos >= range_.to_) {
    return std::nullopt;
  }

  SplitResult ret{
      .primary_ = OffsetRange{.from_ = range_.from_, .to_ = split_pos},
      .residual_ = OffsetRange{.from_ = split_pos, .to_ = range_.to_},
  };
  range_.to_ = split_pos;
  DEBUGF("split at {}: primary {} residual {}", split_pos, ret.primary_,
         ret.residual_);
  return ret;
}

Result<void> OffsetRangeTracker::check_done() const {
  if (cursor_ + 1 >= range_.to_) {
    return outcome::success();
  }
  return make_error(ChunkErrc::unclaimed_work,
                    ErrorInfo{
                        .detail = fmt::format("{} left unclaimed in {}",
                                              current_restriction(), range_),
                    });
}

}  // namespace chunkspan
