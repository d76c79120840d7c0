#pragma once

#include "chunk_range.hh"
#include "outcome.hh"

#include <optional>

namespace chunkspan {

/// Claim bookkeeping for one restriction. Indices must be claimed one by one
/// starting at from_; the first claim that is out of order or outside the
/// live range moves the tracker to the done state for good.
///
/// Owned by a single worker. Nothing here is synchronized: an engine that
/// wants to checkpoint or hand off work calls release() or try_split() from
/// the thread driving the claims.
class OffsetRangeTracker {
public:
  struct SplitResult {
    OffsetRange primary_;
    OffsetRange residual_;
  };

  struct Progress {
    uint64_t completed_;
    uint64_t remaining_;
  };

  explicit OffsetRangeTracker(OffsetRange range);

  bool try_claim(ChunkIndex i);

  /// Unclaimed suffix [last claimed + 1, to_).
  OffsetRange current_restriction() const {
    return OffsetRange{
        .from_ = cursor_ + 1,
        .to_ = range_.to_,
    };
  }

  OffsetRange remaining() const {
    return current_restriction();
  }

  /// Gives up everything not yet claimed and finishes the tracker. The
  /// returned range is what another worker must process.
  OffsetRange release();

  /// Splits the unclaimed suffix after ceil(remaining * fraction) indices.
  /// This tracker keeps the primary part and goes on claiming; nothing is
  /// returned when the residual would be empty.
  std::optional<SplitResult> try_split(double fraction_of_remainder);

  Result<void> check_done() const;

  Progress progress() const {
    return Progress{
        .completed_ = cursor_ + 1 - range_.from_,
        .remaining_ = range_.to_ - (cursor_ + 1),
    };
  }

  bool is_done() const {
    return done_;
  }

  /// The range this tracker is responsible for, shrunk by any split.
  OffsetRange restriction() const {
    return range_;
  }

private:
  OffsetRange range_;
  ChunkIndex cursor_;
  bool done_ = false;
};

}  // namespace chunkspan
