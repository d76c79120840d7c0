#pragma once

#include "chunk_extractor.hh"
#include "chunk_range.hh"
#include "range_tracker.hh"
#include "readable_file.hh"

#include <functional>
#include <vector>

namespace chunkspan {

/// Splits files into fixed size chunks in a way an execution engine can
/// partition: the engine asks for the initial restriction of a file,
/// optionally splits it, and runs process() once per piece with a tracker
/// of its own. Pieces share no state and may run on different threads.
class ChunkSplitter {
public:
  using Receiver = std::function<void(ChunkRecord)>;

  /// Throws std::invalid_argument when `chunk_size` is 0.
  explicit ChunkSplitter(uint32_t chunk_size);

  OffsetRange initial_restriction(const ReadableFile &file) const;

  std::vector<OffsetRange> split_restriction(const ReadableFile &file,
                                             OffsetRange range) const;

  OffsetRangeTracker new_tracker(OffsetRange range) const {
    return OffsetRangeTracker(range);
  }

  /// Claims indices from `tracker` in order and hands every chunk read to
  /// `out`. Returns once the tracker refuses a claim, or with the first
  /// failure to open or read the file. The reader opened here is closed on
  /// every path out.
  Result<void> process(const ReadableFile &file, OffsetRangeTracker &tracker,
                       const Receiver &out) const;

  uint32_t chunk_size() const {
    return extractor_.chunk_size();
  }

private:
  ChunkExtractor extractor_;
};

}  // namespace chunkspan
