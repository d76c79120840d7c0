#pragma once

#include "chunk_range.hh"
#include "outcome.hh"
#include "readable_file.hh"

#include <cstdint>
#include <string>

namespace chunkspan {

/// One emitted piece of a file. `data` holds chunk_size bytes except for the
/// last index of the file, which holds whatever is left (possibly nothing).
struct ChunkRecord {
  std::string file_id;
  ChunkIndex index;
  std::string data;

  bool operator==(const ChunkRecord &) const = default;
};

class ChunkExtractor {
public:
  /// Throws std::invalid_argument when `chunk_size` is 0.
  explicit ChunkExtractor(uint32_t chunk_size);

  /// Reads chunk `index` of `file_id` through `reader`. Failures are tagged
  /// with the file id and the byte offset of the chunk; nothing is returned
  /// for a chunk that could not be read completely.
  Result<ChunkRecord> extract(const std::string &file_id, ChunkIndex index,
                              SeekableReader &reader) const;

  uint32_t chunk_size() const {
    return chunk_size_;
  }

private:
  uint32_t chunk_size_;
};

}  // namespace chunkspan
