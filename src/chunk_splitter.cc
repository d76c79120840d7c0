#include "chunk_splitter.hh"
#include "log.hh"

#include <absl/cleanup/cleanup.h>

namespace chunkspan {

ChunkSplitter::ChunkSplitter(uint32_t chunk_size) : extractor_(chunk_size) {}

OffsetRange ChunkSplitter::initial_restriction(const ReadableFile &file) const {
  auto range = chunkspan::initial_restriction(file.size(), chunk_size());
  INFOF("splitting file `{}` ({} bytes) into {} chunks of {} bytes", file.id(),
        file.size(), range.size(), chunk_size());
  return range;
}

std::vector<OffsetRange> ChunkSplitter::split_restriction(
    const ReadableFile &file, OffsetRange range) const {
  auto pieces = split_into_unit_restrictions(range);
  TRACEF("file `{}`: {} split into {} pieces", file.id(), range, pieces.size());
  return pieces;
}

Result<void> ChunkSplitter::process(const ReadableFile &file,
                                    OffsetRangeTracker &tracker,
                                    const Receiver &out) const {
  auto opened = file.open_seekable();
  if (!opened) {
    ERRORF("failed to open file `{}`: {}", file.id(), opened.error());
    return make_file_error(ChunkErrc::open_failed, file.id(), std::nullopt,
                           fmt::format("{}", opened.error().message()));
  }
  auto reader = std::move(opened).value();
  absl::Cleanup closer = [&reader] { reader->close(); };

  for (auto i = tracker.current_restriction().from_; tracker.try_claim(i);
       ++i) {
    auto chunk = TRYX(extractor_.extract(file.id(), i, *reader));
    DEBUGF("current restriction: {}. chunk size: {} bytes. file: `{}`",
           tracker.current_restriction(), chunk.data.size(), file.id());
    out(std::move(chunk));
  }
  return outcome::success();
}

}  // namespace chunkspan
