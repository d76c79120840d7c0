#include "chunk_extractor.hh"

#include <stdexcept>

namespace chunkspan {

ChunkExtractor::ChunkExtractor(uint32_t chunk_size) : chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("chunk size must be > 0");
  }
}

Result<ChunkRecord> ChunkExtractor::extract(const std::string &file_id,
                                            ChunkIndex index,
                                            SeekableReader &reader) const {
  if (index == 0) {
    return make_file_error(ChunkErrc::invalid_argument, file_id, std::nullopt,
                           "chunk indices start at 1");
  }

  auto offset = chunk_byte_offset(index, chunk_size_);
  if (auto ret = reader.seek(offset); !ret) {
    return make_file_error(ChunkErrc::seek_failed, file_id, offset,
                           fmt::format("{}", ret.error().message()));
  }

  std::string data;
  data.resize(chunk_size_);
  std::size_t filled = 0;
  // readers may return short reads before the end of the file
  while (filled < data.size()) {
    auto n = reader.read(std::span<char>(data).subspan(filled));
    if (!n) {
      return make_file_error(ChunkErrc::read_failed, file_id, offset + filled,
                             fmt::format("{}", n.error().message()));
    }
    if (n.value() == 0) {
      break;
    }
    filled += n.value();
  }
  data.resize(filled);

  return ChunkRecord{
      .file_id = file_id,
      .index = index,
      .data = std::move(data),
  };
}

}  // namespace chunkspan
