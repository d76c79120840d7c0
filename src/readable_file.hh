#pragma once

#include "outcome.hh"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace chunkspan {

/// Random access byte source over one file.
struct SeekableReader {  // NOLINT
  using Ptr = std::unique_ptr<SeekableReader>;

  virtual ~SeekableReader() = default;

  virtual Result<void> seek(uint64_t offset) = 0;

  /// Reads at most buf.size() bytes at the current position. Returns 0 only
  /// at end of file.
  virtual Result<std::size_t> read(std::span<char> buf) = 0;

  /// Releases the underlying handle. Safe to call more than once.
  virtual void close() = 0;
};
using SeekableReaderPtr = std::unique_ptr<SeekableReader>;

/// A file handed to the chunker: its identifier, its byte length, and a way
/// to open readers over its content.
struct ReadableFile {  // NOLINT
  virtual ~ReadableFile() = default;
  virtual const std::string &id() const = 0;
  virtual uint64_t size() const = 0;
  virtual Result<SeekableReaderPtr> open_seekable() const = 0;
};

class LocalFile final : public ReadableFile {
public:
  using Ptr = std::unique_ptr<LocalFile>;

  LocalFile(std::string path, uint64_t size)
      : path_(std::move(path)), size_(size) {}

  const std::string &id() const final {
    return path_;
  }

  uint64_t size() const final {
    return size_;
  }

  Result<SeekableReaderPtr> open_seekable() const final;

  /// Stats `path` and returns a file whose id is the path itself.
  static Result<Ptr> open(const std::string &path);

private:
  std::string path_;
  uint64_t size_;
};

}  // namespace chunkspan
