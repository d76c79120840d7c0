#pragma once

#include "readable_file.hh"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <limits>
#include <optional>
#include <string_view>

namespace chunkspan {

/// Failures a MemoryFile injects into its readers.
struct FaultPlan {
  bool fail_open = false;
  std::optional<uint64_t> fail_seek_at;
  /// Reads starting at or past this position fail.
  std::optional<uint64_t> fail_read_at;
  /// Caps every read, to exercise short reads before end of file.
  std::size_t max_read = std::numeric_limits<std::size_t>::max();
};

/// In memory ReadableFile for tests. Counts opened and closed readers so
/// tests can check that every reader is released.
class MemoryFile final : public ReadableFile {
public:
  MemoryFile(std::string id, std::string data, FaultPlan faults = {})
      : id_(std::move(id)), data_(std::move(data)), faults_(faults) {}

  const std::string &id() const final {
    return id_;
  }

  uint64_t size() const final {
    return data_.size();
  }

  Result<SeekableReaderPtr> open_seekable() const final {
    if (faults_.fail_open) {
      return make_file_error(ChunkErrc::io_error, id_, std::nullopt,
                             "open refused");
    }
    opened_++;
    return std::make_unique<Reader>(*this);
  }

  const std::string &data() const {
    return data_;
  }

  int opened() const {
    return opened_;
  }

  int closed() const {
    return closed_;
  }

private:
  class Reader final : public SeekableReader {
  public:
    explicit Reader(const MemoryFile &file) : file_(file) {}

    Reader(const Reader &) = delete;
    Reader &operator=(const Reader &) = delete;

    ~Reader() final {
      close();
    }

    Result<void> seek(uint64_t offset) final {
      if (file_.faults_.fail_seek_at == offset) {
        return make_file_error(ChunkErrc::io_error, file_.id_, offset,
                               "seek refused");
      }
      pos_ = offset;
      return outcome::success();
    }

    Result<std::size_t> read(std::span<char> buf) final {
      if (closed_) {
        return make_file_error(ChunkErrc::io_error, file_.id_, pos_,
                               "read after close");
      }
      if (file_.faults_.fail_read_at && pos_ >= *file_.faults_.fail_read_at) {
        return make_file_error(ChunkErrc::io_error, file_.id_, pos_,
                               "read refused");
      }
      const auto &data = file_.data_;
      if (pos_ >= data.size()) {
        return std::size_t{0};
      }
      auto n = std::min({buf.size(), file_.faults_.max_read,
                         static_cast<std::size_t>(data.size() - pos_)});
      std::memcpy(buf.data(), data.data() + pos_, n);  // NOLINT
      pos_ += n;
      return n;
    }

    void close() final {
      if (!closed_) {
        closed_ = true;
        file_.closed_++;
      }
    }

  private:
    const MemoryFile &file_;
    uint64_t pos_ = 0;
    bool closed_ = false;
  };

  std::string id_;
  std::string data_;
  FaultPlan faults_;
  mutable std::atomic<int> opened_{0};
  mutable std::atomic<int> closed_{0};
};

/// "0123456789abcdef..." repeated up to `size` bytes.
inline std::string make_pattern(std::size_t size) {
  static constexpr std::string_view kDigits =
      "0123456789abcdefghijklmnopqrstuvwxyz";
  std::string ret;
  ret.reserve(size);
  for (std::size_t i = 0; i < size; i++) {
    ret.push_back(kDigits[i % kDigits.size()]);
  }
  return ret;
}

}  // namespace chunkspan
