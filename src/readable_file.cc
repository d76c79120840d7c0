#include "readable_file.hh"
#include "log.hh"

#include <sys/types.h>
#include <cerrno>
#include <cstdio>

namespace chunkspan {

namespace {

class FileReader final : public SeekableReader {
public:
  FileReader(std::FILE *file, std::string path)
      : file_(file), path_(std::move(path)) {}

  FileReader(const FileReader &) = delete;
  FileReader &operator=(const FileReader &) = delete;

  ~FileReader() final {
    close();
  }

  Result<void> seek(uint64_t offset) final {
    if (file_ == nullptr) {
      return make_file_error(ChunkErrc::io_error, path_, offset,
                             "reader already closed");
    }
    if (fseeko(file_, static_cast<off_t>(offset), SEEK_SET) != 0) {
      return make_file_error(ChunkErrc::io_error, path_, offset,
                             errno_message(errno));
    }
    return outcome::success();
  }

  Result<std::size_t> read(std::span<char> buf) final {
    if (file_ == nullptr) {
      return make_file_error(ChunkErrc::io_error, path_, std::nullopt,
                             "reader already closed");
    }
    auto n = fread(buf.data(), sizeof(char), buf.size(), file_);
    if (n < buf.size() && ferror(file_) != 0) {
      auto err = errno;
      auto pos = ftello(file_);
      return make_file_error(
          ChunkErrc::io_error, path_,
          pos == -1 ? std::nullopt : std::optional<uint64_t>(pos),
          errno_message(err));
    }
    return n;
  }

  void close() final {
    if (file_ == nullptr) {
      return;
    }
    if (fclose(file_) != 0) {  // NOLINT
      WARNF("failed to close `{}`: {}", path_, errno_message(errno));
    }
    file_ = nullptr;
  }

private:
  std::FILE *file_;
  std::string path_;
};

}  // namespace

Result<SeekableReaderPtr> LocalFile::open_seekable() const {
  auto file = fopen(path_.c_str(), "rb");  // NOLINT
  if (file == nullptr) {
    return make_file_error(ChunkErrc::io_error, path_, std::nullopt,
                           errno_message(errno));
  }
  return std::make_unique<FileReader>(file, path_);
}

Result<LocalFile::Ptr> LocalFile::open(const std::string &path) {
  auto file = fopen(path.c_str(), "rb");  // NOLINT
  if (file == nullptr) {
    return make_file_error(ChunkErrc::io_error, path, std::nullopt,
                           errno_message(errno));
  }

  auto get_size = [&path](std::FILE *f) -> Result<uint64_t> {
    if (fseeko(f, 0, SEEK_END) != 0) {
      return make_file_error(ChunkErrc::io_error, path, std::nullopt,
                             errno_message(errno));
    }
    auto file_size = ftello(f);
    if (file_size == -1) {
      return make_file_error(ChunkErrc::io_error, path, std::nullopt,
                             errno_message(errno));
    }
    return static_cast<uint64_t>(file_size);
  };

  auto file_size = get_size(file);
  fclose(file);  // NOLINT
  if (!file_size) {
    return std::move(file_size).error();
  }

  return std::make_unique<LocalFile>(path, file_size.value());
}

}  // namespace chunkspan
