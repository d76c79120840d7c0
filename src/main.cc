#include "chunk_splitter.hh"
#include "log.hh"
#include "outcome.hh"
#include "serde.hh"

#include <absl/cleanup/cleanup.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <fmt/format.h>

#include <cerrno>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

ABSL_FLAG(uint32_t, chunk_size, 1U << 20, "bytes per chunk");
ABSL_FLAG(std::string, output, "-",
          "file receiving the encoded chunk records, - for stdout");
ABSL_FLAG(bool, unit_split, false,
          "give every chunk its own restriction and tracker, as an engine "
          "does after pre-splitting");
ABSL_FLAG(int, verbosity, 0, "1 logs every chunk, 2 logs claims and splits");

namespace chunkspan {
namespace {

Result<void> split_file(const ChunkSplitter &splitter, const std::string &path,
                        bool unit_split, std::FILE *sink) {
  auto file = TRYX(LocalFile::open(path));
  auto range = splitter.initial_restriction(*file);
  auto pieces = unit_split ? splitter.split_restriction(*file, range)
                           : std::vector<OffsetRange>{range};

  for (auto piece : pieces) {
    auto tracker = splitter.new_tracker(piece);
    int write_errno = 0;
    TRYV(splitter.process(*file, tracker, [&](ChunkRecord chunk) {
      auto frame = encode_record(chunk);
      if (fwrite(frame.data(), 1, frame.size(), sink) != frame.size()) {
        // stop claiming; the rest of the piece stays unprocessed
        write_errno = errno;
        tracker.release();
      }
    }));
    if (write_errno != 0) {
      return make_file_error(ChunkErrc::io_error, absl::GetFlag(FLAGS_output),
                             std::nullopt, errno_message(write_errno));
    }
    TRYV(tracker.check_done());
  }
  return outcome::success();
}

}  // namespace
}  // namespace chunkspan

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage(
      "splits files into fixed size chunk records\n"
      "usage: chunkspan [--chunk_size=N] [--output=PATH] FILE...");
  auto args = absl::ParseCommandLine(argc, argv);
  chunkspan::init_logging(absl::GetFlag(FLAGS_verbosity));

  if (args.size() < 2) {
    fmt::print(stderr, "{}\n", absl::ProgramUsageMessage());
    return 2;
  }

  auto output = absl::GetFlag(FLAGS_output);
  std::FILE *sink = stdout;
  if (output != "-") {
    sink = fopen(output.c_str(), "wb");  // NOLINT
    if (sink == nullptr) {
      ERRORF("can not open `{}`: {}", output,
             chunkspan::errno_message(errno));
      return 1;
    }
  }
  absl::Cleanup close_sink = [sink] {
    if (sink != stdout && fclose(sink) != 0) {  // NOLINT
      ERRORF("failed to close output: {}", chunkspan::errno_message(errno));
    }
  };

  try {
    chunkspan::ChunkSplitter splitter(absl::GetFlag(FLAGS_chunk_size));
    int status = 0;
    for (std::size_t i = 1; i < args.size(); i++) {
      auto res = chunkspan::split_file(splitter, args[i],
                                       absl::GetFlag(FLAGS_unit_split), sink);
      if (!res) {
        ERRORF("{}", res.error());
        status = 1;
      }
    }
    if (fflush(sink) != 0) {
      ERRORF("failed to flush output: {}", chunkspan::errno_message(errno));
      status = 1;
    }
    return status;
  } catch (const std::invalid_argument &ex) {
    ERRORF("{}", ex.what());
    return 2;
  }
}
