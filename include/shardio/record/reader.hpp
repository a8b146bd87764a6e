// include/shardio/record/reader.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "shardio/shard/file.hpp"

namespace shardio {

enum class CorruptionPolicy : uint8_t {
  Error,   // stop at the first corrupt chunk
  Recover, // drop the whole corrupt chunk and continue with the next one
};

const char* corruption_policy_name(CorruptionPolicy p);

struct RecordReaderOptions {
  CorruptionPolicy corruption = CorruptionPolicy::Error;
};

class RecordReader {
public:
  enum class State { Open, Exhausted, Failed, Closed };

  explicit RecordReader(const std::string& path, const RecordReaderOptions& opts = {});
  ~RecordReader() = default;

  RecordReader(const RecordReader&) = delete;
  RecordReader& operator=(const RecordReader&) = delete;
  RecordReader(RecordReader&&) noexcept = default;
  RecordReader& operator=(RecordReader&&) noexcept = default;

  // nullopt at end of file (or after a failure was already reported).
  // Throws CorruptDataError under CorruptionPolicy::Error, IoError on OS errors,
  // ReaderClosedError after close().
  std::optional<std::string> next_record();

  void close();

  State state() const noexcept { return state_; }
  const std::string& path() const noexcept { return path_; }
  uint64_t chunks_skipped() const noexcept { return chunks_skipped_; }

  // Streams the whole file under the given policy without keeping records.
  static uint64_t count_records(const std::string& path,
                                CorruptionPolicy policy = CorruptionPolicy::Error);

private:
  bool load_next_chunk();
  void on_corrupt(uint64_t offset, const char* what, uint64_t declared);

  std::string path_;
  ShardFile file_;
  RecordReaderOptions opts_;
  State state_ = State::Open;

  std::vector<std::string> buffered_;
  size_t next_ = 0;
  uint64_t chunks_skipped_ = 0;
};

} // namespace shardio
