// include/shardio/record/writer.hpp
#pragma once
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

#include "shardio/chunk/compression.hpp"
#include "shardio/chunk/format.hpp"
#include "shardio/shard/file.hpp"

namespace shardio {

struct RecordWriterOptions {
  Compression compression = Compression::None;
  int zstd_level = kDefaultZstdLevel;
  uint64_t chunk_size_bytes = kDefaultChunkSizeBytes;
  bool append = false; // false: truncate an existing file
};

// Single-shard writer. Records are buffered into the pending chunk and hit
// the disk only when a chunk is sealed (size threshold, flush, close).
class RecordWriter {
public:
  explicit RecordWriter(const std::string& path, const RecordWriterOptions& opts = {});
  ~RecordWriter();

  RecordWriter(const RecordWriter&) = delete;
  RecordWriter& operator=(const RecordWriter&) = delete;
  RecordWriter(RecordWriter&&) noexcept = default;
  RecordWriter& operator=(RecordWriter&&) noexcept = default;

  void write_record(std::string_view record);
  // Seal the pending chunk (if any) and fdatasync.
  void flush();
  // Flush and release the file. A second call does nothing.
  // After a failed chunk write only the descriptor is released.
  void close();

  bool closed() const noexcept { return closed_; }
  // A chunk write failed; write_record/flush rethrow that IoError.
  bool failed() const noexcept { return static_cast<bool>(failure_); }
  const std::string& path() const noexcept { return file_.path(); }

  uint64_t records_written() const noexcept { return records_written_; }
  uint64_t bytes_written() const noexcept { return bytes_written_; } // record payload bytes
  uint64_t chunks_written() const noexcept { return chunks_written_; }

private:
  void seal_pending();

  ShardFile file_;
  RecordWriterOptions opts_;

  std::string pending_;          // length-prefixed, uncompressed
  uint64_t pending_records_ = 0;

  uint64_t records_written_ = 0;
  uint64_t bytes_written_ = 0;
  uint64_t chunks_written_ = 0;
  bool closed_ = false;
  std::exception_ptr failure_;
};

} // namespace shardio
