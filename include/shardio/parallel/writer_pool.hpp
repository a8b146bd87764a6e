// include/shardio/parallel/writer_pool.hpp
#pragma once
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <string_view>

#include "shardio/chunk/compression.hpp"
#include "shardio/chunk/format.hpp"

namespace shardio {

struct WriterPoolOptions {
  std::string dir_path;
  std::string prefix = "shard";

  size_t   num_shards = 2;                    // concurrently open shard files
  size_t   worker_threads = 0;                // 0 = hardware concurrency
  uint64_t max_bytes_per_writer = 10ull << 30; // record bytes per file; 0 = unlimited
  size_t   task_queue_capacity = 2000;
  bool     enable_auto_sharding = true;
  bool     append = true;

  Compression compression = Compression::None;
  int         zstd_level = kDefaultZstdLevel;
  uint64_t    chunk_size_bytes = kDefaultChunkSizeBytes;
};

// Spreads records over num_shards RecordWriters using a fixed set of worker
// threads fed by a bounded task queue. write_record blocks while the queue is
// full. A worker takes whichever shard slot has been free the longest, so with
// one worker the distribution is strict round-robin.
//
// Worker-side failures are kept and rethrown by the next write_record, flush
// or close.
class WriterPool {
public:
  explicit WriterPool(const WriterPoolOptions& opts);
  ~WriterPool();

  WriterPool(const WriterPool&) = delete;
  WriterPool& operator=(const WriterPool&) = delete;

  void write_record(std::string_view record);
  // The future completes once the record reached its shard writer.
  std::future<void> write_record_async(std::string record);

  // Waits for queued tasks, then seals and syncs every open shard.
  void flush();
  // Drains the queue, joins workers, closes every shard. Later calls do nothing.
  void close();

  size_t pending_tasks() const;
  size_t available_writers() const;
  bool closed() const;
  uint64_t records_written() const;

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

} // namespace shardio
