// include/shardio/parallel/reader_pool.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "shardio/parallel/locator.hpp"
#include "shardio/record/reader.hpp"

namespace shardio {

struct ReaderPoolOptions {
  size_t num_shards = 2;                 // concurrently open shard files
  size_t worker_threads = 0;             // 0 = hardware concurrency
  size_t queue_size_bytes = 8u << 20;    // output queue budget, record bytes
  CorruptionPolicy corruption = CorruptionPolicy::Error;
};

// Reads records from the shards a ShardLocator hands out, num_shards files at
// a time, into a byte-bounded output queue. Record order is kept within a
// shard only.
//
// A shard that fails (corrupt chunk under CorruptionPolicy::Error, I/O error)
// surfaces its error once from next_record(); the other shards keep going and
// the failing slot moves on to the next path.
class ReaderPool {
public:
  explicit ReaderPool(std::unique_ptr<ShardLocator> locator, const ReaderPoolOptions& opts = {});
  ~ReaderPool();

  ReaderPool(ReaderPool&&) noexcept;
  ReaderPool& operator=(ReaderPool&&) noexcept;
  ReaderPool(const ReaderPool&) = delete;
  ReaderPool& operator=(const ReaderPool&) = delete;

  static ReaderPool with_shards(const std::string& dir, const std::string& prefix = "shard",
                                const ReaderPoolOptions& opts = {});
  static ReaderPool with_shard_paths(std::vector<std::string> paths, const ReaderPoolOptions& opts = {});
  // Never runs dry; seed == 0 picks a random seed.
  static ReaderPool with_random_shard_paths(std::vector<std::string> paths,
                                            const ReaderPoolOptions& opts = {}, uint64_t seed = 0);

  // Blocks while the queue is empty and some shard is still being read.
  // nullopt once every shard is done.
  std::optional<std::string> next_record();

  void close();

  size_t queued_records() const;
  size_t queued_bytes() const;
  bool closed() const;

  static uint64_t count_records_with_shards(const std::string& dir, const std::string& prefix = "shard",
                                            CorruptionPolicy policy = CorruptionPolicy::Error);
  static uint64_t count_records_with_shard_paths(const std::vector<std::string>& paths,
                                                 CorruptionPolicy policy = CorruptionPolicy::Error);

private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

} // namespace shardio
