#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "shardio/errors.hpp"
#include "shardio/parallel/reader_pool.hpp"
#include "shardio/parallel/writer_pool.hpp"
#include "shardio/record/reader.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace shardio;
using namespace std::chrono_literals;

static std::string mktemp_dir(const char* prefix) {
  auto p = std::filesystem::temp_directory_path() / (std::string(prefix) + std::to_string(::getpid()));
  std::filesystem::remove_all(p);
  return p.string();
}

static std::vector<std::string> write_shards(const std::string& dir, size_t n, size_t shards) {
  std::vector<std::string> recs;
  WriterPool pool({.dir_path = dir, .num_shards = shards, .worker_threads = 1, .append = false});
  for (size_t i = 0; i < n; ++i) {
    recs.push_back("Record #" + std::to_string(i) + ": " + std::string(1024, 'X'));
    pool.write_record(recs.back());
  }
  pool.close();
  return recs;
}

static std::vector<std::string> small_shards(const std::string& dir, size_t n, size_t shards) {
  std::vector<std::string> recs;
  WriterPool pool({.dir_path = dir, .num_shards = shards, .worker_threads = 1, .append = false});
  for (size_t i = 0; i < n; ++i) {
    recs.push_back("r" + std::to_string(i));
    pool.write_record(recs.back());
  }
  pool.close();
  return recs;
}

static std::vector<std::string> drain(ReaderPool& pool) {
  std::vector<std::string> out;
  while (auto rec = pool.next_record()) out.push_back(std::move(*rec));
  return out;
}

static void overwrite_at(const std::string& path, uint64_t off, const std::string& bytes) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  REQUIRE(f.good());
  f.seekp(static_cast<std::streamoff>(off));
  f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

TEST_CASE("reader pool returns the written multiset") {
  auto dir = mktemp_dir("shardio_rp_set_");
  auto recs = small_shards(dir, 5000, 4);

  for (size_t slots : {1u, 2u, 8u}) {
    auto pool = ReaderPool::with_shards(dir, "shard", {.num_shards = slots, .worker_threads = 3});
    auto got = drain(pool);
    std::sort(got.begin(), got.end());
    auto want = recs;
    std::sort(want.begin(), want.end());
    REQUIRE(got == want);
    REQUIRE_FALSE(pool.next_record().has_value());
  }
}

TEST_CASE("order is kept within one shard") {
  auto dir = mktemp_dir("shardio_rp_order_");
  auto recs = small_shards(dir, 500, 1);

  auto pool = ReaderPool::with_shard_paths({dir + "/shard_0"});
  REQUIRE(drain(pool) == recs);
}

TEST_CASE("path list may be shorter than the shard set") {
  auto dir = mktemp_dir("shardio_rp_partial_");
  small_shards(dir, 1000, 3);

  auto pool = ReaderPool::with_shard_paths({dir + "/shard_0", dir + "/shard_2"},
                                           {.num_shards = 1});
  const auto got = drain(pool);
  REQUIRE(got.size() == RecordReader::count_records(dir + "/shard_0") +
                        RecordReader::count_records(dir + "/shard_2"));
  REQUIRE(got.size() == ReaderPool::count_records_with_shard_paths({dir + "/shard_0", dir + "/shard_2"}));
}

TEST_CASE("4000 records over 2 shards with a corrupt shard") {
  auto dir = mktemp_dir("shardio_rp_corrupt_");
  const auto recs = write_shards(dir, 4000, 2);
  REQUIRE(ReaderPool::count_records_with_shards(dir) == 4000);

  std::string junk;
  for (int i = 0; i < 50; ++i) junk += "CORRUPTION";
  overwrite_at(dir + "/shard_0", 400, junk);

  SECTION("error policy raises on the corrupt chunk") {
    auto pool = ReaderPool::with_shards(dir, "shard", {.worker_threads = 1});
    bool raised = false;
    size_t read = 0;
    try {
      while (pool.next_record()) ++read;
    } catch (const CorruptDataError&) {
      raised = true;
    }
    REQUIRE(raised);
    REQUIRE(read < 4000);
    REQUIRE_THROWS_AS(ReaderPool::count_records_with_shards(dir), CorruptDataError);
  }

  SECTION("error is delivered once and the other shard keeps going") {
    auto pool = ReaderPool::with_shards(dir, "shard", {.worker_threads = 2});
    size_t errors = 0;
    std::vector<std::string> got;
    for (;;) {
      try {
        auto rec = pool.next_record();
        if (!rec) break;
        got.push_back(std::move(*rec));
      } catch (const CorruptDataError&) {
        ++errors;
      }
    }
    REQUIRE(errors == 1);
    REQUIRE(got.size() >= RecordReader::count_records(dir + "/shard_1"));
  }

  SECTION("recover policy returns well-formed records from the original set") {
    auto pool = ReaderPool::with_shards(dir, "shard", {.corruption = CorruptionPolicy::Recover});
    auto got = drain(pool);
    REQUIRE(got.size() < 4000);
    REQUIRE(got.size() > 0);

    const std::set<std::string> original(recs.begin(), recs.end());
    for (const auto& r : got) REQUIRE(original.count(r) == 1);
    REQUIRE(std::set<std::string>(got.begin(), got.end()).size() == got.size());
    REQUIRE(got.size() == ReaderPool::count_records_with_shards(dir, "shard", CorruptionPolicy::Recover));
  }
}

TEST_CASE("random shard paths never run dry") {
  auto dir = mktemp_dir("shardio_rp_random_");
  const auto recs = small_shards(dir, 100, 2);
  const std::set<std::string> original(recs.begin(), recs.end());

  auto pool = ReaderPool::with_random_shard_paths({dir + "/shard_0", dir + "/shard_1"},
                                                  {.queue_size_bytes = 4096}, 7);
  std::set<std::string> seen;
  bool repeated = false;
  for (int i = 0; i < 250; ++i) {
    auto rec = pool.next_record();
    REQUIRE(rec.has_value());
    REQUIRE(original.count(*rec) == 1);
    if (i < 200 && !seen.insert(*rec).second) repeated = true;
  }
  REQUIRE(repeated);
  pool.close();
}

TEST_CASE("close stops workers blocked on a full queue") {
  auto dir = mktemp_dir("shardio_rp_close_");
  small_shards(dir, 1000, 2);

  auto pool = ReaderPool::with_random_shard_paths({dir + "/shard_0", dir + "/shard_1"},
                                                  {.worker_threads = 2, .queue_size_bytes = 64});
  REQUIRE(pool.next_record().has_value());

  // воркеры заполняют крошечную очередь и блокируются
  for (int i = 0; i < 200 && pool.queued_records() == 0; ++i) std::this_thread::sleep_for(10ms);
  REQUIRE(pool.queued_records() > 0);
  REQUIRE(pool.queued_bytes() <= 64);

  pool.close();
  REQUIRE(pool.closed());
  REQUIRE_NOTHROW(pool.close());
  REQUIRE(pool.queued_records() == 0);
  REQUIRE_THROWS_AS(pool.next_record(), ReaderClosedError);
}

TEST_CASE("close wakes a consumer blocked on an empty queue") {
  auto dir = mktemp_dir("shardio_rp_wake_");
  small_shards(dir, 10, 1);

  // случайный пул по пустому шарду не кончается и ничего не отдаёт
  std::filesystem::create_directories(dir);
  { std::ofstream(dir + "/shard_empty"); }
  auto pool = ReaderPool::with_random_shard_paths({dir + "/shard_empty"}, {.worker_threads = 1});

  std::atomic<int> result{-1};
  std::thread consumer([&] {
    try {
      result = pool.next_record().has_value() ? 1 : 0;
    } catch (const ReaderClosedError&) {
      result = 2;
    }
  });
  std::this_thread::sleep_for(100ms);
  REQUIRE(result.load() == -1);
  pool.close();
  consumer.join();
  REQUIRE(result.load() != 1);
}

TEST_CASE("a repeating pool with nothing to read backs off") {
  auto dir = mktemp_dir("shardio_rp_idle_");
  std::filesystem::create_directories(dir);

  // каждое открытие несуществующего шарда даёт ошибку в очереди
  auto pool = ReaderPool::with_random_shard_paths({dir + "/missing"}, {.worker_threads = 1});
  std::this_thread::sleep_for(200ms);
  const size_t errors = pool.queued_records();
  REQUIRE(errors > 0);
  REQUIRE(errors < 100);

  REQUIRE_THROWS_AS(pool.next_record(), IoError);
  pool.close();
}

TEST_CASE("missing and empty inputs") {
  REQUIRE_THROWS_AS(ReaderPool::with_shards("/nonexistent/shardio_rp"), IoError);
  REQUIRE_THROWS_AS(ReaderPool::with_random_shard_paths({}), ConfigError);

  auto dir = mktemp_dir("shardio_rp_empty_");
  std::filesystem::create_directories(dir);
  auto pool = ReaderPool::with_shards(dir);
  REQUIRE_FALSE(pool.next_record().has_value());
  REQUIRE(ReaderPool::count_records_with_shards(dir) == 0);

  SECTION("a missing file surfaces as IoError and the rest is read") {
    auto d2 = mktemp_dir("shardio_rp_missing_");
    const auto recs = small_shards(d2, 50, 1);
    auto p2 = ReaderPool::with_shard_paths({d2 + "/nope", d2 + "/shard_0"}, {.num_shards = 1});
    REQUIRE_THROWS_AS(p2.next_record(), IoError);
    REQUIRE(drain(p2) == recs);
  }
}
