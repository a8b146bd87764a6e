#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "shardio/chunk/codec.hpp"
#include "shardio/errors.hpp"
#include "shardio/record/reader.hpp"
#include "shardio/record/writer.hpp"
#include "shardio/shard/file.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace shardio;

static std::string mktemp_file(const char* name) {
  auto dir = std::filesystem::temp_directory_path() / ("shardio_corrupt_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  auto p = dir / name;
  std::filesystem::remove(p);
  return p.string();
}

static void overwrite_at(const std::string& path, uint64_t off, const std::string& bytes) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  REQUIRE(f.good());
  f.seekp(static_cast<std::streamoff>(off));
  f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

static void flip_byte(const std::string& path, uint64_t off) {
  std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
  REQUIRE(f.good());
  f.seekg(static_cast<std::streamoff>(off));
  char c = 0;
  f.read(&c, 1);
  c = static_cast<char>(c ^ 0xff);
  f.seekp(static_cast<std::streamoff>(off));
  f.write(&c, 1);
}

struct ChunkInfo {
  uint64_t offset;
  uint64_t records;
};

// Chunk layout of an intact file.
static std::vector<ChunkInfo> chunk_map(const std::string& path) {
  std::vector<ChunkInfo> out;
  auto f = ShardFile::open_for_read(path);
  for (;;) {
    auto r = f.read_next_chunk();
    if (r.status != ShardFile::ReadStatus::Chunk) break;
    ChunkHeader h{};
    REQUIRE(parse_chunk_header(r.frame.data(), r.frame.size(), h));
    out.push_back({r.offset, h.record_count});
  }
  return out;
}

static std::vector<std::string> write_file(const std::string& path, size_t n, size_t chunk_size,
                                           Compression c = Compression::None) {
  std::vector<std::string> recs;
  RecordWriter w(path, {.compression = c, .chunk_size_bytes = chunk_size});
  for (size_t i = 0; i < n; ++i) {
    std::string r = "rec-" + std::to_string(i) + ":";
    r.resize(100, '.');
    w.write_record(r);
    recs.push_back(std::move(r));
  }
  w.close();
  return recs;
}

static std::vector<std::string> read_all(RecordReader& r) {
  std::vector<std::string> out;
  while (auto rec = r.next_record()) out.push_back(std::move(*rec));
  return out;
}

TEST_CASE("corruption in the first chunk: 2000 records of 1 KiB") {
  auto path = mktemp_file("first_chunk");
  std::vector<std::string> recs;
  {
    RecordWriter w(path);
    for (int i = 0; i < 2000; ++i) {
      recs.push_back("Record #" + std::to_string(i) + ": " + std::string(1024, 'X'));
      w.write_record(recs.back());
    }
  }
  const auto chunks = chunk_map(path);
  REQUIRE(chunks.size() >= 2);
  const uint64_t lost = chunks[0].records;

  std::string junk;
  for (int i = 0; i < 50; ++i) junk += "CORRUPTION";
  overwrite_at(path, 400, junk);

  SECTION("error policy raises and then stays failed") {
    RecordReader r(path);
    REQUIRE_THROWS_AS(r.next_record(), CorruptDataError);
    REQUIRE(r.state() == RecordReader::State::Failed);
    REQUIRE_FALSE(r.next_record().has_value());
    REQUIRE_THROWS_AS(RecordReader::count_records(path), CorruptDataError);
  }

  SECTION("recover policy loses exactly the corrupt chunk") {
    RecordReader r(path, {.corruption = CorruptionPolicy::Recover});
    auto got = read_all(r);
    REQUIRE(got.size() == recs.size() - lost);
    REQUIRE(got == std::vector<std::string>(recs.begin() + static_cast<std::ptrdiff_t>(lost), recs.end()));
    REQUIRE(r.chunks_skipped() == 1);
    REQUIRE(RecordReader::count_records(path, CorruptionPolicy::Recover) == recs.size() - lost);
  }
}

TEST_CASE("corrupt middle chunk leaves its neighbours intact") {
  for (Compression c : {Compression::None, Compression::Zstd}) {
    auto path = mktemp_file(c == Compression::None ? "middle_none" : "middle_zstd");
    const auto recs = write_file(path, 100, 4096, c);
    const auto chunks = chunk_map(path);
    REQUIRE(chunks.size() >= 3);

    // последний байт полезной нагрузки чанка 1
    flip_byte(path, chunks[2].offset - 1);

    const auto first = static_cast<std::ptrdiff_t>(chunks[0].records);
    const auto middle = static_cast<std::ptrdiff_t>(chunks[1].records);

    {
      RecordReader r(path);
      for (std::ptrdiff_t i = 0; i < first; ++i) REQUIRE(*r.next_record() == recs[i]);
      REQUIRE_THROWS_AS(r.next_record(), CorruptDataError);
    }
    {
      RecordReader r(path, {.corruption = CorruptionPolicy::Recover});
      std::vector<std::string> want(recs.begin(), recs.begin() + first);
      want.insert(want.end(), recs.begin() + first + middle, recs.end());
      REQUIRE(read_all(r) == want);
    }
  }
}

TEST_CASE("corrupt header is skipped by resynchronizing") {
  auto path = mktemp_file("header");
  const auto recs = write_file(path, 100, 4096);
  const auto chunks = chunk_map(path);
  REQUIRE(chunks.size() >= 3);

  overwrite_at(path, chunks[1].offset + 8, "\xff\xff\xff");

  const auto first = static_cast<std::ptrdiff_t>(chunks[0].records);
  const auto middle = static_cast<std::ptrdiff_t>(chunks[1].records);

  SECTION("error") {
    RecordReader r(path);
    for (std::ptrdiff_t i = 0; i < first; ++i) REQUIRE(r.next_record().has_value());
    REQUIRE_THROWS_AS(r.next_record(), CorruptDataError);
  }

  SECTION("recover") {
    RecordReader r(path, {.corruption = CorruptionPolicy::Recover});
    std::vector<std::string> want(recs.begin(), recs.begin() + first);
    want.insert(want.end(), recs.begin() + first + middle, recs.end());
    REQUIRE(read_all(r) == want);
    REQUIRE(r.chunks_skipped() == 1);
    REQUIRE(RecordReader::count_records(path, CorruptionPolicy::Recover) == want.size());
  }
}

TEST_CASE("torn final chunk drops only that chunk") {
  auto path = mktemp_file("torn");
  const auto recs = write_file(path, 100, 4096);
  const auto chunks = chunk_map(path);
  REQUIRE(chunks.size() >= 2);

  std::filesystem::resize_file(path, std::filesystem::file_size(path) - 10);

  RecordReader r(path);
  auto got = read_all(r);
  REQUIRE(got.size() == recs.size() - chunks.back().records);
  REQUIRE(r.state() == RecordReader::State::Exhausted);
}
