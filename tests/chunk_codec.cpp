#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "shardio/chunk/codec.hpp"
#include "shardio/chunk/compression.hpp"
#include "shardio/chunk/format.hpp"
#include "shardio/errors.hpp"
#include "shardio/util.hpp"

#include <cstring>
#include <string>
#include <vector>

using namespace shardio;

static std::vector<std::string> sample_records() {
  std::vector<std::string> recs;
  recs.emplace_back("");                        // empty record
  std::string all;
  for (int b = 0; b < 256; ++b) all.push_back(static_cast<char>(b));
  recs.push_back(all);                          // every byte value
  recs.emplace_back(std::string("\0\0\0", 3));
  recs.emplace_back(300, 'z');                  // two-byte length prefix
  for (int i = 0; i < 100; ++i) recs.push_back("record-" + std::to_string(i));
  return recs;
}

TEST_CASE("chunk round-trips for both codecs") {
  const auto recs = sample_records();
  for (Compression c : {Compression::None, Compression::Zstd}) {
    auto frame = encode_chunk(recs, c);
    REQUIRE(frame.size() > kChunkHeaderSize);

    ChunkHeader h{};
    REQUIRE(parse_chunk_header(frame.data(), frame.size(), h));
    REQUIRE(h.codec == static_cast<uint8_t>(c));
    REQUIRE(h.record_count == recs.size());
    REQUIRE(h.stored_len == frame.size() - kChunkHeaderSize);

    auto dec = decode_chunk(frame);
    REQUIRE(dec.verified);
    REQUIRE(dec.declared_records == recs.size());
    REQUIRE(dec.records == recs);

    uint64_t n = 0;
    REQUIRE(verify_chunk(frame, n));
    REQUIRE(n == recs.size());
  }
}

TEST_CASE("codec none stores the payload byte for byte") {
  std::vector<std::string> recs{"abc", "de"};
  auto frame = encode_chunk(recs, Compression::None);
  std::string payload;
  append_record(payload, "abc");
  append_record(payload, "de");
  REQUIRE(frame.substr(kChunkHeaderSize) == payload);
}

TEST_CASE("empty chunk decodes to no records") {
  for (Compression c : {Compression::None, Compression::Zstd}) {
    auto dec = decode_chunk(encode_chunk({}, c));
    REQUIRE(dec.verified);
    REQUIRE(dec.records.empty());
  }
}

TEST_CASE("corrupt chunks are reported, never thrown") {
  const auto recs = sample_records();

  SECTION("payload byte flip") {
    for (Compression c : {Compression::None, Compression::Zstd}) {
      auto frame = encode_chunk(recs, c);
      frame[kChunkHeaderSize + 5] ^= 0x5a;
      auto dec = decode_chunk(frame);
      REQUIRE_FALSE(dec.verified);
      REQUIRE(dec.records.empty());
      REQUIRE(dec.declared_records == recs.size());
      uint64_t n = 0;
      REQUIRE_FALSE(verify_chunk(frame, n));
    }
  }

  SECTION("header byte flip") {
    auto frame = encode_chunk(recs, Compression::None);
    frame[10] ^= 0x01; // inside record_count
    ChunkHeader h{};
    REQUIRE_FALSE(parse_chunk_header(frame.data(), frame.size(), h));
    auto dec = decode_chunk(frame);
    REQUIRE_FALSE(dec.verified);
    REQUIRE(dec.declared_records == 0);
  }

  SECTION("truncated frame") {
    auto frame = encode_chunk(recs, Compression::Zstd);
    frame.resize(frame.size() - 1);
    REQUIRE_FALSE(decode_chunk(frame).verified);
    REQUIRE_FALSE(decode_chunk(std::string_view(frame.data(), 20)).verified);
  }

  SECTION("declared count does not match the payload") {
    std::string payload;
    append_record(payload, "one");
    append_record(payload, "two");
    REQUIRE_FALSE(decode_chunk(seal_chunk(payload, 3, Compression::None)).verified);
    REQUIRE_FALSE(decode_chunk(seal_chunk(payload, 1, Compression::None)).verified);
    REQUIRE(decode_chunk(seal_chunk(payload, 2, Compression::None)).verified);
  }

  SECTION("length prefix runs past the payload") {
    std::string payload;
    put_varint64(payload, 50);
    payload += "short";
    REQUIRE_FALSE(decode_chunk(seal_chunk(payload, 1, Compression::Zstd)).verified);
  }
}

TEST_CASE("compression names") {
  REQUIRE(parse_compression("none") == Compression::None);
  REQUIRE(parse_compression("zstd") == Compression::Zstd);
  REQUIRE(std::string(compression_name(Compression::Zstd)) == "zstd");
  REQUIRE_THROWS_AS(parse_compression("ZSTD"), UnsupportedCompressionError);
  REQUIRE_THROWS_AS(parse_compression("lz4"), ConfigError);
  try {
    parse_compression("gzip");
    FAIL("expected UnsupportedCompressionError");
  } catch (const UnsupportedCompressionError& e) {
    REQUIRE(std::string(e.what()) == "Unsupported compression type: 'gzip'. Supported types: 'zstd', 'none'");
  }
}

TEST_CASE("zstd shrinks repetitive payloads") {
  std::vector<std::string> recs(200, std::string(1000, 'X'));
  auto plain = encode_chunk(recs, Compression::None);
  auto packed = encode_chunk(recs, Compression::Zstd);
  REQUIRE(packed.size() < plain.size() / 10);
  REQUIRE(decode_chunk(packed).records == recs);
}

TEST_CASE("varint prefixes") {
  for (uint64_t v : {0ull, 1ull, 127ull, 128ull, 16383ull, 16384ull, (1ull << 35) + 7, ~0ull}) {
    std::string buf;
    put_varint64(buf, v);
    REQUIRE(buf.size() == varint_length(v));
    size_t pos = 0;
    uint64_t out = 0;
    REQUIRE(get_varint64(buf, pos, out));
    REQUIRE(out == v);
    REQUIRE(pos == buf.size());

    if (buf.size() > 1) {
      size_t p2 = 0;
      REQUIRE_FALSE(get_varint64(std::string_view(buf.data(), buf.size() - 1), p2, out));
    }
  }
}
