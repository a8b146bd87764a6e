// include/shardio/chunk/codec.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "shardio/chunk/compression.hpp"
#include "shardio/chunk/format.hpp"

namespace shardio {

struct DecodedChunk {
  std::vector<std::string> records;
  bool verified = false;          // false => ChunkCorrupt, records is empty
  uint64_t declared_records = 0;  // from the header, when the header itself parsed
};

// Appends one length-prefixed record to an uncompressed payload.
void append_record(std::string& payload, std::string_view record);

// Header + (possibly compressed) payload for an already length-prefixed payload.
std::string seal_chunk(std::string_view raw_payload, uint64_t record_count,
                       Compression c, int zstd_level = kDefaultZstdLevel);

std::string encode_chunk(const std::vector<std::string>& records,
                         Compression c, int zstd_level = kDefaultZstdLevel);

// Checks magic, version, codec id and header checksum. len must be >= kChunkHeaderSize.
bool parse_chunk_header(const char* data, size_t len, ChunkHeader& out);

// frame = header + payload exactly. Never throws on bad data.
DecodedChunk decode_chunk(std::string_view frame);

// Same validation as decode_chunk without materializing records.
bool verify_chunk(std::string_view frame, uint64_t& record_count);

} // namespace shardio
