// include/shardio/chunk/format.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace shardio {

// Chunk header, written verbatim in front of every chunk payload.
// Payload = for each record: varint64(len) || bytes, optionally compressed.
struct ChunkHeader {
  uint32_t magic;            // kChunkMagic
  uint8_t  version;          // kChunkVersion
  uint8_t  codec;            // Compression
  uint16_t reserved;         // 0
  uint64_t record_count;
  uint64_t uncompressed_len; // payload size before compression
  uint64_t stored_len;       // payload bytes following the header
  uint64_t payload_checksum; // XXH64(stored payload)
  uint64_t header_checksum;  // XXH64(header bytes before this field)
};

static_assert(std::is_standard_layout_v<ChunkHeader>);
static_assert(sizeof(ChunkHeader) == 48, "chunk header layout is part of the file format");

inline constexpr uint32_t kChunkMagic   = 0x43485253u; // "SRHC" on disk
inline constexpr uint8_t  kChunkVersion = 1;
inline constexpr size_t   kChunkHeaderSize = sizeof(ChunkHeader);
inline constexpr size_t   kHeaderChecksumOffset = offsetof(ChunkHeader, header_checksum);

// Чанк запечатывается, когда несжатая нагрузка достигла этого размера.
inline constexpr uint64_t kDefaultChunkSizeBytes = 1ull << 20;

} // namespace shardio
