// source/chunk/codec.cpp
#include "shardio/chunk/codec.hpp"
#include "shardio/util.hpp"

#include <algorithm>
#include <cstring>

namespace shardio {

void append_record(std::string& payload, std::string_view record) {
  put_varint64(payload, record.size());
  payload.append(record.data(), record.size());
}

std::string seal_chunk(std::string_view raw_payload, uint64_t record_count,
                       Compression c, int zstd_level) {
  std::string stored = compress(c, raw_payload, zstd_level);

  ChunkHeader h{};
  h.magic            = kChunkMagic;
  h.version          = kChunkVersion;
  h.codec            = static_cast<uint8_t>(c);
  h.reserved         = 0;
  h.record_count     = record_count;
  h.uncompressed_len = raw_payload.size();
  h.stored_len       = stored.size();
  h.payload_checksum = checksum64(stored);
  h.header_checksum  = checksum64(&h, kHeaderChecksumOffset);

  std::string frame;
  frame.reserve(kChunkHeaderSize + stored.size());
  frame.append(reinterpret_cast<const char*>(&h), sizeof(h));
  frame.append(stored);
  return frame;
}

std::string encode_chunk(const std::vector<std::string>& records,
                         Compression c, int zstd_level) {
  std::string payload;
  size_t total = 0;
  for (const auto& r : records) total += r.size() + varint_length(r.size());
  payload.reserve(total);
  for (const auto& r : records) append_record(payload, r);
  return seal_chunk(payload, records.size(), c, zstd_level);
}

bool parse_chunk_header(const char* data, size_t len, ChunkHeader& out) {
  if (len < kChunkHeaderSize) return false;
  ChunkHeader h{};
  std::memcpy(&h, data, sizeof(h));
  if (h.magic != kChunkMagic) return false;
  if (h.header_checksum != checksum64(data, kHeaderChecksumOffset)) return false;
  if (h.version != kChunkVersion) return false;
  if (!is_known_codec(h.codec)) return false;
  out = h;
  return true;
}

// ---- payload splitting ----

template <class OnRecord>
static bool split_payload(std::string_view payload, uint64_t declared, OnRecord&& on_record) {
  size_t pos = 0;
  uint64_t n = 0;
  while (pos < payload.size()) {
    uint64_t len = 0;
    if (!get_varint64(payload, pos, len)) return false;
    if (len > payload.size() - pos) return false;
    if (++n > declared) return false;
    on_record(payload.substr(pos, static_cast<size_t>(len)));
    pos += static_cast<size_t>(len);
  }
  return n == declared;
}

static bool open_payload(std::string_view frame, ChunkHeader& h,
                         std::string& scratch, std::string_view& payload) {
  if (!parse_chunk_header(frame.data(), frame.size(), h)) return false;
  const std::string_view stored = frame.substr(kChunkHeaderSize);
  if (stored.size() != h.stored_len) return false;
  if (checksum64(stored) != h.payload_checksum) return false;

  const auto c = static_cast<Compression>(h.codec);
  if (c == Compression::None) {
    if (h.uncompressed_len != h.stored_len) return false;
    payload = stored;
    return true;
  }
  if (!decompress(c, stored, h.uncompressed_len, scratch)) return false;
  payload = scratch;
  return true;
}

DecodedChunk decode_chunk(std::string_view frame) {
  DecodedChunk out;
  ChunkHeader h{};
  std::string scratch;
  std::string_view payload;
  if (!open_payload(frame, h, scratch, payload)) {
    if (parse_chunk_header(frame.data(), frame.size(), h)) out.declared_records = h.record_count;
    return out;
  }
  out.declared_records = h.record_count;

  // a record costs at least one prefix byte, so this bounds the reservation
  out.records.reserve(static_cast<size_t>(std::min<uint64_t>(h.record_count, payload.size())));
  const bool ok = split_payload(payload, h.record_count, [&](std::string_view r) {
    out.records.emplace_back(r);
  });
  if (!ok) {
    out.records.clear();
    return out;
  }
  out.verified = true;
  return out;
}

bool verify_chunk(std::string_view frame, uint64_t& record_count) {
  ChunkHeader h{};
  std::string scratch;
  std::string_view payload;
  if (!open_payload(frame, h, scratch, payload)) return false;
  if (!split_payload(payload, h.record_count, [](std::string_view) {})) return false;
  record_count = h.record_count;
  return true;
}

} // namespace shardio
