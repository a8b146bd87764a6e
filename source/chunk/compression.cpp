#include "shardio/chunk/compression.hpp"
#include "shardio/errors.hpp"

#include <zstd.h>

namespace shardio {

Compression parse_compression(std::string_view name) {
  if (name == "none") return Compression::None;
  if (name == "zstd") return Compression::Zstd;
  throw UnsupportedCompressionError(std::string(name));
}

const char* compression_name(Compression c) {
  switch (c) {
    case Compression::None: return "none";
    case Compression::Zstd: return "zstd";
  }
  return "unknown";
}

bool is_known_codec(uint8_t id) {
  return id == static_cast<uint8_t>(Compression::None) ||
         id == static_cast<uint8_t>(Compression::Zstd);
}

std::string compress(Compression c, std::string_view raw, int level) {
  if (c == Compression::None) return std::string(raw);

  const size_t bound = ZSTD_compressBound(raw.size());
  std::string out(bound, '\0');
  const size_t n = ZSTD_compress(out.data(), bound, raw.data(), raw.size(), level);
  if (ZSTD_isError(n)) {
    throw Error(std::string("zstd compression failed: ") + ZSTD_getErrorName(n));
  }
  out.resize(n);
  return out;
}

bool decompress(Compression c, std::string_view stored, uint64_t expected_len, std::string& out) {
  if (c == Compression::None) {
    if (stored.size() != expected_len) return false;
    out.assign(stored.data(), stored.size());
    return true;
  }

  // фрейм обязан объявить ровно ту длину, что в заголовке чанка
  const unsigned long long declared = ZSTD_getFrameContentSize(stored.data(), stored.size());
  if (declared == ZSTD_CONTENTSIZE_ERROR || declared == ZSTD_CONTENTSIZE_UNKNOWN) return false;
  if (declared != expected_len) return false;

  out.resize(static_cast<size_t>(expected_len));
  const size_t n = ZSTD_decompress(out.data(), out.size(), stored.data(), stored.size());
  if (ZSTD_isError(n) || n != expected_len) {
    out.clear();
    return false;
  }
  return true;
}

} // namespace shardio
