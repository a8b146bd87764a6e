#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace shardio {

enum class Compression : uint8_t { None = 0, Zstd = 1 };

inline constexpr int kDefaultZstdLevel = 3;

// "none" | "zstd"; anything else throws UnsupportedCompressionError.
Compression parse_compression(std::string_view name);
const char* compression_name(Compression c);
bool is_known_codec(uint8_t id);

// compress throws shardio::Error if the codec fails; decompress returns false
// on malformed input or a size that does not match expected_len.
std::string compress(Compression c, std::string_view raw, int level = kDefaultZstdLevel);
bool decompress(Compression c, std::string_view stored, uint64_t expected_len, std::string& out);

} // namespace shardio
