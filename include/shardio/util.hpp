#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace shardio {

bool ensure_dir(const std::string& p);
std::string join_path(std::string a, std::string b);

// XXH64 with seed 0
uint64_t checksum64(const void* data, size_t len);
inline uint64_t checksum64(std::string_view s) { return checksum64(s.data(), s.size()); }

// LEB128 varint для префиксов длины записей
void put_varint64(std::string& dst, uint64_t v);
// Returns false on truncated or overlong input; advances pos on success.
bool get_varint64(std::string_view src, size_t& pos, uint64_t& v);
size_t varint_length(uint64_t v);

// "4096", "64K", "8m", "1G" -> bytes (binary units). ConfigError on anything
// else, including overflow.
uint64_t parse_bytes(std::string_view s);

// "{prefix}_{index}"
std::string shard_name(std::string_view prefix, uint64_t index);

// Regular files in dir named "{prefix}_*", sorted by numeric suffix when it
// parses, otherwise by name. Full paths.
std::vector<std::string> list_shards_sorted(const std::string& dir, std::string_view prefix);

// Parses the index out of "{prefix}_{index}"; false if the suffix is not a number.
bool parse_shard_index(std::string_view name, std::string_view prefix, uint64_t& index);

} // namespace shardio
