#include "shardio/util.hpp"
#include "shardio/errors.hpp"

#include <algorithm>
#include <charconv>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <xxhash.h>

namespace shardio {

static bool mkdir_one(const std::string& p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) == 0) {
    return S_ISDIR(st.st_mode);
  }
  return ::mkdir(p.c_str(), 0755) == 0 || errno == EEXIST;
}

bool ensure_dir(const std::string &p) {
  if (p.empty()) return false;
  // создаём родительские каталоги по одному
  for (size_t pos = p.find('/', 1); pos != std::string::npos; pos = p.find('/', pos + 1)) {
    if (!mkdir_one(p.substr(0, pos))) return false;
  }
  return mkdir_one(p);
}

std::string join_path(std::string a, std::string b) {
  if (!a.empty() && a.back() != '/')
    a.push_back('/');
  a += b;
  return a;
}

uint64_t checksum64(const void* data, size_t len) {
  return static_cast<uint64_t>(XXH64(data, len, 0));
}

void put_varint64(std::string& dst, uint64_t v) {
  char buf[10];
  size_t n = 0;
  while (v >= 0x80) {
    buf[n++] = static_cast<char>((v & 0x7F) | 0x80);
    v >>= 7;
  }
  buf[n++] = static_cast<char>(v);
  dst.append(buf, n);
}

bool get_varint64(std::string_view src, size_t& pos, uint64_t& v) {
  uint64_t result = 0;
  size_t p = pos;
  for (unsigned shift = 0; shift <= 63 && p < src.size(); shift += 7) {
    const uint64_t byte = static_cast<unsigned char>(src[p++]);
    result |= (byte & 0x7F) << shift;
    if ((byte & 0x80) == 0) {
      v = result;
      pos = p;
      return true;
    }
  }
  return false;
}

size_t varint_length(uint64_t v) {
  size_t n = 1;
  while (v >= 0x80) { v >>= 7; ++n; }
  return n;
}

uint64_t parse_bytes(std::string_view s) {
  unsigned shift = 0;
  std::string_view num = s;
  if (!num.empty()) {
    switch (num.back()) {
      case 'K': case 'k': shift = 10; break;
      case 'M': case 'm': shift = 20; break;
      case 'G': case 'g': shift = 30; break;
      default: break;
    }
    if (shift) num.remove_suffix(1);
  }

  uint64_t v = 0;
  const auto [end, ec] = std::from_chars(num.data(), num.data() + num.size(), v);
  if (num.empty() || ec != std::errc() || end != num.data() + num.size())
    throw ConfigError("bad byte size: '" + std::string(s) + "'");
  if (shift && v > (UINT64_MAX >> shift))
    throw ConfigError("byte size out of range: '" + std::string(s) + "'");
  return v << shift;
}

std::string shard_name(std::string_view prefix, uint64_t index) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "_%llu", static_cast<unsigned long long>(index));
  return std::string(prefix) + buf;
}

bool parse_shard_index(std::string_view name, std::string_view prefix, uint64_t& index) {
  if (name.size() <= prefix.size() + 1) return false;
  if (name.substr(0, prefix.size()) != prefix || name[prefix.size()] != '_') return false;
  auto digits = name.substr(prefix.size() + 1);
  if (digits.size() > 19) return false;
  if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c){ return c >= '0' && c <= '9'; }))
    return false;
  uint64_t v = 0;
  for (char c : digits) v = v * 10 + static_cast<uint64_t>(c - '0');
  index = v;
  return true;
}

std::vector<std::string> list_shards_sorted(const std::string& dir, std::string_view prefix) {
  struct Entry { std::string name; bool numbered; uint64_t index; };
  std::vector<Entry> found;

  DIR* d = ::opendir(dir.c_str());
  if (!d) return {};
  const std::string lead = std::string(prefix) + "_";
  while (auto* ent = ::readdir(d)) {
    std::string n = ent->d_name;
    if (n.size() < lead.size() || n.compare(0, lead.size(), lead) != 0) continue;

    struct stat st {};
    if (::stat(join_path(dir, n).c_str(), &st) != 0 || !S_ISREG(st.st_mode)) continue;

    Entry e{n, false, 0};
    e.numbered = parse_shard_index(n, prefix, e.index);
    found.push_back(std::move(e));
  }
  ::closedir(d);

  // сначала нумерованные шарды по индексу, затем остальные по имени
  std::sort(found.begin(), found.end(), [](const Entry& a, const Entry& b) {
    if (a.numbered != b.numbered) return a.numbered;
    if (a.numbered && a.index != b.index) return a.index < b.index;
    return a.name < b.name;
  });

  std::vector<std::string> out;
  out.reserve(found.size());
  for (auto& e : found) out.push_back(join_path(dir, e.name));
  return out;
}

} // namespace shardio
