#include "shardio/errors.hpp"
#include "shardio/expand.hpp"
#include "shardio/logging.hpp"
#include "shardio/parallel/reader_pool.hpp"
#include "shardio/parallel/writer_pool.hpp"
#include "shardio/path.hpp"
#include "shardio/record/reader.hpp"
#include "shardio/util.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <string_view>
#include <vector>

// ----------------------------
// Разбор аргументов
// ----------------------------
struct Args {
  std::string mode;                     // count | cat | pack | bench
  std::vector<std::string> paths;       // files or directories after the mode

  std::string dir = "/tmp/shardio_demo";
  std::string prefix = "shard";
  size_t      shards = 2;
  size_t      threads = 0;
  std::string compression = "none";
  bool        recover = false;
  std::string log_level = "info";
  bool        raw = false;

  // bench
  uint64_t count = 100'000;
  size_t   size = 1024;

  bool help = false;
};

static void print_usage(const char* prog) {
  fmt::print(
R"(Usage:
  {0} [options] <count|cat|pack|bench> [paths...]

Modes:
  count [PATH...]                  : records per shard file and total
  cat [PATH...]                    : print every record on its own line
  pack                             : read newline-separated records from stdin into --dir
  bench                            : write then read synthetic records through the pools

  PATH may be a shard file or a directory (expanded to {{prefix}}_*).
  Without PATH, --dir is used.

Options:
  --dir DIR                        : shard directory (default: /tmp/shardio_demo)
  --prefix NAME                    : shard file prefix (default: shard)
  --shards N                       : concurrently open shards (default: 2)
  --threads N                      : worker threads, 0 = all cores (default: 0)
  --compression none|zstd          : chunk codec for pack/bench (default: none)
  --recover                        : skip corrupt chunks instead of failing
  --count N                        : bench records (default: 100000)
  --size BYTES                     : bench record size, K/M suffix (default: 1024)
  --log-level LEVEL                : trace|debug|info|warn|error|off (default: info)
  --raw                            : cat: do not escape record bytes

Examples:
  {0} --dir /tmp/shards --compression zstd bench --count 200000 --size 4K
  {0} --recover count /tmp/shards
)",
    prog);
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i) {
    std::string_view t = argv[i];
    if (t=="-h" || t=="--help") { a.help=true; break; }

    auto need_value = [&](int i)->bool { return (i+1)<argc; };

    if (t=="--dir" && need_value(i))         { a.dir = argv[++i]; continue; }
    if (t=="--prefix" && need_value(i))      { a.prefix = argv[++i]; continue; }
    if (t=="--shards" && need_value(i))      { a.shards = std::strtoul(argv[++i],nullptr,10); continue; }
    if (t=="--threads" && need_value(i))     { a.threads = std::strtoul(argv[++i],nullptr,10); continue; }
    if (t=="--compression" && need_value(i)) { a.compression = argv[++i]; continue; }
    if (t=="--recover")                      { a.recover = true; continue; }
    if (t=="--count" && need_value(i))       { a.count = std::strtoull(argv[++i],nullptr,10); continue; }
    if (t=="--size" && need_value(i))        { a.size = shardio::parse_bytes(argv[++i]); continue; }
    if (t=="--log-level" && need_value(i))   { a.log_level = argv[++i]; continue; }
    if (t=="--raw")                          { a.raw = true; continue; }

    if (!t.empty() && t[0]=='-') {
      spdlog::warn("Unknown arg: {}", t);
      a.help = true;
      continue;
    }
    if (a.mode.empty()) { a.mode = std::string(t); continue; }
    a.paths.emplace_back(t);
  }
  if (a.mode.empty()) a.help = true;
  return a;
}

// ----------------------------
// Вспомогательное
// ----------------------------
static shardio::CorruptionPolicy policy_of(const Args& a) {
  return a.recover ? shardio::CorruptionPolicy::Recover : shardio::CorruptionPolicy::Error;
}

// Файлы из командной строки берём как есть, каталоги раскрываем в их шарды.
// Без путей используется --dir.
static std::vector<std::string> resolve_paths(const Args& a) {
  std::vector<std::string> in = a.paths;
  if (in.empty()) in.push_back(a.dir);

  std::vector<std::string> out;
  for (const auto& p : in) {
    auto canon = shardio::to_path_string(p);
    auto files = shardio::expand_dirs({canon}, a.prefix);
    if (files.empty()) out.push_back(canon);
    else out.insert(out.end(), files.begin(), files.end());
  }
  return out;
}

static std::string escape_record(std::string_view r) {
  std::string s;
  s.reserve(r.size());
  for (unsigned char c : r) {
    if (c == '\\') s += "\\\\";
    else if (c == '\n') s += "\\n";
    else if (c == '\t') s += "\\t";
    else if (c < 0x20 || c >= 0x7f) s += fmt::format("\\x{:02x}", c);
    else s += static_cast<char>(c);
  }
  return s;
}

static shardio::WriterPoolOptions writer_opts(const Args& a) {
  shardio::WriterPoolOptions o;
  o.dir_path       = shardio::to_path_string(a.dir);
  o.prefix         = a.prefix;
  o.num_shards     = a.shards;
  o.worker_threads = a.threads;
  o.compression    = shardio::parse_compression(a.compression);
  return o;
}

// ----------------------------
// Режимы
// ----------------------------
static int run_count(const Args& a) {
  uint64_t total = 0;
  auto files = resolve_paths(a);
  for (const auto& f : files) {
    uint64_t n = shardio::RecordReader::count_records(f, policy_of(a));
    fmt::print("{}\t{}\n", n, f);
    total += n;
  }
  fmt::print("{}\ttotal ({} files)\n", total, files.size());
  return 0;
}

static int run_cat(const Args& a) {
  auto files = resolve_paths(a);
  for (const auto& f : files) {
    shardio::RecordReader r(f, {.corruption = policy_of(a)});
    while (auto rec = r.next_record()) {
      if (a.raw) {
        std::fwrite(rec->data(), 1, rec->size(), stdout);
        std::fputc('\n', stdout);
      } else {
        fmt::print("{}\n", escape_record(*rec));
      }
    }
    r.close();
  }
  return 0;
}

static int run_pack(const Args& a) {
  shardio::WriterPool pool(writer_opts(a));
  std::string line;
  while (std::getline(std::cin, line)) pool.write_record(line);
  pool.close();
  fmt::print("packed {} records into {}/{}_*\n", pool.records_written(), a.dir, a.prefix);
  return 0;
}

static int run_bench(const Args& a) {
  auto wopts = writer_opts(a);
  wopts.append = false;

  std::mt19937_64 rng(0xBADC0FFEEULL);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string payload(a.size, '\0');
  for (auto& c : payload) c = static_cast<char>(dist(rng));

  auto now = []{ return std::chrono::steady_clock::now(); };

  auto t0 = now();
  {
    shardio::WriterPool pool(wopts);
    for (uint64_t i=0;i<a.count;++i) pool.write_record(payload);
    pool.close();
  }
  auto t1 = now();

  uint64_t read = 0, read_bytes = 0;
  {
    auto pool = shardio::ReaderPool::with_shards(wopts.dir_path, a.prefix,
      {.num_shards = a.shards, .worker_threads = a.threads, .corruption = policy_of(a)});
    while (auto rec = pool.next_record()) { ++read; read_bytes += rec->size(); }
  }
  auto t2 = now();

  double wsec = std::chrono::duration<double>(t1-t0).count();
  double rsec = std::chrono::duration<double>(t2-t1).count();
  double mib  = static_cast<double>(a.count * a.size) / (1024.0 * 1024.0);

  fmt::print("=== shardio bench @ {} (shards={}, threads={}, compression={}) ===\n",
             wopts.dir_path, a.shards, a.threads, a.compression);
  fmt::print("write: {} records x {}B in {:.3f} s  {} rec/s  {:.1f} MiB/s\n",
             a.count, a.size, wsec, static_cast<uint64_t>(a.count/wsec), mib/wsec);
  fmt::print("read:  {} records ({} B) in {:.3f} s  {} rec/s  {:.1f} MiB/s\n",
             read, read_bytes, rsec, static_cast<uint64_t>(read/rsec), mib/rsec);
  if (read != a.count) {
    spdlog::error("read back {} records, wrote {}", read, a.count);
    return 1;
  }
  return 0;
}

// ----------------------------
// main
// ----------------------------
int main(int argc, char** argv) {
  Args a;
  try {
    a = parse_args(argc, argv);
  } catch (const shardio::ConfigError& e) {
    spdlog::error("{}", e.what());
    return 2;
  }
  if (a.help) { print_usage(argv[0]); return 0; }

  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

  try {
    shardio::set_log_level(a.log_level);

    if (a.mode == "count") return run_count(a);
    if (a.mode == "cat")   return run_cat(a);
    if (a.mode == "pack")  return run_pack(a);
    if (a.mode == "bench") return run_bench(a);
  } catch (const shardio::Error& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  spdlog::error("Unknown mode: {}", a.mode);
  print_usage(argv[0]);
  return 2;
}
