// source/parallel/locator.cpp
#include "shardio/parallel/locator.hpp"
#include "shardio/errors.hpp"
#include "shardio/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <mutex>
#include <random>
#include <sys/stat.h>

namespace shardio {

namespace {

class ListLocator : public ShardLocator {
public:
  explicit ListLocator(std::vector<std::string> paths) : paths_(std::move(paths)) {}

  std::optional<std::string> acquire() override {
    std::lock_guard<std::mutex> lk(mu_);
    if (pos_ >= paths_.size()) return std::nullopt;
    return paths_[pos_++];
  }

  size_t total_shards() const override { return paths_.size(); }
  bool finite() const override { return true; }

private:
  std::mutex mu_;
  std::vector<std::string> paths_;
  size_t pos_ = 0;
};

class RandomLocator : public ShardLocator {
public:
  RandomLocator(std::vector<std::string> paths, uint64_t seed)
    : paths_(std::move(paths)), rng_(seed ? seed : std::random_device{}()) {
    reshuffle_locked();
  }

  std::optional<std::string> acquire() override {
    std::lock_guard<std::mutex> lk(mu_);
    if (pos_ >= paths_.size()) {
      reshuffle_locked();
      ++passes_;
      spdlog::debug("random locator: pass {} over {} shards", passes_, paths_.size());
    }
    return paths_[pos_++];
  }

  size_t total_shards() const override { return paths_.size(); }
  bool finite() const override { return false; }

private:
  void reshuffle_locked() {
    std::shuffle(paths_.begin(), paths_.end(), rng_);
    pos_ = 0;
  }

  std::mutex mu_;
  std::vector<std::string> paths_;
  std::mt19937_64 rng_;
  size_t pos_ = 0;
  uint64_t passes_ = 0;
};

} // namespace

std::unique_ptr<ShardLocator> make_directory_locator(const std::string& dir, const std::string& prefix) {
  struct stat st {};
  if (::stat(dir.c_str(), &st) != 0) throw IoError("shard directory " + dir, errno);
  if (!S_ISDIR(st.st_mode)) throw IoError("shard directory " + dir, ENOTDIR);

  auto paths = list_shards_sorted(dir, prefix);
  spdlog::debug("directory locator: {} shards matching {}_* in {}", paths.size(), prefix, dir);
  return std::make_unique<ListLocator>(std::move(paths));
}

std::unique_ptr<ShardLocator> make_path_list_locator(std::vector<std::string> paths) {
  return std::make_unique<ListLocator>(std::move(paths));
}

std::unique_ptr<ShardLocator> make_random_locator(std::vector<std::string> paths, uint64_t seed) {
  if (paths.empty()) throw ConfigError("random shard locator needs at least one path");
  return std::make_unique<RandomLocator>(std::move(paths), seed);
}

} // namespace shardio
