#include "shardio/parallel/sharder.hpp"
#include "shardio/errors.hpp"
#include "shardio/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace shardio {

FileSharder::FileSharder(std::string dir, std::string prefix, size_t initial, bool append)
  : dir_(std::move(dir)), prefix_(std::move(prefix)), append_(append)
{
  if (!ensure_dir(dir_)) throw IoError("create shard directory " + dir_, errno ? errno : ENOTDIR);

  next_index_ = initial;
  if (!append_) {
    // новая сессия: файлы прошлых сессий (включая авто-шарды) удаляем
    for (const auto& p : list_shards_sorted(dir_, prefix_)) {
      if (::unlink(p.c_str()) != 0 && errno != ENOENT) {
        const int err = errno;
        spdlog::error("sharder: cannot remove {} ({})", p, std::strerror(err));
        throw IoError("remove " + p, err);
      }
      spdlog::debug("sharder: removed {} from an earlier session", p);
    }
  } else {
    for (const auto& p : list_shards_sorted(dir_, prefix_)) {
      uint64_t idx = 0;
      const auto name = p.substr(p.find_last_of('/') + 1);
      if (parse_shard_index(name, prefix_, idx)) next_index_ = std::max(next_index_, idx + 1);
    }
  }
  spdlog::debug("sharder {}/{}_*: slots 0..{}, next fresh index {}", dir_, prefix_,
                initial ? initial - 1 : 0, next_index_);
}

std::string FileSharder::path_for(uint64_t index) const {
  return join_path(dir_, shard_name(prefix_, index));
}

std::string FileSharder::next_path() {
  std::lock_guard<std::mutex> lk(mu_);
  return path_for(next_index_++);
}

} // namespace shardio
