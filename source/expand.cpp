#include "shardio/expand.hpp"
#include "shardio/util.hpp"

#include <spdlog/spdlog.h>

#include <sys/stat.h>

namespace shardio {

std::vector<std::string> expand_dirs(const std::vector<std::string>& dirs, const std::string& prefix) {
  std::vector<std::string> out;
  for (const auto& d : dirs) {
    struct stat st {};
    if (::stat(d.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
      spdlog::debug("expand_dirs: {} is not a directory, skipped", d);
      continue;
    }
    auto files = list_shards_sorted(d, prefix);
    out.insert(out.end(), files.begin(), files.end());
  }
  return out;
}

} // namespace shardio
