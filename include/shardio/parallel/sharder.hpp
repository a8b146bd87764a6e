#pragma once
#include <cstdint>
#include <mutex>
#include <string>

namespace shardio {

// Names the files of a writer pool: {dir}/{prefix}_{index}.
// Slots start on indices 0..initial-1; auto-sharding draws fresh indices past
// both those and anything already present in the directory. Without append
// every existing {prefix}_* file in dir is removed first.
class FileSharder {
public:
  FileSharder(std::string dir, std::string prefix, size_t initial, bool append);

  std::string path_for(uint64_t index) const;
  std::string next_path();

  const std::string& dir() const noexcept { return dir_; }
  const std::string& prefix() const noexcept { return prefix_; }
  bool append() const noexcept { return append_; }

private:
  std::string dir_;
  std::string prefix_;
  bool append_;

  std::mutex mu_;
  uint64_t next_index_ = 0;
};

} // namespace shardio
