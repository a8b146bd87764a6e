// include/shardio/parallel/locator.hpp
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace shardio {

// Supplies shard paths to free reader slots. Implementations are thread-safe.
//
//   directory  : {dir}/{prefix}_* listed once, finite
//   path list  : caller's paths in order, finite
//   random     : shuffled paths, reshuffled on every full pass, never ends
class ShardLocator {
public:
  virtual ~ShardLocator() = default;

  // nullopt once a finite locator has handed out every path.
  virtual std::optional<std::string> acquire() = 0;
  // Слот закончил с path.
  virtual void release(const std::string& path) { (void)path; }
  // Paths known to the locator (for logging and sizing).
  virtual size_t total_shards() const = 0;
  virtual bool finite() const = 0;
};

std::unique_ptr<ShardLocator> make_directory_locator(const std::string& dir,
                                                     const std::string& prefix = "shard");
std::unique_ptr<ShardLocator> make_path_list_locator(std::vector<std::string> paths);
// seed == 0 draws a seed from std::random_device
std::unique_ptr<ShardLocator> make_random_locator(std::vector<std::string> paths,
                                                  uint64_t seed = 0);

} // namespace shardio
