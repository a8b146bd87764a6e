#pragma once
#include <string>
#include <vector>

namespace shardio {

// Shard files "{prefix}_*" of every directory, directories in the given order,
// files sorted within each. Missing directories contribute nothing.
std::vector<std::string> expand_dirs(const std::vector<std::string>& dirs,
                                     const std::string& prefix = "shard");

} // namespace shardio
