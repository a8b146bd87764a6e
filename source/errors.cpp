#include "shardio/errors.hpp"

#include <cstring>

namespace shardio {

IoError::IoError(const std::string& what, int err)
  : Error(what + ": " + std::strerror(err)), errno_(err) {}

UnsupportedCompressionError::UnsupportedCompressionError(const std::string& name)
  : ConfigError("Unsupported compression type: '" + name + "'. Supported types: 'zstd', 'none'") {}

} // namespace shardio
