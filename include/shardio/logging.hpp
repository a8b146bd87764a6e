// include/shardio/logging.hpp
#pragma once
#include <string_view>

namespace shardio {

// trace, debug, info, warn (or warning), error, off; case-insensitive.
// Sets the spdlog default logger level. Anything else throws ConfigError.
void set_log_level(std::string_view level);

} // namespace shardio
