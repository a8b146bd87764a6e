#include "shardio/logging.hpp"
#include "shardio/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace shardio {

void set_log_level(std::string_view level) {
  std::string s(level);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });

  spdlog::level::level_enum lvl;
  if      (s == "trace")                   lvl = spdlog::level::trace;
  else if (s == "debug")                   lvl = spdlog::level::debug;
  else if (s == "info")                    lvl = spdlog::level::info;
  else if (s == "warn" || s == "warning")  lvl = spdlog::level::warn;
  else if (s == "error")                   lvl = spdlog::level::err;
  else if (s == "off")                     lvl = spdlog::level::off;
  else throw ConfigError("invalid log level '" + std::string(level) +
                         "', expected one of trace, debug, info, warn, error, off");

  spdlog::set_level(lvl);
}

} // namespace shardio
