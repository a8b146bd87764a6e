// include/shardio/path.hpp
#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace shardio {

// Canonical path strings for the API boundary. Empty input or an embedded NUL
// byte throws TypeConversionError.
std::string to_path_string(std::string_view p);
std::string to_path_string(const char* p);
std::string to_path_string(const std::string& p);
std::string to_path_string(const std::filesystem::path& p);

} // namespace shardio
