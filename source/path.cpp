#include "shardio/path.hpp"
#include "shardio/errors.hpp"

namespace shardio {

std::string to_path_string(std::string_view p) {
  if (p.empty()) throw TypeConversionError("path is empty");
  if (p.find('\0') != std::string_view::npos)
    throw TypeConversionError("path contains a NUL byte");
  return std::filesystem::path(p).lexically_normal().string();
}

std::string to_path_string(const char* p) {
  if (!p) throw TypeConversionError("path is null");
  return to_path_string(std::string_view(p));
}

std::string to_path_string(const std::string& p) {
  return to_path_string(std::string_view(p));
}

std::string to_path_string(const std::filesystem::path& p) {
  return to_path_string(std::string_view(p.native()));
}

} // namespace shardio
