// include/shardio/shard/file.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace shardio {

// One shard on disk: a POSIX descriptor plus the chunk framing rules.
// Writers append whole chunks; readers walk chunk boundaries forward.
// All OS failures throw IoError.
class ShardFile {
public:
  enum class Mode { Append, Truncate, Read };

  enum class ReadStatus {
    Chunk,      // frame holds header + payload
    EndOfFile,  // clean end or torn tail
    BadHeader,  // bytes at offset() are not a valid chunk header
  };

  struct ReadResult {
    ReadStatus status = ReadStatus::EndOfFile;
    std::string frame;
    uint64_t offset = 0; // file offset where the chunk (or bad header) starts
  };

  static ShardFile open_for_append(const std::string& path);
  static ShardFile open_for_write(const std::string& path);  // truncates
  static ShardFile open_for_read(const std::string& path);

  ShardFile() = default;
  ~ShardFile();
  ShardFile(const ShardFile&) = delete;
  ShardFile& operator=(const ShardFile&) = delete;
  ShardFile(ShardFile&&) noexcept;
  ShardFile& operator=(ShardFile&&) noexcept;

  bool is_open() const noexcept { return fd_ >= 0; }
  const std::string& path() const noexcept { return path_; }
  uint64_t offset() const noexcept { return pos_; }

  void write_chunk(std::string_view frame);
  ReadResult read_next_chunk();
  // После BadHeader: переход к следующему валидному заголовку.
  // false, если до конца файла такого нет.
  bool resync();
  void sync();
  void close();

private:
  ShardFile(std::string path, int fd, Mode mode);
  size_t read_at(uint64_t off, char* buf, size_t len);

  std::string path_;
  int fd_ = -1;
  Mode mode_ = Mode::Read;
  uint64_t pos_ = 0;
};

} // namespace shardio
