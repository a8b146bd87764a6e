// source/shard/file.cpp
#include "shardio/shard/file.hpp"
#include "shardio/chunk/codec.hpp"
#include "shardio/chunk/format.hpp"
#include "shardio/errors.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shardio {

static constexpr size_t kResyncBlock = 64 * 1024;

static uint64_t file_size(int fd, const std::string& path) {
  struct stat st {};
  if (::fstat(fd, &st) != 0) throw IoError("fstat " + path, errno);
  return static_cast<uint64_t>(st.st_size);
}

ShardFile::ShardFile(std::string path, int fd, Mode mode)
  : path_(std::move(path)), fd_(fd), mode_(mode) {}

static int open_or_throw(const std::string& path, int flags, const char* what) {
  int fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
  if (fd < 0) {
    const int err = errno;
    spdlog::error("shard {} failed: {} ({})", what, path, std::strerror(err));
    throw IoError(std::string("open ") + path, err);
  }
  return fd;
}

ShardFile ShardFile::open_for_append(const std::string& path) {
  int fd = open_or_throw(path, O_CREAT | O_WRONLY | O_APPEND, "open for append");
  ShardFile f(path, fd, Mode::Append);
  f.pos_ = file_size(fd, path);
  spdlog::debug("shard open (append): {} at {}", path, f.pos_);
  return f;
}

ShardFile ShardFile::open_for_write(const std::string& path) {
  int fd = open_or_throw(path, O_CREAT | O_TRUNC | O_WRONLY, "open for write");
  spdlog::debug("shard open (truncate): {}", path);
  return ShardFile(path, fd, Mode::Truncate);
}

ShardFile ShardFile::open_for_read(const std::string& path) {
  int fd = open_or_throw(path, O_RDONLY, "open for read");
  spdlog::debug("shard open (read): {}", path);
  return ShardFile(path, fd, Mode::Read);
}

ShardFile::~ShardFile() {
  if (fd_ >= 0) ::close(fd_);
}

ShardFile::ShardFile(ShardFile&& o) noexcept
  : path_(std::move(o.path_)), fd_(o.fd_), mode_(o.mode_), pos_(o.pos_) {
  o.fd_ = -1;
}

ShardFile& ShardFile::operator=(ShardFile&& o) noexcept {
  if (this != &o) {
    if (fd_ >= 0) ::close(fd_);
    path_ = std::move(o.path_);
    fd_   = o.fd_;   o.fd_ = -1;
    mode_ = o.mode_;
    pos_  = o.pos_;
  }
  return *this;
}

// ---- запись ----

void ShardFile::write_chunk(std::string_view frame) {
  if (fd_ < 0) throw IoError("write " + path_ + ": file is closed", EBADF);
  if (mode_ == Mode::Read) throw IoError("write " + path_ + ": opened for reading", EBADF);

  const char* p = frame.data();
  size_t left = frame.size();
  while (left > 0) {
    ssize_t w = ::write(fd_, p, left);
    if (w < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      spdlog::error("shard write failed: {} ({})", path_, std::strerror(err));
      throw IoError("write " + path_, err);
    }
    p    += w;
    left -= static_cast<size_t>(w);
  }
  pos_ += frame.size();
}

void ShardFile::sync() {
  if (fd_ < 0 || mode_ == Mode::Read) return;
  if (::fdatasync(fd_) != 0) {
    // pipes and character devices cannot be synced
    if (errno == EINVAL) return;
    throw IoError("fdatasync " + path_, errno);
  }
}

void ShardFile::close() {
  if (fd_ < 0) return;
  const int fd = fd_;
  fd_ = -1;
  if (::close(fd) != 0) throw IoError("close " + path_, errno);
}

// ---- чтение ----

size_t ShardFile::read_at(uint64_t off, char* buf, size_t len) {
  size_t got = 0;
  while (got < len) {
    ssize_t r = ::pread(fd_, buf + got, len - got, static_cast<off_t>(off + got));
    if (r < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      spdlog::error("shard read failed: {} at {} ({})", path_, off + got, std::strerror(err));
      throw IoError("read " + path_, err);
    }
    if (r == 0) break;
    got += static_cast<size_t>(r);
  }
  return got;
}

ShardFile::ReadResult ShardFile::read_next_chunk() {
  if (fd_ < 0) throw IoError("read " + path_ + ": file is closed", EBADF);

  ReadResult res;
  res.offset = pos_;

  char hb[kChunkHeaderSize];
  const size_t got = read_at(pos_, hb, sizeof(hb));
  if (got < sizeof(hb)) {
    if (got > 0) spdlog::warn("{}: {} trailing bytes at offset {} (torn header), treating as end of file",
                              path_, got, pos_);
    res.status = ReadStatus::EndOfFile;
    return res;
  }

  ChunkHeader h{};
  if (!parse_chunk_header(hb, sizeof(hb), h)) {
    res.status = ReadStatus::BadHeader;
    return res;
  }

  const uint64_t end = file_size(fd_, path_);
  const uint64_t body_off = pos_ + kChunkHeaderSize;
  if (h.stored_len > end - body_off) {
    spdlog::warn("{}: chunk at offset {} needs {} payload bytes, {} present (torn write), treating as end of file",
                 path_, pos_, h.stored_len, end - body_off);
    pos_ = end;
    res.status = ReadStatus::EndOfFile;
    return res;
  }

  res.frame.resize(kChunkHeaderSize + static_cast<size_t>(h.stored_len));
  std::memcpy(res.frame.data(), hb, sizeof(hb));
  const size_t body = read_at(body_off, res.frame.data() + kChunkHeaderSize,
                              static_cast<size_t>(h.stored_len));
  if (body != h.stored_len) {
    // файл укоротили у нас под ногами
    spdlog::warn("{}: short payload read at offset {}, treating as end of file", path_, pos_);
    res.frame.clear();
    res.status = ReadStatus::EndOfFile;
    return res;
  }

  pos_ = body_off + h.stored_len;
  res.status = ReadStatus::Chunk;
  return res;
}

bool ShardFile::resync() {
  if (fd_ < 0) throw IoError("read " + path_ + ": file is closed", EBADF);

  char magic[sizeof(kChunkMagic)];
  std::memcpy(magic, &kChunkMagic, sizeof(magic));

  std::string buf(kResyncBlock, '\0');
  uint64_t off = pos_ + 1;
  for (;;) {
    const size_t got = read_at(off, buf.data(), buf.size());
    if (got < kChunkHeaderSize) break;

    for (size_t i = 0; i + sizeof(magic) <= got; ++i) {
      if (std::memcmp(buf.data() + i, magic, sizeof(magic)) != 0) continue;
      char hb[kChunkHeaderSize];
      ChunkHeader h{};
      if (read_at(off + i, hb, sizeof(hb)) == sizeof(hb) && parse_chunk_header(hb, sizeof(hb), h)) {
        spdlog::debug("{}: resynchronized at offset {} after bad header at {}", path_, off + i, pos_);
        pos_ = off + i;
        return true;
      }
    }
    if (got < buf.size()) break;
    off += got - (sizeof(magic) - 1); // overlap so a magic across the block edge is seen
  }

  pos_ = file_size(fd_, path_);
  return false;
}

} // namespace shardio
