// source/record/reader.cpp
#include "shardio/record/reader.hpp"
#include "shardio/chunk/codec.hpp"
#include "shardio/errors.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace shardio {

const char* corruption_policy_name(CorruptionPolicy p) {
  return p == CorruptionPolicy::Recover ? "recover" : "error";
}

RecordReader::RecordReader(const std::string& path, const RecordReaderOptions& opts)
  : path_(path), file_(ShardFile::open_for_read(path)), opts_(opts) {}

void RecordReader::close() {
  if (state_ == State::Closed) return;
  state_ = State::Closed;
  buffered_.clear();
  next_ = 0;
  file_.close();
}

void RecordReader::on_corrupt(uint64_t offset, const char* what, uint64_t declared) {
  if (opts_.corruption == CorruptionPolicy::Error) {
    state_ = State::Failed;
    buffered_.clear();
    next_ = 0;
    throw CorruptDataError(fmt::format("{}: corrupt chunk at offset {} ({})", path_, offset, what));
  }
  ++chunks_skipped_;
  if (declared > 0) {
    spdlog::warn("{}: skipping corrupt chunk at offset {} ({}), {} records lost",
                 path_, offset, what, declared);
  } else {
    spdlog::warn("{}: skipping corrupt chunk at offset {} ({})", path_, offset, what);
  }
}

// Loads the next well-formed chunk into buffered_. false at end of file.
bool RecordReader::load_next_chunk() {
  for (;;) {
    auto res = file_.read_next_chunk();
    switch (res.status) {
      case ShardFile::ReadStatus::EndOfFile:
        return false;

      case ShardFile::ReadStatus::BadHeader:
        on_corrupt(res.offset, "bad header", 0);
        if (!file_.resync()) return false;
        continue;

      case ShardFile::ReadStatus::Chunk: {
        auto dec = decode_chunk(res.frame);
        if (!dec.verified) {
          on_corrupt(res.offset, "checksum or structure mismatch", dec.declared_records);
          continue;
        }
        if (dec.records.empty()) continue;
        buffered_ = std::move(dec.records);
        next_ = 0;
        return true;
      }
    }
  }
}

std::optional<std::string> RecordReader::next_record() {
  switch (state_) {
    case State::Closed:    throw ReaderClosedError();
    case State::Exhausted:
    case State::Failed:    return std::nullopt;
    case State::Open:      break;
  }

  if (next_ >= buffered_.size()) {
    buffered_.clear();
    next_ = 0;
    if (!load_next_chunk()) {
      state_ = State::Exhausted;
      return std::nullopt;
    }
  }
  return std::move(buffered_[next_++]);
}

uint64_t RecordReader::count_records(const std::string& path, CorruptionPolicy policy) {
  ShardFile file = ShardFile::open_for_read(path);
  uint64_t total = 0;
  for (;;) {
    auto res = file.read_next_chunk();
    if (res.status == ShardFile::ReadStatus::EndOfFile) break;

    if (res.status == ShardFile::ReadStatus::BadHeader) {
      if (policy == CorruptionPolicy::Error)
        throw CorruptDataError(fmt::format("{}: corrupt chunk at offset {} (bad header)", path, res.offset));
      spdlog::warn("{}: skipping corrupt chunk at offset {} (bad header)", path, res.offset);
      if (!file.resync()) break;
      continue;
    }

    uint64_t n = 0;
    if (!verify_chunk(res.frame, n)) {
      if (policy == CorruptionPolicy::Error)
        throw CorruptDataError(fmt::format("{}: corrupt chunk at offset {} (checksum or structure mismatch)",
                                           path, res.offset));
      spdlog::warn("{}: skipping corrupt chunk at offset {} (checksum or structure mismatch)", path, res.offset);
      continue;
    }
    total += n;
  }
  file.close();
  return total;
}

} // namespace shardio
