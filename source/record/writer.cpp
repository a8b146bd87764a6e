// source/record/writer.cpp
#include "shardio/record/writer.hpp"
#include "shardio/chunk/codec.hpp"
#include "shardio/errors.hpp"

#include <spdlog/spdlog.h>

namespace shardio {

RecordWriter::RecordWriter(const std::string& path, const RecordWriterOptions& opts)
  : file_(opts.append ? ShardFile::open_for_append(path) : ShardFile::open_for_write(path)),
    opts_(opts)
{
  if (opts_.chunk_size_bytes == 0) opts_.chunk_size_bytes = kDefaultChunkSizeBytes;
  pending_.reserve(static_cast<size_t>(opts_.chunk_size_bytes + 64));
}

RecordWriter::~RecordWriter() {
  if (closed_ || !file_.is_open()) return;
  try {
    close();
  } catch (const std::exception& e) {
    spdlog::error("record writer {}: close on destruction failed: {}", file_.path(), e.what());
  }
}

void RecordWriter::write_record(std::string_view record) {
  if (closed_) throw WriterClosedError();
  if (failure_) std::rethrow_exception(failure_);

  append_record(pending_, record);
  ++pending_records_;
  ++records_written_;
  bytes_written_ += record.size();

  if (pending_.size() >= opts_.chunk_size_bytes) seal_pending();
}

void RecordWriter::seal_pending() {
  if (pending_records_ == 0) return;

  const std::string frame = seal_chunk(pending_, pending_records_, opts_.compression, opts_.zstd_level);
  try {
    file_.write_chunk(frame);
  } catch (const IoError&) {
    // часть кадра уже могла попасть на диск: повторная запись дала бы дубликат
    pending_.clear();
    pending_records_ = 0;
    failure_ = std::current_exception();
    throw;
  }
  ++chunks_written_;
  spdlog::trace("{}: sealed chunk #{} ({} records, {} -> {} bytes)",
                file_.path(), chunks_written_, pending_records_, pending_.size(),
                frame.size() - kChunkHeaderSize);

  pending_.clear();
  pending_records_ = 0;
}

void RecordWriter::flush() {
  if (closed_) throw WriterClosedError();
  if (failure_) std::rethrow_exception(failure_);
  seal_pending();
  file_.sync();
}

void RecordWriter::close() {
  if (closed_) return;
  // помечаем заранее: деструктор не должен повторять неудачный flush
  closed_ = true;
  if (!failure_) {
    seal_pending();
    file_.sync();
  }
  file_.close();
}

} // namespace shardio
