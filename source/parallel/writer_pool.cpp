// source/parallel/writer_pool.cpp
#include "shardio/parallel/writer_pool.hpp"
#include "shardio/errors.hpp"
#include "shardio/parallel/bounded_queue.hpp"
#include "shardio/parallel/sharder.hpp"
#include "shardio/record/writer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace shardio {

struct WriterPool::Impl {
  struct Task {
    std::string record;
    std::shared_ptr<std::promise<void>> done; // set only for write_record_async
  };

  struct Slot {
    std::unique_ptr<RecordWriter> writer;
  };

  WriterPoolOptions   opts;
  RecordWriterOptions writer_opts;
  FileSharder         sharder;
  BoundedQueue<Task>  tasks;

  // владение слотами: индекс либо в free_slots, либо у одного воркера
  std::vector<Slot>       slots;
  mutable std::mutex      slots_mu;
  std::condition_variable slot_cv;
  std::deque<size_t>      free_slots;
  size_t                  live_slots = 0;

  // задачи в очереди + выполняемые, первая ошибка воркера
  std::mutex              state_mu;
  std::condition_variable idle_cv;
  uint64_t                outstanding = 0;
  std::exception_ptr      first_error;

  std::mutex               close_mu;
  std::atomic<bool>        closed{false};
  std::atomic<uint64_t>    records{0};
  std::vector<std::thread> workers;

  static void validate(const WriterPoolOptions& o) {
    if (o.dir_path.empty())          throw ConfigError("writer pool: dir_path is empty");
    if (o.prefix.empty())            throw ConfigError("writer pool: prefix is empty");
    if (o.num_shards == 0)           throw ConfigError("writer pool: num_shards must be > 0");
    if (o.task_queue_capacity == 0)  throw ConfigError("writer pool: task_queue_capacity must be > 0");
  }

  static const WriterPoolOptions& checked(const WriterPoolOptions& o) {
    validate(o);
    return o;
  }

  explicit Impl(const WriterPoolOptions& o)
    : opts(checked(o)),
      sharder(o.dir_path, o.prefix, o.num_shards, o.append),
      tasks(o.task_queue_capacity)
  {
    writer_opts.compression      = opts.compression;
    writer_opts.zstd_level       = opts.zstd_level;
    writer_opts.chunk_size_bytes = opts.chunk_size_bytes;
    writer_opts.append           = opts.append;

    slots.resize(opts.num_shards);
    for (size_t i = 0; i < opts.num_shards; ++i) {
      slots[i].writer = std::make_unique<RecordWriter>(sharder.path_for(i), writer_opts);
      free_slots.push_back(i);
    }
    live_slots = opts.num_shards;

    size_t n = opts.worker_threads;
    if (n == 0) n = std::max(1u, std::thread::hardware_concurrency());
    for (size_t i = 0; i < n; ++i) {
      workers.emplace_back([this] { worker_main(); });
    }

    spdlog::info("writer pool: {} shards in {} (prefix {}, {} workers, queue {}, compression {}, {})",
                 opts.num_shards, opts.dir_path, opts.prefix, n, opts.task_queue_capacity,
                 compression_name(opts.compression), opts.append ? "append" : "truncate");
  }

  ~Impl() {
    // no-op after close()
    tasks.close();
    for (auto& t : workers)
      if (t.joinable()) t.join();
  }

  // ---- слоты ----

  size_t acquire_slot() {
    std::unique_lock<std::mutex> lk(slots_mu);
    slot_cv.wait(lk, [&] { return !free_slots.empty() || live_slots == 0; });
    if (free_slots.empty()) {
      throw ShardCapacityError("writer pool: no writable shard left (max_bytes_per_writer " +
                               std::to_string(opts.max_bytes_per_writer) +
                               " reached with auto-sharding disabled, or a shard write failed)");
    }
    const size_t idx = free_slots.front();
    free_slots.pop_front();
    return idx;
  }

  void release_slot(size_t idx, bool retire) {
    {
      std::lock_guard<std::mutex> lk(slots_mu);
      if (retire) --live_slots;
      else free_slots.push_back(idx);
    }
    slot_cv.notify_all();
  }

  // Slot idx is held by the caller. Returns true if the slot retired.
  bool rotate_if_full(size_t idx) {
    auto& w = slots[idx].writer;
    if (opts.max_bytes_per_writer == 0 || w->bytes_written() < opts.max_bytes_per_writer) return false;

    const std::string old_path = w->path();
    const uint64_t bytes = w->bytes_written();
    w->close();

    if (!opts.enable_auto_sharding) {
      w.reset();
      spdlog::info("shard {} reached {} bytes, retired", old_path, bytes);
      return true;
    }

    const std::string path = sharder.next_path();
    w = std::make_unique<RecordWriter>(path, writer_opts);
    spdlog::info("auto-sharding: {} reached {} bytes, continuing in {}", old_path, bytes, path);
    return false;
  }

  void write_one(const std::string& record) {
    const size_t idx = acquire_slot();
    bool retire = false;
    try {
      slots[idx].writer->write_record(record);
      records.fetch_add(1, std::memory_order_relaxed);
      retire = rotate_if_full(idx);
    } catch (...) {
      // шард без писателя или с неудачной записью из обслуживания выводится
      const auto& w = slots[idx].writer;
      release_slot(idx, !w || w->closed() || w->failed());
      throw;
    }
    release_slot(idx, retire);
  }

  // ---- задачи ----

  void finish_task() {
    std::lock_guard<std::mutex> lk(state_mu);
    if (--outstanding == 0) idle_cv.notify_all();
  }

  void keep_error(std::exception_ptr e) {
    std::lock_guard<std::mutex> lk(state_mu);
    if (!first_error) first_error = std::move(e);
  }

  void rethrow_pending() {
    std::exception_ptr e;
    {
      std::lock_guard<std::mutex> lk(state_mu);
      std::swap(e, first_error);
    }
    if (e) std::rethrow_exception(e);
  }

  void worker_main() {
    while (auto task = tasks.pop()) {
      std::exception_ptr err;
      try {
        write_one(task->record);
      } catch (const std::exception& e) {
        spdlog::error("writer pool: record write failed: {}", e.what());
        err = std::current_exception();
      }

      if (task->done) {
        if (err) task->done->set_exception(err);
        else task->done->set_value();
      } else if (err) {
        keep_error(err);
      }
      finish_task();
    }
  }

  bool enqueue(Task t) {
    {
      std::lock_guard<std::mutex> lk(state_mu);
      ++outstanding;
    }
    if (!tasks.push(std::move(t))) {
      finish_task();
      return false;
    }
    return true;
  }

  void wait_idle() {
    std::unique_lock<std::mutex> lk(state_mu);
    idle_cv.wait(lk, [&] { return outstanding == 0; });
  }

  // Takes every live slot away from the workers, then flushes them.
  void flush_slots() {
    std::unique_lock<std::mutex> lk(slots_mu);
    slot_cv.wait(lk, [&] { return free_slots.size() == live_slots; });
    for (size_t idx : free_slots) slots[idx].writer->flush();
  }
};

WriterPool::WriterPool(const WriterPoolOptions& opts) : p_(std::make_unique<Impl>(opts)) {}

WriterPool::~WriterPool() {
  if (!p_ || p_->closed.load()) return;
  try {
    close();
  } catch (const std::exception& e) {
    spdlog::error("writer pool {}: close on destruction failed: {}", p_->opts.dir_path, e.what());
  }
}

void WriterPool::write_record(std::string_view record) {
  if (p_->closed.load()) throw WriterClosedError();
  p_->rethrow_pending();
  if (!p_->enqueue(Impl::Task{std::string(record), nullptr})) throw WriterClosedError();
}

std::future<void> WriterPool::write_record_async(std::string record) {
  if (p_->closed.load()) throw WriterClosedError();
  auto done = std::make_shared<std::promise<void>>();
  auto fut = done->get_future();
  if (!p_->enqueue(Impl::Task{std::move(record), std::move(done)})) throw WriterClosedError();
  return fut;
}

void WriterPool::flush() {
  std::lock_guard<std::mutex> lk(p_->close_mu);
  if (p_->closed.load()) throw WriterClosedError();
  p_->wait_idle();
  p_->rethrow_pending();
  p_->flush_slots();
}

void WriterPool::close() {
  std::lock_guard<std::mutex> lk(p_->close_mu);
  if (p_->closed.exchange(true)) return;

  // воркеры дорабатывают очередь, видят закрытие и выходят
  p_->tasks.close();
  for (auto& t : p_->workers)
    if (t.joinable()) t.join();

  std::exception_ptr err;
  {
    std::lock_guard<std::mutex> slk(p_->state_mu);
    std::swap(err, p_->first_error);
  }

  size_t closed_files = 0;
  for (auto& s : p_->slots) {
    if (!s.writer) continue;
    try {
      s.writer->close();
      ++closed_files;
    } catch (const std::exception& e) {
      spdlog::error("writer pool: closing {} failed: {}", s.writer->path(), e.what());
      if (!err) err = std::current_exception();
    }
  }
  spdlog::info("writer pool closed: {} records, {} open shards closed in {}",
               p_->records.load(), closed_files, p_->opts.dir_path);

  if (err) std::rethrow_exception(err);
}

size_t WriterPool::pending_tasks() const {
  return p_->tasks.size();
}

size_t WriterPool::available_writers() const {
  std::lock_guard<std::mutex> lk(p_->slots_mu);
  return p_->free_slots.size();
}

bool WriterPool::closed() const {
  return p_->closed.load();
}

uint64_t WriterPool::records_written() const {
  return p_->records.load();
}

} // namespace shardio
