// source/parallel/reader_pool.cpp
#include "shardio/parallel/reader_pool.hpp"
#include "shardio/errors.hpp"
#include "shardio/parallel/bounded_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace shardio {

namespace {
constexpr size_t kBatchRecords = 64; // records moved per slot turn
constexpr auto   kIdleBackoff  = std::chrono::milliseconds(10);
}

struct ReaderPool::Impl {
  struct Piece {
    std::string record;
    std::exception_ptr error; // set for a shard failure, record is empty then
  };

  struct Slot {
    std::unique_ptr<RecordReader> reader;
    std::string path;
  };

  ReaderPoolOptions             opts;
  std::unique_ptr<ShardLocator> locator;
  BoundedQueue<Piece>           out;

  std::vector<Slot>       slots;
  std::mutex              slots_mu;
  std::condition_variable ready_cv;
  std::deque<size_t>      ready;
  size_t                  live_slots = 0;

  std::mutex               close_mu;
  std::atomic<bool>        stopping{false};
  std::atomic<bool>        closed{false};
  std::atomic<uint64_t>    shards_done{0};
  std::vector<std::thread> workers;

  // открытия подряд без единой записи; после полного прохода бесконечного
  // локатора воркер засыпает, чтобы не крутиться по пустым шардам
  std::atomic<uint64_t>    idle_opens{0};
  std::mutex               idle_mu;
  std::condition_variable  idle_cv;

  Impl(std::unique_ptr<ShardLocator> loc, const ReaderPoolOptions& o)
    : opts(o), locator(std::move(loc)), out(o.queue_size_bytes)
  {
    if (!locator)              throw ConfigError("reader pool: no shard locator");
    if (opts.num_shards == 0)  throw ConfigError("reader pool: num_shards must be > 0");
    if (opts.queue_size_bytes == 0) throw ConfigError("reader pool: queue_size_bytes must be > 0");

    slots.resize(opts.num_shards);
    for (size_t i = 0; i < opts.num_shards; ++i) ready.push_back(i);
    live_slots = opts.num_shards;

    size_t n = opts.worker_threads;
    if (n == 0) n = std::max(1u, std::thread::hardware_concurrency());
    for (size_t i = 0; i < n; ++i) {
      workers.emplace_back([this] { worker_main(); });
    }

    spdlog::info("reader pool: {} slots over {} {} shards ({} workers, queue {} bytes, corruption {})",
                 opts.num_shards, locator->total_shards(), locator->finite() ? "finite" : "repeating",
                 n, opts.queue_size_bytes, corruption_policy_name(opts.corruption));
  }

  ~Impl() {
    stop_workers();
  }

  void stop_workers() {
    {
      std::scoped_lock lk(slots_mu, idle_mu);
      stopping.store(true);
    }
    ready_cv.notify_all();
    idle_cv.notify_all();
    // будит воркеров на полной очереди и потребителей на пустой
    out.close();
    out.clear();
    for (auto& t : workers)
      if (t.joinable()) t.join();
  }

  void deliver_error(std::exception_ptr e) {
    out.push(Piece{std::string(), std::move(e)}, 1);
  }

  void drop_reader(Slot& s) {
    if (!s.reader) return;
    try {
      s.reader->close();
    } catch (const Error& e) {
      spdlog::warn("reader pool: closing {} failed: {}", s.path, e.what());
    }
    s.reader.reset();
    locator->release(s.path);
    s.path.clear();
    shards_done.fetch_add(1, std::memory_order_relaxed);
  }

  void back_off_if_idle() {
    if (locator->finite()) return;
    if (idle_opens.fetch_add(1) < locator->total_shards()) return;
    std::unique_lock<std::mutex> lk(idle_mu);
    idle_cv.wait_for(lk, kIdleBackoff, [&] { return stopping.load(); });
  }

  // Points the slot at the next openable path. false when the locator is dry.
  bool open_next(Slot& s) {
    while (!stopping.load()) {
      back_off_if_idle();
      if (stopping.load()) return false;
      auto path = locator->acquire();
      if (!path) return false;
      try {
        s.reader = std::make_unique<RecordReader>(*path, RecordReaderOptions{.corruption = opts.corruption});
        s.path = std::move(*path);
        spdlog::debug("reader pool: opened {}", s.path);
        return true;
      } catch (const IoError& e) {
        spdlog::error("reader pool: {}", e.what());
        locator->release(*path);
        deliver_error(std::current_exception());
      }
    }
    return false;
  }

  // Один проход по слоту idx. false, если слот выбыл.
  bool serve(size_t idx) {
    Slot& s = slots[idx];
    if (!s.reader && !open_next(s)) return false;

    for (size_t n = 0; n < kBatchRecords; ++n) {
      if (stopping.load()) return true;

      std::optional<std::string> rec;
      try {
        rec = s.reader->next_record();
      } catch (const Error& e) {
        spdlog::error("reader pool: shard {} failed: {}", s.path, e.what());
        deliver_error(std::current_exception());
        drop_reader(s);
        return open_next(s);
      }

      if (!rec) {
        if (s.reader->chunks_skipped() > 0)
          spdlog::warn("reader pool: {} done, {} corrupt chunks skipped", s.path, s.reader->chunks_skipped());
        drop_reader(s);
        return open_next(s);
      }

      const size_t cost = std::max<size_t>(rec->size(), 1);
      if (!out.push(Piece{std::move(*rec), nullptr}, cost)) return true;
      idle_opens.store(0, std::memory_order_relaxed);
    }
    return true;
  }

  void worker_main() {
    for (;;) {
      size_t idx = 0;
      {
        std::unique_lock<std::mutex> lk(slots_mu);
        ready_cv.wait(lk, [&] { return stopping.load() || !ready.empty() || live_slots == 0; });
        if (stopping.load() || ready.empty()) return;
        idx = ready.front();
        ready.pop_front();
      }

      const bool keep = serve(idx);

      bool last = false;
      {
        std::lock_guard<std::mutex> lk(slots_mu);
        if (keep) ready.push_back(idx);
        else last = (--live_slots == 0);
      }
      ready_cv.notify_all();

      if (last) {
        spdlog::info("reader pool: all slots retired after {} shards", shards_done.load());
        out.close();
      }
    }
  }
};

ReaderPool::ReaderPool(std::unique_ptr<ShardLocator> locator, const ReaderPoolOptions& opts)
  : p_(std::make_unique<Impl>(std::move(locator), opts)) {}

ReaderPool::ReaderPool(ReaderPool&&) noexcept = default;
ReaderPool& ReaderPool::operator=(ReaderPool&&) noexcept = default;

ReaderPool::~ReaderPool() {
  if (!p_) return;
  try {
    close();
  } catch (const std::exception& e) {
    spdlog::error("reader pool: close on destruction failed: {}", e.what());
  }
}

ReaderPool ReaderPool::with_shards(const std::string& dir, const std::string& prefix,
                                   const ReaderPoolOptions& opts) {
  return ReaderPool(make_directory_locator(dir, prefix), opts);
}

ReaderPool ReaderPool::with_shard_paths(std::vector<std::string> paths, const ReaderPoolOptions& opts) {
  return ReaderPool(make_path_list_locator(std::move(paths)), opts);
}

ReaderPool ReaderPool::with_random_shard_paths(std::vector<std::string> paths,
                                               const ReaderPoolOptions& opts, uint64_t seed) {
  return ReaderPool(make_random_locator(std::move(paths), seed), opts);
}

std::optional<std::string> ReaderPool::next_record() {
  if (p_->closed.load()) throw ReaderClosedError();

  auto piece = p_->out.pop();
  if (!piece) return std::nullopt;
  if (piece->error) std::rethrow_exception(piece->error);
  return std::move(piece->record);
}

void ReaderPool::close() {
  std::lock_guard<std::mutex> lk(p_->close_mu);
  if (p_->closed.exchange(true)) return;

  p_->stop_workers();
  for (auto& s : p_->slots) p_->drop_reader(s);
  spdlog::debug("reader pool closed after {} shards", p_->shards_done.load());
}

size_t ReaderPool::queued_records() const {
  return p_->out.size();
}

size_t ReaderPool::queued_bytes() const {
  return p_->out.cost();
}

bool ReaderPool::closed() const {
  return p_->closed.load();
}

uint64_t ReaderPool::count_records_with_shards(const std::string& dir, const std::string& prefix,
                                               CorruptionPolicy policy) {
  auto locator = make_directory_locator(dir, prefix);
  uint64_t total = 0;
  while (auto path = locator->acquire()) total += RecordReader::count_records(*path, policy);
  return total;
}

uint64_t ReaderPool::count_records_with_shard_paths(const std::vector<std::string>& paths,
                                                    CorruptionPolicy policy) {
  uint64_t total = 0;
  for (const auto& p : paths) total += RecordReader::count_records(p, policy);
  return total;
}

} // namespace shardio
