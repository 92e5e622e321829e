#include "dispatch.hh"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "config.hh"
#include "log.hh"

#ifndef BOOST_ASIO_HAS_STD_INVOKE_RESULT
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT
#endif

#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/bind/bind.hpp>
#include <boost/core/ref.hpp>

namespace declutter {

inline namespace detail_v1 {

namespace {

// indices of finished slots, drained by the coordinator
struct done_queue_t {
  std::mutex mtx;
  std::condition_variable cv;
  std::vector<std::size_t> idx;
};

void hash_task(const dir_entry_t &entry, const EVP_MD *md,
               std::optional<file_record_t> &slot, const std::size_t idx,
               done_queue_t &done) {
  try {
    slot = make_record(entry, md);
  } catch (const std::exception &e) {
    log_warn() << "skip file: " << entry.path() << " - " << e.what();
    slot.reset();
  }
  {
    std::lock_guard lk(done.mtx);
    done.idx.push_back(idx);
  }
  done.cv.notify_one();
}

}  // namespace

uint32_t default_threads() noexcept {
  const auto hw = std::thread::hardware_concurrency();
  return std::max(1U, std::min(max_hash_workers, hw));
}

uint32_t clamp_threads(const uint32_t max_thread) noexcept {
  if (max_thread == 0) {
    return default_threads();
  }
  return std::min(max_thread, max_hash_workers);
}

fp_table_t dispatch(std::span<const dir_entry_t> entries, const EVP_MD *md,
                    uint32_t max_thread, const progress_fn &progress) {
  max_thread = clamp_threads(max_thread);

  const auto total = entries.size();
  std::vector<std::optional<file_record_t>> slots(total);
  done_queue_t done;
  fp_table_t table;

  boost::asio::thread_pool pool(max_thread);
  for (std::size_t i = 0; i < total; ++i) {
    boost::asio::post(
        pool, boost::bind(hash_task, boost::cref(entries[i]), md,
                          boost::ref(slots[i]), i, boost::ref(done)));
  }

  // merge as tasks complete
  std::vector<std::size_t> batch;
  std::size_t merged = 0;
  while (merged < total) {
    {
      std::unique_lock lk(done.mtx);
      done.cv.wait(lk, [&done] { return !done.idx.empty(); });
      batch.swap(done.idx);
    }
    for (const auto idx : batch) {
      auto &slot = slots[idx];
      if (slot) {
        auto &fp_map = slot->kind() == file_kind_t::image ? table.image
                                                          : table.generic;
        auto fingerprint = slot->fingerprint();
        fp_map[std::move(fingerprint)].emplace_back(std::move(*slot));
        slot.reset();
      }
      ++merged;
      if (progress) {
        progress(merged, total);
      }
    }
    batch.clear();
  }
  pool.join();

  return table;
}

}  // namespace detail_v1

}  // namespace declutter
