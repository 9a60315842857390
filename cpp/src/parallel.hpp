// src/parallel.hpp
#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace ph {
namespace detail {

// 0 = auto (hardware concurrency, at least 1).
inline unsigned resolve_threads(unsigned requested) {
  if (requested != 0)
    return requested;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw ? hw : 1u;
}

// Runs fn(i) for every i in [0, n). Each index is an output slot owned by
// exactly one worker; the caller joins before reading any slot. The first
// exception thrown by fn is rethrown here after all workers stop.
template <typename Fn>
void parallel_for(std::size_t n, unsigned threads, Fn &&fn) {
  if (n == 0)
    return;
  const unsigned workers =
      static_cast<unsigned>(std::min<std::size_t>(n, resolve_threads(threads)));
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i)
      fn(i);
    return;
  }

  std::atomic<std::size_t> next{0};
  std::atomic<bool> stop{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  std::vector<std::thread> ts;
  ts.reserve(workers);
  for (unsigned t = 0; t < workers; ++t) {
    ts.emplace_back([&]() {
      while (!stop.load(std::memory_order_relaxed)) {
        const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
        if (i >= n)
          break;
        try {
          fn(i);
        } catch (...) {
          std::lock_guard<std::mutex> lock(error_mutex);
          if (!first_error)
            first_error = std::current_exception();
          stop.store(true, std::memory_order_relaxed);
        }
      }
    });
  }
  for (auto &th : ts)
    th.join();
  if (first_error)
    std::rethrow_exception(first_error);
}

} // namespace detail
} // namespace ph
