#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

#include "core/work_queue.hpp"

namespace netmon_agent::core {

// Runs fn(item) for every item on at most `concurrency` worker threads that drain
// a shared queue. Returns once every item is processed. The first exception thrown
// by fn is rethrown after all workers have joined.
template <typename Item, typename Fn>
void run_bounded(const std::vector<Item>& items, std::size_t concurrency, Fn&& fn) {
  if (items.empty()) {
    return;
  }

  WorkQueue<std::size_t> queue;
  for (std::size_t i = 0; i < items.size(); ++i) {
    queue.push(i);
  }
  queue.shutdown();

  std::mutex error_mutex;
  std::exception_ptr first_error{};

  const std::size_t worker_count = std::clamp<std::size_t>(concurrency, 1, items.size());
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (std::size_t w = 0; w < worker_count; ++w) {
    workers.emplace_back([&]() {
      while (const auto index = queue.pop()) {
        try {
          fn(items[*index]);
        } catch (...) {
          std::lock_guard<std::mutex> lock(error_mutex);
          if (!first_error) {
            first_error = std::current_exception();
          }
        }
      }
    });
  }

  for (auto& worker : workers) {
    worker.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

// Like run_bounded but collects fn(item) results in input order. fn must not
// return bool: std::vector<bool> elements are not safe to write concurrently.
template <typename Item, typename Fn>
auto map_bounded(const std::vector<Item>& items, std::size_t concurrency, Fn&& fn)
    -> std::vector<std::invoke_result_t<Fn&, const Item&>> {
  using Result = std::invoke_result_t<Fn&, const Item&>;
  static_assert(!std::is_same_v<Result, bool>, "map_bounded cannot collect bool results");

  std::vector<Result> results(items.size());
  std::vector<std::size_t> indices(items.size());
  for (std::size_t i = 0; i < indices.size(); ++i) {
    indices[i] = i;
  }

  run_bounded(indices, concurrency, [&](const std::size_t index) { results[index] = fn(items[index]); });
  return results;
}

}  // namespace netmon_agent::core
