#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace asymunc {

inline std::size_t normalized_thread_count(std::size_t requested) {
  const std::size_t hw = std::max<std::size_t>(1, std::thread::hardware_concurrency());
  if (requested == 0) {
    return hw;
  }
  return std::min(requested, hw);
}

inline std::size_t block_count(std::size_t total_items, std::size_t block_size) {
  if (block_size == 0) {
    return 0;
  }
  return (total_items + block_size - 1) / block_size;
}

// Splits [0, total_items) into fixed blocks of block_size items and hands contiguous
// runs of whole blocks to worker threads. fn(block_index, begin, end) sees the same
// block boundaries whatever the thread count, so per-block work seeded by
// block_index is reproducible bit for bit.
template <typename Func>
void parallel_for_blocks(std::size_t total_items, std::size_t block_size, std::size_t requested_threads, Func&& fn) {
  const std::size_t blocks = block_count(total_items, block_size);
  if (blocks == 0) {
    return;
  }

  auto run_range = [&](std::size_t first_block, std::size_t last_block) {
    for (std::size_t b = first_block; b < last_block; ++b) {
      const std::size_t begin = b * block_size;
      const std::size_t end = std::min(total_items, begin + block_size);
      fn(b, begin, end);
    }
  };

  const std::size_t thread_count =
      std::max<std::size_t>(1, std::min(normalized_thread_count(requested_threads), blocks));

  if (thread_count == 1) {
    run_range(0, blocks);
    return;
  }

  const std::size_t share = blocks / thread_count;
  const std::size_t remainder = blocks % thread_count;

  std::vector<std::thread> workers;
  std::vector<std::exception_ptr> errors(thread_count);
  workers.reserve(thread_count - 1);

  std::size_t first = 0;
  for (std::size_t i = 0; i < thread_count; ++i) {
    const std::size_t last = first + share + (i < remainder ? 1 : 0);

    if (i + 1 == thread_count) {
      try {
        run_range(first, last);
      } catch (...) {
        errors[i] = std::current_exception();
      }
    } else {
      workers.emplace_back([first, last, i, &run_range, &errors]() {
        try {
          run_range(first, last);
        } catch (...) {
          errors[i] = std::current_exception();
        }
      });
    }

    first = last;
  }

  for (auto& worker : workers) {
    worker.join();
  }

  for (const auto& error : errors) {
    if (error) {
      std::rethrow_exception(error);
    }
  }
}

}  // namespace asymunc
