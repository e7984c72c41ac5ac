#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace footpack {

// <= 0 means "use the hardware", never more workers than items.
inline int ResolveThreadCount(int requested, std::size_t items)
{
  int n = requested;
  if (n <= 0) n = static_cast<int>(std::thread::hardware_concurrency());
  if (n <= 0) n = 1;
  if (items < static_cast<std::size_t>(n)) n = static_cast<int>(std::max<std::size_t>(items, 1));
  return n;
}

// Run fn(i) for every i in [0, count). Workers pull indices from a shared
// counter; fn must write its result to a slot owned by i so the outcome does
// not depend on scheduling. fn must not throw.
template <typename Fn>
void ParallelFor(std::size_t count, int threads, Fn&& fn)
{
  const int n = ResolveThreadCount(threads, count);
  if (n <= 1) {
    for (std::size_t i = 0; i < count; ++i) fn(i);
    return;
  }

  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1);
      if (i >= count) break;
      fn(i);
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(n));
  for (int t = 0; t < n; ++t) pool.emplace_back(worker);
  for (std::thread& th : pool) {
    if (th.joinable()) th.join();
  }
}

} // namespace footpack
