#include "tally/parallel/parallelism.hpp"

#include <algorithm>

#include <tbb/info.h>

static size_t CheckMaxThreads(size_t max_threads) {
  if (max_threads == 0) {
    Fail("ParallelismLimit needs at least one thread");
  }
  return max_threads;
}

ParallelismLimit::ParallelismLimit(size_t max_threads)
    : max_threads_{CheckMaxThreads(max_threads)},
      control_{tbb::global_control::max_allowed_parallelism, max_threads_} {}

size_t ParallelismLimit::ActiveLimit() {
  return tbb::global_control::active_value(
      tbb::global_control::max_allowed_parallelism);
}

size_t DefaultBucketCount() {
  const size_t concurrency = static_cast<size_t>(tbb::info::default_concurrency());
  return std::max<size_t>(1, std::min(concurrency, ParallelismLimit::ActiveLimit()));
}
