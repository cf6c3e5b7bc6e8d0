#pragma once

#include <cstddef>

#include <tbb/global_control.h>

#include "tally/common.hpp"

/*
 * Caps the number of TBB worker threads while in scope. Limits nest: TBB
 * applies the smallest limit among all live instances.
 */
class ParallelismLimit {
 public:
  explicit ParallelismLimit(size_t max_threads);
  NO_COPY_NO_MOVE(ParallelismLimit);

  size_t GetMaxThreads() const { return max_threads_; }

  /* The limit currently in effect for the process */
  static size_t ActiveLimit();

 private:
  size_t max_threads_;
  tbb::global_control control_;
};

/* Bucket count for a Reduction fed from the TBB pool: one per worker */
size_t DefaultBucketCount();
