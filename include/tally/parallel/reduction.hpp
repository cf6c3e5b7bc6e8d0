#pragma once

#include <atomic>
#include <thread>

#include "tally/fixed_array.hpp"
#include "tally/parallel/parallel_common.hpp"

/*
 * Collects results from many threads into a fixed number of buckets, each
 * guarded by its own mutex. A writer takes whichever bucket is free, so
 * contention stays low while there are at least as many buckets as workers.
 * GatherAndClear hands all buckets to a single caller and resets them.
 */
template <typename Container>
class Reduction {
 public:
  explicit Reduction(size_t buckets) : buckets_{CheckBucketCount(buckets)} {}

  NO_COPY_NO_MOVE(Reduction);

  /*
   * Calls func(bucket, args...) with exclusive access to one bucket. Safe to
   * call concurrently with other AddElement calls.
   */
  template <typename F, typename... Args>
  decltype(auto) AddElement(F&& func, Args&&... args) {
    auto gather_lock = ReadLock(gather_mutex_);
    Bucket& bucket = [this]() -> Bucket& {
      while (true) {
        for (auto& i : buckets_) {
          if (i.mutex_.try_lock()) {
            return i;
          }
        }
        std::this_thread::yield();
      }
    }();
    const size_t size = bucket.data_.size();
    finally cleanup{[this, &bucket, size] {
      size_approx_.fetch_add(bucket.data_.size() - size);
      bucket.mutex_.unlock();
    }};
    return std::invoke(std::forward<F>(func), static_cast<Container&>(bucket.data_),
                       std::forward<Args>(args)...);
  }

  /*
   * Calls func(buckets, args...) where buckets is a range of Container&&,
   * then leaves every bucket empty. Waits for running AddElement calls.
   */
  template <typename F, typename... Args>
  decltype(auto) GatherAndClear(F&& func, Args&&... args) {
    auto gather_lock = WriteLock(gather_mutex_);
    finally cleanup{[this] {
      size_approx_.store(0);
      for (auto& i : buckets_) {
        i.data_ = Container{};
      }
    }};
    auto data = buckets_ | ranges::views::transform([](Bucket& i) -> Container&& {
                  return std::move(i.data_);
                });
    return std::invoke(std::forward<F>(func), data, std::forward<Args>(args)...);
  }

  size_t size_approx() const { return size_approx_.load(); }

  size_t buckets_count() const { return buckets_.size(); }

 private:
  struct Bucket {
    std::mutex mutex_;
    Container data_;
  };

  static size_t CheckBucketCount(size_t buckets) {
    if (buckets == 0) {
      Fail("Reduction needs at least one bucket");
    }
    return buckets;
  }

  std::shared_mutex gather_mutex_;
  FixedArray<Bucket> buckets_;
  std::atomic<size_t> size_approx_{0};
};
