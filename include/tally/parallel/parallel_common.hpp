#pragma once

#include "tally/common.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

template <typename M>
auto ReadLock(M& mutex) {
  if constexpr (std::is_same_v<M, std::mutex>) {
    return std::unique_lock<M>{mutex};
  } else {
    return std::shared_lock<M>{mutex};
  }
}

template <typename M>
std::unique_lock<M> WriteLock(M& mutex) {
  return std::unique_lock{mutex};
}

/*
 * Calls func once for every item of range on the TBB worker pool and returns
 * after all calls finished. Sized random access ranges are visited in place.
 * Other finite ranges are materialized first: ranges of lvalues as addresses
 * of their items, so func still sees the caller's objects, ranges of
 * prvalues as copies that live until ParallelForEach returns.
 */
template <typename Range, typename F>
void ParallelForEach(Range&& range, F&& func) {
  using block = tbb::blocked_range<size_t>;
  if constexpr (ranges::random_access_range<Range> and ranges::sized_range<Range>) {
    using difference = ranges::range_difference_t<Range>;
    auto first = ranges::begin(range);
    const auto size = static_cast<size_t>(ranges::size(range));
    tbb::parallel_for(block{0, size}, [first, &func](const block& x) {
      for (size_t i = x.begin(); i != x.end(); ++i) {
        func(first[static_cast<difference>(i)]);
      }
    });
  } else if constexpr (std::is_lvalue_reference_v<ranges::range_reference_t<Range>>) {
    std::vector items = ranges::to_vector(
        range | ranges::views::transform([](auto& i) { return std::addressof(i); }));
    tbb::parallel_for(block{0, items.size()}, [&items, &func](const block& x) {
      for (size_t i = x.begin(); i != x.end(); ++i) {
        func(*items[i]);
      }
    });
  } else {
    std::vector vec = ranges::to_vector(range);
    tbb::parallel_for(block{0, vec.size()}, [&vec, &func](const block& x) {
      for (size_t i = x.begin(); i != x.end(); ++i) {
        func(vec[i]);
      }
    });
  }
}

template <typename Range, typename F>
void SeqForEach(Range&& range, F&& func) {
  ranges::for_each(std::forward<Range>(range), std::forward<F>(func));
}
