/**
  Builds a Counter from elements produced on the TBB worker pool.

  Workers never touch the Counter. Each call of the producer emits elements
  into a local vector, which is appended to one bucket of a Reduction. Once
  every worker has finished, the buckets are drained on the calling thread
  through Counter::Update, so the result does not depend on how the work was
  interleaved.

  Items of a range of lvalues (a container, or a filter of one) are passed to
  the producer as the caller's own objects, so a Counter over
  std::string_view may count views into them as long as the underlying
  storage outlives the result. Items of a range of prvalues are temporaries
  and must not be borrowed.

  Example:

    std::vector<std::string> lines = ...;
    auto words = ParallelCollect<Counter<std::string>>(
        lines, [](const std::string& line, auto& emit) {
          for (auto& word : SplitWords(line)) {
            emit(word);
          }
        });
 */

#pragma once

#include <vector>

#include "tally/counter.hpp"
#include "tally/parallel/parallel_common.hpp"
#include "tally/parallel/parallelism.hpp"
#include "tally/parallel/reduction.hpp"

/*
 * Runs producer(item, emit) for every item of range in parallel and counts
 * every element passed to emit.
 */
template <typename CounterType, typename Range, typename Producer>
CounterType ParallelCollect(Range&& range, Producer&& producer,
                            size_t buckets = DefaultBucketCount()) {
  using Elem = typename CounterType::element_type;
  Reduction<std::vector<Elem>> reduction{buckets};

  ParallelForEach(std::forward<Range>(range), [&reduction, &producer](auto&& item) {
    std::vector<Elem> produced;
    auto emit = [&produced](auto&& element) {
      produced.emplace_back(std::forward<decltype(element)>(element));
    };
    producer(item, emit);
    if (produced.empty()) {
      return;
    }
    reduction.AddElement(
        [](std::vector<Elem>& bucket, std::vector<Elem>& elements) {
          bucket.insert(bucket.end(), std::make_move_iterator(elements.begin()),
                        std::make_move_iterator(elements.end()));
        },
        produced);
  });

  CounterType result;
  reduction.GatherAndClear([&result](auto buckets) {
    for (auto&& bucket : buckets) {
      result.Update(bucket);
    }
  });
  return result;
}

/* Counts the elements of range, gathering them on the TBB worker pool */
template <typename CounterType, typename Range>
CounterType ParallelCount(Range&& range, size_t buckets = DefaultBucketCount()) {
  return ParallelCollect<CounterType>(
      std::forward<Range>(range),
      [](const auto& item, auto& emit) { emit(item); }, buckets);
}
