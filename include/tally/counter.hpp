/**
  Counter is a multiset over hashable elements: a mapping from element to the
  number of times it has been seen.

  Every element stored in a Counter has a strictly positive count. Update adds
  one occurrence per input element, Subtract removes one occurrence per input
  element and drops any element whose count reaches zero. Elements that are
  absent are never given a zero or negative entry.

  The binary operators combine two counters key by key and return a new
  counter, leaving both operands untouched:

    (c + d)[x] == c[x] + d[x]
    (c - d)[x] == c[x] - d[x], kept only when positive
    (c & d)[x] == min(c[x], d[x])
    (c | d)[x] == max(c[x], d[x])

  Counter is not thread safe. To count from many threads, collect the elements
  first (see parallel/parallel_counter.hpp) or count per thread and combine the
  partial counters with operator+.

  Example:

    Counter<std::string> words{std::vector<std::string>{"a", "b", "a"}};
    words.Update(std::vector<std::string>{"c"});
    for (auto& [count, word] : words.MostCommon()) { ... }
 */

#pragma once

#include <functional>
#include <initializer_list>
#include <iostream>
#include <unordered_map>
#include <utility>
#include <vector>

#include "tally/common.hpp"
#include "tally/count_traits.hpp"

template <typename Elem, typename Count = DefaultCount,
          typename Hash = std::hash<Elem>, typename KeyEqual = std::equal_to<Elem>>
class Counter {
 public:
  using element_type = Elem;
  using count_type = Count;
  using map_type = std::unordered_map<Elem, Count, Hash, KeyEqual>;
  using value_type = typename map_type::value_type;
  using const_iterator = typename map_type::const_iterator;
  using Traits = CountTraits<Count>;

  Counter() = default;
  Counter(const Counter&) = default;
  Counter(Counter&&) = default;
  Counter& operator=(const Counter&) = default;
  Counter& operator=(Counter&&) = default;
  ~Counter() = default;

  template <typename Range,
            typename = std::enable_if_t<
                not std::is_same_v<remove_cvref_t<Range>, Counter> and
                not std::is_same_v<remove_cvref_t<Range>, map_type> and
                is_range_of_v<remove_cvref_t<Range>, Elem>>>
  explicit Counter(const Range& elements);
  Counter(std::initializer_list<Elem> elements);
  /* Adopts an existing mapping, dropping entries with non-positive counts */
  explicit Counter(map_type&& counts);

  static Counter FromCounts(std::initializer_list<std::pair<Elem, Count>> counts);

  /* Adds one occurrence of every element of the range */
  template <typename Range>
  void Update(const Range& elements);
  /* Adds the counts of another counter */
  void Update(const Counter& other);
  void Add(const Elem& element, const Count& count = Traits::One());

  /*
   * Removes one occurrence of every element of the range. Elements reaching
   * zero are erased; elements not present are ignored.
   */
  template <typename Range>
  void Subtract(const Range& elements);
  void Subtract(const Counter& other);

  bool Erase(const Elem& element);
  void Clear();
  /* Restores the positive count invariant after edits through GetMutableCounts */
  void Prune();

  /*
   * All (count, element) pairs, most common first. Equal counts are ordered by
   * ascending element.
   */
  std::vector<std::pair<Count, Elem>> MostCommon() const;
  std::vector<std::pair<Count, Elem>> MostCommon(size_t n) const;

  Count Get(const Elem& element) const;
  bool Contains(const Elem& element) const;
  Count Total() const;
  /* Every element repeated as many times as it is counted, in MostCommon order */
  std::vector<Elem> Elements() const;

  size_t size() const { return counts_.size(); }
  bool empty() const { return counts_.empty(); }
  const_iterator begin() const { return counts_.begin(); }
  const_iterator end() const { return counts_.end(); }

  const map_type& GetCounts() const;
  map_type& GetMutableCounts();

  Counter operator+(const Counter& rhs) const;
  Counter operator-(const Counter& rhs) const;
  Counter operator&(const Counter& rhs) const;
  Counter operator|(const Counter& rhs) const;
  Counter& operator+=(const Counter& rhs);
  Counter& operator-=(const Counter& rhs);
  Counter& operator&=(const Counter& rhs);
  Counter& operator|=(const Counter& rhs);

  bool operator==(const Counter& rhs) const;
  bool operator!=(const Counter& rhs) const;

 private:
  map_type counts_;
};

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
std::ostream& operator<<(std::ostream& os,
                         const Counter<Elem, Count, Hash, KeyEqual>& counter);

#include "tally/impl/counter_impl.hpp"
