#include <algorithm>

struct MostCommonOrder {
  template <typename Pair>
  bool operator()(const Pair& lhs, const Pair& rhs) const {
    if (lhs.first != rhs.first) {
      return lhs.first > rhs.first;
    }
    return lhs.second < rhs.second;
  }
};

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
template <typename Range, typename>
Counter<Elem, Count, Hash, KeyEqual>::Counter(const Range& elements) {
  Update(elements);
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual>::Counter(std::initializer_list<Elem> elements) {
  Update(elements);
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual>::Counter(map_type&& counts)
    : counts_{std::move(counts)} {
  Prune();
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual> Counter<Elem, Count, Hash, KeyEqual>::FromCounts(
    std::initializer_list<std::pair<Elem, Count>> counts) {
  Counter result;
  for (auto& [element, count] : counts) {
    result.Add(element, count);
  }
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
template <typename Range>
void Counter<Elem, Count, Hash, KeyEqual>::Update(const Range& elements) {
  static_assert(is_range_of_v<Range, Elem>, "Update expects a range of elements");
  for (auto&& element : elements) {
    auto [it, inserted] = counts_.try_emplace(element, Traits::One());
    if (not inserted) {
      Traits::Increment(it->second);
    }
  }
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
void Counter<Elem, Count, Hash, KeyEqual>::Update(const Counter& other) {
  for (auto& [element, count] : other.counts_) {
    Assert(count > Traits::Zero());
    auto [it, inserted] = counts_.try_emplace(element, count);
    if (not inserted) {
      it->second = Traits::Sum(it->second, count);
    }
  }
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
void Counter<Elem, Count, Hash, KeyEqual>::Add(const Elem& element, const Count& count) {
  if (count <= Traits::Zero()) {
    return;
  }
  auto [it, inserted] = counts_.try_emplace(element, count);
  if (not inserted) {
    it->second = Traits::Sum(it->second, count);
  }
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
template <typename Range>
void Counter<Elem, Count, Hash, KeyEqual>::Subtract(const Range& elements) {
  static_assert(is_range_of_v<Range, Elem>, "Subtract expects a range of elements");
  for (auto&& element : elements) {
    auto it = counts_.find(element);
    if (it == counts_.end()) {
      continue;
    }
    Traits::Decrement(it->second);
    if (it->second <= Traits::Zero()) {
      counts_.erase(it);
    }
  }
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
void Counter<Elem, Count, Hash, KeyEqual>::Subtract(const Counter& other) {
  if (this == std::addressof(other)) {
    counts_.clear();
    return;
  }
  for (auto& [element, count] : other.counts_) {
    Assert(count > Traits::Zero());
    auto it = counts_.find(element);
    if (it == counts_.end()) {
      continue;
    }
    if (it->second > count) {
      it->second = Traits::Difference(it->second, count);
    } else {
      counts_.erase(it);
    }
  }
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
bool Counter<Elem, Count, Hash, KeyEqual>::Erase(const Elem& element) {
  return counts_.erase(element) > 0;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
void Counter<Elem, Count, Hash, KeyEqual>::Clear() {
  counts_.clear();
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
void Counter<Elem, Count, Hash, KeyEqual>::Prune() {
  for (auto it = counts_.begin(); it != counts_.end();) {
    if (it->second <= Traits::Zero()) {
      it = counts_.erase(it);
    } else {
      ++it;
    }
  }
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
std::vector<std::pair<Count, Elem>> Counter<Elem, Count, Hash, KeyEqual>::MostCommon()
    const {
  return MostCommon(counts_.size());
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
std::vector<std::pair<Count, Elem>> Counter<Elem, Count, Hash, KeyEqual>::MostCommon(
    size_t n) const {
  auto result = counts_ | ranges::views::transform([](const value_type& i) {
                  return std::pair<Count, Elem>{i.second, i.first};
                }) |
                ranges::to_vector;
  n = std::min(n, result.size());
  auto middle = result.begin() + static_cast<std::ptrdiff_t>(n);
  std::partial_sort(result.begin(), middle, result.end(), MostCommonOrder{});
  result.erase(middle, result.end());
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Count Counter<Elem, Count, Hash, KeyEqual>::Get(const Elem& element) const {
  auto it = counts_.find(element);
  if (it == counts_.end()) {
    return Traits::Zero();
  }
  return it->second;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
bool Counter<Elem, Count, Hash, KeyEqual>::Contains(const Elem& element) const {
  return counts_.find(element) != counts_.end();
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Count Counter<Elem, Count, Hash, KeyEqual>::Total() const {
  Count result = Traits::Zero();
  for (auto& i : counts_) {
    result = Traits::Sum(result, i.second);
  }
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
std::vector<Elem> Counter<Elem, Count, Hash, KeyEqual>::Elements() const {
  std::vector<Elem> result;
  for (auto& [count, element] : MostCommon()) {
    for (Count i = Traits::Zero(); i < count; Traits::Increment(i)) {
      result.push_back(element);
    }
  }
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
const typename Counter<Elem, Count, Hash, KeyEqual>::map_type&
Counter<Elem, Count, Hash, KeyEqual>::GetCounts() const {
  return counts_;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
typename Counter<Elem, Count, Hash, KeyEqual>::map_type&
Counter<Elem, Count, Hash, KeyEqual>::GetMutableCounts() {
  return counts_;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual> Counter<Elem, Count, Hash, KeyEqual>::operator+(
    const Counter& rhs) const {
  Counter result(*this);
  result += rhs;
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual> Counter<Elem, Count, Hash, KeyEqual>::operator-(
    const Counter& rhs) const {
  Counter result(*this);
  result -= rhs;
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual> Counter<Elem, Count, Hash, KeyEqual>::operator&(
    const Counter& rhs) const {
  Counter result(*this);
  result &= rhs;
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual> Counter<Elem, Count, Hash, KeyEqual>::operator|(
    const Counter& rhs) const {
  Counter result(*this);
  result |= rhs;
  return result;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual>& Counter<Elem, Count, Hash, KeyEqual>::operator+=(
    const Counter& rhs) {
  Update(rhs);
  return *this;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual>& Counter<Elem, Count, Hash, KeyEqual>::operator-=(
    const Counter& rhs) {
  Subtract(rhs);
  return *this;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual>& Counter<Elem, Count, Hash, KeyEqual>::operator&=(
    const Counter& rhs) {
  for (auto it = counts_.begin(); it != counts_.end();) {
    auto other = rhs.counts_.find(it->first);
    if (other == rhs.counts_.end()) {
      it = counts_.erase(it);
      continue;
    }
    if (other->second < it->second) {
      it->second = other->second;
    }
    Assert(it->second > Traits::Zero());
    ++it;
  }
  return *this;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
Counter<Elem, Count, Hash, KeyEqual>& Counter<Elem, Count, Hash, KeyEqual>::operator|=(
    const Counter& rhs) {
  for (auto& [element, count] : rhs.counts_) {
    Assert(count > Traits::Zero());
    auto [it, inserted] = counts_.try_emplace(element, count);
    if (not inserted and it->second < count) {
      it->second = count;
    }
  }
  return *this;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
bool Counter<Elem, Count, Hash, KeyEqual>::operator==(const Counter& rhs) const {
  return counts_ == rhs.counts_;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
bool Counter<Elem, Count, Hash, KeyEqual>::operator!=(const Counter& rhs) const {
  return counts_ != rhs.counts_;
}

template <typename Elem, typename Count, typename Hash, typename KeyEqual>
std::ostream& operator<<(std::ostream& os,
                         const Counter<Elem, Count, Hash, KeyEqual>& counter) {
  auto items = counter.MostCommon();
  if (items.empty()) {
    os << "{}";
    return os;
  }
  auto addpair = [&os](auto const& item) { os << item.second << ": " << item.first; };
  os << "{";
  for (auto i = items.begin(); i != --items.end(); i++) {
    addpair(*i);
    os << ", ";
  }
  addpair(items.back());
  os << "}";
  return os;
}
