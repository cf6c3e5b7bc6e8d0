#pragma once

#include <memory>

#include "tally/common.hpp"

/* Heap array whose size is set once; holds non-movable types such as mutexes */
template <typename T>
class FixedArray {
 public:
  using value_type = T;
  using size_type = std::size_t;
  using iterator = value_type*;
  using const_iterator = const value_type*;

  explicit FixedArray(size_t size) : size_{size}, data_{new T[size]} {}

  FixedArray(FixedArray&& other) noexcept
      : size_{other.size_}, data_{std::move(other.data_)} {
    other.size_ = 0;
  }

  FixedArray& operator=(FixedArray&& other) noexcept {
    size_ = other.size_;
    data_ = std::move(other.data_);
    other.size_ = 0;
    return *this;
  }

  NO_COPY(FixedArray);

  iterator begin() noexcept { return data_.get(); }
  const_iterator begin() const noexcept { return data_.get(); }
  iterator end() noexcept { return data_.get() + size_; }
  const_iterator end() const noexcept { return data_.get() + size_; }

  size_type size() const noexcept { return size_; }

 private:
  size_t size_;
  std::unique_ptr<T[]> data_;
};
