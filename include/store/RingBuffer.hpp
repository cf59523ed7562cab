#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace skynode::store {

// Fixed-capacity FIFO. push() overwrites the oldest element when full.
template <class T>
class RingBuffer {
public:
  explicit RingBuffer(size_t capacity) : buf_(std::max<size_t>(1, capacity)) {}

  void push(T v) {
    buf_[(head_ + size_) % buf_.size()] = std::move(v);
    if (size_ < buf_.size()) ++size_;
    else head_ = (head_ + 1) % buf_.size();
  }

  [[nodiscard]] size_t size() const { return size_; }
  [[nodiscard]] size_t capacity() const { return buf_.size(); }
  [[nodiscard]] bool empty() const { return size_ == 0; }

  // i = 0 is the oldest element
  [[nodiscard]] const T& at(size_t i) const { return buf_[(head_ + i) % buf_.size()]; }
  [[nodiscard]] const T& back() const { return at(size_ - 1); }

  // Newest min(n, size()) elements, oldest first.
  [[nodiscard]] std::vector<T> tail(size_t n) const {
    n = std::min(n, size_);
    std::vector<T> out;
    out.reserve(n);
    for (size_t i = size_ - n; i < size_; ++i) out.push_back(at(i));
    return out;
  }

  // Remove elements from the front while pred holds; returns how many were dropped.
  template <class Pred>
  size_t drop_front_while(Pred pred) {
    size_t n = 0;
    while (size_ > 0 && pred(at(0))) {
      buf_[head_] = T{};
      head_ = (head_ + 1) % buf_.size();
      --size_;
      ++n;
    }
    return n;
  }

  // Keeps the newest elements that still fit.
  void set_capacity(size_t capacity) {
    capacity = std::max<size_t>(1, capacity);
    if (capacity == buf_.size()) return;
    std::vector<T> keep = tail(capacity);
    buf_.assign(capacity, T{});
    head_ = 0;
    size_ = 0;
    for (auto& v : keep) push(std::move(v));
  }

  void clear() {
    buf_.assign(buf_.size(), T{});
    head_ = 0;
    size_ = 0;
  }

private:
  std::vector<T> buf_;
  size_t head_{0};
  size_t size_{0};
};

} // namespace skynode::store
