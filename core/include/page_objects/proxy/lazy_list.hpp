// page_objects/proxy/lazy_list.hpp - Lazy, always-fresh sequence
//
// A LazyList holds a producer, not elements. Every begin(), to_vector(),
// size() or empty() runs the producer once; iterators walk the snapshot taken
// by the begin() that created them.
//
#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

namespace page_objects
{

template <typename T>
class LazyList
{
public:
  using value_type = T;
  using Producer = std::function<std::vector<T>()>;

  class const_iterator
  {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = const T *;
    using reference = const T &;

    const_iterator() = default;
    const_iterator(std::shared_ptr<const std::vector<T>> snapshot, size_t index)
    : snapshot_(std::move(snapshot)), index_(index)
    {
    }

    reference operator*() const { return (*snapshot_)[index_]; }
    pointer operator->() const { return &(*snapshot_)[index_]; }

    const_iterator & operator++()
    {
      ++index_;
      return *this;
    }
    const_iterator operator++(int)
    {
      const_iterator tmp = *this;
      ++index_;
      return tmp;
    }

    friend bool operator==(const const_iterator & a, const const_iterator & b)
    {
      const bool a_end = a.at_end();
      const bool b_end = b.at_end();
      if (a_end || b_end) return a_end == b_end;
      return a.snapshot_ == b.snapshot_ && a.index_ == b.index_;
    }
    friend bool operator!=(const const_iterator & a, const const_iterator & b) { return !(a == b); }

  private:
    [[nodiscard]] bool at_end() const noexcept
    {
      return !snapshot_ || index_ >= snapshot_->size();
    }

    std::shared_ptr<const std::vector<T>> snapshot_;
    size_t index_ = 0;
  };

  using iterator = const_iterator;

  /// An empty list (produces nothing)
  LazyList() = default;

  explicit LazyList(Producer producer) : producer_(std::move(producer)) {}

  /// Run one fresh enumeration
  [[nodiscard]] std::vector<T> to_vector() const
  {
    if (!producer_) return {};
    return producer_();
  }

  [[nodiscard]] size_t size() const { return to_vector().size(); }
  [[nodiscard]] bool empty() const { return to_vector().empty(); }

  [[nodiscard]] const_iterator begin() const
  {
    return const_iterator(std::make_shared<const std::vector<T>>(to_vector()), 0);
  }
  [[nodiscard]] const_iterator end() const { return const_iterator(); }

  /**
   * Lazily transform each enumeration. `fn` runs once per element per
   * enumeration.
   */
  template <typename U, typename Fn>
  [[nodiscard]] LazyList<U> map(Fn fn) const
  {
    Producer source = producer_;
    return LazyList<U>([source, fn]() {
      std::vector<U> out;
      if (!source) return out;
      auto items = source();
      out.reserve(items.size());
      for (auto & item : items) {
        out.push_back(fn(item));
      }
      return out;
    });
  }

private:
  Producer producer_;
};

}  // namespace page_objects
