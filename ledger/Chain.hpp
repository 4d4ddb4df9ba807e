#ifndef TALLY_CHAIN_HPP
#define TALLY_CHAIN_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>

namespace tally {

/**
 * Append-only singly linked sequence.
 *
 * Each node owns its predecessor, and the chain owns the head. append()
 * prepends a new head in O(1); iteration runs from the newest item to the
 * oldest. There is no removal and no random access.
 *
 * The mutable iterator allows editing an item in place; link topology is
 * never exposed.
 */
template <typename T> class Chain {
  struct Node {
    T data;
    std::unique_ptr<Node> upPrev;

    Node(T &&item, std::unique_ptr<Node> prev)
        : data(std::move(item)), upPrev(std::move(prev)) {}
  };

  template <typename NodeT, typename ValueT> class Iter {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = ValueT *;
    using reference = ValueT &;

    Iter() = default;
    explicit Iter(NodeT *node) : node_(node) {}

    reference operator*() const { return node_->data; }
    pointer operator->() const { return &node_->data; }

    Iter &operator++() {
      node_ = node_->upPrev.get();
      return *this;
    }

    Iter operator++(int) {
      Iter tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const Iter &other) const { return node_ == other.node_; }
    bool operator!=(const Iter &other) const { return node_ != other.node_; }

  private:
    NodeT *node_{ nullptr };
  };

public:
  using iterator = Iter<Node, T>;
  using const_iterator = Iter<const Node, const T>;

  Chain() = default;

  ~Chain() { clear(); }

  Chain(const Chain &) = delete;
  Chain &operator=(const Chain &) = delete;

  Chain(Chain &&other) noexcept
      : upHead_(std::move(other.upHead_)), size_(other.size_) {
    other.size_ = 0;
  }

  Chain &operator=(Chain &&other) noexcept {
    if (this != &other) {
      clear();
      upHead_ = std::move(other.upHead_);
      size_ = other.size_;
      other.size_ = 0;
    }
    return *this;
  }

  void append(T item) {
    upHead_ = std::make_unique<Node>(std::move(item), std::move(upHead_));
    ++size_;
  }

  // Most recently appended item, nullptr when empty
  const T *head() const { return upHead_ ? &upHead_->data : nullptr; }
  T *head() { return upHead_ ? &upHead_->data : nullptr; }

  size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  iterator begin() { return iterator(upHead_.get()); }
  iterator end() { return iterator(); }
  const_iterator begin() const { return const_iterator(upHead_.get()); }
  const_iterator end() const { return const_iterator(); }
  const_iterator cbegin() const { return begin(); }
  const_iterator cend() const { return end(); }

private:
  // Unlink nodes one at a time so a long chain does not recurse on teardown
  void clear() {
    std::unique_ptr<Node> upNode = std::move(upHead_);
    while (upNode) {
      upNode = std::move(upNode->upPrev);
    }
    size_ = 0;
  }

  std::unique_ptr<Node> upHead_;
  size_t size_{ 0 };
};

} // namespace tally

#endif // TALLY_CHAIN_HPP
