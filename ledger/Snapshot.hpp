#ifndef TALLY_SNAPSHOT_HPP
#define TALLY_SNAPSHOT_HPP

#include <utility>

namespace tally {

/**
 * Scoped copy of a value that is written back when the scope exits,
 * including by exception, unless commit() was called first.
 *
 * Usage:
 *   Snapshot<Table> snapshot(table);
 *   ... mutate table, return early on failure ...
 *   snapshot.commit();
 */
template <typename T> class Snapshot {
public:
  explicit Snapshot(T &target) : target_(target), saved_(target) {}

  ~Snapshot() {
    if (active_) {
      target_ = std::move(saved_);
    }
  }

  Snapshot(const Snapshot &) = delete;
  Snapshot &operator=(const Snapshot &) = delete;

  // Keep the current contents of the target
  void commit() { active_ = false; }

  bool isActive() const { return active_; }

private:
  T &target_;
  T saved_;
  bool active_{ true };
};

} // namespace tally

#endif // TALLY_SNAPSHOT_HPP
