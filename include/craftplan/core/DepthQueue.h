#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace craftplan::core {

// Min-priority work queue keyed by a bounded depth counter.
//
//  - popMin() yields the smallest depth; ties go to the key that entered the queue first.
//  - pushIncrease() inserts a key or raises its depth. It never lowers a depth, so a key
//    reachable through several paths keeps the deepest depth it was given.
//  - compact() rewrites all depths as dense ranks (0, 1, 2, ...) so callers can keep
//    counting after reaching max().
//
// Keys are unique: a key is in the queue at most once.
template <class Key, class Priority = std::uint32_t, class Hash = std::hash<Key>>
class DepthQueue {
  static_assert(std::is_unsigned_v<Priority>, "DepthQueue priorities must be unsigned");

public:
  struct Entry {
    Key key;
    Priority depth;
  };

  static constexpr Priority max() { return std::numeric_limits<Priority>::max(); }

  bool empty() const { return order_.empty(); }
  std::size_t size() const { return order_.size(); }

  bool contains(const Key& key) const { return index_.find(key) != index_.end(); }

  std::optional<Priority> depthOf(const Key& key) const {
    const auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second.first;
  }

  // Returns true if the key was inserted or its depth changed.
  bool pushIncrease(const Key& key, Priority depth) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      const Slot slot{depth, nextSeq_++};
      index_.emplace(key, slot);
      order_.emplace(slot, key);
      return true;
    }
    if (depth <= it->second.first) return false;

    // Keep the original sequence number so the discovery order survives a raise.
    auto node = order_.extract(it->second);
    node.key().first = depth;
    order_.insert(std::move(node));
    it->second.first = depth;
    return true;
  }

  std::optional<Entry> popMin() {
    if (order_.empty()) return std::nullopt;
    auto first = order_.begin();
    Entry e{std::move(first->second), first->first.first};
    order_.erase(first);
    index_.erase(e.key);
    return e;
  }

  // Replace every queued depth with its dense rank among the distinct queued depths and
  // `anchor`. Returns the rank assigned to `anchor`, which callers use as their new
  // current depth. Relative order and tie order are unchanged.
  Priority compact(Priority anchor) {
    std::vector<Priority> distinct;
    distinct.reserve(order_.size() + 1);
    distinct.push_back(anchor);
    for (const auto& kv : order_) distinct.push_back(kv.first.first);
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());

    const auto rankOf = [&](Priority p) {
      const auto it = std::lower_bound(distinct.begin(), distinct.end(), p);
      return static_cast<Priority>(it - distinct.begin());
    };

    Order rebuilt;
    for (const auto& kv : order_) {
      const Slot slot{rankOf(kv.first.first), kv.first.second};
      index_.find(kv.second)->second = slot;
      rebuilt.emplace(slot, kv.second);
    }
    order_.swap(rebuilt);
    return rankOf(anchor);
  }

  void clear() {
    order_.clear();
    index_.clear();
    nextSeq_ = 0;
  }

private:
  // (depth, insertion sequence)
  using Slot = std::pair<Priority, std::uint64_t>;
  using Order = std::map<Slot, Key>;

  Order order_;
  std::unordered_map<Key, Slot, Hash> index_;
  std::uint64_t nextSeq_{0};
};

} // namespace craftplan::core
