#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

namespace craftplan::plan {

// Number of items in a stack; also used for repeat counts.
using Count = std::uint64_t;

// Some number of one item.
class Stack {
public:
  Stack() = default;
  Stack(std::string item, Count count) : item_(std::move(item)), count_(count) {}

  const std::string& item() const { return item_; }
  Count count() const { return count_; }

  friend bool operator==(const Stack& a, const Stack& b) {
    return a.count_ == b.count_ && a.item_ == b.item_;
  }
  friend bool operator!=(const Stack& a, const Stack& b) { return !(a == b); }

private:
  std::string item_;
  Count count_{0};
};

// "item (count)"
std::ostream& operator<<(std::ostream& os, const Stack& stack);
std::string toString(const Stack& stack);

} // namespace craftplan::plan
