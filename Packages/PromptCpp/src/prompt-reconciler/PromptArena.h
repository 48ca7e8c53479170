#pragma once

#include <cstdint>
#include <deque>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace prompt {

// Index into a GenerationalArena. A released slot bumps its generation so
// stale handles are detected instead of aliasing a newer occupant.
template <typename Tag>
struct ArenaHandle {
  static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

  uint32_t index{kInvalidIndex};
  uint32_t generation{0};

  explicit operator bool() const {
    return index != kInvalidIndex;
  }

  friend bool operator==(const ArenaHandle& lhs, const ArenaHandle& rhs) {
    return lhs.index == rhs.index && lhs.generation == rhs.generation;
  }
  friend bool operator!=(const ArenaHandle& lhs, const ArenaHandle& rhs) {
    return !(lhs == rhs);
  }
};

template <typename T>
class GenerationalArena {
public:
  using Handle = ArenaHandle<T>;

  Handle insert(T value) {
    uint32_t index;
    if (!freeList_.empty()) {
      index = freeList_.back();
      freeList_.pop_back();
    } else {
      index = static_cast<uint32_t>(slots_.size());
      slots_.emplace_back();
    }
    Slot& slot = slots_[index];
    slot.value.emplace(std::move(value));
    ++size_;
    return Handle{index, slot.generation};
  }

  bool erase(Handle handle) {
    if (!contains(handle)) {
      return false;
    }
    Slot& slot = slots_[handle.index];
    slot.value.reset();
    ++slot.generation;
    freeList_.push_back(handle.index);
    --size_;
    return true;
  }

  bool contains(Handle handle) const {
    return handle.index < slots_.size() && slots_[handle.index].value.has_value() &&
        slots_[handle.index].generation == handle.generation;
  }

  T& at(Handle handle) {
    if (!contains(handle)) {
      throw std::out_of_range("Stale or invalid arena handle");
    }
    return *slots_[handle.index].value;
  }

  const T& at(Handle handle) const {
    if (!contains(handle)) {
      throw std::out_of_range("Stale or invalid arena handle");
    }
    return *slots_[handle.index].value;
  }

  T* find(Handle handle) {
    return contains(handle) ? &*slots_[handle.index].value : nullptr;
  }

  const T* find(Handle handle) const {
    return contains(handle) ? &*slots_[handle.index].value : nullptr;
  }

  std::size_t size() const {
    return size_;
  }

  void clear() {
    for (uint32_t index = 0; index < slots_.size(); ++index) {
      Slot& slot = slots_[index];
      if (slot.value) {
        slot.value.reset();
        ++slot.generation;
        freeList_.push_back(index);
      }
    }
    size_ = 0;
  }

private:
  struct Slot {
    std::optional<T> value;
    uint32_t generation{0};
  };

  // Deque keeps element addresses stable while the arena grows.
  std::deque<Slot> slots_;
  std::vector<uint32_t> freeList_;
  std::size_t size_{0};
};

} // namespace prompt
