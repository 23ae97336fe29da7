#ifndef EWSB_OBJECT_POOL_HPP_
#define EWSB_OBJECT_POOL_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <array>
#include <new>
#include <utility>

namespace ewsb {

// ============================================================================
// ObjectPool - O(1) acquire/release, objects constructed in place
// ============================================================================

/**
 * @brief Fixed array of MaxSlots objects of type T with a stack free list.
 *
 * Objects never move once constructed, so their addresses can be handed out
 * as callback targets.
 */
template <typename T, size_t MaxSlots>
class alignas(kCacheLine) ObjectPool {
 public:
  ObjectPool() {
    for (size_t i = 0; i < MaxSlots; ++i) {
      free_list_[i] = MaxSlots - 1 - i;
      active_[i] = false;
      constructed_[i] = false;
    }
    free_count_ = MaxSlots;
  }

  ~ObjectPool() {
    for (size_t i = 0; i < MaxSlots; ++i) {
      destroy(static_cast<int32_t>(i));
    }
  }

  ObjectPool(const ObjectPool&) = delete;
  ObjectPool& operator=(const ObjectPool&) = delete;

  // Returns a slot index, or -1 if the pool is exhausted
  int32_t acquire() {
    if (free_count_ == 0)
      return -1;
    --free_count_;
    size_t idx = free_list_[free_count_];
    active_[idx] = true;
    return static_cast<int32_t>(idx);
  }

  template <typename... Args>
  T* emplace(int32_t idx, Args&&... args) {
    EWSB_ASSERT(is_active(idx) && !constructed_[static_cast<size_t>(idx)]);
    T* obj = ::new (storage(idx)) T(std::forward<Args>(args)...);
    constructed_[static_cast<size_t>(idx)] = true;
    return obj;
  }

  void destroy(int32_t idx) {
    if (!valid(idx) || !constructed_[static_cast<size_t>(idx)])
      return;
    get(idx)->~T();
    constructed_[static_cast<size_t>(idx)] = false;
  }

  // Destroys the object if still alive and returns the slot to the free list
  void release(int32_t idx) {
    if (!is_active(idx))
      return;
    destroy(idx);
    active_[static_cast<size_t>(idx)] = false;
    free_list_[free_count_] = static_cast<size_t>(idx);
    ++free_count_;
  }

  T* get(int32_t idx) { return std::launder(reinterpret_cast<T*>(storage(idx))); }
  const T* get(int32_t idx) const { return std::launder(reinterpret_cast<const T*>(storage(idx))); }

  size_t available() const { return free_count_; }
  static constexpr size_t capacity() { return MaxSlots; }
  size_t in_use() const { return MaxSlots - free_count_; }
  bool is_active(int32_t idx) const { return valid(idx) && active_[static_cast<size_t>(idx)]; }
  bool is_constructed(int32_t idx) const { return valid(idx) && constructed_[static_cast<size_t>(idx)]; }

 private:
  static bool valid(int32_t idx) { return idx >= 0 && static_cast<size_t>(idx) < MaxSlots; }

  void* storage(int32_t idx) { return &slots_[static_cast<size_t>(idx) * sizeof(T)]; }
  const void* storage(int32_t idx) const { return &slots_[static_cast<size_t>(idx) * sizeof(T)]; }

  alignas(kCacheLine) uint8_t slots_[MaxSlots * sizeof(T)]{};

  std::array<size_t, MaxSlots> free_list_{};
  size_t free_count_ = 0;

  std::array<bool, MaxSlots> active_{};
  std::array<bool, MaxSlots> constructed_{};
};

}  // namespace ewsb

#endif  // EWSB_OBJECT_POOL_HPP_
