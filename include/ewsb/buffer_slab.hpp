#ifndef EWSB_BUFFER_SLAB_HPP_
#define EWSB_BUFFER_SLAB_HPP_

#include "config.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <memory>
#include <vector>

namespace ewsb {

// ============================================================================
// MutableBuffer - Non-owning view over one slab slot
// ============================================================================

class MutableBuffer {
 public:
  MutableBuffer(uint8_t* data, size_t size) : data_(data), size_(size) {}

  uint8_t* data() const { return data_; }
  size_t size() const { return size_; }

  uint8_t& operator[](size_t index) const {
    EWSB_ASSERT(index < size_);
    return data_[index];
  }

 private:
  uint8_t* data_;
  size_t size_;
};

// ============================================================================
// BufferSlab - Fixed pool of equal-size slots, zero allocation after startup
// ============================================================================

/**
 * @brief One contiguous block of memory split into power-of-two sized slots.
 *
 * acquire() starts probing at a position derived from the caller's key and
 * takes the next free slot; the key itself is never stored. A slot belongs to
 * the caller until release(). Views returned by buffer() are meant for
 * immediate use and must not be kept across other slab calls.
 *
 * Not thread safe: each instance is owned by a single execution context.
 */
class BufferSlab {
 public:
  static constexpr int32_t kNoSlot = -1;

  // Throws std::invalid_argument unless both capacities are powers of two
  // and slot_capacity <= total_capacity.
  BufferSlab(size_t total_capacity, size_t slot_capacity);
  explicit BufferSlab(const SlabConfig& config) : BufferSlab(config.total_capacity, config.slot_capacity) {}

  BufferSlab(const BufferSlab&) = delete;
  BufferSlab& operator=(const BufferSlab&) = delete;

  // Returns a free slot index, or kNoSlot when every slot is in use.
  int32_t acquire(uint64_t key);

  // Writable view of exactly slot_capacity() bytes.
  MutableBuffer buffer(int32_t slot);

  // Writable view of the slot from offset to its end.
  MutableBuffer buffer(int32_t slot, size_t offset);

  void release(int32_t slot);

  // Initial probe position for a key; pure function of (key, mask).
  static uint32_t probe_start(uint64_t key, uint32_t mask);

  static expected<void, ErrorCode> validate(size_t total_capacity, size_t slot_capacity);

  // Status
  size_t slot_count() const { return static_cast<size_t>(mask_) + 1; }
  size_t slot_capacity() const { return slot_capacity_; }
  size_t available() const { return available_; }
  size_t in_use() const { return slot_count() - available_; }
  bool is_acquired(int32_t slot) const {
    return slot >= 0 && static_cast<size_t>(slot) < slot_count() && used_[static_cast<size_t>(slot)];
  }

 private:
  size_t slot_capacity_;
  uint32_t bits_per_slot_;
  uint32_t mask_;
  std::unique_ptr<uint8_t[]> memory_;
  std::vector<bool> used_;
  size_t available_;
};

}  // namespace ewsb

#endif  // EWSB_BUFFER_SLAB_HPP_
