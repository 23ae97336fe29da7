#include "ewsb/buffer_slab.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace ewsb {

namespace {

uint32_t trailing_zeros(size_t value) {
  uint32_t n = 0;
  while ((value & 1U) == 0U) {
    value >>= 1;
    ++n;
  }
  return n;
}

}  // namespace

expected<void, ErrorCode> BufferSlab::validate(size_t total_capacity, size_t slot_capacity) {
  SlabConfig config;
  config.total_capacity = total_capacity;
  config.slot_capacity = slot_capacity;
  return config.validate();
}

BufferSlab::BufferSlab(size_t total_capacity, size_t slot_capacity) : slot_capacity_(slot_capacity) {
  if (!is_power_of_two(total_capacity)) {
    EWSB_THROW(std::invalid_argument("totalCapacity " + std::to_string(total_capacity) + " is not a power of 2"));
  }
  if (!is_power_of_two(slot_capacity)) {
    EWSB_THROW(std::invalid_argument("slotCapacity " + std::to_string(slot_capacity) + " is not a power of 2"));
  }
  if (slot_capacity > total_capacity) {
    EWSB_THROW(std::invalid_argument("slotCapacity exceeds totalCapacity"));
  }

  const size_t total_slots = total_capacity / slot_capacity;
  bits_per_slot_ = trailing_zeros(slot_capacity);
  mask_ = static_cast<uint32_t>(total_slots - 1);
  memory_ = std::make_unique<uint8_t[]>(total_capacity);
  used_.assign(total_slots, false);
  available_ = total_slots;
}

uint32_t BufferSlab::probe_start(uint64_t key, uint32_t mask) {
  // Fold the high word in, then h * -254.
  uint32_t hash = static_cast<uint32_t>(key) ^ static_cast<uint32_t>(key >> 32);
  hash = (hash << 1) - (hash << 8);
  return hash & mask;
}

int32_t BufferSlab::acquire(uint64_t key) {
  if (available_ == 0)
    return kNoSlot;

  // A free slot exists, so the scan terminates.
  uint32_t slot = probe_start(key, mask_);
  while (used_[slot]) {
    slot = (slot + 1) & mask_;
  }
  used_[slot] = true;
  --available_;

  return static_cast<int32_t>(slot);
}

MutableBuffer BufferSlab::buffer(int32_t slot) { return buffer(slot, 0); }

MutableBuffer BufferSlab::buffer(int32_t slot, size_t offset) {
  EWSB_ASSERT(is_acquired(slot));
  EWSB_ASSERT(offset <= slot_capacity_);
  uint8_t* base = memory_.get() + (static_cast<size_t>(slot) << bits_per_slot_);
  return MutableBuffer(base + offset, slot_capacity_ - offset);
}

void BufferSlab::release(int32_t slot) {
  EWSB_ASSERT(is_acquired(slot));
  if (!is_acquired(slot))
    return;
  used_[static_cast<size_t>(slot)] = false;
  ++available_;
}

}  // namespace ewsb
