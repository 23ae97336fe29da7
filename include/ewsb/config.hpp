#ifndef EWSB_CONFIG_HPP_
#define EWSB_CONFIG_HPP_

#include "log.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

namespace ewsb {

constexpr bool is_power_of_two(size_t value) { return value != 0 && (value & (value - 1)) == 0; }

// ============================================================================
// Slab Configuration
// ============================================================================

struct SlabConfig {
  size_t total_capacity = 64 * 1024;  // Backing memory, power of two
  size_t slot_capacity = 4 * 1024;    // Per-slot size, power of two, <= total

  size_t slot_count() const { return total_capacity / slot_capacity; }

  expected<void, ErrorCode> validate() const {
    if (!is_power_of_two(total_capacity) || !is_power_of_two(slot_capacity) || slot_capacity > total_capacity) {
      return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
    }
    return expected<void, ErrorCode>::success();
  }
};

// ============================================================================
// Bridge Configuration
// ============================================================================

struct BridgeConfig {
  SlabConfig slab;
  size_t max_streams = 64;  // Clamped to StreamBridge::kMaxStreams
  Logger::Level log_level = Logger::Level::kInfo;

  expected<void, ErrorCode> validate() const {
    if (max_streams == 0) {
      return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
    }
    return slab.validate();
  }
};

}  // namespace ewsb

#endif  // EWSB_CONFIG_HPP_
