#ifndef EWSB_BRIDGE_HPP_
#define EWSB_BRIDGE_HPP_

#include "config.hpp"
#include "correlator.hpp"
#include "endpoint.hpp"
#include "frame.hpp"
#include "object_pool.hpp"
#include "stream_translator.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <unordered_map>

namespace ewsb {

// ============================================================================
// BridgeStats - Atomic counters, readable from a monitoring thread
// ============================================================================

struct alignas(kCacheLine) BridgeStats {
  std::atomic<uint64_t> frames_in{0};
  std::atomic<uint64_t> bytes_relayed{0};

  std::atomic<uint64_t> streams_opened{0};
  std::atomic<uint64_t> streams_ended{0};
  std::atomic<uint64_t> streams_rejected{0};
  std::atomic<uint64_t> active_streams{0};

  std::atomic<uint64_t> pool_exhausted{0};

  // Clears the cumulative counters; active_streams is a gauge and is kept.
  void reset() {
    frames_in = 0;
    bytes_relayed = 0;
    streams_opened = 0;
    streams_ended = 0;
    streams_rejected = 0;
    pool_exhausted = 0;
  }

  // >90% of the translator pool in use
  bool is_overloaded(size_t capacity) const {
    return active_streams.load(std::memory_order_relaxed) > (capacity * 9 / 10);
  }
};

// ============================================================================
// StreamBridge - all translators fed by one source endpoint
// ============================================================================

/**
 * @brief Creates a StreamTranslator for every new source stream id, routes
 *        frames to it, and reclaims it once the stream has ended.
 *
 * Translators live in a fixed ObjectPool; when it is full the new stream is
 * reset and on_source_frame() reports kMaxStreamsExceeded. One bridge is
 * driven by a single execution context.
 */
class StreamBridge {
 public:
  static constexpr size_t kMaxStreams = 64;

  // Throws std::invalid_argument if config.validate() fails.
  StreamBridge(SourceEndpoint& source, TargetResolver& targets, Correlator& correlator,
               const BridgeConfig& config = BridgeConfig());
  ~StreamBridge();

  StreamBridge(const StreamBridge&) = delete;
  StreamBridge& operator=(const StreamBridge&) = delete;

  // Configuration
  StreamBridge& set_max_streams(size_t max);

  // Dispatch one frame from the source endpoint.
  expected<void, ErrorCode> on_source_frame(const Frame& frame);

  // nullptr if no translator holds stream_id.
  const StreamTranslator* find(uint64_t stream_id) const;

  // Status
  size_t active_streams() const { return slots_by_stream_.size(); }
  size_t max_streams() const { return max_streams_; }

  // Performance monitoring
  const BridgeStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  void reclaim(uint64_t stream_id, int32_t slot);

  SourceEndpoint& source_;
  TargetResolver& targets_;
  Correlator& correlator_;

  ObjectPool<StreamTranslator, kMaxStreams> pool_;
  std::unordered_map<uint64_t, int32_t> slots_by_stream_;
  size_t max_streams_ = kMaxStreams;

  BridgeStats stats_;
};

}  // namespace ewsb

#endif  // EWSB_BRIDGE_HPP_
