#include "ewsb/bridge.hpp"

#include "ewsb/log.hpp"

#include <stdexcept>
#include <string>

namespace ewsb {

StreamBridge::StreamBridge(SourceEndpoint& source, TargetResolver& targets, Correlator& correlator,
                           const BridgeConfig& config)
    : source_(source), targets_(targets), correlator_(correlator) {
  if (!config.validate().has_value()) {
    EWSB_THROW(std::invalid_argument("Invalid bridge configuration"));
  }
  Logger::set_level(config.log_level);
  set_max_streams(config.max_streams);
}

StreamBridge::~StreamBridge() {
  for (const auto& entry : slots_by_stream_) {
    pool_.release(entry.second);
  }
}

StreamBridge& StreamBridge::set_max_streams(size_t max) {
  if (max > kMaxStreams) {
    EWSB_LOG_WARN("max_streams " + std::to_string(max) + " clamped to " + std::to_string(kMaxStreams));
    max = kMaxStreams;
  }
  max_streams_ = max;
  return *this;
}

expected<void, ErrorCode> StreamBridge::on_source_frame(const Frame& frame) {
  stats_.frames_in.fetch_add(1, std::memory_order_relaxed);

  int32_t slot = -1;
  auto it = slots_by_stream_.find(frame.stream_id);
  if (it != slots_by_stream_.end()) {
    slot = it->second;
  } else {
    if (slots_by_stream_.size() < max_streams_) {
      slot = pool_.acquire();
    }
    if (slot < 0) {
      stats_.pool_exhausted.fetch_add(1, std::memory_order_relaxed);
      EWSB_LOG_ERROR("Stream " + std::to_string(frame.stream_id) + " refused: " +
                     std::to_string(slots_by_stream_.size()) + " streams active");
      source_.do_reset(frame.stream_id);
      return expected<void, ErrorCode>::error(ErrorCode::kMaxStreamsExceeded);
    }
    pool_.emplace(slot, source_, targets_, correlator_);
    slots_by_stream_.emplace(frame.stream_id, slot);
    stats_.active_streams.fetch_add(1, std::memory_order_relaxed);
  }

  StreamTranslator* translator = pool_.get(slot);
  const StreamPhase before = translator->phase();
  translator->on_frame(frame);
  const StreamPhase after = translator->phase();

  if (before == StreamPhase::kEstablished && after == StreamPhase::kEstablished &&
      frame.type == FrameType::kData) {
    stats_.bytes_relayed.fetch_add(frame.payload.size(), std::memory_order_relaxed);
  }
  if (after != before) {
    if (after == StreamPhase::kEstablished) {
      stats_.streams_opened.fetch_add(1, std::memory_order_relaxed);
    } else if (after == StreamPhase::kRejectedOrReset) {
      stats_.streams_rejected.fetch_add(1, std::memory_order_relaxed);
    }
  }

  if (translator->is_ended()) {
    stats_.streams_ended.fetch_add(1, std::memory_order_relaxed);
    reclaim(frame.stream_id, slot);
  }
  return expected<void, ErrorCode>::success();
}

const StreamTranslator* StreamBridge::find(uint64_t stream_id) const {
  auto it = slots_by_stream_.find(stream_id);
  if (it == slots_by_stream_.end())
    return nullptr;
  return pool_.get(it->second);
}

void StreamBridge::reclaim(uint64_t stream_id, int32_t slot) {
  slots_by_stream_.erase(stream_id);
  pool_.release(slot);
  stats_.active_streams.fetch_sub(1, std::memory_order_relaxed);
}

}  // namespace ewsb
