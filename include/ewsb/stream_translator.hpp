#ifndef EWSB_STREAM_TRANSLATOR_HPP_
#define EWSB_STREAM_TRANSLATOR_HPP_

#include "correlator.hpp"
#include "endpoint.hpp"
#include "frame.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string_view>

namespace ewsb {

// ============================================================================
// Phases
// ============================================================================

enum class StreamPhase : uint8_t {
  kBeforeBegin,      // 等待 BEGIN 与握手关联
  kEstablished,      // 下游 101 已发出，双向转发
  kRejectedOrReset,  // 已向上游发送 RESET，吸收剩余帧
  kEnded             // 终止
};

const char* phase_name(StreamPhase phase);

// ============================================================================
// Effects (outbound calls produced by a transition)
// ============================================================================

enum class EffectType : uint8_t {
  kTargetBegin,
  kTargetData,
  kTargetEnd,
  kAddThrottle,
  kRemoveThrottle,
  kSourceWindow,
  kSourceReset,
  kSourceRemoveStream
};

struct Effect {
  EffectType type;
  uint64_t stream_id;
  int32_t credit;            // kSourceWindow
  uint8_t flags;             // kTargetData
  std::string_view payload;  // kTargetData
};

struct StreamContext {
  StreamPhase phase = StreamPhase::kBeforeBegin;
  uint64_t source_stream_id = 0;
  uint64_t target_stream_id = 0;  // 0 until the downstream stream is opened
  bool throttling = false;        // throttle registered on target_stream_id
};

struct Transition {
  StreamContext next;
  FixedVector<Effect, 4> effects;
  HttpHeaders headers;          // kTargetBegin
  uint64_t correlation_id = 0;  // kTargetBegin
};

// ============================================================================
// Pure transition rules
// ============================================================================

// Credit the target side spends on framing that the source never sees.
static constexpr int32_t kWindowOverhead = static_cast<int32_t>(ws::kEncodeOverheadMaximum);

// A BEGIN completes the handshake only with source_ref == 0 and a correlation.
bool accepts_begin(const Frame& begin, const Correlation* correlation);

// 101 response headers. Values point into correlation and begin.
HttpHeaders upgrade_headers(const Correlation& correlation, const Frame& begin);

// Frame arriving from the source. correlation is the record taken for a
// BEGIN (nullptr otherwise or when absent); target_stream_id is the id
// reserved on a resolved target, 0 when none was resolved.
Transition on_stream_frame(const StreamContext& ctx, const Frame& frame, const Correlation* correlation = nullptr,
                           uint64_t target_stream_id = 0);

// WINDOW / RESET arriving through the target's throttle.
Transition on_throttle_frame(const StreamContext& ctx, const Frame& frame);

// ============================================================================
// StreamTranslator - one upstream WebSocket stream
// ============================================================================

/**
 * @brief Drives one connection through its phases and performs the effects.
 *
 * Registers itself as throttle handler on the target, so the object must
 * stay at a fixed address while established. Not thread safe.
 */
class StreamTranslator {
 public:
  StreamTranslator(SourceEndpoint& source, TargetResolver& targets, Correlator& correlator);
  ~StreamTranslator();

  StreamTranslator(const StreamTranslator&) = delete;
  StreamTranslator& operator=(const StreamTranslator&) = delete;

  // Handle a frame from the source endpoint.
  void on_frame(const Frame& frame);

  // Handle a WINDOW or RESET from the target endpoint.
  void on_throttle(const Frame& frame);

  StreamPhase phase() const { return ctx_.phase; }
  bool is_ended() const { return ctx_.phase == StreamPhase::kEnded; }
  uint64_t source_stream_id() const { return ctx_.source_stream_id; }
  uint64_t target_stream_id() const { return ctx_.target_stream_id; }
  TargetEndpoint* target() const { return target_; }

 private:
  void apply(const Transition& transition);

  SourceEndpoint& source_;
  TargetResolver& targets_;
  Correlator& correlator_;

  TargetEndpoint* target_ = nullptr;
  StreamContext ctx_;
};

}  // namespace ewsb

#endif  // EWSB_STREAM_TRANSLATOR_HPP_
