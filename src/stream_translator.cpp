#include "ewsb/stream_translator.hpp"

#include "ewsb/log.hpp"

#include <string>

namespace ewsb {

namespace {

Effect make_effect(EffectType type, uint64_t stream_id) { return Effect{type, stream_id, 0, 0, {}}; }

Effect window_effect(uint64_t stream_id, int32_t credit) {
  return Effect{EffectType::kSourceWindow, stream_id, credit, 0, {}};
}

Effect data_effect(uint64_t stream_id, uint8_t flags, std::string_view payload) {
  return Effect{EffectType::kTargetData, stream_id, 0, flags, payload};
}

// Reset the upstream stream and absorb whatever follows.
Transition reject(const StreamContext& ctx, const Frame& frame) {
  Transition t;
  t.next = ctx;
  t.next.phase = StreamPhase::kRejectedOrReset;
  if (t.next.source_stream_id == 0) {
    t.next.source_stream_id = frame.stream_id;
  }
  t.effects.push_back(make_effect(EffectType::kSourceReset, frame.stream_id));
  return t;
}

Transition before_begin(const StreamContext& ctx, const Frame& frame, const Correlation* correlation,
                        uint64_t target_stream_id) {
  if (!accepts_begin(frame, correlation) || target_stream_id == 0) {
    return reject(ctx, frame);
  }

  Transition t;
  t.next.phase = StreamPhase::kEstablished;
  t.next.source_stream_id = frame.stream_id;
  t.next.target_stream_id = target_stream_id;
  t.next.throttling = true;
  t.headers = upgrade_headers(*correlation, frame);
  t.correlation_id = correlation->id;
  t.effects.push_back(make_effect(EffectType::kTargetBegin, target_stream_id));
  t.effects.push_back(make_effect(EffectType::kAddThrottle, target_stream_id));
  return t;
}

Transition established(const StreamContext& ctx, const Frame& frame) {
  Transition t;
  t.next = ctx;

  switch (frame.type) {
    case FrameType::kData:
      t.effects.push_back(
          data_effect(ctx.target_stream_id, frame.flags.value_or(ws::kDefaultDataFlags), frame.payload));
      return t;

    case FrameType::kEnd:
      t.next.phase = StreamPhase::kEnded;
      t.next.throttling = false;
      t.effects.push_back(make_effect(EffectType::kTargetEnd, ctx.target_stream_id));
      t.effects.push_back(make_effect(EffectType::kRemoveThrottle, ctx.target_stream_id));
      t.effects.push_back(make_effect(EffectType::kSourceRemoveStream, ctx.source_stream_id));
      return t;

    default:
      return reject(ctx, frame);
  }
}

Transition rejected_or_reset(const StreamContext& ctx, const Frame& frame) {
  Transition t;
  t.next = ctx;

  switch (frame.type) {
    case FrameType::kData:
      // Keep the rejected peer draining instead of stalling on window.
      if (!frame.payload.empty()) {
        t.effects.push_back(window_effect(frame.stream_id, static_cast<int32_t>(frame.payload.size())));
      }
      return t;

    case FrameType::kEnd:
      t.next.phase = StreamPhase::kEnded;
      t.effects.push_back(make_effect(EffectType::kSourceRemoveStream, frame.stream_id));
      if (ctx.throttling) {
        t.next.throttling = false;
        t.effects.push_back(make_effect(EffectType::kRemoveThrottle, ctx.target_stream_id));
      }
      return t;

    default:
      return t;
  }
}

}  // namespace

const char* phase_name(StreamPhase phase) {
  switch (phase) {
    case StreamPhase::kBeforeBegin:
      return "BeforeBegin";
    case StreamPhase::kEstablished:
      return "Established";
    case StreamPhase::kRejectedOrReset:
      return "RejectedOrReset";
    case StreamPhase::kEnded:
      return "Ended";
  }
  return "Unknown";
}

bool accepts_begin(const Frame& begin, const Correlation* correlation) {
  return begin.type == FrameType::kBegin && begin.source_ref == 0 && correlation != nullptr;
}

HttpHeaders upgrade_headers(const Correlation& correlation, const Frame& begin) {
  HttpHeaders headers;
  headers.push_back(HttpHeader{":status", "101"});
  headers.push_back(HttpHeader{"upgrade", "websocket"});
  headers.push_back(HttpHeader{"connection", "upgrade"});
  headers.push_back(HttpHeader{"sec-websocket-accept", correlation.hash});

  std::string_view negotiated = correlation.protocol;
  if (begin.protocol && !begin.protocol.value().empty()) {
    negotiated = begin.protocol.value();
  }
  if (!negotiated.empty()) {
    headers.push_back(HttpHeader{"sec-websocket-protocol", negotiated});
  }
  return headers;
}

Transition on_stream_frame(const StreamContext& ctx, const Frame& frame, const Correlation* correlation,
                           uint64_t target_stream_id) {
  switch (ctx.phase) {
    case StreamPhase::kBeforeBegin:
      if (frame.type == FrameType::kBegin) {
        return before_begin(ctx, frame, correlation, target_stream_id);
      }
      return reject(ctx, frame);

    case StreamPhase::kEstablished:
      return established(ctx, frame);

    case StreamPhase::kRejectedOrReset:
      return rejected_or_reset(ctx, frame);

    case StreamPhase::kEnded: {
      // Terminal: stray frames are reset but the phase does not move.
      Transition t;
      t.next = ctx;
      t.effects.push_back(make_effect(EffectType::kSourceReset, frame.stream_id));
      return t;
    }
  }
  return reject(ctx, frame);
}

Transition on_throttle_frame(const StreamContext& ctx, const Frame& frame) {
  Transition t;
  t.next = ctx;
  if (ctx.phase != StreamPhase::kEstablished) {
    return t;
  }

  switch (frame.type) {
    case FrameType::kWindow: {
      // Non-positive results are dropped; a later, larger update unblocks.
      const int64_t credit = static_cast<int64_t>(frame.update) - kWindowOverhead;
      if (credit > 0) {
        t.effects.push_back(window_effect(ctx.source_stream_id, static_cast<int32_t>(credit)));
      }
      return t;
    }

    case FrameType::kReset:
      t.next.phase = StreamPhase::kRejectedOrReset;
      t.next.throttling = false;
      t.effects.push_back(make_effect(EffectType::kSourceReset, ctx.source_stream_id));
      t.effects.push_back(make_effect(EffectType::kRemoveThrottle, ctx.target_stream_id));
      return t;

    default:
      return t;
  }
}

// ============================================================================
// StreamTranslator
// ============================================================================

StreamTranslator::StreamTranslator(SourceEndpoint& source, TargetResolver& targets, Correlator& correlator)
    : source_(source), targets_(targets), correlator_(correlator) {}

StreamTranslator::~StreamTranslator() {
  if (ctx_.throttling && target_ != nullptr) {
    target_->remove_throttle(ctx_.target_stream_id);
  }
}

void StreamTranslator::on_frame(const Frame& frame) {
  const StreamPhase before = ctx_.phase;

  if (before == StreamPhase::kBeforeBegin && frame.type == FrameType::kBegin) {
    // The lookup consumes the correlation even if the BEGIN is then rejected.
    optional<Correlation> correlation = correlator_.take(frame.correlation_id);
    const Correlation* record = correlation ? &correlation.value() : nullptr;

    TargetEndpoint* target = nullptr;
    uint64_t target_stream_id = 0;
    if (accepts_begin(frame, record)) {
      target = targets_.resolve(record->source);
      if (target != nullptr) {
        target_stream_id = targets_.next_stream_id();
      } else {
        EWSB_LOG_WARN("Stream " + std::to_string(frame.stream_id) + ": no target named '" + record->source + "'");
      }
    }

    Transition t = on_stream_frame(ctx_, frame, record, target_stream_id);
    if (t.next.phase == StreamPhase::kEstablished) {
      target_ = target;
      EWSB_LOG_DEBUG("Stream " + std::to_string(frame.stream_id) + " established as " + record->source + "#" +
                     std::to_string(target_stream_id));
    } else {
      EWSB_LOG_WARN("Stream " + std::to_string(frame.stream_id) + ": handshake rejected (source_ref=" +
                    std::to_string(frame.source_ref) + ", correlation " + std::to_string(frame.correlation_id) +
                    (record != nullptr ? " found)" : " missing)"));
    }
    apply(t);
    return;
  }

  Transition t = on_stream_frame(ctx_, frame);
  if (t.next.phase != before) {
    if (t.next.phase == StreamPhase::kRejectedOrReset) {
      EWSB_LOG_WARN("Stream " + std::to_string(frame.stream_id) + ": unexpected " + frame_name(frame.type) +
                    " in " + phase_name(before));
    } else {
      EWSB_LOG_DEBUG("Stream " + std::to_string(frame.stream_id) + " " + phase_name(before) + " -> " +
                     phase_name(t.next.phase));
    }
  }
  apply(t);
}

void StreamTranslator::on_throttle(const Frame& frame) {
  Transition t = on_throttle_frame(ctx_, frame);
  if (frame.type == FrameType::kReset && t.next.phase != ctx_.phase) {
    EWSB_LOG_WARN("Stream " + std::to_string(ctx_.source_stream_id) + ": reset by target");
  }
  apply(t);
}

void StreamTranslator::apply(const Transition& transition) {
  // Commit first: effects may call back into on_throttle().
  ctx_ = transition.next;

  for (const Effect& effect : transition.effects) {
    switch (effect.type) {
      case EffectType::kTargetBegin:
        target_->do_begin(effect.stream_id, 0, transition.correlation_id, transition.headers);
        break;
      case EffectType::kTargetData:
        target_->do_data(effect.stream_id, effect.payload, effect.flags);
        break;
      case EffectType::kTargetEnd:
        target_->do_end(effect.stream_id);
        break;
      case EffectType::kAddThrottle:
        target_->add_throttle(effect.stream_id, [this](const Frame& frame) { on_throttle(frame); });
        break;
      case EffectType::kRemoveThrottle:
        target_->remove_throttle(effect.stream_id);
        break;
      case EffectType::kSourceWindow:
        source_.do_window(effect.stream_id, effect.credit);
        break;
      case EffectType::kSourceReset:
        source_.do_reset(effect.stream_id);
        break;
      case EffectType::kSourceRemoveStream:
        source_.remove_stream(effect.stream_id);
        break;
    }
  }
}

}  // namespace ewsb
