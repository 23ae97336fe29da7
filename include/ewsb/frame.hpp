#ifndef EWSB_FRAME_HPP_
#define EWSB_FRAME_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string_view>

namespace ewsb {

// ============================================================================
// Stream frames (decoded views handed over by the transport codecs)
// ============================================================================

enum class FrameType : uint8_t {
  kBegin = 1,
  kData = 2,
  kEnd = 3,
  kWindow = 4,
  kReset = 5
};

inline const char* frame_name(FrameType type) {
  switch (type) {
    case FrameType::kBegin:
      return "BEGIN";
    case FrameType::kData:
      return "DATA";
    case FrameType::kEnd:
      return "END";
    case FrameType::kWindow:
      return "WINDOW";
    case FrameType::kReset:
      return "RESET";
  }
  return "UNKNOWN";
}

/**
 * @brief One decoded frame. Which fields are meaningful depends on type:
 *
 *   BEGIN   stream_id, source_ref, correlation_id, protocol (extension)
 *   DATA    stream_id, payload, flags (extension)
 *   END     stream_id
 *   WINDOW  stream_id, update
 *   RESET   stream_id
 *
 * payload and protocol point into transport memory and are only valid while
 * the frame is being handled.
 */
struct Frame {
  FrameType type = FrameType::kReset;
  uint64_t stream_id = 0;
  uint64_t source_ref = 0;
  uint64_t correlation_id = 0;
  std::string_view payload;
  int32_t update = 0;
  optional<std::string_view> protocol;
  optional<uint8_t> flags;

  static Frame begin(uint64_t stream_id, uint64_t source_ref, uint64_t correlation_id) {
    Frame f;
    f.type = FrameType::kBegin;
    f.stream_id = stream_id;
    f.source_ref = source_ref;
    f.correlation_id = correlation_id;
    return f;
  }

  static Frame begin(uint64_t stream_id, uint64_t source_ref, uint64_t correlation_id, std::string_view protocol) {
    Frame f = begin(stream_id, source_ref, correlation_id);
    f.protocol = protocol;
    return f;
  }

  static Frame data(uint64_t stream_id, std::string_view payload) {
    Frame f;
    f.type = FrameType::kData;
    f.stream_id = stream_id;
    f.payload = payload;
    return f;
  }

  static Frame data(uint64_t stream_id, std::string_view payload, uint8_t flags) {
    Frame f = data(stream_id, payload);
    f.flags = flags;
    return f;
  }

  static Frame end(uint64_t stream_id) {
    Frame f;
    f.type = FrameType::kEnd;
    f.stream_id = stream_id;
    return f;
  }

  static Frame window(uint64_t stream_id, int32_t update) {
    Frame f;
    f.type = FrameType::kWindow;
    f.stream_id = stream_id;
    f.update = update;
    return f;
  }

  static Frame reset(uint64_t stream_id) {
    Frame f;
    f.type = FrameType::kReset;
    f.stream_id = stream_id;
    return f;
  }
};

// ============================================================================
// WebSocket framing helpers
// ============================================================================

namespace ws {

enum class OpCode : uint8_t {
  kContinuation = 0x0,
  kText = 0x1,
  kBinary = 0x2,
  kClose = 0x8,
  kPing = 0x9,
  kPong = 0xA
};

static constexpr uint8_t kFinBit = 0x80;

// FIN + binary: flags used when a DATA frame carries no extension.
static constexpr uint8_t kDefaultDataFlags = 0x82;

// Largest header encode_frame_header() can produce: 2 + 8 length + 4 mask.
static constexpr size_t kEncodeOverheadMaximum = 14;

constexpr uint8_t make_flags(bool fin, OpCode opcode) {
  return static_cast<uint8_t>((fin ? kFinBit : 0x00) | static_cast<uint8_t>(opcode));
}

constexpr OpCode opcode_of(uint8_t flags) { return static_cast<OpCode>(flags & 0x0F); }

constexpr bool is_final(uint8_t flags) { return (flags & kFinBit) != 0; }

// Write an unmasked frame header whose first byte is flags verbatim.
// buf must hold kEncodeOverheadMaximum bytes. Returns bytes written.
inline size_t encode_frame_header(uint8_t* buf, uint8_t flags, uint64_t payload_len) {
  size_t pos = 0;
  buf[pos++] = flags;
  if (payload_len < 126) {
    buf[pos++] = static_cast<uint8_t>(payload_len);
  } else if (payload_len < 65536) {
    buf[pos++] = 126;
    buf[pos++] = static_cast<uint8_t>((payload_len >> 8) & 0xFF);
    buf[pos++] = static_cast<uint8_t>(payload_len & 0xFF);
  } else {
    buf[pos++] = 127;
    for (int i = 7; i >= 0; --i)
      buf[pos++] = static_cast<uint8_t>((payload_len >> (i * 8)) & 0xFF);
  }
  return pos;
}

}  // namespace ws

}  // namespace ewsb

#endif  // EWSB_FRAME_HPP_
