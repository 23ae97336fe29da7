#ifndef EWSB_TCP_TARGET_HPP_
#define EWSB_TCP_TARGET_HPP_

#include "buffer_slab.hpp"
#include "endpoint.hpp"
#include "frame.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>

namespace ewsb {

// ============================================================================
// TcpTargetEndpoint - relays one upgraded stream onto a TCP connection
// ============================================================================

/**
 * @brief Writes the 101 response and WebSocket frames to a socket.
 *
 * Each outgoing frame is assembled in a BufferSlab slot acquired for the
 * stream at BEGIN, so the hot path does not allocate. Window is granted back
 * through the throttle: slot_capacity once the throttle is registered, then
 * payload + kEncodeOverheadMaximum after every written frame. A payload that
 * cannot fit in the slot, an exhausted slab, or a socket error resets the
 * stream through the throttle instead.
 *
 * Carries a single stream per socket. Blocking writes.
 */
class TcpTargetEndpoint : public TargetEndpoint {
 public:
  static constexpr uint16_t kNormalClosure = 1000;

  TcpTargetEndpoint(sockpp::tcp_socket&& sock, BufferSlab& slab);
  TcpTargetEndpoint(int fd, BufferSlab& slab);  // Native socket fd constructor
  ~TcpTargetEndpoint() override;

  TcpTargetEndpoint(const TcpTargetEndpoint&) = delete;
  TcpTargetEndpoint& operator=(const TcpTargetEndpoint&) = delete;

  void do_begin(uint64_t stream_id, uint64_t source_ref, uint64_t correlation_id,
                const HttpHeaders& headers) override;
  void do_data(uint64_t stream_id, std::string_view payload, uint8_t flags) override;
  void do_end(uint64_t stream_id) override;
  void add_throttle(uint64_t stream_id, ThrottleHandler handler) override;
  void remove_throttle(uint64_t stream_id) override;

  bool is_open() const { return socket_.is_open(); }
  uint64_t stream_id() const { return stream_id_; }
  bool has_throttle() const { return static_cast<bool>(throttle_); }

  // Get last error code (cached from most recent operation)
  ErrorCode get_last_error() const { return last_error_code_; }

 private:
  // Write a whole buffer, retrying short writes.
  expected<void, ErrorCode> write_all(const uint8_t* data, size_t len);

  // Encode flags + payload as one frame in the stream's slot and write it.
  expected<void, ErrorCode> write_frame(uint8_t flags, std::string_view payload);

  // Mark the stream failed and deliver RESET through the throttle.
  void fail(ErrorCode code, const std::string& msg);

  void notify(const Frame& frame);
  void release_slot();

  sockpp::tcp_socket socket_;
  BufferSlab& slab_;

  uint64_t stream_id_ = 0;
  int32_t slot_ = BufferSlab::kNoSlot;
  ThrottleHandler throttle_;
  bool failed_ = false;

  ErrorCode last_error_code_ = ErrorCode::kOk;
};

}  // namespace ewsb

#endif  // EWSB_TCP_TARGET_HPP_
