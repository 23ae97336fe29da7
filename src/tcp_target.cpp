#include "ewsb/tcp_target.hpp"

#include "ewsb/log.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <utility>

namespace ewsb {

namespace {

// Append text at pos; false if it does not fit.
bool append(const MutableBuffer& buf, size_t& pos, std::string_view text) {
  if (text.size() > buf.size() - pos)
    return false;
  std::memcpy(buf.data() + pos, text.data(), text.size());
  pos += text.size();
  return true;
}

}  // namespace

TcpTargetEndpoint::TcpTargetEndpoint(sockpp::tcp_socket&& sock, BufferSlab& slab)
    : socket_(std::move(sock)), slab_(slab) {}

TcpTargetEndpoint::TcpTargetEndpoint(int fd, BufferSlab& slab) : socket_(fd), slab_(slab) {}

TcpTargetEndpoint::~TcpTargetEndpoint() {
  release_slot();
  if (socket_.is_open()) {
    socket_.close();
  }
}

void TcpTargetEndpoint::do_begin(uint64_t stream_id, uint64_t /* source_ref */, uint64_t /* correlation_id */,
                                 const HttpHeaders& headers) {
  if (stream_id_ != 0) {
    // Refused streams are reset when their throttle is registered.
    EWSB_LOG_ERROR("TCP target already carries stream " + std::to_string(stream_id_) + ", refusing " +
                   std::to_string(stream_id));
    return;
  }

  stream_id_ = stream_id;
  failed_ = false;
  slot_ = slab_.acquire(stream_id);
  if (slot_ == BufferSlab::kNoSlot) {
    failed_ = true;
    last_error_code_ = ErrorCode::kNoSlot;
    EWSB_LOG_ERROR("No slab slot for stream " + std::to_string(stream_id));
    return;
  }

  // Status line from :status, remaining headers as name: value
  std::string_view status = "101";
  for (const HttpHeader& header : headers) {
    if (header.name == ":status") {
      status = header.value;
    }
  }

  MutableBuffer buf = slab_.buffer(slot_);
  size_t pos = 0;
  bool fits = append(buf, pos, "HTTP/1.1 ") && append(buf, pos, status) &&
              append(buf, pos, status == "101" ? " Switching Protocols\r\n" : "\r\n");
  for (const HttpHeader& header : headers) {
    if (!fits)
      break;
    if (!header.name.empty() && header.name.front() == ':')
      continue;
    fits = append(buf, pos, header.name) && append(buf, pos, ": ") && append(buf, pos, header.value) &&
           append(buf, pos, "\r\n");
  }
  fits = fits && append(buf, pos, "\r\n");

  if (!fits) {
    failed_ = true;
    last_error_code_ = ErrorCode::kBufferFull;
    EWSB_LOG_ERROR("Upgrade response exceeds slot capacity " + std::to_string(slab_.slot_capacity()));
    return;
  }

  if (!write_all(buf.data(), pos).has_value()) {
    failed_ = true;
  }
}

void TcpTargetEndpoint::add_throttle(uint64_t stream_id, ThrottleHandler handler) {
  if (stream_id != stream_id_) {
    handler(Frame::reset(stream_id));
    return;
  }

  throttle_ = std::move(handler);
  if (failed_) {
    notify(Frame::reset(stream_id_));
  } else {
    notify(Frame::window(stream_id_, static_cast<int32_t>(slab_.slot_capacity())));
  }
}

void TcpTargetEndpoint::remove_throttle(uint64_t stream_id) {
  if (stream_id == stream_id_) {
    throttle_ = nullptr;
  }
}

void TcpTargetEndpoint::do_data(uint64_t stream_id, std::string_view payload, uint8_t flags) {
  if (stream_id != stream_id_ || failed_)
    return;

  if (payload.size() + ws::kEncodeOverheadMaximum > slab_.slot_capacity()) {
    fail(ErrorCode::kBufferFull, "Frame of " + std::to_string(payload.size()) + " bytes exceeds window");
    return;
  }

  if (!write_frame(flags, payload).has_value()) {
    fail(last_error_code_, "Write failed on stream " + std::to_string(stream_id));
    return;
  }

  notify(Frame::window(stream_id_, static_cast<int32_t>(payload.size() + ws::kEncodeOverheadMaximum)));
}

void TcpTargetEndpoint::do_end(uint64_t stream_id) {
  if (stream_id != stream_id_)
    return;

  if (!failed_) {
    const uint8_t code[2] = {static_cast<uint8_t>(kNormalClosure >> 8), static_cast<uint8_t>(kNormalClosure & 0xFF)};
    auto result = write_frame(ws::make_flags(true, ws::OpCode::kClose),
                              std::string_view(reinterpret_cast<const char*>(code), sizeof(code)));
    if (!result.has_value()) {
      EWSB_LOG_WARN("Close frame not delivered on stream " + std::to_string(stream_id));
    }
  }

  release_slot();
  socket_.close();
}

expected<void, ErrorCode> TcpTargetEndpoint::write_frame(uint8_t flags, std::string_view payload) {
  MutableBuffer buf = slab_.buffer(slot_);
  size_t header_len = ws::encode_frame_header(buf.data(), flags, payload.size());
  if (!payload.empty()) {
    std::memcpy(buf.data() + header_len, payload.data(), payload.size());
  }
  return write_all(buf.data(), header_len + payload.size());
}

expected<void, ErrorCode> TcpTargetEndpoint::write_all(const uint8_t* data, size_t len) {
  if (!socket_.is_open()) {
    last_error_code_ = ErrorCode::kSocketError;
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  // MSG_NOSIGNAL: a closed peer surfaces as EPIPE instead of SIGPIPE.
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(socket_.handle(), data + sent, len - sent, MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      int err = errno;
      last_error_code_ = ErrorCode::kSocketError;
      EWSB_LOG_ERROR("Write error: " + std::string(n == 0 ? "connection closed" : strerror(err)));
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
    sent += static_cast<size_t>(n);
  }

  last_error_code_ = ErrorCode::kOk;
  return expected<void, ErrorCode>::success();
}

void TcpTargetEndpoint::fail(ErrorCode code, const std::string& msg) {
  failed_ = true;
  last_error_code_ = code;
  EWSB_LOG_ERROR(msg + " (" + error_name(code) + ")");
  notify(Frame::reset(stream_id_));
}

void TcpTargetEndpoint::notify(const Frame& frame) {
  // The handler may remove itself while running.
  if (throttle_) {
    throttle_(frame);
  }
}

void TcpTargetEndpoint::release_slot() {
  if (slot_ != BufferSlab::kNoSlot) {
    slab_.release(slot_);
    slot_ = BufferSlab::kNoSlot;
  }
}

}  // namespace ewsb
