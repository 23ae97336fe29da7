#ifndef EWSB_TESTS_RAW_PEER_HPP_
#define EWSB_TESTS_RAW_PEER_HPP_

#include <cstdint>
#include <cstring>

#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ewsb {
namespace test {

// ============================================================================
// RawPeer - reads what a target endpoint writes (raw POSIX socket)
// ============================================================================

class RawPeer {
 public:
  explicit RawPeer(int fd, int timeout_ms = 2000) : fd_(fd) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }

  ~RawPeer() { close(); }

  RawPeer(const RawPeer&) = delete;
  RawPeer& operator=(const RawPeer&) = delete;

  // Read until the HTTP header terminator. Empty on timeout or EOF.
  std::string recv_head() {
    std::string head;
    char c;
    while (head.size() < 4096) {
      ssize_t n = ::recv(fd_, &c, 1, 0);
      if (n <= 0)
        return {};
      head.push_back(c);
      if (head.size() >= 4 && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0)
        return head;
    }
    return {};
  }

  // Read one unmasked WebSocket frame. Sets ok to false on short read.
  std::string recv_frame(uint8_t* out_flags, bool* ok) {
    *ok = false;
    uint8_t header[2];
    if (!recv_exact(header, 2))
      return {};
    if (out_flags)
      *out_flags = header[0];

    uint64_t payload_len = header[1] & 0x7F;
    if (payload_len == 126) {
      uint8_t ext[2];
      if (!recv_exact(ext, 2))
        return {};
      payload_len = (static_cast<uint64_t>(ext[0]) << 8) | ext[1];
    } else if (payload_len == 127) {
      uint8_t ext[8];
      if (!recv_exact(ext, 8))
        return {};
      payload_len = 0;
      for (int i = 0; i < 8; ++i) {
        payload_len = (payload_len << 8) | ext[i];
      }
    }

    std::string payload(payload_len, '\0');
    if (payload_len > 0 && !recv_exact(reinterpret_cast<uint8_t*>(&payload[0]), payload_len))
      return {};
    *ok = true;
    return payload;
  }

  // True once the writer has closed its end and nothing is left to read.
  bool at_eof() {
    char c;
    return ::recv(fd_, &c, 1, 0) == 0;
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }

 private:
  bool recv_exact(uint8_t* buf, size_t len) {
    size_t got = 0;
    while (got < len) {
      ssize_t n = ::recv(fd_, buf + got, len - got, 0);
      if (n <= 0)
        return false;
      got += static_cast<size_t>(n);
    }
    return true;
  }

  int fd_ = -1;
};

}  // namespace test
}  // namespace ewsb

#endif  // EWSB_TESTS_RAW_PEER_HPP_
