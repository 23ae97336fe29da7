#include "ewsb.hpp"
#include "ewsb/tcp_target.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <iostream>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

// Accepts TCP clients (e.g. `nc localhost 8080`) and relays a scripted
// upstream WebSocket stream to each one: the 101 response, a few frames and
// a close frame.

namespace {

// Upstream stand-in: logs the credit and resets it receives.
class ScriptedSource : public ewsb::SourceEndpoint {
 public:
  void do_window(uint64_t stream_id, int32_t credit) override {
    EWSB_LOG_INFO("Stream " + std::to_string(stream_id) + " window +" + std::to_string(credit));
  }
  void do_reset(uint64_t stream_id) override { EWSB_LOG_WARN("Stream " + std::to_string(stream_id) + " reset"); }
  void remove_stream(uint64_t stream_id) override {
    EWSB_LOG_INFO("Stream " + std::to_string(stream_id) + " released");
  }
};

int listen_on(uint16_t port) {
  int sock = ::socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    EWSB_THROW(std::runtime_error("Failed to create socket"));
  }

  int reuse = 1;
  setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  struct sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);

  if (::bind(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(sock);
    EWSB_THROW(std::runtime_error("Failed to bind port " + std::to_string(port) + ": " + strerror(err)));
  }

  if (::listen(sock, 16) < 0) {
    ::close(sock);
    EWSB_THROW(std::runtime_error("Failed to listen"));
  }
  return sock;
}

void relay(ewsb::StreamBridge& bridge, const ewsb::Frame& frame) {
  auto result = bridge.on_source_frame(frame);
  if (!result) {
    EWSB_LOG_ERROR(std::string("Frame refused: ") + ewsb::error_name(result.get_error()));
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  uint16_t port = 8080;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  try {
    int listener = listen_on(port);
    EWSB_LOG_INFO("Listening on port " + std::to_string(port));

    ewsb::BridgeConfig config;
    ewsb::BufferSlab slab(config.slab);
    ScriptedSource source;
    ewsb::CorrelationTable correlations;
    ewsb::TargetDirectory targets;
    ewsb::StreamBridge bridge(source, targets, correlations, config);

    uint64_t next_id = 1;
    while (true) {
      int client = ::accept(listener, nullptr, nullptr);
      if (client < 0) {
        if (errno == EINTR)
          continue;
        EWSB_LOG_ERROR(std::string("Accept failed: ") + strerror(errno));
        break;
      }

      const uint64_t id = next_id++;
      const std::string name = "http#" + std::to_string(id);
      ewsb::TcpTargetEndpoint http(client, slab);
      targets.add(name, http);

      if (!correlations.deposit(ewsb::Correlation{id, name, "", "s3pPLMBiTxaQ9kYGzzhZRbK+xOo="})) {
        targets.remove(name);
        continue;
      }

      relay(bridge, ewsb::Frame::begin(id, 0, id));
      relay(bridge, ewsb::Frame::data(id, "Hello from ewsb", ewsb::ws::make_flags(true, ewsb::ws::OpCode::kText)));
      relay(bridge, ewsb::Frame::data(id, name));
      relay(bridge, ewsb::Frame::end(id));

      targets.remove(name);
    }

    ::close(listener);

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
