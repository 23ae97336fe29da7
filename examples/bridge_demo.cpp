#include "ewsb.hpp"
#include <iostream>
#include <string>
#include <utility>

// In-memory walk through one bridged WebSocket stream: the source and target
// just print what the bridge asks of them.

namespace {

class ConsoleSource : public ewsb::SourceEndpoint {
 public:
  void do_window(uint64_t stream_id, int32_t credit) override {
    std::cout << "  source <- WINDOW stream=" << stream_id << " credit=" << credit << std::endl;
  }
  void do_reset(uint64_t stream_id) override { std::cout << "  source <- RESET stream=" << stream_id << std::endl; }
  void remove_stream(uint64_t stream_id) override {
    std::cout << "  source <- release stream=" << stream_id << std::endl;
  }
};

class ConsoleTarget : public ewsb::TargetEndpoint {
 public:
  void do_begin(uint64_t stream_id, uint64_t, uint64_t correlation_id, const ewsb::HttpHeaders& headers) override {
    std::cout << "  target <- BEGIN stream=" << stream_id << " correlation=" << correlation_id << std::endl;
    for (const ewsb::HttpHeader& h : headers) {
      std::cout << "      " << h.name << ": " << h.value << std::endl;
    }
  }

  void do_data(uint64_t stream_id, std::string_view payload, uint8_t flags) override {
    std::cout << "  target <- DATA stream=" << stream_id << " flags=0x" << std::hex << static_cast<int>(flags)
              << std::dec << " \"" << payload << "\"" << std::endl;
    // Pretend the peer consumed it right away
    if (throttle_) {
      throttle_(ewsb::Frame::window(stream_id, static_cast<int32_t>(payload.size() + 14)));
    }
  }

  void do_end(uint64_t stream_id) override { std::cout << "  target <- END stream=" << stream_id << std::endl; }

  void add_throttle(uint64_t stream_id, ewsb::ThrottleHandler handler) override {
    throttle_ = std::move(handler);
    throttle_(ewsb::Frame::window(stream_id, 8192));
  }

  void remove_throttle(uint64_t) override { throttle_ = nullptr; }

 private:
  ewsb::ThrottleHandler throttle_;
};

}  // namespace

int main(int argc, char* argv[]) {
  std::string protocol;

  if (argc > 1) {
    protocol = argv[1];
  }

  try {
    ConsoleSource source;
    ConsoleTarget http;

    ewsb::TargetDirectory targets;
    targets.add("http#0", http);

    ewsb::CorrelationTable correlations;
    if (!correlations.deposit(ewsb::Correlation{1, "http#0", protocol, "s3pPLMBiTxaQ9kYGzzhZRbK+xOo="})) {
      std::cerr << "Correlation already pending" << std::endl;
      return 1;
    }

    ewsb::BridgeConfig config;
    config.log_level = ewsb::Logger::Level::kDebug;
    ewsb::StreamBridge bridge(source, targets, correlations, config);

    auto feed = [&bridge](const ewsb::Frame& frame) {
      auto result = bridge.on_source_frame(frame);
      if (!result) {
        std::cerr << "  refused: " << ewsb::error_name(result.get_error()) << std::endl;
      }
    };

    std::cout << "BEGIN (correlation 1)" << std::endl;
    feed(ewsb::Frame::begin(10, 0, 1));

    std::cout << "DATA (binary)" << std::endl;
    feed(ewsb::Frame::data(10, "abc"));

    std::cout << "DATA (text)" << std::endl;
    feed(ewsb::Frame::data(10, "Hello", ewsb::ws::make_flags(true, ewsb::ws::OpCode::kText)));

    std::cout << "END" << std::endl;
    feed(ewsb::Frame::end(10));

    std::cout << "BEGIN (correlation 1 again)" << std::endl;
    feed(ewsb::Frame::begin(11, 0, 1));
    feed(ewsb::Frame::end(11));

    const ewsb::BridgeStats& stats = bridge.stats();
    std::cout << "opened=" << stats.streams_opened.load() << " rejected=" << stats.streams_rejected.load()
              << " ended=" << stats.streams_ended.load() << " bytes=" << stats.bytes_relayed.load() << std::endl;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
