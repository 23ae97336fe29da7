#include "ewsb/bridge.hpp"

#include "fake_endpoints.hpp"

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <string>

using namespace ewsb;
using ewsb::test::RecordingSource;
using ewsb::test::RecordingTarget;

namespace {

struct BridgeFixture {
  explicit BridgeFixture(BridgeConfig config = BridgeConfig()) : bridge(source, targets, correlations, config) {}

  void expect_upgrade(uint64_t correlation_id) {
    REQUIRE(correlations.deposit(Correlation{correlation_id, "http#0", "", "accept"}).has_value());
  }

  RecordingSource source;
  RecordingTarget target;
  TargetDirectory targets = make_targets(target);
  CorrelationTable correlations;
  StreamBridge bridge;

 private:
  static TargetDirectory make_targets(RecordingTarget& t) {
    TargetDirectory d;
    d.add("http#0", t);
    return d;
  }
};

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("StreamBridge - invalid config throws", "[bridge]") {
  RecordingSource source;
  TargetDirectory targets;
  CorrelationTable correlations;
  BridgeConfig config;
  config.max_streams = 0;
  REQUIRE_THROWS_AS(StreamBridge(source, targets, correlations, config), std::invalid_argument);
}

TEST_CASE("StreamBridge - max_streams clamped to pool size", "[bridge]") {
  BridgeConfig config;
  config.max_streams = 1000;
  BridgeFixture f(config);
  REQUIRE(f.bridge.max_streams() == StreamBridge::kMaxStreams);
}

// ============================================================================
// Routing
// ============================================================================

TEST_CASE("StreamBridge - full stream lifecycle", "[bridge]") {
  BridgeFixture f;
  f.expect_upgrade(100);

  REQUIRE(f.bridge.on_source_frame(Frame::begin(1, 0, 100)).has_value());
  REQUIRE(f.bridge.active_streams() == 1);
  const StreamTranslator* t = f.bridge.find(1);
  REQUIRE(t != nullptr);
  REQUIRE(t->phase() == StreamPhase::kEstablished);

  REQUIRE(f.bridge.on_source_frame(Frame::data(1, "hello")).has_value());
  REQUIRE(f.target.data.size() == 1);
  REQUIRE(f.target.data[0].payload == "hello");

  REQUIRE(f.bridge.on_source_frame(Frame::end(1)).has_value());
  REQUIRE(f.bridge.active_streams() == 0);
  REQUIRE(f.bridge.find(1) == nullptr);
  REQUIRE(f.target.ends.size() == 1);

  const BridgeStats& stats = f.bridge.stats();
  REQUIRE(stats.frames_in.load() == 3);
  REQUIRE(stats.bytes_relayed.load() == 5);
  REQUIRE(stats.streams_opened.load() == 1);
  REQUIRE(stats.streams_ended.load() == 1);
  REQUIRE(stats.streams_rejected.load() == 0);
  REQUIRE(stats.active_streams.load() == 0);
}

TEST_CASE("StreamBridge - streams are independent", "[bridge]") {
  BridgeFixture f;
  f.expect_upgrade(100);
  f.expect_upgrade(200);

  f.bridge.on_source_frame(Frame::begin(1, 0, 100));
  f.bridge.on_source_frame(Frame::begin(2, 0, 200));
  REQUIRE(f.bridge.active_streams() == 2);

  const uint64_t target1 = f.bridge.find(1)->target_stream_id();
  const uint64_t target2 = f.bridge.find(2)->target_stream_id();
  REQUIRE(target1 != target2);

  f.bridge.on_source_frame(Frame::data(2, "two"));
  f.bridge.on_source_frame(Frame::data(1, "one"));
  REQUIRE(f.target.data[0].stream_id == target2);
  REQUIRE(f.target.data[1].stream_id == target1);

  f.target.throttle(Frame::window(target2, 114));
  REQUIRE(f.source.total_credit(2) == 100);
  REQUIRE(f.source.total_credit(1) == 0);
}

TEST_CASE("StreamBridge - rejected stream is kept until end", "[bridge]") {
  BridgeFixture f;

  f.bridge.on_source_frame(Frame::begin(1, 0, 999));
  REQUIRE(f.bridge.find(1)->phase() == StreamPhase::kRejectedOrReset);
  REQUIRE(f.bridge.stats().streams_rejected.load() == 1);
  REQUIRE(f.source.count(RecordingSource::Call::kReset) == 1);

  f.bridge.on_source_frame(Frame::data(1, "abc"));
  REQUIRE(f.source.total_credit(1) == 3);
  REQUIRE(f.target.data.empty());

  f.bridge.on_source_frame(Frame::end(1));
  REQUIRE(f.bridge.find(1) == nullptr);
  REQUIRE(f.source.count(RecordingSource::Call::kRemoveStream) == 1);
}

TEST_CASE("StreamBridge - unknown stream data is reset", "[bridge]") {
  BridgeFixture f;
  REQUIRE(f.bridge.on_source_frame(Frame::data(7, "stray")).has_value());
  REQUIRE(f.source.count(RecordingSource::Call::kReset) == 1);
  REQUIRE(f.source.calls[0].stream_id == 7);
  REQUIRE(f.bridge.find(7)->phase() == StreamPhase::kRejectedOrReset);
}

TEST_CASE("StreamBridge - pool exhaustion resets new streams", "[bridge]") {
  BridgeConfig config;
  config.max_streams = 2;
  BridgeFixture f(config);
  f.expect_upgrade(1);
  f.expect_upgrade(2);
  f.expect_upgrade(3);

  REQUIRE(f.bridge.on_source_frame(Frame::begin(1, 0, 1)).has_value());
  REQUIRE(f.bridge.on_source_frame(Frame::begin(2, 0, 2)).has_value());

  auto result = f.bridge.on_source_frame(Frame::begin(3, 0, 3));
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kMaxStreamsExceeded);
  REQUIRE(f.bridge.stats().pool_exhausted.load() == 1);
  REQUIRE(f.source.count(RecordingSource::Call::kReset) == 1);
  REQUIRE(f.source.calls[0].stream_id == 3);
  REQUIRE(f.correlations.contains(3));

  // A finished stream frees its slot
  f.bridge.on_source_frame(Frame::end(1));
  REQUIRE(f.bridge.on_source_frame(Frame::begin(3, 0, 3)).has_value());
  REQUIRE(f.bridge.find(3)->phase() == StreamPhase::kEstablished);
}

TEST_CASE("StreamBridge - destruction removes live throttles", "[bridge]") {
  RecordingSource source;
  RecordingTarget target;
  TargetDirectory targets;
  targets.add("http#0", target);
  CorrelationTable correlations;
  REQUIRE(correlations.deposit(Correlation{1, "http#0", "", "accept"}).has_value());

  {
    StreamBridge bridge(source, targets, correlations);
    bridge.on_source_frame(Frame::begin(1, 0, 1));
    REQUIRE(target.throttles_added == 1);
  }
  REQUIRE(target.throttles_removed == 1);
}

TEST_CASE("BridgeStats - overload detection", "[bridge]") {
  BridgeStats stats;
  stats.active_streams = 9;
  REQUIRE(!stats.is_overloaded(10));
  stats.active_streams = 10;
  REQUIRE(stats.is_overloaded(10));

  stats.frames_in = 5;
  stats.streams_opened = 10;
  stats.reset();
  REQUIRE(stats.frames_in.load() == 0);
  REQUIRE(stats.streams_opened.load() == 0);
  REQUIRE(stats.active_streams.load() == 10);
}

TEST_CASE("StreamBridge - reset_stats keeps live stream gauge", "[bridge]") {
  BridgeFixture f;
  f.expect_upgrade(1);

  REQUIRE(f.bridge.on_source_frame(Frame::begin(1, 0, 1)).has_value());
  f.bridge.reset_stats();
  REQUIRE(f.bridge.stats().streams_opened.load() == 0);
  REQUIRE(f.bridge.stats().active_streams.load() == 1);

  REQUIRE(f.bridge.on_source_frame(Frame::end(1)).has_value());
  REQUIRE(f.bridge.active_streams() == 0);
  REQUIRE(f.bridge.stats().active_streams.load() == 0);
  REQUIRE(f.bridge.stats().streams_ended.load() == 1);
  REQUIRE(!f.bridge.stats().is_overloaded(StreamBridge::kMaxStreams));
}
