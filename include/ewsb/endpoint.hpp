#ifndef EWSB_ENDPOINT_HPP_
#define EWSB_ENDPOINT_HPP_

#include "frame.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <string_view>
#include <unordered_map>

namespace ewsb {

// ============================================================================
// HTTP header list carried by an outbound BEGIN
// ============================================================================

struct HttpHeader {
  std::string_view name;
  std::string_view value;
};

// :status, upgrade, connection, sec-websocket-accept, sec-websocket-protocol
using HttpHeaders = FixedVector<HttpHeader, 5>;

// Receives WINDOW and RESET frames for an outbound stream.
using ThrottleHandler = FixedFunction<void(const Frame&)>;

// ============================================================================
// Endpoint capabilities
// ============================================================================

/**
 * @brief Upstream side: where WebSocket frames come from.
 *
 * Only the calls the translator makes back towards the source.
 */
class SourceEndpoint {
 public:
  virtual ~SourceEndpoint() = default;

  // Grant the peer `credit` more bytes on stream_id.
  virtual void do_window(uint64_t stream_id, int32_t credit) = 0;

  virtual void do_reset(uint64_t stream_id) = 0;

  // Release per-stream resources held by the transport.
  virtual void remove_stream(uint64_t stream_id) = 0;
};

/**
 * @brief Downstream side: the HTTP/1.1-style stream the upgrade is relayed to.
 *
 * Header names/values and payloads are only valid during the call;
 * implementations copy what they need to keep.
 */
class TargetEndpoint {
 public:
  virtual ~TargetEndpoint() = default;

  virtual void do_begin(uint64_t stream_id, uint64_t source_ref, uint64_t correlation_id,
                        const HttpHeaders& headers) = 0;

  virtual void do_data(uint64_t stream_id, std::string_view payload, uint8_t flags) = 0;

  virtual void do_end(uint64_t stream_id) = 0;

  virtual void add_throttle(uint64_t stream_id, ThrottleHandler handler) = 0;

  virtual void remove_throttle(uint64_t stream_id) = 0;
};

/**
 * @brief Resolves target endpoints by name and hands out stream ids.
 */
class TargetResolver {
 public:
  virtual ~TargetResolver() = default;

  // nullptr when no endpoint is registered under name.
  virtual TargetEndpoint* resolve(std::string_view name) = 0;

  // Never returns 0.
  virtual uint64_t next_stream_id() = 0;
};

// ============================================================================
// TargetDirectory - name -> endpoint map with a monotonic stream id counter
// ============================================================================

class TargetDirectory : public TargetResolver {
 public:
  // Endpoints are not owned and must outlive the directory.
  void add(std::string name, TargetEndpoint& endpoint) { targets_[std::move(name)] = &endpoint; }

  bool remove(const std::string& name) { return targets_.erase(name) > 0; }

  TargetEndpoint* resolve(std::string_view name) override {
    auto it = targets_.find(std::string(name));
    return it == targets_.end() ? nullptr : it->second;
  }

  uint64_t next_stream_id() override { return next_stream_id_++; }

  size_t size() const { return targets_.size(); }

 private:
  std::unordered_map<std::string, TargetEndpoint*> targets_;
  uint64_t next_stream_id_ = 1;
};

}  // namespace ewsb

#endif  // EWSB_ENDPOINT_HPP_
