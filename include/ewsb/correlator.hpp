#ifndef EWSB_CORRELATOR_HPP_
#define EWSB_CORRELATOR_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <string>
#include <unordered_map>

namespace ewsb {

// ============================================================================
// Correlation - pending handshake deposited by the accepting side
// ============================================================================

struct Correlation {
  uint64_t id = 0;
  std::string source;    // Endpoint name the response is routed to
  std::string protocol;  // Negotiated sub-protocol, empty when none
  std::string hash;      // Sec-WebSocket-Accept value
};

/**
 * @brief One-shot lookup of pending handshakes.
 *
 * take() removes the record, so a correlation id can complete at most one
 * handshake.
 */
class Correlator {
 public:
  virtual ~Correlator() = default;

  virtual optional<Correlation> take(uint64_t correlation_id) = 0;
};

// ============================================================================
// CorrelationTable - in-memory Correlator
// ============================================================================

class CorrelationTable : public Correlator {
 public:
  // Returns error(kDuplicateCorrelation) if the id is still pending.
  expected<void, ErrorCode> deposit(Correlation correlation);

  optional<Correlation> take(uint64_t correlation_id) override;

  bool contains(uint64_t correlation_id) const { return pending_.count(correlation_id) != 0; }

  size_t size() const { return pending_.size(); }

 private:
  std::unordered_map<uint64_t, Correlation> pending_;
};

}  // namespace ewsb

#endif  // EWSB_CORRELATOR_HPP_
