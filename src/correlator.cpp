#include "ewsb/correlator.hpp"

#include "ewsb/log.hpp"

#include <utility>

namespace ewsb {

expected<void, ErrorCode> CorrelationTable::deposit(Correlation correlation) {
  const uint64_t id = correlation.id;
  if (!pending_.emplace(id, std::move(correlation)).second) {
    EWSB_LOG_WARN("Correlation " + std::to_string(id) + " already pending");
    return expected<void, ErrorCode>::error(ErrorCode::kDuplicateCorrelation);
  }
  return expected<void, ErrorCode>::success();
}

optional<Correlation> CorrelationTable::take(uint64_t correlation_id) {
  auto it = pending_.find(correlation_id);
  if (it == pending_.end())
    return optional<Correlation>();

  optional<Correlation> result(std::move(it->second));
  pending_.erase(it);
  return result;
}

}  // namespace ewsb
