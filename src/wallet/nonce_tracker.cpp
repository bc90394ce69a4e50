#include "wallet/nonce_tracker.hpp"
#include "common/errors.hpp"
#include <string>

uint64_t NonceTracker::Expected(const Address& caller) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = next_.find(NormalizeAddress(caller));
  return it == next_.end() ? 0 : it->second;
}

void NonceTracker::Consume(const Address& caller, uint64_t nonce) {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t& next = next_[NormalizeAddress(caller)];
  if (nonce != next) {
    throw LedgerError(ErrorCode::Unauthorized, "nonce " + std::to_string(nonce) + " from " + caller +
                      ", expected " + std::to_string(next));
  }
  ++next;
}
