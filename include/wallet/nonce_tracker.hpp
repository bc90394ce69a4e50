#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include "common/types.hpp"

// Per-caller sequence for signed requests. Each caller starts at 0 and a
// request is accepted only with the caller's next nonce.
class NonceTracker {
public:
  uint64_t Expected(const Address& caller) const;
  // Throws LedgerError(Unauthorized) unless nonce is the expected one, then advances it
  void Consume(const Address& caller, uint64_t nonce);
private:
  mutable std::mutex mutex_;
  std::map<Address, uint64_t> next_;
};
