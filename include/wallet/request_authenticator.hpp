#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

class Signer;

namespace RequestAuth {
  // Request without its "signature" member, keys sorted, no whitespace
  std::string CanonicalPayload(const nlohmann::json& request);
  // Returns a copy of request carrying "signature"
  nlohmann::json Sign(const nlohmann::json& request, const Signer& signer);
  // Throws LedgerError(Unauthorized) unless the signature recovers to expected_caller.
  // A missing signature passes only when required is false.
  void Verify(const nlohmann::json& request, const Address& expected_caller, bool required);
  // The "nonce" member of a signed request; throws LedgerError(Unauthorized) when absent or not unsigned
  uint64_t Nonce(const nlohmann::json& request);
}
