#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

// Operator / request identity: a secp256k1 key whose address is the last 20 bytes
// of keccak256(pubkey without the 0x04 prefix).
class Signer {
public:
  explicit Signer(const std::string& private_key_hex);
  // 0x r(32) || s(32) || v(1) over keccak256(message)
  std::string SignMessage(const std::string& message) const;
  const Address& GetAddress() const { return address_; }
  // Address that produced signature_hex over message; throws std::invalid_argument on malformed input
  static Address RecoverAddress(const std::string& message, const std::string& signature_hex);
  static Address AddressFromPublicKey(const std::vector<unsigned char>& pub65);
private:
  std::vector<unsigned char> priv_;
  Address address_;
};
