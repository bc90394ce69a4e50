#include "wallet/signer.hpp"
#include "crypto/keccak.hpp"
#include "crypto/secp256k1.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

static std::vector<unsigned char> MessageDigest(const std::string& message) {
  auto digest = Crypto::Keccak256(message);
  return std::vector<unsigned char>(digest.begin(), digest.end());
}

Signer::Signer(const std::string& private_key_hex) {
  if (private_key_hex.empty()) throw std::invalid_argument("empty private key");
  priv_ = HexToBytes(private_key_hex);
  if (priv_.size() != 32) throw std::invalid_argument("invalid private key length");
  address_ = AddressFromPublicKey(Crypto::PublicKeyFromPrivate(priv_));
}

Address Signer::AddressFromPublicKey(const std::vector<unsigned char>& pub65) {
  if (pub65.size() != 65 || pub65[0] != 0x04) throw std::invalid_argument("expected uncompressed public key");
  // keccak256 of pubkey[1:] (skip 0x04), last 20 bytes
  auto hash = Crypto::Keccak256(std::string(reinterpret_cast<const char*>(&pub65[1]), pub65.size() - 1));
  return BytesToHex0x(hash.data() + 12, 20);
}

std::string Signer::SignMessage(const std::string& message) const {
  auto sig = Crypto::SignDigest(priv_, MessageDigest(message));
  std::vector<unsigned char> packed(sig.r);
  packed.insert(packed.end(), sig.s.begin(), sig.s.end());
  packed.push_back(sig.v);
  return BytesToHex0x(packed);
}

Address Signer::RecoverAddress(const std::string& message, const std::string& signature_hex) {
  auto packed = HexToBytes(signature_hex);
  if (packed.size() != 65) throw std::invalid_argument("signature must be 65 bytes");
  Crypto::Signature sig;
  sig.r.assign(packed.begin(), packed.begin() + 32);
  sig.s.assign(packed.begin() + 32, packed.begin() + 64);
  sig.v = packed[64];
  return AddressFromPublicKey(Crypto::RecoverPublicKey(sig, MessageDigest(message)));
}
