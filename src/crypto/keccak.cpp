#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <cryptopp/keccak.h>

namespace Crypto {
  Digest32 Keccak256(const std::string& raw) {
    CryptoPP::Keccak_256 hash;
    Digest32 digest{};
    hash.CalculateDigest(digest.data(), reinterpret_cast<const CryptoPP::byte*>(raw.data()), raw.size());
    return digest;
  }

  std::string Keccak256Raw(const std::string& raw) {
    auto digest = Keccak256(raw);
    return BytesToHex0x(digest.data(), digest.size());
  }

  std::string Keccak256Hex(const std::string& hex_input) {
    auto bytes = HexToBytes(hex_input);
    return Keccak256Raw(std::string(bytes.begin(), bytes.end()));
  }
}
