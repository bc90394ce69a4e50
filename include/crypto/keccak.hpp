#pragma once
#include <array>
#include <string>

namespace Crypto {
  using Digest32 = std::array<unsigned char, 32>;
  // keccak256 (pre-NIST padding) of the input interpreted as raw bytes
  Digest32 Keccak256(const std::string& raw);
  // Returns 0x-prefixed hex keccak256 hash of the input interpreted as raw bytes
  std::string Keccak256Raw(const std::string& raw);
  // Returns 0x-prefixed hex keccak256 of hex-encoded input (0x-hex or hex)
  std::string Keccak256Hex(const std::string& hex_input);
}
