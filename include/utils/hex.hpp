#pragma once
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include <stdexcept>

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

inline bool IsHexDigits(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

// Accepts 0x-prefixed or bare hex; throws std::invalid_argument on odd length or non-hex input
inline std::vector<unsigned char> HexToBytes(const std::string& hex) {
  std::string digits = Strip0x(hex);
  if (digits.size() % 2 != 0 || !IsHexDigits(digits)) throw std::invalid_argument("malformed hex string");
  auto val = [](char c)->int{ if (c>='0'&&c<='9') return c-'0'; if (c>='a'&&c<='f') return 10+c-'a'; return 10+c-'A'; };
  std::vector<unsigned char> out; out.reserve(digits.size() / 2);
  for (size_t i = 0; i + 1 < digits.size(); i += 2) {
    out.push_back(static_cast<unsigned char>((val(digits[i]) << 4) | val(digits[i+1])));
  }
  return out;
}

inline std::string BytesToHex0x(const unsigned char* data, size_t len) {
  static const char* hex = "0123456789abcdef";
  std::string out; out.reserve(len * 2 + 2); out += "0x";
  for (size_t i = 0; i < len; ++i) { unsigned char b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
  return out;
}

inline std::string BytesToHex0x(const std::vector<unsigned char>& data) {
  return BytesToHex0x(data.data(), data.size());
}
