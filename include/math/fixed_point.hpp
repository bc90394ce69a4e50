#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <string>

// Checked: overflow and subtraction below zero throw instead of wrapping
using U256 = boost::multiprecision::checked_uint256_t;
using U512 = boost::multiprecision::checked_uint512_t;

namespace FixedPoint {
  constexpr unsigned kWadDecimals = 18;
  constexpr uint64_t kBpsDenominator = 10000;
  constexpr unsigned kQ112Bits = 112;

  // 1e18
  const U256& Wad();
  const U256& MaxU256();
  // 2^112, the UQ112x112 unit
  const U256& Q112();
  // 10^exponent, exponent <= 77
  U256 Pow10(unsigned exponent);

  // floor(a * b / d) with a 512-bit intermediate.
  // Throws std::domain_error when d == 0 and std::overflow_error when the quotient does not fit.
  U256 MulDiv(const U256& a, const U256& b, const U256& d);
  // floor(a * b / 1e18)
  U256 WadMul(const U256& a, const U256& b);
  // floor(a * 1e18 / b)
  U256 WadDiv(const U256& a, const U256& b);
  // floor(a * b * 1e18 / (c * d)), the shape of every value ratio in the ledger
  U256 RatioWad(const U256& a, const U256& b, const U256& c, const U256& d);
  // floor(amount * bps / 10000)
  U256 ApplyBps(const U256& amount, uint64_t bps);
  // |a - b| * 10000 / reference, floored
  U256 DeviationBps(const U256& a, const U256& reference);
  U256 AbsDiff(const U256& a, const U256& b);

  // Rescales an integer amount between decimal precisions, flooring when precision drops
  U256 Rescale(const U256& amount, unsigned from_decimals, unsigned to_decimals);

  // UQ112x112 encoding of numerator / denominator
  U256 EncodeQ112(const U256& numerator, const U256& denominator);

  // Exact decimal text ("50000", "0.98", "+1.5") to a scaled integer; extra fraction digits are floored.
  // Throws std::invalid_argument on anything else, including values wider than 256 bits.
  U256 ParseDecimal(const std::string& text, unsigned decimals = kWadDecimals);
  // Scaled integer to decimal text, trailing zeros trimmed
  std::string FormatDecimal(const U256& value, unsigned decimals = kWadDecimals, unsigned max_fraction_digits = 18);
  // Plain integer text (decimal or 0x-hex); throws std::invalid_argument, also when out of range
  U256 ParseInteger(const std::string& text);
  // Lossy, for telemetry only
  double ToDouble(const U256& value, unsigned decimals = kWadDecimals);
}
