#include "math/fixed_point.hpp"
#include <array>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace FixedPoint {
  namespace {
    const std::array<U256, 78>& Pow10Table() {
      static const std::array<U256, 78> table = []{
        std::array<U256, 78> t;
        t[0] = 1;
        for (size_t i = 1; i < t.size(); ++i) t[i] = t[i - 1] * 10;
        return t;
      }();
      return table;
    }

    U256 Narrow(const U512& wide) {
      if (wide > U512(MaxU256())) throw std::overflow_error("fixed point result exceeds 256 bits");
      return U256(wide);
    }
  }

  const U256& Wad() {
    static const U256 wad = Pow10(kWadDecimals);
    return wad;
  }

  const U256& MaxU256() {
    static const U256 max = std::numeric_limits<U256>::max();
    return max;
  }

  const U256& Q112() {
    static const U256 q = U256(1) << kQ112Bits;
    return q;
  }

  U256 Pow10(unsigned exponent) {
    if (exponent >= Pow10Table().size()) throw std::overflow_error("10^" + std::to_string(exponent) + " exceeds 256 bits");
    return Pow10Table()[exponent];
  }

  U256 MulDiv(const U256& a, const U256& b, const U256& d) {
    if (d == 0) throw std::domain_error("division by zero in MulDiv");
    U512 product = U512(a) * U512(b);
    return Narrow(product / U512(d));
  }

  U256 WadMul(const U256& a, const U256& b) { return MulDiv(a, b, Wad()); }

  U256 WadDiv(const U256& a, const U256& b) { return MulDiv(a, Wad(), b); }

  U256 RatioWad(const U256& a, const U256& b, const U256& c, const U256& d) {
    U512 denominator = U512(c) * U512(d);
    if (denominator == 0) throw std::domain_error("division by zero in RatioWad");
    // split into quotient and remainder so a * b * 1e18 never has to fit in 512 bits
    U512 numerator = U512(a) * U512(b);
    U512 quotient = numerator / denominator;
    U512 remainder = numerator % denominator;
    U512 scaled = quotient * U512(Wad()) + (remainder * U512(Wad())) / denominator;
    return Narrow(scaled);
  }

  U256 ApplyBps(const U256& amount, uint64_t bps) { return MulDiv(amount, U256(bps), U256(kBpsDenominator)); }

  U256 AbsDiff(const U256& a, const U256& b) { return a >= b ? U256(a - b) : U256(b - a); }

  U256 DeviationBps(const U256& a, const U256& reference) {
    if (reference == 0) throw std::domain_error("deviation against a zero reference");
    return MulDiv(AbsDiff(a, reference), U256(kBpsDenominator), reference);
  }

  U256 Rescale(const U256& amount, unsigned from_decimals, unsigned to_decimals) {
    if (from_decimals == to_decimals) return amount;
    if (to_decimals > from_decimals) return amount * Pow10(to_decimals - from_decimals);
    return amount / Pow10(from_decimals - to_decimals);
  }

  U256 EncodeQ112(const U256& numerator, const U256& denominator) {
    return MulDiv(numerator, Q112(), denominator);
  }

  U256 ParseDecimal(const std::string& text, unsigned decimals) {
    size_t i = 0;
    if (i < text.size() && text[i] == '+') ++i;
    U256 integer = 0;
    U256 fraction = 0;
    unsigned fraction_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;
    try {
      for (; i < text.size(); ++i) {
        char c = text[i];
        if (c == '.' && !seen_point) { seen_point = true; continue; }
        if (!std::isdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("malformed decimal: '" + text + "'");
        seen_digit = true;
        unsigned digit = static_cast<unsigned>(c - '0');
        if (!seen_point) {
          integer = integer * 10 + digit;
        } else if (fraction_digits < decimals) {
          fraction = fraction * 10 + digit;
          ++fraction_digits;
        }
      }
      if (!seen_digit) throw std::invalid_argument("malformed decimal: '" + text + "'");
      return integer * Pow10(decimals) + fraction * Pow10(decimals - fraction_digits);
    } catch (const std::overflow_error&) {
      throw std::invalid_argument("decimal out of range: '" + text + "'");
    }
  }

  std::string FormatDecimal(const U256& value, unsigned decimals, unsigned max_fraction_digits) {
    if (decimals == 0) return value.str();
    const U256 unit = Pow10(decimals);
    std::string integer = U256(value / unit).str();
    std::string fraction = U256(value % unit).str();
    fraction.insert(0, decimals - fraction.size(), '0');
    if (fraction.size() > max_fraction_digits) fraction.resize(max_fraction_digits);
    while (!fraction.empty() && fraction.back() == '0') fraction.pop_back();
    return fraction.empty() ? integer : integer + "." + fraction;
  }

  U256 ParseInteger(const std::string& text) {
    if (text.empty()) throw std::invalid_argument("empty integer");
    bool hex = text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0;
    size_t start = hex ? 2 : 0;
    if (start == text.size()) throw std::invalid_argument("malformed integer: '" + text + "'");
    for (size_t i = start; i < text.size(); ++i) {
      unsigned char c = static_cast<unsigned char>(text[i]);
      if (hex ? !std::isxdigit(c) : !std::isdigit(c)) throw std::invalid_argument("malformed integer: '" + text + "'");
    }
    try {
      return U256(text.c_str());
    } catch (const std::runtime_error&) {
      // wider than 256 bits
      throw std::invalid_argument("integer out of range: '" + text + "'");
    }
  }

  double ToDouble(const U256& value, unsigned decimals) {
    return value.convert_to<double>() / std::pow(10.0, static_cast<double>(decimals));
  }
}
