#pragma once
#include "common/clock.hpp"
#include "common/types.hpp"
#include "math/fixed_point.hpp"

// Validated USD price, 18 decimals. Computed per request, never stored.
struct TrustedPrice {
  Asset asset = Asset::Reserve;
  U256 value = 0;
  Timestamp as_of = 0;
};

class TrustedPriceSource {
public:
  virtual ~TrustedPriceSource() = default;
  virtual TrustedPrice GetTrustedPrice(Asset asset) const = 0;
};
