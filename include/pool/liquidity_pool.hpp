#pragma once
#include <string>
#include "common/clock.hpp"
#include "math/fixed_point.hpp"

struct PoolReserves {
  U256 reserve0 = 0;
  U256 reserve1 = 0;
};

// Uniswap-V2 style UQ112x112 accumulators, each summing spot price * seconds
struct CumulativePrices {
  U256 price0 = 0; // token0 priced in token1
  U256 price1 = 0; // token1 priced in token0
};

class LiquidityPool {
public:
  virtual ~LiquidityPool() = default;
  virtual const std::string& PairId() const = 0;
  virtual unsigned Token0Decimals() const = 0;
  virtual unsigned Token1Decimals() const = 0;
  virtual CumulativePrices CumulativePriceAccumulators() const = 0;
  virtual PoolReserves Reserves() const = 0;
  virtual Timestamp LastSyncTime() const = 0;
};
