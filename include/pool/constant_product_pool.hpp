#pragma once
#include <string>
#include "pool/liquidity_pool.hpp"
#include "substrate/state_participant.hpp"

struct PoolToken {
  std::string symbol;
  unsigned decimals = 18;
};

// x*y=k pool with a 0.3% input fee. Accumulators advance on every reserve
// change using the price that held since the previous sync.
class ConstantProductPool : public LiquidityPool, public StateParticipant {
public:
  ConstantProductPool(std::string pair_id, PoolToken token0, PoolToken token1, const Clock& clock);

  const std::string& PairId() const override { return pair_id_; }
  unsigned Token0Decimals() const override { return token0_.decimals; }
  unsigned Token1Decimals() const override { return token1_.decimals; }
  CumulativePrices CumulativePriceAccumulators() const override { return cumulative_; }
  PoolReserves Reserves() const override { return reserves_; }
  Timestamp LastSyncTime() const override { return last_sync_; }

  const PoolToken& Token0() const { return token0_; }
  const PoolToken& Token1() const { return token1_; }

  // Replaces reserves (liquidity add/remove or external sync)
  void SetReserves(const U256& reserve0, const U256& reserve1);
  // Folds the elapsed time into the accumulators without changing reserves
  void Sync();
  // Constant product quote with 0.3% fee; 0 when the pool is empty
  U256 QuoteOut(bool zero_for_one, const U256& amount_in) const;
  // Executes a swap and returns the amount out; throws LedgerError(ZeroAmount) for dust
  U256 Swap(bool zero_for_one, const U256& amount_in);
  // token0 spot price in token1, 18 decimals
  U256 SpotPrice0() const;

  std::string ParticipantName() const override { return "pool:" + pair_id_; }
  nlohmann::json Snapshot() const override;
  void Restore(const nlohmann::json& snapshot) override;
private:
  void Update(const U256& reserve0, const U256& reserve1);

  std::string pair_id_;
  PoolToken token0_;
  PoolToken token1_;
  const Clock& clock_;
  PoolReserves reserves_;
  CumulativePrices cumulative_;
  Timestamp last_sync_ = 0;
};
