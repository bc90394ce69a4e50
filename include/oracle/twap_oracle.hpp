#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/clock.hpp"
#include "pool/liquidity_pool.hpp"
#include "substrate/state_participant.hpp"

struct Observation {
  Timestamp timestamp = 0;
  U256 price0_cumulative = 0;
  U256 price1_cumulative = 0;
};

// Two slots per pair; older.timestamp <= newer.timestamp
struct ObservationSlots {
  std::optional<Observation> older;
  std::optional<Observation> newer;
};

struct ObservationInfo {
  bool has_observations = false;
  Timestamp older_timestamp = 0;
  Timestamp newer_timestamp = 0;
  uint64_t elapsed = 0; // seconds since the newer observation
};

// Which side of the pair is being priced
enum class PriceSide { Token0, Token1 };

// Manipulation-resistant time-weighted average price over LiquidityPool accumulators.
class TimeWeightedPriceOracle : public StateParticipant {
public:
  static constexpr uint64_t kPeriodSeconds = 30 * 60;

  explicit TimeWeightedPriceOracle(const Clock& clock, uint64_t period_s = kPeriodSeconds);

  void TrackPair(std::shared_ptr<LiquidityPool> pool);
  std::vector<std::string> TrackedPairs() const;
  const LiquidityPool& Pool(const std::string& pair) const;

  // First call stores the newer slot; later calls shift only once PERIOD has
  // elapsed since the newer slot. Returns whether a shift happened.
  bool RecordObservationIfDue(const std::string& pair);
  bool NeedsUpdate(const std::string& pair) const;
  bool IsReady(const std::string& pair) const;
  // Raw UQ112x112 average price from the reference observation to now.
  // Throws LedgerError(ObservationNotReady) when no observation is at least PERIOD old.
  U256 ComputeAverage(const std::string& pair, PriceSide side = PriceSide::Token0) const;
  // Average rescaled to 18 decimals: avg * 10^(18 + base_decimals) / (10^quote_decimals * 2^112)
  U256 PriceInUnits(const std::string& pair, unsigned base_decimals, unsigned quote_decimals,
                    PriceSide side = PriceSide::Token0) const;
  ObservationInfo GetObservationInfo(const std::string& pair) const;
  ObservationSlots Slots(const std::string& pair) const;
  uint64_t Period() const { return period_s_; }

  // Accumulators as they would read if the pool synced right now
  CumulativePrices CurrentCumulative(const LiquidityPool& pool) const;

  std::string ParticipantName() const override { return "twap"; }
  nlohmann::json Snapshot() const override;
  void Restore(const nlohmann::json& snapshot) override;
private:
  struct TrackedPair {
    std::shared_ptr<LiquidityPool> pool;
    ObservationSlots slots;
  };
  const TrackedPair& Find(const std::string& pair) const;
  TrackedPair& Find(const std::string& pair);
  std::optional<Observation> SelectReference(const ObservationSlots& slots, Timestamp now) const;

  const Clock& clock_;
  uint64_t period_s_;
  std::map<std::string, TrackedPair> pairs_;
};
