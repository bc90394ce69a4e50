#include "oracle/twap_oracle.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <stdexcept>

static uint64_t Age(Timestamp then, Timestamp now) { return now > then ? now - then : 0; }

TimeWeightedPriceOracle::TimeWeightedPriceOracle(const Clock& clock, uint64_t period_s)
  : clock_(clock), period_s_(period_s) {
  if (period_s_ == 0) throw std::invalid_argument("TWAP period must be positive");
}

void TimeWeightedPriceOracle::TrackPair(std::shared_ptr<LiquidityPool> pool) {
  if (!pool) throw std::invalid_argument("TrackPair: null pool");
  const std::string id = pool->PairId();
  auto it = pairs_.find(id);
  if (it != pairs_.end()) {
    it->second.pool = std::move(pool);
    return;
  }
  pairs_[id] = TrackedPair{std::move(pool), ObservationSlots{}};
  BITRES_LOG_INFO("TWAP tracking pair " + id);
}

std::vector<std::string> TimeWeightedPriceOracle::TrackedPairs() const {
  std::vector<std::string> out;
  out.reserve(pairs_.size());
  for (const auto& kv : pairs_) out.push_back(kv.first);
  return out;
}

const TimeWeightedPriceOracle::TrackedPair& TimeWeightedPriceOracle::Find(const std::string& pair) const {
  auto it = pairs_.find(pair);
  if (it == pairs_.end()) throw LedgerError(ErrorCode::UnknownPair, "pair " + pair + " is not tracked");
  return it->second;
}

TimeWeightedPriceOracle::TrackedPair& TimeWeightedPriceOracle::Find(const std::string& pair) {
  auto it = pairs_.find(pair);
  if (it == pairs_.end()) throw LedgerError(ErrorCode::UnknownPair, "pair " + pair + " is not tracked");
  return it->second;
}

const LiquidityPool& TimeWeightedPriceOracle::Pool(const std::string& pair) const { return *Find(pair).pool; }

CumulativePrices TimeWeightedPriceOracle::CurrentCumulative(const LiquidityPool& pool) const {
  CumulativePrices cumulative = pool.CumulativePriceAccumulators();
  const Timestamp now = clock_.Now();
  const Timestamp last_sync = pool.LastSyncTime();
  if (now > last_sync) {
    const PoolReserves r = pool.Reserves();
    if (r.reserve0 != 0 && r.reserve1 != 0) {
      const uint64_t elapsed = now - last_sync;
      cumulative.price0 += FixedPoint::EncodeQ112(r.reserve1, r.reserve0) * elapsed;
      cumulative.price1 += FixedPoint::EncodeQ112(r.reserve0, r.reserve1) * elapsed;
    }
  }
  return cumulative;
}

bool TimeWeightedPriceOracle::RecordObservationIfDue(const std::string& pair) {
  TrackedPair& tracked = Find(pair);
  const Timestamp now = clock_.Now();
  ObservationSlots& slots = tracked.slots;
  if (slots.newer && Age(slots.newer->timestamp, now) < period_s_) return false;

  const CumulativePrices cumulative = CurrentCumulative(*tracked.pool);
  Observation candidate{now, cumulative.price0, cumulative.price1};
  if (slots.newer) slots.older = slots.newer;
  slots.newer = candidate;

  BITRES_LOG_INFO("observation recorded for " + pair + " at " + std::to_string(now));
  StructuredLogger::Instance().Emit("observation_recorded", {
    {"pair", pair},
    {"timestamp", now},
    {"older_timestamp", slots.older ? slots.older->timestamp : 0}
  });
  return true;
}

bool TimeWeightedPriceOracle::NeedsUpdate(const std::string& pair) const {
  const TrackedPair& tracked = Find(pair);
  if (!tracked.slots.newer) return true;
  return Age(tracked.slots.newer->timestamp, clock_.Now()) >= period_s_;
}

std::optional<Observation> TimeWeightedPriceOracle::SelectReference(const ObservationSlots& slots, Timestamp now) const {
  if (slots.newer && Age(slots.newer->timestamp, now) >= period_s_) return slots.newer;
  if (slots.older && Age(slots.older->timestamp, now) >= period_s_) return slots.older;
  return std::nullopt;
}

bool TimeWeightedPriceOracle::IsReady(const std::string& pair) const {
  const TrackedPair& tracked = Find(pair);
  return SelectReference(tracked.slots, clock_.Now()).has_value();
}

U256 TimeWeightedPriceOracle::ComputeAverage(const std::string& pair, PriceSide side) const {
  const TrackedPair& tracked = Find(pair);
  const Timestamp now = clock_.Now();
  auto reference = SelectReference(tracked.slots, now);
  if (!reference) {
    throw LedgerError(ErrorCode::ObservationNotReady, "no observation for " + pair + " is " + std::to_string(period_s_) + "s old");
  }
  const CumulativePrices current = CurrentCumulative(*tracked.pool);
  const U256& now_cumulative = side == PriceSide::Token0 ? current.price0 : current.price1;
  const U256& ref_cumulative = side == PriceSide::Token0 ? reference->price0_cumulative : reference->price1_cumulative;
  // accumulators only increase
  return (now_cumulative - ref_cumulative) / (now - reference->timestamp);
}

U256 TimeWeightedPriceOracle::PriceInUnits(const std::string& pair, unsigned base_decimals, unsigned quote_decimals,
                                           PriceSide side) const {
  const U256 average = ComputeAverage(pair, side);
  const U256 scale = FixedPoint::Pow10(FixedPoint::kWadDecimals + base_decimals);
  const U512 denominator = U512(FixedPoint::Pow10(quote_decimals)) * U512(FixedPoint::Q112());
  const U512 wide = U512(average) * U512(scale) / denominator;
  if (wide > U512(FixedPoint::MaxU256())) throw std::overflow_error("TWAP price for " + pair + " exceeds 256 bits");
  return U256(wide);
}

ObservationInfo TimeWeightedPriceOracle::GetObservationInfo(const std::string& pair) const {
  const TrackedPair& tracked = Find(pair);
  ObservationInfo info;
  if (!tracked.slots.newer) return info;
  info.has_observations = true;
  info.newer_timestamp = tracked.slots.newer->timestamp;
  info.older_timestamp = tracked.slots.older ? tracked.slots.older->timestamp : 0;
  info.elapsed = Age(info.newer_timestamp, clock_.Now());
  return info;
}

ObservationSlots TimeWeightedPriceOracle::Slots(const std::string& pair) const { return Find(pair).slots; }

static nlohmann::json ObservationToJson(const std::optional<Observation>& o) {
  if (!o) return nullptr;
  return {{"timestamp", o->timestamp},
          {"price0_cumulative", o->price0_cumulative.str()},
          {"price1_cumulative", o->price1_cumulative.str()}};
}

static std::optional<Observation> ObservationFromJson(const nlohmann::json& j) {
  if (j.is_null()) return std::nullopt;
  Observation o;
  o.timestamp = j.at("timestamp").get<Timestamp>();
  o.price0_cumulative = FixedPoint::ParseInteger(j.at("price0_cumulative").get<std::string>());
  o.price1_cumulative = FixedPoint::ParseInteger(j.at("price1_cumulative").get<std::string>());
  return o;
}

nlohmann::json TimeWeightedPriceOracle::Snapshot() const {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& kv : pairs_) {
    out[kv.first] = {{"older", ObservationToJson(kv.second.slots.older)},
                     {"newer", ObservationToJson(kv.second.slots.newer)}};
  }
  return out;
}

void TimeWeightedPriceOracle::Restore(const nlohmann::json& snapshot) {
  for (auto& kv : pairs_) kv.second.slots = ObservationSlots{};
  for (const auto& item : snapshot.items()) {
    auto it = pairs_.find(item.key());
    if (it == pairs_.end()) {
      BITRES_LOG_WARN("ignoring observations for untracked pair " + item.key());
      continue;
    }
    it->second.slots.older = ObservationFromJson(item.value().at("older"));
    it->second.slots.newer = ObservationFromJson(item.value().at("newer"));
  }
}
