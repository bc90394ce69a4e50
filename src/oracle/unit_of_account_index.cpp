#include "oracle/unit_of_account_index.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <sstream>
#include <stdexcept>
#include <vector>

UnitOfAccountIndex::UnitOfAccountIndex(const Address& owner, std::shared_ptr<PriceFeedAdapter> pce_feed,
                                       const Clock& clock, const U256& initial_value)
  : ownership_(owner), pce_feed_(std::move(pce_feed)), clock_(clock), initial_value_(initial_value), value_(initial_value) {
  if (!pce_feed_) throw std::invalid_argument("unit of account index needs a PCE feed");
  if (initial_value_ == 0) throw std::invalid_argument("unit of account index must start above zero");
}

bool UnitOfAccountIndex::IsUpdaterAuthorized(const Address& account) const {
  if (ownership_.IsOwner(account)) return true;
  if (!whitelist_enabled_) return false;
  return updaters_.count(NormalizeAddress(account)) > 0;
}

void UnitOfAccountIndex::SetUpdaterAuthorization(const Address& caller, const Address& account, bool authorized) {
  ownership_.RequireOwner(caller, "manage index updaters");
  if (authorized) updaters_.insert(NormalizeAddress(account));
  else updaters_.erase(NormalizeAddress(account));
}

void UnitOfAccountIndex::SetWhitelistEnabled(const Address& caller, bool enabled) {
  ownership_.RequireOwner(caller, "toggle the updater whitelist");
  whitelist_enabled_ = enabled;
}

IndexUpdate UnitOfAccountIndex::Update(const Address& caller) {
  if (!IsUpdaterAuthorized(caller)) throw LedgerError(ErrorCode::Unauthorized, caller + " may not update the index");
  FeedReading pce = pce_feed_->Read();
  if (pce_base_ == 0) pce_base_ = pce.value;
  value_ = FixedPoint::MulDiv(initial_value_, pce.value, pce_base_);
  last_updated_ = clock_.Now();
  IndexUpdate update{last_updated_, value_, pce.value};
  history_.push_back(update);
  if (history_.size() > kMaxHistory) history_.pop_front();

  BITRES_LOG_INFO("unit of account index updated to " + FixedPoint::FormatDecimal(value_, 18, 6));
  StructuredLogger::Instance().Emit("index_updated", {
    {"value", value_.str()}, {"pce", pce.value.str()}, {"caller", caller}
  });
  return update;
}

IndexUpdate UnitOfAccountIndex::LatestUpdate() const {
  if (history_.empty()) throw LedgerError(ErrorCode::InvalidParameter, "unit of account index has no updates yet");
  return history_.back();
}

std::string UnitOfAccountIndex::FormattedInfo() const {
  std::ostringstream oss;
  oss << "Unit: " << FixedPoint::FormatDecimal(value_, 18, 6)
      << " | Target: " << FixedPoint::FormatDecimal(kTargetAnnualInflationBps, 2, 2) << "% annual"
      << " | Change since base: ";
  // percent with two decimals, from the WAD ratio value / initial
  const U256 ratio = FixedPoint::WadDiv(value_, initial_value_);
  const U256& wad = FixedPoint::Wad();
  const bool up = ratio >= wad;
  const U256 delta_bps = FixedPoint::MulDiv(FixedPoint::AbsDiff(ratio, wad), U256(FixedPoint::kBpsDenominator), wad);
  oss << (up ? "+" : "-") << FixedPoint::FormatDecimal(delta_bps, 2, 2) << "%";
  return oss.str();
}

nlohmann::json UnitOfAccountIndex::Snapshot() const {
  nlohmann::json history = nlohmann::json::array();
  for (const auto& h : history_) {
    history.push_back({{"timestamp", h.timestamp}, {"value", h.value.str()}, {"pce", h.pce.str()}});
  }
  return {
    {"ownership", ownership_.ToJson()},
    {"value", value_.str()},
    {"pce_base", pce_base_.str()},
    {"last_updated", last_updated_},
    {"whitelist_enabled", whitelist_enabled_},
    {"updaters", std::vector<std::string>(updaters_.begin(), updaters_.end())},
    {"history", history}
  };
}

void UnitOfAccountIndex::Restore(const nlohmann::json& snapshot) {
  ownership_.FromJson(snapshot.at("ownership"));
  value_ = FixedPoint::ParseInteger(snapshot.at("value").get<std::string>());
  pce_base_ = FixedPoint::ParseInteger(snapshot.at("pce_base").get<std::string>());
  last_updated_ = snapshot.at("last_updated").get<Timestamp>();
  whitelist_enabled_ = snapshot.at("whitelist_enabled").get<bool>();
  updaters_.clear();
  for (const auto& u : snapshot.at("updaters")) updaters_.insert(u.get<std::string>());
  history_.clear();
  for (const auto& h : snapshot.at("history")) {
    history_.push_back(IndexUpdate{h.at("timestamp").get<Timestamp>(),
                                   FixedPoint::ParseInteger(h.at("value").get<std::string>()),
                                   FixedPoint::ParseInteger(h.at("pce").get<std::string>())});
    if (history_.size() > kMaxHistory) history_.pop_front();
  }
}
