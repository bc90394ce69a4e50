#pragma once
#include <deque>
#include <memory>
#include <set>
#include <string>
#include "common/clock.hpp"
#include "governance/ownership.hpp"
#include "oracle/price_feed_adapter.hpp"
#include "substrate/state_participant.hpp"

struct IndexUpdate {
  Timestamp timestamp = 0;
  U256 value = 0; // WAD
  U256 pce = 0;   // WAD
};

// Inflation-tracking unit of account: value = initial * pce_now / pce_base,
// where pce_base is the first PCE reading taken.
class UnitOfAccountIndex : public StateParticipant {
public:
  static constexpr uint64_t kTargetAnnualInflationBps = 200;
  // Updates kept in history; older ones are dropped
  static constexpr size_t kMaxHistory = 64;

  UnitOfAccountIndex(const Address& owner, std::shared_ptr<PriceFeedAdapter> pce_feed,
                     const Clock& clock, const U256& initial_value = FixedPoint::Wad());

  U256 Current() const { return value_; }
  Timestamp LastUpdated() const { return last_updated_; }
  // Reads the PCE feed and appends to the bounded history. Owner always; whitelisted updaters
  // only while the whitelist is enabled.
  IndexUpdate Update(const Address& caller);

  bool IsUpdaterAuthorized(const Address& account) const;
  void SetUpdaterAuthorization(const Address& caller, const Address& account, bool authorized);
  void SetWhitelistEnabled(const Address& caller, bool enabled);
  bool WhitelistEnabled() const { return whitelist_enabled_; }

  size_t HistoryLength() const { return history_.size(); }
  // Throws LedgerError(InvalidParameter) before the first update
  IndexUpdate LatestUpdate() const;
  // e.g. "Unit: 1.0125 | Target: 2% annual | Change since base: +1.25%"
  std::string FormattedInfo() const;

  Ownership& OwnershipRole() { return ownership_; }

  std::string ParticipantName() const override { return "unit_index"; }
  nlohmann::json Snapshot() const override;
  void Restore(const nlohmann::json& snapshot) override;
private:
  Ownership ownership_;
  std::shared_ptr<PriceFeedAdapter> pce_feed_;
  const Clock& clock_;
  U256 initial_value_;
  U256 value_;
  U256 pce_base_ = 0;
  Timestamp last_updated_ = 0;
  bool whitelist_enabled_ = false;
  std::set<Address> updaters_;
  std::deque<IndexUpdate> history_;
};
