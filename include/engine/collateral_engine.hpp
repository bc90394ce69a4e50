#pragma once
#include <cstdint>
#include <deque>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "engine/collateral_position.hpp"
#include "engine/transitions.hpp"
#include "governance/ownership.hpp"
#include "governance/parameter_store.hpp"
#include "oracle/trusted_price.hpp"
#include "protocols/token_ledger.hpp"
#include "substrate/state_participant.hpp"
#include "vault/reserve_vault.hpp"

struct MintResult {
  U256 reserve_in = 0;
  U256 gross_stable = 0;
  U256 fee = 0;
  U256 stable_minted = 0; // net, to the caller
  U256 reserve_price = 0;
  U256 unit_price = 0;
};

struct BondRedemptionResult {
  U256 bond_burned = 0;
  U256 stable_out = 0;
  U256 cap = 0;
};

struct BondRequest {
  uint64_t ticket = 0;
  Address caller;
  U256 amount = 0;
  Timestamp enqueued_at = 0;
};

struct BondQueueOutcome {
  uint64_t ticket = 0;
  Address caller;
  U256 amount = 0;
  bool served = false;
  std::string error; // set when the request was dropped
};

struct CollateralEngineWiring {
  Address account;        // engine custody account and allowance spender
  Address owner;
  TokenLedger& reserve;
  TokenLedger& stable;
  TokenLedger& bond;
  ReserveVault& vault;
  const TrustedPriceSource& prices;
  const ParameterSource& params;
  const Clock& clock;
};

// Mint/redeem orchestration over the collateral position. Prices come from the
// TrustedPriceSource, amounts from the pure Quote* transitions, and every token
// movement goes through the ledgers and the vault.
class CollateralEngine : public StateParticipant {
public:
  explicit CollateralEngine(const CollateralEngineWiring& wiring);

  MintResult Mint(const Address& caller, const U256& reserve_amount);
  RedemptionQuote Redeem(const Address& caller, const U256& stable_amount);
  BondRedemptionResult RedeemBond(const Address& caller, const U256& bond_amount);

  // Read-only previews with current prices
  U256 CollateralRatio() const;
  RedemptionQuote QuoteRedeem(const U256& stable_amount) const;
  U256 CurrentBondRedemptionCap() const;

  // FIFO bond redemption
  uint64_t EnqueueBondRedemption(const Address& caller, const U256& bond_amount);
  // Serves at most max_requests in arrival order, stopping at the first one that does
  // not fit under the cap. Requests the caller can no longer fund are dropped.
  std::vector<BondQueueOutcome> ProcessBondQueue(size_t max_requests);
  size_t PendingBondRequests() const { return bond_queue_.size(); }
  std::vector<BondRequest> PendingBondQueue() const;

  void Pause(const Address& caller);
  void Unpause(const Address& caller);
  bool IsPaused() const { return paused_; }

  const CollateralPosition& Position() const { return position_; }
  // Used when loading persisted state
  void LoadPosition(const CollateralPosition& position) { position_ = position; }
  const Address& Account() const { return account_; }
  Ownership& OwnershipRole() { return ownership_; }
  const Ownership& OwnershipRole() const { return ownership_; }

  std::string ParticipantName() const override { return "engine"; }
  nlohmann::json Snapshot() const override;
  void Restore(const nlohmann::json& snapshot) override;
private:
  void RequireNotPaused(const char* action) const;
  // InsufficientFunds / InsufficientAllowance before any mutation
  void RequirePull(const TokenLedger& ledger, const Address& owner, const U256& amount) const;
  RedemptionInputs BuildRedemptionInputs(const U256& stable_amount) const;
  BondRedemptionResult ExecuteBondRedemption(const Address& caller, const U256& bond_amount);

  Address account_;
  Ownership ownership_;
  TokenLedger& reserve_;
  TokenLedger& stable_;
  TokenLedger& bond_;
  ReserveVault& vault_;
  const TrustedPriceSource& prices_;
  const ParameterSource& params_;
  const Clock& clock_;

  CollateralPosition position_;
  bool paused_ = false;
  bool entered_ = false;
  std::deque<BondRequest> bond_queue_;
  uint64_t next_ticket_ = 1;
};
