#include "engine/collateral_engine.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "engine/reentrancy_guard.hpp"
#include "telemetry/structured_logger.hpp"

using FixedPoint::FormatDecimal;

CollateralEngine::CollateralEngine(const CollateralEngineWiring& w)
  : account_(NormalizeAddress(w.account)), ownership_(w.owner), reserve_(w.reserve), stable_(w.stable), bond_(w.bond),
    vault_(w.vault), prices_(w.prices), params_(w.params), clock_(w.clock) {}

void CollateralEngine::RequireNotPaused(const char* action) const {
  if (paused_) throw LedgerError(ErrorCode::Paused, std::string(action) + " is disabled while the engine is paused");
}

void CollateralEngine::RequirePull(const TokenLedger& ledger, const Address& owner, const U256& amount) const {
  const U256 balance = ledger.BalanceOf(owner);
  if (balance < amount) {
    throw LedgerError(ErrorCode::InsufficientFunds, owner + " holds " + FormatDecimal(balance, ledger.Decimals()) + " " +
                      ledger.Symbol() + ", needs " + FormatDecimal(amount, ledger.Decimals()));
  }
  const U256 allowance = ledger.Allowance(owner, account_);
  if (allowance < amount) {
    throw LedgerError(ErrorCode::InsufficientAllowance, owner + " approved " + FormatDecimal(allowance, ledger.Decimals()) + " " +
                      ledger.Symbol() + " to the engine, needs " + FormatDecimal(amount, ledger.Decimals()));
  }
}

MintResult CollateralEngine::Mint(const Address& caller, const U256& reserve_amount) {
  ReentrancyGuard guard(entered_, "mint");
  RequireNotPaused("mint");
  if (reserve_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "mint of zero reserve");
  RequirePull(reserve_, caller, reserve_amount);

  const GovernableParameters params = params_.Current();
  MintInputs in;
  in.reserve_amount = reserve_amount;
  in.reserve_decimals = reserve_.Decimals();
  in.reserve_price = prices_.GetTrustedPrice(Asset::Reserve).value;
  in.unit_price = prices_.GetTrustedPrice(Asset::UnitOfAccount).value;
  in.mint_fee_bps = params.mint_fee_bps;
  const MintQuote quote = QuoteMint(position_, in);

  vault_.DepositReserve(account_, caller, reserve_amount);
  stable_.Mint(caller, quote.net_stable);
  if (quote.fee != 0) stable_.Mint(vault_.Account(), quote.fee);
  position_ = quote.next;

  MintResult result{reserve_amount, quote.gross_stable, quote.fee, quote.net_stable, in.reserve_price, in.unit_price};
  BITRES_LOG_INFO("mint: " + caller + " locked " + FormatDecimal(reserve_amount, in.reserve_decimals) + " " + reserve_.Symbol() +
                  " for " + FormatDecimal(quote.net_stable, 18, 6) + " " + stable_.Symbol() + " (fee " + FormatDecimal(quote.fee, 18, 6) + ")");
  StructuredLogger::Instance().Emit("mint", {
    {"caller", caller},
    {"reserve_in", reserve_amount.str()},
    {"gross_stable", quote.gross_stable.str()},
    {"fee", quote.fee.str()},
    {"net_stable", quote.net_stable.str()},
    {"reserve_price", in.reserve_price.str()},
    {"unit_price", in.unit_price.str()}
  });
  return result;
}

U256 CollateralEngine::CollateralRatio() const {
  if (position_.total_stable_supply_tracked == 0) return FixedPoint::MaxU256();
  return ComputeCollateralRatio(position_, reserve_.Decimals(),
                                prices_.GetTrustedPrice(Asset::Reserve).value,
                                prices_.GetTrustedPrice(Asset::UnitOfAccount).value);
}

RedemptionInputs CollateralEngine::BuildRedemptionInputs(const U256& stable_amount) const {
  const GovernableParameters params = params_.Current();
  RedemptionInputs in;
  in.stable_amount = stable_amount;
  in.reserve_decimals = reserve_.Decimals();
  in.reserve_price = prices_.GetTrustedPrice(Asset::Reserve).value;
  in.unit_price = prices_.GetTrustedPrice(Asset::UnitOfAccount).value;
  in.redeem_fee_bps = params.redeem_fee_bps;
  // bond, backstop and Stable prices only matter below full backing
  const U256 ratio = ComputeCollateralRatio(position_, in.reserve_decimals, in.reserve_price, in.unit_price);
  if (ratio < FixedPoint::Wad()) {
    // the floor is set in Stable, bond prices are quoted in USD
    if (params.bond_floor_price != 0)
      in.bond_floor_price = FixedPoint::WadMul(params.bond_floor_price, prices_.GetTrustedPrice(Asset::Stable).value);
    in.bond_price = prices_.GetTrustedPrice(Asset::Bond).value;
    if (*in.bond_price < in.bond_floor_price) in.backstop_price = prices_.GetTrustedPrice(Asset::Backstop).value;
  }
  return in;
}

RedemptionQuote CollateralEngine::QuoteRedeem(const U256& stable_amount) const {
  if (stable_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "redemption of zero Stable");
  return QuoteRedemption(position_, BuildRedemptionInputs(stable_amount));
}

RedemptionQuote CollateralEngine::Redeem(const Address& caller, const U256& stable_amount) {
  ReentrancyGuard guard(entered_, "redeem");
  RequireNotPaused("redeem");
  if (stable_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "redemption of zero Stable");
  RequirePull(stable_, caller, stable_amount);

  const RedemptionQuote quote = QuoteRedemption(position_, BuildRedemptionInputs(stable_amount));
  const VaultBalances held = vault_.Balances();
  if (quote.reserve_out > held.reserve) {
    throw LedgerError(ErrorCode::InsufficientFunds, "vault reserve " + FormatDecimal(held.reserve, reserve_.Decimals()) +
                      " cannot cover " + FormatDecimal(quote.reserve_out, reserve_.Decimals()));
  }
  if (quote.backstop_out > held.backstop) {
    throw LedgerError(ErrorCode::InsufficientFunds, "backstop reserve " + FormatDecimal(held.backstop) +
                      " cannot cover " + FormatDecimal(quote.backstop_out));
  }

  stable_.TransferIn(account_, caller, account_, stable_amount);
  if (quote.fee != 0) vault_.CollectStableFee(account_, account_, quote.fee);
  stable_.Burn(account_, quote.net_stable);
  if (quote.reserve_out != 0) vault_.WithdrawReserve(account_, caller, quote.reserve_out);
  if (quote.bond_out != 0) bond_.Mint(caller, quote.bond_out);
  if (quote.backstop_out != 0) vault_.Compensate(account_, caller, quote.backstop_out);
  position_ = quote.next;

  BITRES_LOG_INFO("redeem: " + caller + " burned " + FormatDecimal(quote.net_stable, 18, 6) + " " + stable_.Symbol() +
                  " tier=" + RedemptionTierName(quote.tier) + " reserve_out=" + FormatDecimal(quote.reserve_out, reserve_.Decimals()) +
                  " bond_out=" + FormatDecimal(quote.bond_out, 18, 6) + " backstop_out=" + FormatDecimal(quote.backstop_out, 18, 6));
  StructuredLogger::Instance().Emit("redeem", {
    {"caller", caller},
    {"stable_in", stable_amount.str()},
    {"fee", quote.fee.str()},
    {"tier", RedemptionTierName(quote.tier)},
    {"collateral_ratio", quote.collateral_ratio.str()},
    {"reserve_out", quote.reserve_out.str()},
    {"bond_out", quote.bond_out.str()},
    {"backstop_out", quote.backstop_out.str()}
  });
  return quote;
}

U256 CollateralEngine::CurrentBondRedemptionCap() const {
  return BondRedemptionCap(position_, reserve_.Decimals(),
                           prices_.GetTrustedPrice(Asset::Reserve).value,
                           prices_.GetTrustedPrice(Asset::UnitOfAccount).value);
}

BondRedemptionResult CollateralEngine::ExecuteBondRedemption(const Address& caller, const U256& bond_amount) {
  if (bond_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "bond redemption of zero");
  RequirePull(bond_, caller, bond_amount);
  const BondRedemptionQuote quote = QuoteBondRedemption(position_, bond_amount, reserve_.Decimals(),
                                                        prices_.GetTrustedPrice(Asset::Reserve).value,
                                                        prices_.GetTrustedPrice(Asset::UnitOfAccount).value);
  bond_.TransferIn(account_, caller, account_, bond_amount);
  bond_.Burn(account_, bond_amount);
  stable_.Mint(caller, quote.stable_out);
  position_ = quote.next;

  BITRES_LOG_INFO("bond redemption: " + caller + " burned " + FormatDecimal(bond_amount, 18, 6) + " " + bond_.Symbol() +
                  " for " + FormatDecimal(quote.stable_out, 18, 6) + " " + stable_.Symbol());
  StructuredLogger::Instance().Emit("bond_redeemed", {
    {"caller", caller}, {"bond_in", bond_amount.str()}, {"stable_out", quote.stable_out.str()}, {"cap", quote.cap.str()}
  });
  return BondRedemptionResult{bond_amount, quote.stable_out, quote.cap};
}

BondRedemptionResult CollateralEngine::RedeemBond(const Address& caller, const U256& bond_amount) {
  ReentrancyGuard guard(entered_, "redeem_bond");
  RequireNotPaused("bond redemption");
  return ExecuteBondRedemption(caller, bond_amount);
}

uint64_t CollateralEngine::EnqueueBondRedemption(const Address& caller, const U256& bond_amount) {
  ReentrancyGuard guard(entered_, "enqueue_bond");
  RequireNotPaused("bond redemption");
  if (bond_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "bond redemption of zero");
  const uint64_t ticket = next_ticket_++;
  bond_queue_.push_back(BondRequest{ticket, NormalizeAddress(caller), bond_amount, clock_.Now()});
  BITRES_LOG_DEBUG("bond redemption ticket " + std::to_string(ticket) + " queued for " + caller);
  return ticket;
}

std::vector<BondQueueOutcome> CollateralEngine::ProcessBondQueue(size_t max_requests) {
  ReentrancyGuard guard(entered_, "process_bond_queue");
  RequireNotPaused("bond redemption");
  std::vector<BondQueueOutcome> outcomes;
  while (!bond_queue_.empty() && outcomes.size() < max_requests) {
    const BondRequest request = bond_queue_.front();
    BondQueueOutcome outcome{request.ticket, request.caller, request.amount, false, std::string()};
    try {
      ExecuteBondRedemption(request.caller, request.amount);
      outcome.served = true;
    } catch (const LedgerError& e) {
      if (e.Code() == ErrorCode::RedemptionCapExceeded) break;
      if (e.Code() != ErrorCode::InsufficientFunds && e.Code() != ErrorCode::InsufficientAllowance) throw;
      outcome.error = e.what();
      BITRES_LOG_WARN("dropping bond redemption ticket " + std::to_string(request.ticket) + ": " + e.what());
    }
    bond_queue_.pop_front();
    outcomes.push_back(outcome);
  }
  return outcomes;
}

std::vector<BondRequest> CollateralEngine::PendingBondQueue() const {
  return std::vector<BondRequest>(bond_queue_.begin(), bond_queue_.end());
}

void CollateralEngine::Pause(const Address& caller) {
  ownership_.RequireOwner(caller, "pause the engine");
  paused_ = true;
  BITRES_LOG_WARN("engine paused by " + caller);
  StructuredLogger::Instance().Emit("paused", {{"caller", caller}});
}

void CollateralEngine::Unpause(const Address& caller) {
  ownership_.RequireOwner(caller, "unpause the engine");
  paused_ = false;
  BITRES_LOG_INFO("engine unpaused by " + caller);
  StructuredLogger::Instance().Emit("unpaused", {{"caller", caller}});
}

nlohmann::json CollateralEngine::Snapshot() const {
  nlohmann::json queue = nlohmann::json::array();
  for (const auto& r : bond_queue_) {
    queue.push_back({{"ticket", r.ticket}, {"caller", r.caller}, {"amount", r.amount.str()}, {"enqueued_at", r.enqueued_at}});
  }
  return {
    {"position", position_.ToJson()},
    {"paused", paused_},
    {"ownership", ownership_.ToJson()},
    {"bond_queue", queue},
    {"next_ticket", next_ticket_}
  };
}

void CollateralEngine::Restore(const nlohmann::json& snapshot) {
  position_ = CollateralPosition::FromJson(snapshot.at("position"));
  paused_ = snapshot.at("paused").get<bool>();
  ownership_.FromJson(snapshot.at("ownership"));
  bond_queue_.clear();
  for (const auto& r : snapshot.at("bond_queue")) {
    bond_queue_.push_back(BondRequest{r.at("ticket").get<uint64_t>(), r.at("caller").get<std::string>(),
                                      FixedPoint::ParseInteger(r.at("amount").get<std::string>()),
                                      r.at("enqueued_at").get<Timestamp>()});
  }
  next_ticket_ = snapshot.at("next_ticket").get<uint64_t>();
  entered_ = false;
}
