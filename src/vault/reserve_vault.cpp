#include "vault/reserve_vault.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <stdexcept>

ReserveVault::ReserveVault(const Address& account, TokenLedger& reserve, TokenLedger& backstop, TokenLedger& stable)
  : account_(NormalizeAddress(account)), reserve_(reserve), backstop_(backstop), stable_(stable) {}

void ReserveVault::BindEngine(const Address& engine) {
  if (engine_) throw std::logic_error("vault already bound to engine " + *engine_);
  engine_ = NormalizeAddress(engine);
  BITRES_LOG_INFO("vault " + account_ + " bound to engine " + *engine_);
}

void ReserveVault::RequireEngine(const Address& caller, const char* action) const {
  if (!engine_ || NormalizeAddress(caller) != *engine_) {
    throw LedgerError(ErrorCode::Unauthorized, caller + " may not " + action + " from the vault");
  }
}

void ReserveVault::DepositReserve(const Address& caller, const Address& from, const U256& amount) {
  RequireEngine(caller, "deposit reserve");
  reserve_.TransferIn(*engine_, from, account_, amount);
}

void ReserveVault::WithdrawReserve(const Address& caller, const Address& to, const U256& amount) {
  RequireEngine(caller, "withdraw reserve");
  const U256 held = reserve_.BalanceOf(account_);
  if (held < amount) {
    throw LedgerError(ErrorCode::InsufficientFunds, "vault holds " + FixedPoint::FormatDecimal(held, reserve_.Decimals()) +
                      " " + reserve_.Symbol() + ", withdrawal needs " + FixedPoint::FormatDecimal(amount, reserve_.Decimals()));
  }
  reserve_.TransferOut(account_, to, amount);
}

void ReserveVault::Compensate(const Address& caller, const Address& recipient, const U256& backstop_amount) {
  RequireEngine(caller, "draw backstop");
  const U256 held = backstop_.BalanceOf(account_);
  if (held < backstop_amount) {
    throw LedgerError(ErrorCode::InsufficientFunds, "backstop reserve holds " + FixedPoint::FormatDecimal(held, backstop_.Decimals()) +
                      " " + backstop_.Symbol() + ", compensation needs " + FixedPoint::FormatDecimal(backstop_amount, backstop_.Decimals()));
  }
  backstop_.TransferOut(account_, recipient, backstop_amount);
  BITRES_LOG_INFO("backstop compensation of " + FixedPoint::FormatDecimal(backstop_amount, backstop_.Decimals()) + " to " + recipient);
}

void ReserveVault::CollectStableFee(const Address& caller, const Address& from, const U256& amount) {
  RequireEngine(caller, "collect fees");
  stable_.TransferOut(from, account_, amount);
}

VaultBalances ReserveVault::Balances() const {
  return VaultBalances{reserve_.BalanceOf(account_), backstop_.BalanceOf(account_), stable_.BalanceOf(account_)};
}
