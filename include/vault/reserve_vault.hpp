#pragma once
#include <optional>
#include "common/types.hpp"
#include "math/fixed_point.hpp"
#include "protocols/token_ledger.hpp"

struct VaultBalances {
  U256 reserve = 0;
  U256 backstop = 0;
  U256 stable_held = 0;
};

// Custody of the reserve asset, the backstop reserve and collected Stable fees.
// Only the engine bound at wiring time may move funds.
class ReserveVault {
public:
  ReserveVault(const Address& account, TokenLedger& reserve, TokenLedger& backstop, TokenLedger& stable);

  // Once, at wiring time; a second bind is a std::logic_error
  void BindEngine(const Address& engine);
  const Address& Account() const { return account_; }

  // Pulls reserve from `from` using the engine's allowance
  void DepositReserve(const Address& caller, const Address& from, const U256& amount);
  void WithdrawReserve(const Address& caller, const Address& to, const U256& amount);
  // Pays out of the backstop reserve in full or throws LedgerError(InsufficientFunds)
  void Compensate(const Address& caller, const Address& recipient, const U256& backstop_amount);
  // Moves Stable held by `from` (engine custody) into the vault
  void CollectStableFee(const Address& caller, const Address& from, const U256& amount);

  VaultBalances Balances() const;
private:
  void RequireEngine(const Address& caller, const char* action) const;

  Address account_;
  std::optional<Address> engine_;
  TokenLedger& reserve_;
  TokenLedger& backstop_;
  TokenLedger& stable_;
};
