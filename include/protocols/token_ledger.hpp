#pragma once
#include <string>
#include "common/types.hpp"
#include "math/fixed_point.hpp"

// Fungible token ledger consumed by the engine and vault. Implementations throw
// LedgerError(InsufficientFunds / InsufficientAllowance) and leave balances untouched on failure.
class TokenLedger {
public:
  virtual ~TokenLedger() = default;
  virtual const std::string& Symbol() const = 0;
  virtual unsigned Decimals() const = 0;
  virtual U256 BalanceOf(const Address& account) const = 0;
  virtual U256 Allowance(const Address& owner, const Address& spender) const = 0;
  virtual U256 TotalSupply() const = 0;
  // Moves amount from `from` to `to`, spending spender's allowance unless spender == from
  virtual void TransferIn(const Address& spender, const Address& from, const Address& to, const U256& amount) = 0;
  // Moves amount out of an account the caller controls
  virtual void TransferOut(const Address& from, const Address& to, const U256& amount) = 0;
  virtual void Mint(const Address& to, const U256& amount) = 0;
  virtual void Burn(const Address& from, const U256& amount) = 0;
};
