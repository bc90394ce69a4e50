#pragma once
#include <string>
#include <unordered_map>
#include "protocols/token_ledger.hpp"
#include "substrate/state_participant.hpp"

// Reference ledger for tests and replay; balances keyed by normalized address.
class InMemoryTokenLedger : public TokenLedger, public StateParticipant {
public:
  InMemoryTokenLedger(std::string symbol, unsigned decimals);

  const std::string& Symbol() const override { return symbol_; }
  unsigned Decimals() const override { return decimals_; }
  U256 BalanceOf(const Address& account) const override;
  U256 Allowance(const Address& owner, const Address& spender) const override;
  U256 TotalSupply() const override { return total_supply_; }
  void TransferIn(const Address& spender, const Address& from, const Address& to, const U256& amount) override;
  void TransferOut(const Address& from, const Address& to, const U256& amount) override;
  void Mint(const Address& to, const U256& amount) override;
  void Burn(const Address& from, const U256& amount) override;

  void Approve(const Address& owner, const Address& spender, const U256& amount);

  std::string ParticipantName() const override { return "token:" + symbol_; }
  nlohmann::json Snapshot() const override;
  void Restore(const nlohmann::json& snapshot) override;
private:
  static std::string AllowanceKey(const Address& owner, const Address& spender);
  void Debit(const Address& account, const U256& amount);
  void Credit(const Address& account, const U256& amount);

  std::string symbol_;
  unsigned decimals_;
  U256 total_supply_ = 0;
  std::unordered_map<Address, U256> balances_;
  std::unordered_map<std::string, U256> allowances_; // key: owner|spender
};
