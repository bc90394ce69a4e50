#include "protocols/in_memory_token_ledger.hpp"
#include "common/errors.hpp"
#include "math/fixed_point.hpp"

InMemoryTokenLedger::InMemoryTokenLedger(std::string symbol, unsigned decimals)
  : symbol_(std::move(symbol)), decimals_(decimals) {}

std::string InMemoryTokenLedger::AllowanceKey(const Address& owner, const Address& spender) {
  return NormalizeAddress(owner) + '|' + NormalizeAddress(spender);
}

U256 InMemoryTokenLedger::BalanceOf(const Address& account) const {
  auto it = balances_.find(NormalizeAddress(account));
  return it == balances_.end() ? U256(0) : it->second;
}

U256 InMemoryTokenLedger::Allowance(const Address& owner, const Address& spender) const {
  auto it = allowances_.find(AllowanceKey(owner, spender));
  return it == allowances_.end() ? U256(0) : it->second;
}

void InMemoryTokenLedger::Debit(const Address& account, const U256& amount) {
  U256& balance = balances_[NormalizeAddress(account)];
  if (balance < amount) {
    throw LedgerError(ErrorCode::InsufficientFunds, symbol_ + " balance of " + account + " is " +
                      FixedPoint::FormatDecimal(balance, decimals_) + ", needs " + FixedPoint::FormatDecimal(amount, decimals_));
  }
  balance -= amount;
}

void InMemoryTokenLedger::Credit(const Address& account, const U256& amount) {
  balances_[NormalizeAddress(account)] += amount;
}

void InMemoryTokenLedger::TransferIn(const Address& spender, const Address& from, const Address& to, const U256& amount) {
  const bool spends_allowance = NormalizeAddress(spender) != NormalizeAddress(from);
  const U256 allowed = spends_allowance ? Allowance(from, spender) : U256(0);
  if (spends_allowance && allowed < amount) {
    throw LedgerError(ErrorCode::InsufficientAllowance, symbol_ + " allowance " + from + " -> " + spender + " is " +
                      FixedPoint::FormatDecimal(allowed, decimals_) + ", needs " + FixedPoint::FormatDecimal(amount, decimals_));
  }
  Debit(from, amount);
  Credit(to, amount);
  // an unlimited approval is never drawn down
  if (spends_allowance && allowed != FixedPoint::MaxU256()) allowances_[AllowanceKey(from, spender)] = allowed - amount;
}

void InMemoryTokenLedger::TransferOut(const Address& from, const Address& to, const U256& amount) {
  Debit(from, amount);
  Credit(to, amount);
}

void InMemoryTokenLedger::Mint(const Address& to, const U256& amount) {
  total_supply_ += amount;
  Credit(to, amount);
}

void InMemoryTokenLedger::Burn(const Address& from, const U256& amount) {
  Debit(from, amount);
  total_supply_ -= amount;
}

void InMemoryTokenLedger::Approve(const Address& owner, const Address& spender, const U256& amount) {
  allowances_[AllowanceKey(owner, spender)] = amount;
}

nlohmann::json InMemoryTokenLedger::Snapshot() const {
  nlohmann::json balances = nlohmann::json::object();
  for (const auto& kv : balances_) {
    if (kv.second != 0) balances[kv.first] = kv.second.str();
  }
  nlohmann::json allowances = nlohmann::json::object();
  for (const auto& kv : allowances_) allowances[kv.first] = kv.second.str();
  return {{"total_supply", total_supply_.str()}, {"balances", balances}, {"allowances", allowances}};
}

void InMemoryTokenLedger::Restore(const nlohmann::json& snapshot) {
  total_supply_ = FixedPoint::ParseInteger(snapshot.at("total_supply").get<std::string>());
  balances_.clear();
  for (const auto& item : snapshot.at("balances").items()) {
    balances_[item.key()] = FixedPoint::ParseInteger(item.value().get<std::string>());
  }
  allowances_.clear();
  for (const auto& item : snapshot.at("allowances").items()) {
    allowances_[item.key()] = FixedPoint::ParseInteger(item.value().get<std::string>());
  }
}
