#pragma once
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

struct NoPendingTransfer {};
struct PendingTransfer { Address candidate; };

// Two-step ownership: the owner proposes, the candidate accepts.
class Ownership {
public:
  explicit Ownership(const Address& owner);

  const Address& Owner() const { return owner_; }
  std::optional<Address> PendingOwner() const;
  bool IsOwner(const Address& account) const;
  // Throws LedgerError(Unauthorized) naming the action
  void RequireOwner(const Address& caller, const std::string& action) const;

  // Replaces any earlier proposal
  void TransferOwnership(const Address& caller, const Address& candidate);
  // Only the pending candidate; NoPendingOwner when nothing is proposed
  void AcceptOwnership(const Address& caller);
  void CancelTransfer(const Address& caller);

  nlohmann::json ToJson() const;
  void FromJson(const nlohmann::json& j);
private:
  Address owner_;
  std::variant<NoPendingTransfer, PendingTransfer> state_;
};
