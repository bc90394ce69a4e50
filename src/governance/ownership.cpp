#include "governance/ownership.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"

Ownership::Ownership(const Address& owner) : owner_(NormalizeAddress(owner)), state_(NoPendingTransfer{}) {}

std::optional<Address> Ownership::PendingOwner() const {
  if (auto pending = std::get_if<PendingTransfer>(&state_)) return pending->candidate;
  return std::nullopt;
}

bool Ownership::IsOwner(const Address& account) const { return NormalizeAddress(account) == owner_; }

void Ownership::RequireOwner(const Address& caller, const std::string& action) const {
  if (!IsOwner(caller)) throw LedgerError(ErrorCode::Unauthorized, caller + " may not " + action);
}

void Ownership::TransferOwnership(const Address& caller, const Address& candidate) {
  RequireOwner(caller, "transfer ownership");
  state_ = PendingTransfer{NormalizeAddress(candidate)};
  BITRES_LOG_INFO("ownership transfer proposed: " + owner_ + " -> " + NormalizeAddress(candidate));
}

void Ownership::AcceptOwnership(const Address& caller) {
  auto pending = std::get_if<PendingTransfer>(&state_);
  if (!pending) throw LedgerError(ErrorCode::NoPendingOwner, "no ownership transfer is pending");
  if (NormalizeAddress(caller) != pending->candidate) {
    throw LedgerError(ErrorCode::Unauthorized, caller + " is not the pending owner");
  }
  const Address previous = owner_;
  owner_ = pending->candidate;
  state_ = NoPendingTransfer{};
  BITRES_LOG_INFO("ownership transferred: " + previous + " -> " + owner_);
  StructuredLogger::Instance().Emit("ownership_transferred", {{"previous", previous}, {"owner", owner_}});
}

void Ownership::CancelTransfer(const Address& caller) {
  RequireOwner(caller, "cancel an ownership transfer");
  if (std::holds_alternative<NoPendingTransfer>(state_)) {
    throw LedgerError(ErrorCode::NoPendingOwner, "no ownership transfer is pending");
  }
  state_ = NoPendingTransfer{};
}

nlohmann::json Ownership::ToJson() const {
  auto pending = PendingOwner();
  return {{"owner", owner_}, {"pending", pending ? nlohmann::json(*pending) : nlohmann::json(nullptr)}};
}

void Ownership::FromJson(const nlohmann::json& j) {
  owner_ = NormalizeAddress(j.at("owner").get<std::string>());
  const auto& pending = j.at("pending");
  if (pending.is_null()) state_ = NoPendingTransfer{};
  else state_ = PendingTransfer{NormalizeAddress(pending.get<std::string>())};
}
