#include "substrate/ledger_substrate.hpp"
#include <stdexcept>

void LedgerSubstrate::Register(StateParticipant& participant) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const StateParticipant* p : participants_) {
    if (p->ParticipantName() == participant.ParticipantName()) {
      throw std::invalid_argument("participant " + participant.ParticipantName() + " registered twice");
    }
  }
  participants_.push_back(&participant);
}

nlohmann::json LedgerSubstrate::SnapshotAllLocked() const {
  nlohmann::json out = nlohmann::json::object();
  for (const StateParticipant* p : participants_) out[p->ParticipantName()] = p->Snapshot();
  return out;
}

void LedgerSubstrate::RestoreAllLocked(const nlohmann::json& snapshot) {
  for (StateParticipant* p : participants_) {
    auto it = snapshot.find(p->ParticipantName());
    if (it != snapshot.end()) p->Restore(*it);
  }
}

nlohmann::json LedgerSubstrate::SnapshotAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  return SnapshotAllLocked();
}

void LedgerSubstrate::RestoreAll(const nlohmann::json& snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  RestoreAllLocked(snapshot);
}

size_t LedgerSubstrate::ParticipantCount() {
  std::lock_guard<std::mutex> lock(mutex_);
  return participants_.size();
}
