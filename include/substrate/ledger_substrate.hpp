#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/logger.hpp"
#include "substrate/state_participant.hpp"

// Runs mutating requests one at a time. Each request is atomic: every registered
// participant is snapshotted first and restored if the request throws.
class LedgerSubstrate {
public:
  // Participants must outlive the substrate
  void Register(StateParticipant& participant);

  template <typename Fn>
  auto Execute(const std::string& request, Fn&& fn) -> decltype(fn()) {
    std::lock_guard<std::mutex> lock(mutex_);
    const nlohmann::json before = SnapshotAllLocked();
    try {
      if constexpr (std::is_void_v<decltype(fn())>) {
        fn();
        ++committed_;
      } else {
        auto result = fn();
        ++committed_;
        return result;
      }
    } catch (const std::exception& e) {
      RestoreAllLocked(before);
      ++rejected_;
      BITRES_LOG_DEBUG("request " + request + " rolled back: " + e.what());
      throw;
    }
  }

  nlohmann::json SnapshotAll();
  void RestoreAll(const nlohmann::json& snapshot);

  uint64_t CommittedRequests() const { return committed_; }
  uint64_t RejectedRequests() const { return rejected_; }
  size_t ParticipantCount();
private:
  nlohmann::json SnapshotAllLocked() const;
  void RestoreAllLocked(const nlohmann::json& snapshot);

  std::mutex mutex_;
  std::vector<StateParticipant*> participants_;
  std::atomic<uint64_t> committed_{0};
  std::atomic<uint64_t> rejected_{0};
};
