#pragma once
#include <istream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/clock.hpp"
#include "common/types.hpp"
#include "wallet/nonce_tracker.hpp"

class LedgerSystem;
class CsvLogger;

struct ReplayOutcome {
  size_t line = 0;
  std::string op;
  bool ok = false;
  std::string code;     // ErrorCode name, "InvalidRequest" or "Error" on failure
  std::string message;
  nlohmann::json result = nlohmann::json::object();
};

// Applies JSON-lines requests to a simulated LedgerSystem driven by a ManualClock.
// Amounts are human decimals ("1.5") scaled by the token's decimals.
//
//   {"op":"approve","caller":"0x..","asset":"RESERVE","amount":"max"}
//   {"op":"mint","caller":"0x..","amount":"1"}
//   {"op":"advance","seconds":1800}
//
// A signed request also carries "nonce", the caller's next sequence number
// starting at 0, so each signed line is accepted once.
class ReplayRunner {
public:
  // csv may be null; every outcome is recorded when it is set
  ReplayRunner(LedgerSystem& system, ManualClock& clock, CsvLogger* csv, bool require_signatures);

  // Never throws for a bad request; the failure is in the outcome
  ReplayOutcome Apply(const nlohmann::json& request, size_t line = 0);
  // Blank lines and lines starting with '#' are skipped
  std::vector<ReplayOutcome> RunStream(std::istream& in);
  // Throws std::runtime_error when the file cannot be opened
  std::vector<ReplayOutcome> RunFile(const std::string& path);

  size_t Applied() const { return applied_; }
  size_t Failed() const { return failed_; }
  uint64_t NextNonce(const Address& caller) const { return nonces_.Expected(caller); }
private:
  nlohmann::json Dispatch(const std::string& op, const nlohmann::json& request, const Address& caller);
  void Record(const ReplayOutcome& outcome, const Address& caller);

  LedgerSystem& system_;
  ManualClock& clock_;
  CsvLogger* csv_;
  bool require_signatures_;
  NonceTracker nonces_;
  size_t applied_ = 0;
  size_t failed_ = 0;
};
