#pragma once
#include <stdexcept>
#include <string>

enum class ErrorCode {
  ZeroAmount,
  InsufficientFunds,
  InsufficientAllowance,
  Unauthorized,
  Paused,
  PriceDeviation,
  ObservationNotReady,
  ReentrantCall,
  RedemptionCapExceeded,
  FeedUnavailable,
  StaleFeed,
  InvalidParameter,
  UnknownPair,
  NoPendingOwner
};

const char* ErrorCodeName(ErrorCode code);

// Protocol-level failure. Any LedgerError aborts the whole request.
class LedgerError : public std::runtime_error {
public:
  LedgerError(ErrorCode code, const std::string& detail);
  ErrorCode Code() const { return code_; }
private:
  ErrorCode code_;
};
