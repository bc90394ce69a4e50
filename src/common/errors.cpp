#include "common/errors.hpp"

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::ZeroAmount: return "ZeroAmount";
    case ErrorCode::InsufficientFunds: return "InsufficientFunds";
    case ErrorCode::InsufficientAllowance: return "InsufficientAllowance";
    case ErrorCode::Unauthorized: return "Unauthorized";
    case ErrorCode::Paused: return "Paused";
    case ErrorCode::PriceDeviation: return "PriceDeviation";
    case ErrorCode::ObservationNotReady: return "ObservationNotReady";
    case ErrorCode::ReentrantCall: return "ReentrantCall";
    case ErrorCode::RedemptionCapExceeded: return "RedemptionCapExceeded";
    case ErrorCode::FeedUnavailable: return "FeedUnavailable";
    case ErrorCode::StaleFeed: return "StaleFeed";
    case ErrorCode::InvalidParameter: return "InvalidParameter";
    case ErrorCode::UnknownPair: return "UnknownPair";
    case ErrorCode::NoPendingOwner: return "NoPendingOwner";
  }
  return "Unknown";
}

LedgerError::LedgerError(ErrorCode code, const std::string& detail)
  : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + detail), code_(code) {}
