#pragma once
#include <string>
#include "common/errors.hpp"

// Holds the owner's entered flag for the lifetime of one entry point.
class ReentrancyGuard {
public:
  ReentrancyGuard(bool& entered, const char* entry_point) : entered_(entered) {
    if (entered_) throw LedgerError(ErrorCode::ReentrantCall, std::string(entry_point) + " called while another request is in progress");
    entered_ = true;
  }
  ~ReentrancyGuard() { entered_ = false; }
  ReentrancyGuard(const ReentrancyGuard&) = delete;
  ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;
private:
  bool& entered_;
};
