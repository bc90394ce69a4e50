#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>

// Unix seconds
using Timestamp = uint64_t;

class Clock {
public:
  virtual ~Clock() = default;
  virtual Timestamp Now() const = 0;
};

class SystemClock : public Clock {
public:
  Timestamp Now() const override {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
  }
};

// Driven explicitly by tests and replay scripts
class ManualClock : public Clock {
public:
  explicit ManualClock(Timestamp start = 1700000000ULL) : now_(start) {}
  Timestamp Now() const override { return now_.load(); }
  void Advance(uint64_t seconds) { now_ += seconds; }
  void Set(Timestamp t) { now_ = t; }
private:
  std::atomic<Timestamp> now_;
};
