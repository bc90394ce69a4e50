#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "common/clock.hpp"
#include "math/fixed_point.hpp"

struct FeedReading {
  U256 value = 0;
  unsigned decimals = 18;
  Timestamp as_of = 0;
};

// External push/pull price source. std::nullopt means the source has no answer.
class PushPriceFeed {
public:
  virtual ~PushPriceFeed() = default;
  virtual const std::string& Name() const = 0;
  virtual std::optional<FeedReading> LatestPrice() const = 0;
};

// Operator- or test-set price. With a clock attached every reading is stamped "now".
class StaticPriceFeed : public PushPriceFeed {
public:
  StaticPriceFeed(std::string name, const U256& value, unsigned decimals, Timestamp as_of);
  StaticPriceFeed(std::string name, const U256& value, unsigned decimals, const Clock& clock);
  explicit StaticPriceFeed(std::string name);

  const std::string& Name() const override { return name_; }
  std::optional<FeedReading> LatestPrice() const override;
  void Set(const U256& value, unsigned decimals, Timestamp as_of);
  void SetValue(const U256& value);
  void Clear();
private:
  std::string name_;
  const Clock* clock_ = nullptr;
  mutable std::mutex mutex_;
  std::optional<FeedReading> reading_;
};

// value_a * value_b, e.g. BTC/USD x WBTC/BTC; stamped with the older of the two readings
class ProductPriceFeed : public PushPriceFeed {
public:
  ProductPriceFeed(std::string name, std::shared_ptr<PushPriceFeed> a, std::shared_ptr<PushPriceFeed> b);
  const std::string& Name() const override { return name_; }
  std::optional<FeedReading> LatestPrice() const override;
private:
  std::string name_;
  std::shared_ptr<PushPriceFeed> a_;
  std::shared_ptr<PushPriceFeed> b_;
};

// Normalizes a feed to 18 decimals and enforces freshness.
class PriceFeedAdapter {
public:
  PriceFeedAdapter(std::shared_ptr<PushPriceFeed> feed, const Clock& clock, uint64_t max_staleness_s);
  // Throws LedgerError(FeedUnavailable) when the feed has no positive answer and
  // LedgerError(StaleFeed) when the answer is older than the staleness bound
  FeedReading Read() const;
  const std::string& Name() const { return feed_->Name(); }
  uint64_t MaxStaleness() const { return max_staleness_s_; }
private:
  std::shared_ptr<PushPriceFeed> feed_;
  const Clock& clock_;
  uint64_t max_staleness_s_;
};
