#include "oracle/price_feed_adapter.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <stdexcept>

StaticPriceFeed::StaticPriceFeed(std::string name, const U256& value, unsigned decimals, Timestamp as_of)
  : name_(std::move(name)), reading_(FeedReading{value, decimals, as_of}) {}

StaticPriceFeed::StaticPriceFeed(std::string name, const U256& value, unsigned decimals, const Clock& clock)
  : name_(std::move(name)), clock_(&clock), reading_(FeedReading{value, decimals, 0}) {}

StaticPriceFeed::StaticPriceFeed(std::string name) : name_(std::move(name)) {}

std::optional<FeedReading> StaticPriceFeed::LatestPrice() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reading_) return std::nullopt;
  FeedReading r = *reading_;
  if (clock_) r.as_of = clock_->Now();
  return r;
}

void StaticPriceFeed::Set(const U256& value, unsigned decimals, Timestamp as_of) {
  std::lock_guard<std::mutex> lock(mutex_);
  reading_ = FeedReading{value, decimals, as_of};
}

void StaticPriceFeed::SetValue(const U256& value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!reading_) reading_ = FeedReading{value, 18, clock_ ? clock_->Now() : 0};
  else reading_->value = value;
}

void StaticPriceFeed::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  reading_.reset();
}

ProductPriceFeed::ProductPriceFeed(std::string name, std::shared_ptr<PushPriceFeed> a, std::shared_ptr<PushPriceFeed> b)
  : name_(std::move(name)), a_(std::move(a)), b_(std::move(b)) {
  if (!a_ || !b_) throw std::invalid_argument("product feed " + name_ + " needs two sources");
}

std::optional<FeedReading> ProductPriceFeed::LatestPrice() const {
  auto ra = a_->LatestPrice();
  auto rb = b_->LatestPrice();
  if (!ra || !rb) return std::nullopt;
  FeedReading out;
  out.decimals = ra->decimals;
  out.value = FixedPoint::MulDiv(ra->value, rb->value, FixedPoint::Pow10(rb->decimals));
  out.as_of = std::min(ra->as_of, rb->as_of);
  return out;
}

PriceFeedAdapter::PriceFeedAdapter(std::shared_ptr<PushPriceFeed> feed, const Clock& clock, uint64_t max_staleness_s)
  : feed_(std::move(feed)), clock_(clock), max_staleness_s_(max_staleness_s) {
  if (!feed_) throw std::invalid_argument("price feed adapter needs a feed");
}

FeedReading PriceFeedAdapter::Read() const {
  auto reading = feed_->LatestPrice();
  if (!reading || reading->value == 0) throw LedgerError(ErrorCode::FeedUnavailable, "feed " + Name() + " has no price");
  const Timestamp now = clock_.Now();
  // a source clock slightly ahead of ours counts as fresh
  if (reading->as_of < now && now - reading->as_of > max_staleness_s_) {
    throw LedgerError(ErrorCode::StaleFeed, "feed " + Name() + " last updated " + std::to_string(now - reading->as_of) + "s ago");
  }
  FeedReading normalized;
  normalized.value = FixedPoint::Rescale(reading->value, reading->decimals, FixedPoint::kWadDecimals);
  normalized.decimals = FixedPoint::kWadDecimals;
  normalized.as_of = reading->as_of;
  return normalized;
}
