#include "Features.h"
#include "Heuristics.h"

#include <algorithm>
#include <ctime>
#include <folly/dynamic.h>

using folly::dynamic;
using std::chrono::duration_cast;

namespace {

struct Clock {
  int hour = 0;
  int weekday = 0;
};

Clock breakDown(SystemTimePoint time) {
  struct tm date;
  time_t t = SystemClock::to_time_t(time);
  gmtime_r(&t, &date);
  return Clock{date.tm_hour, date.tm_wday};
}

template<class D>
D nonNegative(SystemTimePoint::duration d) {
  if (d.count() < 0)
    return D{0};
  return duration_cast<D>(d);
}

// Unset timestamps (epoch) carry no age information
std::chrono::hours ageOf(SystemTimePoint created, SystemTimePoint now) {
  if (created.time_since_epoch().count() == 0)
    return std::chrono::hours(0);
  return nonNegative<std::chrono::hours>(now - created);
}

struct ToJsonVisitor {
  dynamic operator()(const CallFeatures &f) const {
    return dynamic::object
      ("duration", f.duration.count())
      ("caller_reputation", f.callerReputation)
      ("callee_reputation", f.calleeReputation)
      ("time_of_day", f.timeOfDay)
      ("day_of_week", f.dayOfWeek)
      ("call_frequency", f.callFrequency)
      ("geographic_risk", f.geographicRisk)
      ("price_deviation", f.priceDeviation)
      ("call_type", f.callType)
      ("source_country", f.sourceCountry)
      ("dest_country", f.destCountry)
      ("from_area_code", f.fromAreaCode)
      ("to_area_code", f.toAreaCode)
      ("carrier_reputation", f.carrierReputation)
      ("is_international", f.isInternational)
      ("has_cli", f.hasCLI)
      ("cli_validated", f.cliValidated);
  }

  dynamic operator()(const BidFeatures &f) const {
    return dynamic::object
      ("bid_amount", f.bidAmount)
      ("buyer_reputation", f.buyerReputation)
      ("quality_score", f.qualityRating)
      ("time_of_day", f.timeOfDay)
      ("day_of_week", f.dayOfWeek)
      ("time_to_submit", f.timeToSubmit.count())
      ("account_age_days", f.accountAge.count() / 24)
      ("account_type", f.accountType)
      ("account_status", f.accountStatus)
      ("region_match", f.regionMatch)
      ("suspicious_amount", f.suspiciousAmount);
  }

  dynamic operator()(const AccountFeatures &f) const {
    return dynamic::object
      ("account_age_days", f.accountAge.count() / 24)
      ("failed_payments", f.failedPayments)
      ("dispute_count", f.disputeCount)
      ("quality_score", f.qualityScore)
      ("account_type", f.accountType)
      ("account_status", f.accountStatus)
      ("suspicious_email", f.suspiciousEmail)
      ("valid_phone", f.validPhone);
  }
};

} // namespace

EntityKind kindOf(const FeatureBag &bag) noexcept {
  switch (bag.index()) {
  case 0:
    return EntityKind::CALL;
  case 1:
    return EntityKind::BID;
  default:
    return EntityKind::ACCOUNT;
  }
}

FeatureBag extractFeatures(const Call &call) {
  CallFeatures f;
  Clock clock = breakDown(call.startTime);

  f.timeOfDay = clock.hour;
  f.dayOfWeek = clock.weekday;
  if (call.durationSec)
    f.duration = std::chrono::seconds(std::max<int64_t>(*call.durationSec, 0));
  f.callType = toString(call.direction);
  f.sourceCountry = call.sourceCountry;
  f.destCountry = call.destCountry;
  f.isInternational = !call.sourceCountry.empty() && !call.destCountry.empty()
    && call.sourceCountry != call.destCountry;
  f.geographicRisk = f.isInternational ? 0.5 : 0.0;
  f.hasCLI = call.hasCLI && !call.fromNumber.empty();
  f.cliValidated = f.hasCLI && call.cliValidated;
  if (!f.hasCLI)
    f.callerReputation = 0.2;

  uint64_t from = PhoneNumber::fromString(call.fromNumber);
  if (from != PhoneNumber::NONE)
    f.fromAreaCode = PhoneNumber::areaCode(from);
  uint64_t to = PhoneNumber::fromString(call.toNumber);
  if (to != PhoneNumber::NONE)
    f.toAreaCode = PhoneNumber::areaCode(to);

  return f;
}

FeatureBag extractFeatures(const Bid &bid, const Account *buyer, SystemTimePoint now) {
  BidFeatures f;
  Clock clock = breakDown(bid.placedAt);

  f.bidAmount = bid.amount;
  f.qualityRating = bid.historicalRating;
  f.timeOfDay = clock.hour;
  f.dayOfWeek = clock.weekday;
  f.suspiciousAmount = isSuspiciousBidAmount(bid.amount);
  if (bid.auctionStart)
    f.timeToSubmit = nonNegative<std::chrono::seconds>(bid.placedAt - *bid.auctionStart);

  if (buyer) {
    f.buyerReputation = std::min(std::max(buyer->qualityScore / 100.0, 0.0), 1.0);
    f.accountAge = ageOf(buyer->createdAt, now);
    f.accountType = toString(buyer->type);
    f.accountStatus = buyer->status;
    if (!bid.countries.empty() && !buyer->country.empty()) {
      f.regionMatch = std::find(bid.countries.begin(), bid.countries.end(),
                                buyer->country) != bid.countries.end();
    }
  }

  return f;
}

FeatureBag extractFeatures(const Account &account, SystemTimePoint now) {
  AccountFeatures f;
  f.accountAge = ageOf(account.createdAt, now);
  f.failedPayments = account.failedPayments;
  f.disputeCount = account.disputeCount;
  f.qualityScore = account.qualityScore;
  f.accountType = toString(account.type);
  f.accountStatus = account.status;
  f.suspiciousEmail = isSuspiciousEmailDomain(account.email);
  f.validPhone = isValidPhoneFormat(account.phoneNumber);
  return f;
}

dynamic toJson(const FeatureBag &bag) {
  return std::visit(ToJsonVisitor{}, bag);
}
