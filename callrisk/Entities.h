#ifndef CALLRISK_ENTITIES_H
#define CALLRISK_ENTITIES_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <folly/Optional.h>
#include <folly/Range.h>

using SystemClock = std::chrono::system_clock;
using SystemTimePoint = SystemClock::time_point;

enum class EntityKind {
  CALL,
  BID,
  ACCOUNT,
};

const char* toString(EntityKind kind) noexcept;
/** Parse "call", "bid" or "account". Returns none otherwise. */
folly::Optional<EntityKind> parseEntityKind(folly::StringPiece s);

enum class CallDirection {
  INBOUND,
  OUTBOUND,
};

/* Subset of the exchange call record the engine reads. */
struct Call {
  std::string id;
  std::string fromNumber;
  std::string toNumber;
  std::string buyerId;
  folly::Optional<std::string> sellerId;
  CallDirection direction = CallDirection::INBOUND;
  SystemTimePoint startTime;
  folly::Optional<int64_t> durationSec;
  folly::Optional<double> cost;
  std::string sourceCountry;
  std::string destCountry;
  bool hasCLI = true;
  bool cliValidated = false;
  folly::Optional<std::string> ipAddress;
};

struct Bid {
  std::string id;
  std::string callId;
  std::string buyerId;
  std::string sellerId;
  double amount = 0;
  double historicalRating = 0;
  SystemTimePoint placedAt;
  folly::Optional<SystemTimePoint> auctionStart;
  std::vector<std::string> countries;
};

enum class AccountType {
  BUYER,
  SELLER,
  ADMIN,
};

struct Account {
  std::string id;
  std::string email;
  std::string phoneNumber;
  AccountType type = AccountType::BUYER;
  std::string status;
  double qualityScore = 0;  // 0-100
  SystemTimePoint createdAt;
  std::string country;
  int failedPayments = 0;
  int disputeCount = 0;
};

const char* toString(CallDirection direction) noexcept;
const char* toString(AccountType type) noexcept;

#endif // CALLRISK_ENTITIES_H
