#ifndef CALLRISK_FEATURES_H
#define CALLRISK_FEATURES_H

#include <chrono>
#include <string>
#include <variant>

#include "Entities.h"

namespace folly { struct dynamic; }

struct CallFeatures {
  std::chrono::seconds duration{0};
  double callerReputation = 0.5;
  double calleeReputation = 0.5;
  int timeOfDay = 0;    // 0-23, UTC
  int dayOfWeek = 0;    // 0-6, Sunday=0
  int callFrequency = 0;
  double geographicRisk = 0;
  double priceDeviation = 0;
  std::string callType;
  std::string sourceCountry;
  std::string destCountry;
  unsigned fromAreaCode = 0;  // 0 when not a NANP number
  unsigned toAreaCode = 0;
  double carrierReputation = 0.5;
  bool isInternational = false;
  bool hasCLI = false;
  bool cliValidated = false;
};

struct BidFeatures {
  double bidAmount = 0;
  double buyerReputation = 0.5;
  double qualityRating = 0;
  int timeOfDay = 0;
  int dayOfWeek = 0;
  std::chrono::seconds timeToSubmit{0};
  std::chrono::hours accountAge{0};
  std::string accountType;
  std::string accountStatus;
  bool regionMatch = true;
  bool suspiciousAmount = false;
};

struct AccountFeatures {
  std::chrono::hours accountAge{0};
  int failedPayments = 0;
  int disputeCount = 0;
  double qualityScore = 0;
  std::string accountType;
  std::string accountStatus;
  bool suspiciousEmail = false;
  bool validPhone = false;
};

using FeatureBag = std::variant<CallFeatures, BidFeatures, AccountFeatures>;

EntityKind kindOf(const FeatureBag &bag) noexcept;

/*
 * Feature extraction. Pure functions: no I/O and no failure modes,
 * missing source fields fall back to neutral defaults. `now` anchors
 * age computations.
 */
FeatureBag extractFeatures(const Call &call);
FeatureBag extractFeatures(const Bid &bid, const Account *buyer, SystemTimePoint now);
FeatureBag extractFeatures(const Account &account, SystemTimePoint now);

/** Flat name->value map for collaborators that consume untyped features. */
folly::dynamic toJson(const FeatureBag &bag);

#endif // CALLRISK_FEATURES_H
