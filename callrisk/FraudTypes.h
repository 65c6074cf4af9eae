#ifndef CALLRISK_FRAUD_TYPES_H
#define CALLRISK_FRAUD_TYPES_H

#include <chrono>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include <folly/dynamic.h>
#include <folly/Optional.h>

#include "Entities.h"

enum class FlagType {
  BLACKLIST,
  VELOCITY,
  ML_ANOMALY,
  PATTERN,
};

enum class Severity {
  LOW,
  MEDIUM,
  HIGH,
  CRITICAL,
};

const char* toString(FlagType type) noexcept;
const char* toString(Severity severity) noexcept;

struct FraudFlag {
  FlagType type;
  Severity severity;
  std::string description;
  double score = 0;
  /* Null unless the signal attached evidence */
  folly::dynamic evidence;
};

struct FraudCheckResult {
  std::string id;
  std::string entityId;
  EntityKind entityKind = EntityKind::CALL;
  SystemTimePoint timestamp;
  bool approved = true;
  double riskScore = 0;
  double confidence = 0;
  std::vector<std::string> reasons;
  std::vector<FraudFlag> flags;
  bool requiresMFA = false;
  bool requiresReview = false;
  folly::dynamic metadata = folly::dynamic::object;

  /** Add a flag and raise the aggregate score to at least its score. */
  void addFlag(FraudFlag flag);
  /** Raise the aggregate score; the aggregate is a maximum, never a sum. */
  void raiseScore(double score) noexcept;
};

struct RiskScoreEntry {
  double score = 0;
  SystemTimePoint timestamp;
  std::string reason;
};

struct RiskProfile {
  std::string entityId;
  EntityKind entityKind = EntityKind::ACCOUNT;
  double currentRiskScore = 0;
  std::deque<RiskScoreEntry> history;
  int fraudCount = 0;
  SystemTimePoint lastCheckTime;
  folly::dynamic attributes = folly::dynamic::object;
};

struct FraudReport {
  std::string id;
  std::string entityId;
  EntityKind entityKind = EntityKind::ACCOUNT;
  SystemTimePoint reportedAt;
  std::string reportedBy;
  std::string fraudType;
  std::string description;
  folly::dynamic evidence = folly::dynamic::object;
  std::string actionTaken;
  std::string status;
};

struct VelocityLimit {
  std::string action;
  int64_t maxCount = 0;
  std::chrono::seconds window{0};
};

struct FraudRules {
  std::map<std::string, VelocityLimit> velocityLimits;
  /* Informational tier labels: tier name -> lower bound of the tier */
  std::map<std::string, double> riskThresholds;
  bool mlEnabled = true;
  bool rulesEnabled = true;
  double requireMFAScore = 0.7;
  double autoBlockScore = 0.9;

  /** Limits and thresholds used when no configuration is supplied. */
  static FraudRules defaults();
};

/** Name of the highest tier whose lower bound is <= score, or "minimal". */
std::string riskTier(const FraudRules &rules, double score);

folly::dynamic toJson(const FraudFlag &flag);
folly::dynamic toJson(const FraudCheckResult &result);
folly::dynamic toJson(const RiskProfile &profile);
folly::dynamic toJson(const FraudReport &report);

/** Microseconds since epoch, the JSON form of every timestamp. */
int64_t toMicros(SystemTimePoint time) noexcept;
SystemTimePoint fromMicros(int64_t micros) noexcept;

/** Random RFC 4122 identifier. */
std::string generateId();

#endif // CALLRISK_FRAUD_TYPES_H
