#include "FraudTypes.h"

#include <algorithm>
#include <cmath>
#include <folly/Conv.h>
#include <uuid.h>

using folly::dynamic;

const char* toString(FlagType type) noexcept {
  switch (type) {
  case FlagType::BLACKLIST:
    return "blacklist";
  case FlagType::VELOCITY:
    return "velocity";
  case FlagType::ML_ANOMALY:
    return "ml_anomaly";
  case FlagType::PATTERN:
    return "pattern";
  }
  return "unknown";
}

const char* toString(Severity severity) noexcept {
  switch (severity) {
  case Severity::LOW:
    return "low";
  case Severity::MEDIUM:
    return "medium";
  case Severity::HIGH:
    return "high";
  case Severity::CRITICAL:
    return "critical";
  }
  return "unknown";
}

void FraudCheckResult::raiseScore(double score) noexcept {
  if (std::isnan(score))
    return;
  score = std::min(std::max(score, 0.0), 1.0);
  riskScore = std::max(riskScore, score);
}

void FraudCheckResult::addFlag(FraudFlag flag) {
  flag.score = std::isnan(flag.score) ? 0.0 : std::min(std::max(flag.score, 0.0), 1.0);
  raiseScore(flag.score);
  flags.push_back(std::move(flag));
}

FraudRules FraudRules::defaults() {
  FraudRules rules;
  rules.velocityLimits["call_placement"] =
    VelocityLimit{"call_placement", 100, std::chrono::hours(1)};
  rules.velocityLimits["bid_placement"] =
    VelocityLimit{"bid_placement", 200, std::chrono::hours(1)};
  rules.riskThresholds = {
    {"low", 0.3},
    {"medium", 0.6},
    {"high", 0.8},
    {"critical", 0.95},
  };
  rules.mlEnabled = true;
  rules.rulesEnabled = true;
  rules.requireMFAScore = 0.7;
  rules.autoBlockScore = 0.9;
  return rules;
}

std::string riskTier(const FraudRules &rules, double score) {
  std::string tier = "minimal";
  double best = -1;
  for (const auto& kv : rules.riskThresholds) {
    if (score >= kv.second && kv.second > best) {
      tier = kv.first;
      best = kv.second;
    }
  }
  return tier;
}

int64_t toMicros(SystemTimePoint time) noexcept {
  using namespace std::chrono;
  return duration_cast<microseconds>(time.time_since_epoch()).count();
}

SystemTimePoint fromMicros(int64_t micros) noexcept {
  using namespace std::chrono;
  return SystemTimePoint(duration_cast<SystemClock::duration>(microseconds(micros)));
}

std::string generateId() {
  uuid_t randomId;
  char buf[37];
  uuid_generate_random(randomId);
  uuid_unparse_lower(randomId, buf);
  return std::string(buf, 36);
}

dynamic toJson(const FraudFlag &flag) {
  dynamic out = dynamic::object
    ("type", toString(flag.type))
    ("severity", toString(flag.severity))
    ("description", flag.description)
    ("score", flag.score);
  if (!flag.evidence.isNull())
    out["evidence"] = flag.evidence;
  return out;
}

dynamic toJson(const FraudCheckResult &result) {
  dynamic reasons = dynamic::array;
  for (const auto& reason : result.reasons)
    reasons.push_back(reason);

  dynamic flags = dynamic::array;
  for (const auto& flag : result.flags)
    flags.push_back(toJson(flag));

  return dynamic::object
    ("id", result.id)
    ("entity_id", result.entityId)
    ("entity_type", toString(result.entityKind))
    ("timestamp", toMicros(result.timestamp))
    ("approved", result.approved)
    ("risk_score", result.riskScore)
    ("confidence", result.confidence)
    ("reasons", std::move(reasons))
    ("flags", std::move(flags))
    ("requires_mfa", result.requiresMFA)
    ("requires_review", result.requiresReview)
    ("metadata", result.metadata);
}

dynamic toJson(const RiskProfile &profile) {
  dynamic history = dynamic::array;
  for (const auto& entry : profile.history) {
    dynamic item = dynamic::object
      ("score", entry.score)
      ("timestamp", toMicros(entry.timestamp));
    if (!entry.reason.empty())
      item["reason"] = entry.reason;
    history.push_back(std::move(item));
  }

  return dynamic::object
    ("entity_id", profile.entityId)
    ("entity_type", toString(profile.entityKind))
    ("current_risk_score", profile.currentRiskScore)
    ("historical_scores", std::move(history))
    ("fraud_count", profile.fraudCount)
    ("last_check_time", toMicros(profile.lastCheckTime))
    ("attributes", profile.attributes);
}

dynamic toJson(const FraudReport &report) {
  return dynamic::object
    ("id", report.id)
    ("entity_id", report.entityId)
    ("entity_type", toString(report.entityKind))
    ("reported_at", toMicros(report.reportedAt))
    ("reported_by", report.reportedBy)
    ("fraud_type", report.fraudType)
    ("description", report.description)
    ("evidence", report.evidence)
    ("action_taken", report.actionTaken)
    ("status", report.status);
}
