#ifndef CALLRISK_COLLABORATORS_H
#define CALLRISK_COLLABORATORS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <folly/Optional.h>
#include <folly/Range.h>

#include "Features.h"
#include "FraudTypes.h"

/*
 * Boundaries of the external signal providers and stores consumed by
 * FraudDetector. Implementations report failures by throwing; the
 * detector treats a throwing signal provider as abstaining.
 */

struct DenylistMatch {
  bool matched = false;
  std::string reason;
};

class DenylistChecker {
 public:
  virtual ~DenylistChecker() = default;

  /** Membership of an identifier ("phone", "email", "account", ...). */
  virtual DenylistMatch isDenylisted(folly::StringPiece identifier,
                                     folly::StringPiece kind) = 0;
};

struct VelocityResult {
  bool passed = true;
  int64_t count = 0;
  int64_t limit = 0;
  std::chrono::seconds window{0};
};

class VelocityChecker {
 public:
  virtual ~VelocityChecker() = default;

  virtual VelocityResult checkVelocity(folly::StringPiece entityId,
                                       folly::StringPiece action) = 0;
  virtual void recordAction(folly::StringPiece entityId,
                            folly::StringPiece action) = 0;
};

struct Prediction {
  double fraudProbability = 0;
  double confidence = 0;
  std::map<std::string, double> featureWeights;
  std::vector<std::string> explanations;
};

class Classifier {
 public:
  virtual ~Classifier() = default;

  virtual Prediction predict(const FeatureBag &features) = 0;
};

struct RuleResult {
  bool matched = false;
  std::vector<std::string> matchedRules;
  double totalScore = 0;
};

class RuleEngine {
 public:
  virtual ~RuleEngine() = default;

  virtual RuleResult evaluate(const FeatureBag &features) = 0;
};

class CheckResultStore {
 public:
  virtual ~CheckResultStore() = default;

  virtual void saveCheckResult(const FraudCheckResult &result) = 0;
  /** Most recent results for the entity, newest first, at most `limit`. */
  virtual std::vector<FraudCheckResult>
    getCheckHistory(folly::StringPiece entityId, size_t limit) = 0;
  virtual void saveFraudReport(const FraudReport &report) = 0;
};

class RiskProfileStore {
 public:
  virtual ~RiskProfileStore() = default;

  /** Returns none when the entity has no profile yet. */
  virtual folly::Optional<RiskProfile>
    getRiskProfile(folly::StringPiece entityId) = 0;
  virtual void saveRiskProfile(const RiskProfile &profile) = 0;
};

#endif // CALLRISK_COLLABORATORS_H
