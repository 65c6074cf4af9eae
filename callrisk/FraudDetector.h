#ifndef CALLRISK_FRAUD_DETECTOR_H
#define CALLRISK_FRAUD_DETECTOR_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <folly/Expected.h>
#include <folly/Range.h>

#include "Collaborators.h"
#include "FraudError.h"
#include "RiskProfileManager.h"
#include "RuleConfig.h"

/* Any of these may be left unset; an unset signal provider abstains. */
struct FraudCollaborators {
  std::shared_ptr<DenylistChecker> denylist;
  std::shared_ptr<VelocityChecker> velocity;
  std::shared_ptr<Classifier> classifier;
  std::shared_ptr<RuleEngine> ruleEngine;
  std::shared_ptr<CheckResultStore> results;
  std::shared_ptr<RiskProfileStore> profiles;
};

/*
 * Fraud decision engine. Every check collects the available signals,
 * keeps the worst one as the risk score, applies the live thresholds
 * and records the outcome. Safe to call from many threads at once.
 */
class FraudDetector {
 public:
  using ClockFn = RiskProfileManager::ClockFn;
  using CheckOutcome = folly::Expected<FraudCheckResult, FraudError>;

  explicit FraudDetector(FraudCollaborators collaborators,
                         FraudRules rules = FraudRules::defaults(),
                         ClockFn clock = &SystemClock::now);
  /** Share live rules with collaborators that follow them. */
  FraudDetector(FraudCollaborators collaborators,
                std::shared_ptr<LiveRules> rules,
                ClockFn clock = &SystemClock::now);

  CheckOutcome checkCall(const Call *call);
  CheckOutcome checkBid(const Bid *bid, const Account *buyer);
  CheckOutcome checkAccount(const Account *account);

  /** Smoothed score of an entity's risk profile. */
  folly::Expected<double, FraudError>
    getRiskScore(folly::StringPiece entityId, EntityKind kind);

  /** Record confirmed fraud and push the subject's score toward 1.0. */
  folly::Expected<FraudReport, FraudError> reportFraud(const FraudReport *report);

  /** Atomically replace the rules; returns the new rules version. */
  folly::Expected<uint64_t, FraudError> updateRules(std::unique_ptr<FraudRules> rules);

  const LiveRules& rules() const noexcept { return *rules_; }

  /** Check results that could not be written to the result store. */
  uint64_t auditFailures() const noexcept { return auditFailures_.load(); }

 private:
  class Evaluation;

  bool denylisted(Evaluation &eval, folly::StringPiece identifier,
                  folly::StringPiece kind, folly::StringPiece label);
  void checkVelocity(Evaluation &eval, folly::StringPiece entityId,
                     folly::StringPiece action, double score);
  void consultClassifier(Evaluation &eval, const FeatureBag &features,
                         double threshold, Severity severity);
  void consultRuleEngine(Evaluation &eval, const FeatureBag &features);
  void checkHistory(Evaluation &eval, folly::StringPiece entityId);
  void applyThresholds(Evaluation &eval);
  FraudCheckResult finish(Evaluation &eval);

  FraudCollaborators c_;
  ClockFn clock_;
  std::shared_ptr<LiveRules> rules_;
  RiskProfileManager profiles_;
  std::atomic<uint64_t> auditFailures_{0};
};

#endif // CALLRISK_FRAUD_DETECTOR_H
