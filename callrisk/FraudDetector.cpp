#include "FraudDetector.h"
#include "Heuristics.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <glog/logging.h>
#include <folly/Format.h>
#include <folly/dynamic.h>
#include <folly/stop_watch.h>

using folly::StringPiece;
using folly::dynamic;

namespace {

// Fixed signal scores
constexpr double kCallVelocityScore = 0.8;
constexpr double kBidVelocityScore = 0.7;
constexpr double kCallAnomalyThreshold = 0.7;
constexpr double kBidAnomalyThreshold = 0.6;
constexpr double kLowQualityScore = 0.6;
constexpr double kSuspiciousAmountScore = 0.3;
constexpr double kFreeMailScore = 0.4;
constexpr double kBadPhoneScore = 0.5;
constexpr double kHistoryScore = 0.9;
constexpr double kReviewScore = 0.6;

constexpr double kMinBuyerQuality = 50;
constexpr size_t kHistoryWindow = 10;
constexpr double kHistoryHighRisk = 0.8;
constexpr int kHistoryMaxHighRisk = 2;

} // namespace

class FraudDetector::Evaluation {
 public:
  Evaluation(StringPiece entityId, EntityKind kind,
             RuleSnapshot snap, SystemTimePoint now)
    : snap(std::move(snap))
  {
    result.id = generateId();
    result.entityId = entityId.str();
    result.entityKind = kind;
    result.timestamp = now;
  }

  void answered(const char *source) {
    for (const auto& s : sources) {
      if (s == source)
        return;
    }
    sources.push_back(source);
  }

  FraudCheckResult result;
  const RuleSnapshot snap;
  dynamic sources = dynamic::array;
  folly::stop_watch<std::chrono::microseconds> watch;
};

FraudDetector::FraudDetector(FraudCollaborators collaborators,
                             FraudRules rules, ClockFn clock)
  : FraudDetector(std::move(collaborators),
                  std::make_shared<LiveRules>(std::move(rules)), std::move(clock))
{
}

FraudDetector::FraudDetector(FraudCollaborators collaborators,
                             std::shared_ptr<LiveRules> rules, ClockFn clock)
  : c_(std::move(collaborators))
  , clock_(std::move(clock))
  , rules_(rules ? std::move(rules) : std::make_shared<LiveRules>())
  , profiles_(c_.profiles.get(), clock_)
{
}

bool FraudDetector::denylisted(Evaluation &eval, StringPiece identifier,
                               StringPiece kind, StringPiece label)
{
  if (!c_.denylist || identifier.empty())
    return false;

  DenylistMatch match;
  try {
    match = c_.denylist->isDenylisted(identifier, kind);
  } catch (const std::exception &e) {
    LOG(WARNING) << "Denylist abstained for " << eval.result.entityId
                 << ": " << e.what();
    return false;
  }
  eval.answered("denylist");
  if (!match.matched)
    return false;

  FraudCheckResult &r = eval.result;
  r.approved = false;
  r.reasons.push_back(folly::sformat("{} denylisted: {}", label, match.reason));
  r.addFlag(FraudFlag{FlagType::BLACKLIST, Severity::CRITICAL,
                      folly::sformat("Denylisted {}", kind), 1.0,
                      dynamic::object("identifier", identifier)("kind", kind)});
  r.riskScore = 1.0;
  return true;
}

void FraudDetector::checkVelocity(Evaluation &eval, StringPiece entityId,
                                  StringPiece action, double score)
{
  if (!c_.velocity)
    return;

  try {
    VelocityResult v = c_.velocity->checkVelocity(entityId, action);
    eval.answered("velocity");
    if (!v.passed) {
      eval.result.addFlag(FraudFlag{
          FlagType::VELOCITY, Severity::HIGH,
          folly::sformat("High {} velocity: {} in {}s (limit {})",
                         action, v.count, v.window.count(), v.limit),
          score,
          dynamic::object("count", v.count)("limit", v.limit)
                         ("window_sec", static_cast<int64_t>(v.window.count()))});
    }
  } catch (const std::exception &e) {
    LOG(WARNING) << "Velocity check abstained for " << entityId
                 << ": " << e.what();
  }

  // Counts toward future windows whatever the outcome
  try {
    c_.velocity->recordAction(entityId, action);
  } catch (const std::exception &e) {
    LOG(WARNING) << "Could not record " << action << " for " << entityId
                 << ": " << e.what();
  }
}

void FraudDetector::consultClassifier(Evaluation &eval, const FeatureBag &features,
                                      double threshold, Severity severity)
{
  if (!c_.classifier || !eval.snap.mlEnabled)
    return;

  Prediction p;
  try {
    p = c_.classifier->predict(features);
  } catch (const std::exception &e) {
    LOG(WARNING) << "Classifier abstained for " << eval.result.entityId
                 << ": " << e.what();
    return;
  }
  eval.answered("classifier");

  FraudCheckResult &r = eval.result;
  r.raiseScore(p.fraudProbability);
  r.confidence = std::isfinite(p.confidence)
      ? std::min(std::max(p.confidence, 0.0), 1.0) : 0.0;
  if (p.fraudProbability > threshold) {
    dynamic weights = dynamic::object;
    for (const auto& kv : p.featureWeights)
      weights[kv.first] = kv.second;
    dynamic explanations = dynamic::array;
    for (const auto& text : p.explanations)
      explanations.push_back(text);

    r.addFlag(FraudFlag{FlagType::ML_ANOMALY, severity,
                        "Classifier detected anomaly", p.fraudProbability,
                        dynamic::object("features", std::move(weights))
                                       ("explanations", std::move(explanations))});
  }
}

void FraudDetector::consultRuleEngine(Evaluation &eval, const FeatureBag &features)
{
  if (!c_.ruleEngine || !eval.snap.rulesEnabled)
    return;

  RuleResult rr;
  try {
    rr = c_.ruleEngine->evaluate(features);
  } catch (const std::exception &e) {
    LOG(WARNING) << "Rule engine abstained for " << eval.result.entityId
                 << ": " << e.what();
    return;
  }
  eval.answered("rules");
  if (!rr.matched)
    return;

  for (const auto& rule : rr.matchedRules) {
    eval.result.addFlag(FraudFlag{FlagType::PATTERN, Severity::MEDIUM,
                                  folly::sformat("Rule matched: {}", rule),
                                  rr.totalScore, nullptr});
  }
  eval.result.raiseScore(rr.totalScore);
}

void FraudDetector::checkHistory(Evaluation &eval, StringPiece entityId)
{
  if (!c_.results)
    return;

  std::vector<FraudCheckResult> history;
  try {
    history = c_.results->getCheckHistory(entityId, kHistoryWindow);
  } catch (const std::exception &e) {
    LOG(WARNING) << "Check history unavailable for " << entityId
                 << ": " << e.what();
    return;
  }
  eval.answered("history");

  auto highRisk = std::count_if(history.begin(), history.end(),
      [](const FraudCheckResult &past) { return past.riskScore > kHistoryHighRisk; });
  if (highRisk > kHistoryMaxHighRisk) {
    eval.result.addFlag(FraudFlag{
        FlagType::PATTERN, Severity::HIGH,
        folly::sformat("Historical fraud indicators: {} high-risk events", highRisk),
        kHistoryScore, nullptr});
  }
}

void FraudDetector::applyThresholds(Evaluation &eval)
{
  FraudCheckResult &r = eval.result;
  const RuleSnapshot &snap = eval.snap;

  r.requiresMFA = r.riskScore >= snap.requireMFAScore;
  if (r.riskScore >= snap.autoBlockScore) {
    r.approved = false;
    r.reasons.push_back("Risk score exceeds auto-block threshold");
  }
  // Blocked events never enter the review queue
  r.requiresReview = r.riskScore >= kReviewScore && r.riskScore < snap.autoBlockScore;
}

FraudCheckResult FraudDetector::finish(Evaluation &eval)
{
  FraudCheckResult &r = eval.result;
  r.metadata["rules_version"] = static_cast<int64_t>(eval.snap.version);
  r.metadata["risk_tier"] = riskTier(*eval.snap.rules, r.riskScore);
  r.metadata["data_sources"] = std::move(eval.sources);
  r.metadata["check_method"] = "realtime";
  r.metadata["processing_time_us"] = static_cast<int64_t>(eval.watch.elapsed().count());
  r.metadata["audit_persisted"] = true;

  if (!c_.results) {
    r.metadata["audit_persisted"] = false;
    return std::move(r);
  }

  try {
    c_.results->saveCheckResult(r);
  } catch (const std::exception &e) {
    ++auditFailures_;
    r.metadata["audit_persisted"] = false;
    LOG(ERROR) << "Check result " << r.id << " for " << toString(r.entityKind)
               << " " << r.entityId << " was not persisted: " << e.what();
  }
  return std::move(r);
}

FraudDetector::CheckOutcome FraudDetector::checkCall(const Call *call)
{
  if (!call)
    return folly::makeUnexpected(FraudError(FRAUD_VAL_MISSING_ENTITY));
  if (call->id.empty()) {
    FraudError err = FRAUD_VAL_MISSING_ENTITY_ID;
    err.putVariable("call");
    return folly::makeUnexpected(std::move(err));
  }

  Evaluation eval(call->id, EntityKind::CALL, rules_->snapshot(), clock_());

  if (denylisted(eval, call->fromNumber, "phone", "From number") ||
      denylisted(eval, call->toNumber, "phone", "To number"))
    return finish(eval);

  checkVelocity(eval, call->buyerId, "call_placement", kCallVelocityScore);

  FeatureBag features = extractFeatures(*call);
  consultClassifier(eval, features, kCallAnomalyThreshold, Severity::HIGH);
  consultRuleEngine(eval, features);
  applyThresholds(eval);

  FraudCheckResult result = finish(eval);
  if (!call->buyerId.empty()) {
    profiles_.update(call->buyerId, EntityKind::ACCOUNT, result.riskScore,
                     folly::sformat("call {}", call->id));
  }
  return result;
}

FraudDetector::CheckOutcome FraudDetector::checkBid(const Bid *bid, const Account *buyer)
{
  if (!bid)
    return folly::makeUnexpected(FraudError(FRAUD_VAL_MISSING_ENTITY));
  if (bid->id.empty()) {
    FraudError err = FRAUD_VAL_MISSING_ENTITY_ID;
    err.putVariable("bid");
    return folly::makeUnexpected(std::move(err));
  }
  if (!buyer) {
    FraudError err = FRAUD_VAL_MISSING_BUYER;
    err.putVariable(bid->id);
    return folly::makeUnexpected(std::move(err));
  }

  const SystemTimePoint now = clock_();
  Evaluation eval(bid->id, EntityKind::BID, rules_->snapshot(), now);

  if (denylisted(eval, bid->buyerId, "account", "Buyer account"))
    return finish(eval);

  if (buyer->qualityScore < kMinBuyerQuality) {
    eval.result.addFlag(FraudFlag{FlagType::PATTERN, Severity::MEDIUM,
                                  "Low account quality score", kLowQualityScore,
                                  dynamic::object("quality_score", buyer->qualityScore)});
  }
  if (isSuspiciousBidAmount(bid->amount)) {
    eval.result.addFlag(FraudFlag{FlagType::PATTERN, Severity::LOW,
                                  "Suspicious bid amount pattern", kSuspiciousAmountScore,
                                  dynamic::object("amount", bid->amount)});
  }

  checkVelocity(eval, bid->buyerId, "bid_placement", kBidVelocityScore);

  FeatureBag features = extractFeatures(*bid, buyer, now);
  consultClassifier(eval, features, kBidAnomalyThreshold, Severity::MEDIUM);
  consultRuleEngine(eval, features);
  applyThresholds(eval);

  FraudCheckResult result = finish(eval);
  if (!bid->buyerId.empty()) {
    profiles_.update(bid->buyerId, EntityKind::ACCOUNT, result.riskScore,
                     folly::sformat("bid {}", bid->id));
  }
  return result;
}

FraudDetector::CheckOutcome FraudDetector::checkAccount(const Account *account)
{
  if (!account)
    return folly::makeUnexpected(FraudError(FRAUD_VAL_MISSING_ENTITY));
  if (account->id.empty()) {
    FraudError err = FRAUD_VAL_MISSING_ENTITY_ID;
    err.putVariable("account");
    return folly::makeUnexpected(std::move(err));
  }

  const SystemTimePoint now = clock_();
  Evaluation eval(account->id, EntityKind::ACCOUNT, rules_->snapshot(), now);

  if (denylisted(eval, account->email, "email", "Email") ||
      denylisted(eval, account->phoneNumber, "phone", "Phone number"))
    return finish(eval);

  if (isSuspiciousEmailDomain(account->email)) {
    eval.result.addFlag(FraudFlag{FlagType::PATTERN, Severity::LOW,
                                  "Suspicious email domain", kFreeMailScore, nullptr});
  }
  if (!isValidPhoneFormat(account->phoneNumber)) {
    eval.result.addFlag(FraudFlag{FlagType::PATTERN, Severity::MEDIUM,
                                  "Invalid phone number format", kBadPhoneScore, nullptr});
  }
  checkHistory(eval, account->id);

  FeatureBag features = extractFeatures(*account, now);
  consultClassifier(eval, features, kCallAnomalyThreshold, Severity::HIGH);
  consultRuleEngine(eval, features);
  applyThresholds(eval);

  // Account checks read past results instead of feeding a profile
  return finish(eval);
}

folly::Expected<double, FraudError>
FraudDetector::getRiskScore(StringPiece entityId, EntityKind kind)
{
  if (entityId.empty()) {
    FraudError err = FRAUD_VAL_MISSING_ENTITY_ID;
    err.putVariable(toString(kind));
    return folly::makeUnexpected(std::move(err));
  }
  return profiles_.get(entityId);
}

folly::Expected<FraudReport, FraudError>
FraudDetector::reportFraud(const FraudReport *report)
{
  if (!report)
    return folly::makeUnexpected(FraudError(FRAUD_VAL_MISSING_REPORT));
  if (report->entityId.empty()) {
    FraudError err = FRAUD_VAL_MISSING_ENTITY_ID;
    err.putVariable("report");
    return folly::makeUnexpected(std::move(err));
  }

  FraudReport recorded = *report;
  recorded.id = generateId();
  recorded.reportedAt = clock_();
  recorded.status = "pending";

  if (c_.results) {
    try {
      c_.results->saveFraudReport(recorded);
    } catch (const std::exception &e) {
      FraudError err = FRAUD_INT_STORE_FAILURE;
      err.putVariable("saveFraudReport");
      err.putVariable(e.what());
      LOG(ERROR) << "Fraud report for " << recorded.entityId
                 << " was not saved: " << e.what();
      return folly::makeUnexpected(std::move(err));
    }
  }

  double score = profiles_.update(recorded.entityId, recorded.entityKind, 1.0,
                                  folly::sformat("fraud report: {}", recorded.fraudType),
                                  true);
  LOG(INFO) << "Fraud reported for " << toString(recorded.entityKind) << " "
            << recorded.entityId << ", smoothed risk now " << score;
  return recorded;
}

folly::Expected<uint64_t, FraudError>
FraudDetector::updateRules(std::unique_ptr<FraudRules> rules)
{
  return rules_->replace(std::move(rules));
}
