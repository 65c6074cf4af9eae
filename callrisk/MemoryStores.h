#ifndef CALLRISK_MEMORY_STORES_H
#define CALLRISK_MEMORY_STORES_H

#include <deque>
#include <functional>
#include <istream>
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <folly/SharedMutex.h>
#include <folly/Synchronized.h>
#include <folly/container/F14Map.h>

#include "Collaborators.h"
#include "RuleConfig.h"

/*
 * In-process reference implementations of the collaborator boundaries.
 * Each one is internally synchronized and may be shared by concurrent
 * evaluations.
 */

class InMemoryDenylist final : public DenylistChecker {
 public:
  DenylistMatch isDenylisted(folly::StringPiece identifier,
                             folly::StringPiece kind) override;

  void add(folly::StringPiece identifier, folly::StringPiece kind,
           folly::StringPiece reason);
  bool remove(folly::StringPiece identifier, folly::StringPiece kind);
  size_t size() const;

  /** Load `identifier,kind,reason` rows. Throws `runtime_error` on bad rows. */
  void fromCSV(std::istream &in, size_t &line);

 private:
  folly::Synchronized<folly::F14FastMap<std::string, std::string>,
                      folly::SharedMutex> entries_;
};

/*
 * Per (entity, action) sliding windows. Limits are looked up in the live
 * rules on every call, so a rules swap applies to the next check.
 * Windows that empty out are dropped.
 */
class SlidingWindowVelocity final : public VelocityChecker {
 public:
  using ClockFn = std::function<SystemTimePoint()>;

  explicit SlidingWindowVelocity(std::shared_ptr<const LiveRules> rules,
                                 ClockFn clock = &SystemClock::now);
  /** Fixed limits, for use without a detector. */
  explicit SlidingWindowVelocity(std::map<std::string, VelocityLimit> limits,
                                 ClockFn clock = &SystemClock::now);

  VelocityResult checkVelocity(folly::StringPiece entityId,
                               folly::StringPiece action) override;
  void recordAction(folly::StringPiece entityId,
                    folly::StringPiece action) override;

  /** Drop windows with no action left inside their limit. */
  size_t sweep();
  /** Number of live (entity, action) windows. */
  size_t size() const;

 private:
  struct Window {
    std::string action;
    std::deque<SystemTimePoint> hits;
  };
  using WindowMap = folly::F14NodeMap<std::string, Window>;

  size_t sweep(WindowMap &windows, const FraudRules &rules, SystemTimePoint now);

  std::shared_ptr<const LiveRules> rules_;
  ClockFn clock_;
  std::atomic<uint64_t> recorded_{0};
  folly::Synchronized<WindowMap> windows_;
};

class InMemoryFraudStore final : public CheckResultStore,
                                 public RiskProfileStore {
 public:
  void saveCheckResult(const FraudCheckResult &result) override;
  std::vector<FraudCheckResult>
    getCheckHistory(folly::StringPiece entityId, size_t limit) override;
  void saveFraudReport(const FraudReport &report) override;

  folly::Optional<RiskProfile> getRiskProfile(folly::StringPiece entityId) override;
  void saveRiskProfile(const RiskProfile &profile) override;

  std::vector<FraudReport> reports() const;

 private:
  struct State {
    folly::F14NodeMap<std::string, std::deque<FraudCheckResult>> results;
    folly::F14NodeMap<std::string, RiskProfile> profiles;
    std::vector<FraudReport> reports;
  };
  folly::Synchronized<State, folly::SharedMutex> state_;
};

#endif // CALLRISK_MEMORY_STORES_H
