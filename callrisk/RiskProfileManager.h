#ifndef CALLRISK_RISK_PROFILE_MANAGER_H
#define CALLRISK_RISK_PROFILE_MANAGER_H

#include <functional>
#include <string>
#include <folly/Expected.h>
#include <folly/Range.h>
#include <folly/SharedMutex.h>
#include <folly/Synchronized.h>
#include <folly/container/F14Map.h>

#include "Collaborators.h"
#include "FraudError.h"

/*
 * Smoothed per-entity risk with a short-lived read-through cache in
 * front of RiskProfileStore. The store stays the authority; the cache
 * only saves a round-trip for scores younger than --risk_cache_ttl_sec.
 *
 * Load-modify-store of a profile is not serialized: two concurrent
 * updates of one entity race and the later save wins.
 */
class RiskProfileManager {
 public:
  using ClockFn = std::function<SystemTimePoint()>;

  explicit RiskProfileManager(RiskProfileStore *store,
                              ClockFn clock = &SystemClock::now);

  /** Current smoothed score, from cache when fresh, else from the store. */
  folly::Expected<double, FraudError> get(folly::StringPiece entityId);

  /**
   * Fold an observed score into the entity's profile:
   * current = alpha * observed + (1 - alpha) * current.
   * Returns the new smoothed score. Never fails; store errors are logged.
   * When the profile cannot be loaded the observation is dropped and the
   * returned score is the one a fresh profile would get.
   */
  double update(folly::StringPiece entityId, EntityKind kind,
                double observed, folly::StringPiece reason,
                bool confirmedFraud = false);

  /** Drop cached scores older than the TTL. Returns how many went. */
  size_t expire();

  /** Number of cached entries, expired ones not yet dropped included. */
  size_t cacheSize() const;

 private:
  struct CachedRisk {
    double score;
    SystemTimePoint loadedAt;
  };

  using CacheMap = folly::F14FastMap<std::string, CachedRisk>;

  void remember(const std::string &entityId, double score, SystemTimePoint now);
  void forget(const std::string &entityId, std::chrono::seconds ttl,
              SystemTimePoint now);
  static size_t sweep(CacheMap &cache, SystemTimePoint now);

  RiskProfileStore *store_;
  ClockFn clock_;
  folly::Synchronized<CacheMap, folly::SharedMutex> cache_;
};

#endif // CALLRISK_RISK_PROFILE_MANAGER_H
