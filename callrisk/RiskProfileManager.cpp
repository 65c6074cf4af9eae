#include "RiskProfileManager.h"

#include <algorithm>
#include <exception>
#include <glog/logging.h>
#include <folly/portability/GFlags.h>

using folly::StringPiece;

DEFINE_uint32(risk_cache_ttl_sec, 300, "How long a cached risk score is served without a store lookup");
DEFINE_double(risk_ema_alpha, 0.3, "Weight of a new observation in the smoothed risk score");
DEFINE_uint32(risk_history_limit, 100, "Maximum number of history entries kept per risk profile");
DEFINE_uint32(risk_cache_sweep_size, 10000, "Drop expired cached scores once the cache grows past this many entries");

RiskProfileManager::RiskProfileManager(RiskProfileStore *store, ClockFn clock)
  : store_(store)
  , clock_(std::move(clock))
{
}

void RiskProfileManager::remember(const std::string &entityId, double score,
                                  SystemTimePoint now)
{
  auto locked = cache_.wlock();
  locked->insert_or_assign(entityId, CachedRisk{score, now});
  if (locked->size() > FLAGS_risk_cache_sweep_size)
    sweep(*locked, now);
}

void RiskProfileManager::forget(const std::string &entityId,
                                std::chrono::seconds ttl, SystemTimePoint now)
{
  auto locked = cache_.wlock();
  auto it = locked->find(entityId);
  if (it != locked->end() && now - it->second.loadedAt >= ttl)
    locked->erase(it);
}

size_t RiskProfileManager::sweep(CacheMap &cache, SystemTimePoint now) {
  const auto ttl = std::chrono::seconds(FLAGS_risk_cache_ttl_sec);
  size_t dropped = 0;
  for (auto it = cache.begin(); it != cache.end();) {
    if (now - it->second.loadedAt >= ttl) {
      it = cache.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  return dropped;
}

size_t RiskProfileManager::expire() {
  return sweep(*cache_.wlock(), clock_());
}

folly::Expected<double, FraudError> RiskProfileManager::get(StringPiece entityId) {
  const auto ttl = std::chrono::seconds(FLAGS_risk_cache_ttl_sec);
  const SystemTimePoint now = clock_();
  const std::string key = entityId.str();

  folly::Optional<CachedRisk> cached;
  {
    auto locked = cache_.rlock();
    auto it = locked->find(key);
    if (it != locked->end())
      cached = it->second;
  }
  if (cached && now - cached->loadedAt < ttl)
    return cached->score;

  FraudError err = FRAUD_NF_RISK_PROFILE;
  if (!store_) {
    if (cached)
      forget(key, ttl, now);
    err.putVariable(entityId);
    return folly::makeUnexpected(std::move(err));
  }

  try {
    if (auto profile = store_->getRiskProfile(entityId)) {
      remember(key, profile->currentRiskScore, now);
      return profile->currentRiskScore;
    }
    if (cached)
      forget(key, ttl, now);
    err.putVariable(entityId);
  } catch (const std::exception &e) {
    if (cached) {
      LOG(WARNING) << "Risk profile store failed for " << entityId
                   << ", serving stale score: " << e.what();
      return cached->score;
    }
    err = FRAUD_INT_STORE_FAILURE;
    err.putVariable("getRiskProfile");
    err.putVariable(e.what());
  }
  return folly::makeUnexpected(std::move(err));
}

double RiskProfileManager::update(StringPiece entityId, EntityKind kind,
                                  double observed, StringPiece reason,
                                  bool confirmedFraud)
{
  const double alpha = FLAGS_risk_ema_alpha;
  const size_t limit = std::max<uint32_t>(FLAGS_risk_history_limit, 1);
  const SystemTimePoint now = clock_();
  observed = std::min(std::max(observed, 0.0), 1.0);

  folly::Optional<RiskProfile> loaded;
  bool loadFailed = false;
  if (store_) {
    try {
      loaded = store_->getRiskProfile(entityId);
    } catch (const std::exception &e) {
      LOG(ERROR) << "Could not load risk profile " << entityId
                 << ", observation not recorded: " << e.what();
      loadFailed = true;
    }
  }

  RiskProfile profile;
  if (loaded) {
    profile = std::move(*loaded);
    if (profile.entityId.empty())
      profile.entityId = entityId.str();
  } else {
    profile.entityId = entityId.str();
    profile.entityKind = kind;
    profile.currentRiskScore = observed;
  }

  profile.currentRiskScore = alpha * observed + (1 - alpha) * profile.currentRiskScore;
  profile.history.push_back(RiskScoreEntry{observed, now, reason.str()});
  while (profile.history.size() > limit)
    profile.history.pop_front();
  if (confirmedFraud)
    ++profile.fraudCount;
  profile.lastCheckTime = now;

  // The stored profile is unknown; saving or caching would clobber it
  if (loadFailed)
    return profile.currentRiskScore;

  if (store_) {
    try {
      store_->saveRiskProfile(profile);
    } catch (const std::exception &e) {
      LOG(ERROR) << "Could not save risk profile " << entityId << ": " << e.what();
    }
  }

  remember(profile.entityId, profile.currentRiskScore, now);
  return profile.currentRiskScore;
}

size_t RiskProfileManager::cacheSize() const {
  return cache_.rlock()->size();
}
