#include <callrisk/RiskProfileManager.h>
#include <callrisk/MemoryStores.h>
#include "Mocks.h"

#include <stdexcept>
#include <folly/Conv.h>
#include <folly/portability/GFlags.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>

DECLARE_uint32(risk_cache_ttl_sec);
DECLARE_uint32(risk_cache_sweep_size);
DECLARE_uint32(risk_history_limit);

using namespace testing;

static RiskProfile profileWith(const char *id, double score) {
  RiskProfile profile;
  profile.entityId = id;
  profile.currentRiskScore = score;
  return profile;
}

class RiskProfileManagerTest : public testing::Test {
 protected:
  SystemTimePoint now = fromMicros(1700000000000000);
  InMemoryFraudStore store;
  RiskProfileManager manager{&store, [this] { return now; }};
};

TEST_F(RiskProfileManagerTest, MissingProfile) {
  auto score = manager.get("nobody");
  ASSERT_FALSE(score);
  EXPECT_STREQ(score.error().id(), "NFD4040");
  EXPECT_THAT(score.error().message(), HasSubstr("nobody"));
}

TEST_F(RiskProfileManagerTest, SmoothedUpdate) {
  store.saveRiskProfile(profileWith("acct-1", 0.2));

  EXPECT_NEAR(manager.update("acct-1", EntityKind::ACCOUNT, 1.0, "report"), 0.44, 1e-9);
  EXPECT_NEAR(manager.get("acct-1").value(), 0.44, 1e-9);

  auto saved = store.getRiskProfile("acct-1");
  ASSERT_TRUE(saved.has_value());
  EXPECT_NEAR(saved->currentRiskScore, 0.44, 1e-9);
  ASSERT_THAT(saved->history, SizeIs(1));
  EXPECT_DOUBLE_EQ(saved->history[0].score, 1.0);
  EXPECT_EQ(saved->history[0].timestamp, now);
  EXPECT_EQ(saved->lastCheckTime, now);
  EXPECT_EQ(saved->fraudCount, 0);
}

TEST_F(RiskProfileManagerTest, FirstObservationSeedsProfile) {
  EXPECT_DOUBLE_EQ(manager.update("acct-2", EntityKind::BID, 0.5, "bid"), 0.5);

  auto saved = store.getRiskProfile("acct-2");
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved->entityId, "acct-2");
  EXPECT_EQ(saved->entityKind, EntityKind::BID);
}

TEST_F(RiskProfileManagerTest, ObservationIsClamped) {
  EXPECT_DOUBLE_EQ(manager.update("acct-3", EntityKind::ACCOUNT, 7.0, "bogus"), 1.0);
  EXPECT_DOUBLE_EQ(manager.update("acct-4", EntityKind::ACCOUNT, -1.0, "bogus"), 0.0);
}

TEST_F(RiskProfileManagerTest, ConfirmedFraudIsCounted) {
  manager.update("acct-5", EntityKind::ACCOUNT, 1.0, "report", true);
  manager.update("acct-5", EntityKind::ACCOUNT, 1.0, "report", true);
  manager.update("acct-5", EntityKind::ACCOUNT, 0.1, "call");
  EXPECT_EQ(store.getRiskProfile("acct-5")->fraudCount, 2);
}

TEST_F(RiskProfileManagerTest, HistoryIsBounded) {
  ASSERT_EQ(FLAGS_risk_history_limit, 100u);
  for (int i = 0; i <= 100; ++i)
    manager.update("acct-6", EntityKind::ACCOUNT, 0.1, folly::to<std::string>("event ", i));

  auto saved = store.getRiskProfile("acct-6");
  ASSERT_TRUE(saved.has_value());
  ASSERT_THAT(saved->history, SizeIs(100));
  EXPECT_EQ(saved->history.front().reason, "event 1");
  EXPECT_EQ(saved->history.back().reason, "event 100");
}

TEST_F(RiskProfileManagerTest, CacheExpires) {
  manager.update("acct-7", EntityKind::ACCOUNT, 0.5, "call");
  store.saveRiskProfile(profileWith("acct-7", 0.9));

  // Served from cache until the TTL elapses
  EXPECT_DOUBLE_EQ(manager.get("acct-7").value(), 0.5);
  now += std::chrono::seconds(FLAGS_risk_cache_ttl_sec - 1);
  EXPECT_DOUBLE_EQ(manager.get("acct-7").value(), 0.5);
  now += std::chrono::seconds(1);
  EXPECT_DOUBLE_EQ(manager.get("acct-7").value(), 0.9);
  EXPECT_EQ(manager.cacheSize(), 1u);
}

TEST_F(RiskProfileManagerTest, ExpiredScoresAreDropped) {
  manager.update("acct-8", EntityKind::ACCOUNT, 0.5, "call");
  manager.update("acct-9", EntityKind::ACCOUNT, 0.5, "call");
  EXPECT_EQ(manager.cacheSize(), 2u);

  now += std::chrono::seconds(FLAGS_risk_cache_ttl_sec);
  manager.update("acct-10", EntityKind::ACCOUNT, 0.5, "call");
  EXPECT_EQ(manager.expire(), 2u);
  EXPECT_EQ(manager.cacheSize(), 1u);

  // A stale lookup for an entity the store no longer knows leaves nothing behind
  RiskProfileManager cacheOnly(nullptr, [this] { return now; });
  cacheOnly.update("acct-11", EntityKind::ACCOUNT, 0.5, "call");
  now += std::chrono::seconds(FLAGS_risk_cache_ttl_sec);
  EXPECT_FALSE(cacheOnly.get("acct-11"));
  EXPECT_EQ(cacheOnly.cacheSize(), 0u);
}

TEST_F(RiskProfileManagerTest, LargeCacheSweepsItself) {
  const uint32_t saved = FLAGS_risk_cache_sweep_size;
  FLAGS_risk_cache_sweep_size = 4;
  for (int i = 0; i < 4; ++i)
    manager.update(folly::to<std::string>("old-", i), EntityKind::ACCOUNT, 0.1, "call");
  now += std::chrono::seconds(FLAGS_risk_cache_ttl_sec);
  manager.update("new-0", EntityKind::ACCOUNT, 0.1, "call");
  FLAGS_risk_cache_sweep_size = saved;

  EXPECT_EQ(manager.cacheSize(), 1u);
}

TEST(RiskProfileManagerStoreFailure, ServesStaleScore) {
  SystemTimePoint now = fromMicros(1700000000000000);
  MockProfileStore store;
  RiskProfileManager manager(&store, [&now] { return now; });

  EXPECT_CALL(store, getRiskProfile(folly::StringPiece("acct-1")))
    .WillOnce(Return(profileWith("acct-1", 0.3)))
    .WillOnce(Throw(std::runtime_error("store down")));
  EXPECT_CALL(store, getRiskProfile(folly::StringPiece("acct-2")))
    .WillOnce(Throw(std::runtime_error("store down")));

  EXPECT_DOUBLE_EQ(manager.get("acct-1").value(), 0.3);
  now += std::chrono::hours(1);
  EXPECT_DOUBLE_EQ(manager.get("acct-1").value(), 0.3);

  auto fresh = manager.get("acct-2");
  ASSERT_FALSE(fresh);
  EXPECT_EQ(fresh.error().kind(), FraudErrorKind::INTERNAL);
}

TEST(RiskProfileManagerStoreFailure, UpdateSurvivesFailedSave) {
  MockProfileStore store;
  RiskProfileManager manager(&store);

  EXPECT_CALL(store, getRiskProfile(_))
    .WillOnce(Return(folly::none));
  EXPECT_CALL(store, saveRiskProfile(_))
    .WillOnce(Throw(std::runtime_error("store down")));

  EXPECT_DOUBLE_EQ(manager.update("acct-1", EntityKind::ACCOUNT, 0.4, "call"), 0.4);
  EXPECT_DOUBLE_EQ(manager.get("acct-1").value(), 0.4);
}

TEST(RiskProfileManagerStoreFailure, FailedLoadKeepsStoredProfile) {
  SystemTimePoint now = fromMicros(1700000000000000);
  InMemoryFraudStore backing;
  RiskProfile known = profileWith("acct-1", 0.9);
  known.fraudCount = 3;
  backing.saveRiskProfile(known);

  NiceMock<MockProfileStore> store;
  EXPECT_CALL(store, getRiskProfile(folly::StringPiece("acct-1")))
    .WillOnce(Invoke([&](folly::StringPiece id) { return backing.getRiskProfile(id); }))
    .WillOnce(Throw(std::runtime_error("store down")))
    .WillRepeatedly(Invoke([&](folly::StringPiece id) { return backing.getRiskProfile(id); }));
  ON_CALL(store, saveRiskProfile(_))
    .WillByDefault(Invoke([&](const RiskProfile &p) { backing.saveRiskProfile(p); }));

  RiskProfileManager manager(&store, [&now] { return now; });
  EXPECT_NEAR(manager.update("acct-1", EntityKind::ACCOUNT, 0.1, "call"), 0.66, 1e-9);
  now += std::chrono::seconds(FLAGS_risk_cache_ttl_sec);

  // The load throws: nothing is saved and nothing replaces the cached score
  manager.update("acct-1", EntityKind::ACCOUNT, 0.1, "call");
  auto stored = backing.getRiskProfile("acct-1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->fraudCount, 3);
  EXPECT_NEAR(stored->currentRiskScore, 0.66, 1e-9);
  EXPECT_THAT(stored->history, SizeIs(1));
  EXPECT_NEAR(manager.get("acct-1").value(), 0.66, 1e-9);
}

TEST(RiskProfileManagerNoStore, CacheOnly) {
  RiskProfileManager manager(nullptr);
  EXPECT_FALSE(manager.get("acct-1"));
  manager.update("acct-1", EntityKind::ACCOUNT, 0.7, "call");
  EXPECT_DOUBLE_EQ(manager.get("acct-1").value(), 0.7);
}
