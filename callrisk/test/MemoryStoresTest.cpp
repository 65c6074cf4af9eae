#include <callrisk/MemoryStores.h>

#include <sstream>
#include <stdexcept>
#include <folly/Conv.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>

using namespace testing;

TEST(InMemoryDenylist, Normalization) {
  InMemoryDenylist denylist;
  denylist.add("(484) 424-9683", "phone", "robocaller");
  denylist.add("Fraud@Example.COM", "email", "chargebacks");

  auto hit = denylist.isDenylisted("+14844249683", "phone");
  EXPECT_TRUE(hit.matched);
  EXPECT_EQ(hit.reason, "robocaller");
  EXPECT_TRUE(denylist.isDenylisted("fraud@example.com", "email").matched);

  // Kinds are separate namespaces
  EXPECT_FALSE(denylist.isDenylisted("fraud@example.com", "account").matched);
  EXPECT_FALSE(denylist.isDenylisted("+14844249684", "phone").matched);

  EXPECT_TRUE(denylist.remove("4844249683", "phone"));
  EXPECT_FALSE(denylist.remove("4844249683", "phone"));
  EXPECT_EQ(denylist.size(), 1u);
}

TEST(InMemoryDenylist, CSV) {
  std::istringstream csv(
    "+14844249683,phone,robocaller\n"
    "\n"
    "acct-13, account\n"
    "spam@tempmail.com,email, throwaway\n");
  InMemoryDenylist denylist;
  size_t line = 0;
  denylist.fromCSV(csv, line);

  EXPECT_EQ(line, 4u);
  EXPECT_EQ(denylist.size(), 3u);
  EXPECT_EQ(denylist.isDenylisted("acct-13", "account").reason, "denylisted");
  EXPECT_EQ(denylist.isDenylisted("spam@tempmail.com", "email").reason, "throwaway");
}

TEST(InMemoryDenylist, BadCSV) {
  std::istringstream csv(
    "+14844249683,phone\n"
    "justonecolumn\n");
  InMemoryDenylist denylist;
  size_t line = 0;
  EXPECT_THROW(denylist.fromCSV(csv, line), std::runtime_error);
  EXPECT_EQ(line, 2u);
}

TEST(SlidingWindowVelocity, Window) {
  SystemTimePoint now = fromMicros(1700000000000000);
  std::map<std::string, VelocityLimit> limits;
  limits["call_placement"] = VelocityLimit{"call_placement", 2, std::chrono::seconds(60)};
  SlidingWindowVelocity velocity(limits, [&now] { return now; });

  EXPECT_TRUE(velocity.checkVelocity("buyer-1", "call_placement").passed);
  velocity.recordAction("buyer-1", "call_placement");
  now += std::chrono::seconds(10);
  velocity.recordAction("buyer-1", "call_placement");

  VelocityResult r = velocity.checkVelocity("buyer-1", "call_placement");
  EXPECT_FALSE(r.passed);
  EXPECT_EQ(r.count, 2);
  EXPECT_EQ(r.limit, 2);
  EXPECT_EQ(r.window, std::chrono::seconds(60));

  // Other entities have their own window
  EXPECT_TRUE(velocity.checkVelocity("buyer-2", "call_placement").passed);

  // First action slides out
  now += std::chrono::seconds(50);
  r = velocity.checkVelocity("buyer-1", "call_placement");
  EXPECT_TRUE(r.passed);
  EXPECT_EQ(r.count, 1);
  EXPECT_EQ(velocity.size(), 1u);

  // Emptied windows go away
  now += std::chrono::seconds(10);
  EXPECT_EQ(velocity.checkVelocity("buyer-1", "call_placement").count, 0);
  EXPECT_EQ(velocity.size(), 0u);
}

TEST(SlidingWindowVelocity, Sweep) {
  SystemTimePoint now = fromMicros(1700000000000000);
  std::map<std::string, VelocityLimit> limits;
  limits["call_placement"] = VelocityLimit{"call_placement", 5, std::chrono::seconds(60)};
  SlidingWindowVelocity velocity(limits, [&now] { return now; });

  for (int i = 0; i < 3; ++i)
    velocity.recordAction(folly::to<std::string>("buyer-", i), "call_placement");
  now += std::chrono::seconds(30);
  velocity.recordAction("buyer-3", "call_placement");
  EXPECT_EQ(velocity.size(), 4u);

  now += std::chrono::seconds(30);
  EXPECT_EQ(velocity.sweep(), 3u);
  EXPECT_EQ(velocity.size(), 1u);
}

TEST(SlidingWindowVelocity, FollowsLiveRules) {
  auto rules = std::make_shared<LiveRules>();
  SlidingWindowVelocity velocity(rules);
  EXPECT_EQ(velocity.checkVelocity("buyer-1", "call_placement").limit, 100);

  auto strict = std::make_unique<FraudRules>(FraudRules::defaults());
  strict->velocityLimits["call_placement"].maxCount = 1;
  ASSERT_TRUE(rules->replace(std::move(strict)).hasValue());

  velocity.recordAction("buyer-1", "call_placement");
  VelocityResult r = velocity.checkVelocity("buyer-1", "call_placement");
  EXPECT_EQ(r.limit, 1);
  EXPECT_FALSE(r.passed);
}

TEST(SlidingWindowVelocity, UnknownAction) {
  SlidingWindowVelocity velocity(std::map<std::string, VelocityLimit>{});
  velocity.recordAction("buyer-1", "refund");
  VelocityResult r = velocity.checkVelocity("buyer-1", "refund");
  EXPECT_TRUE(r.passed);
  EXPECT_EQ(r.limit, 0);
}

TEST(InMemoryFraudStore, HistoryNewestFirst) {
  InMemoryFraudStore store;
  for (int i = 0; i < 5; ++i) {
    FraudCheckResult r;
    r.entityId = "acct-1";
    r.riskScore = i / 10.0;
    store.saveCheckResult(r);
  }

  auto history = store.getCheckHistory("acct-1", 3);
  ASSERT_THAT(history, SizeIs(3));
  EXPECT_DOUBLE_EQ(history[0].riskScore, 0.4);
  EXPECT_DOUBLE_EQ(history[2].riskScore, 0.2);
  EXPECT_THAT(store.getCheckHistory("acct-2", 3), IsEmpty());
}

TEST(InMemoryFraudStore, Profiles) {
  InMemoryFraudStore store;
  EXPECT_FALSE(store.getRiskProfile("acct-1").has_value());

  RiskProfile profile;
  profile.entityId = "acct-1";
  profile.currentRiskScore = 0.25;
  store.saveRiskProfile(profile);
  profile.currentRiskScore = 0.5;
  store.saveRiskProfile(profile);

  auto loaded = store.getRiskProfile("acct-1");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_DOUBLE_EQ(loaded->currentRiskScore, 0.5);
}
