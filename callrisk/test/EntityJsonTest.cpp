#include <callrisk/EntityJson.h>

#include <cmath>
#include <folly/dynamic.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>

using namespace testing;
using folly::dynamic;

template<class Ops>
void ExpectParseError(const dynamic& bad, const char* id, const char* param) {
  auto result = Ops::fromJson(bad);
  if (!result) {
    dynamic detail = result.error().toJson();
    EXPECT_THAT(detail["messageId"].asString(), Eq(id));
    EXPECT_THAT(detail["variables"][0].asString(), Eq(param));
  } else {
    FAIL();
  }
}

#define EXPECT_PARSE_ERROR(id, param)           \
  do {                                          \
    SCOPED_TRACE(param);                        \
    ExpectParseError<Ops>(bad, id, param);      \
  } while (0)

TEST(EntityJson, Call) {
  using Ops = EntityJson<Call>;

  dynamic sample = dynamic::object
    ("id", "call-1")
    ("from_number", "+1-484-424-9683")
    ("to_number", "(215) 555-1212")
    ("buyer_id", "buyer-1")
    ("direction", "outbound")
    ("start_time", 1700000000000000)
    ("duration", 42)
    ("cost", 0.35)
    ("source_country", "US")
    ("dest_country", "US")
    ("has_cli", false);

  Call msg = Ops::fromJson(sample).value();
  EXPECT_EQ(msg.id, "call-1");
  EXPECT_EQ(msg.fromNumber, "+1-484-424-9683");
  EXPECT_EQ(msg.buyerId, "buyer-1");
  EXPECT_EQ(msg.direction, CallDirection::OUTBOUND);
  EXPECT_EQ(toMicros(msg.startTime), 1700000000000000);
  EXPECT_EQ(msg.durationSec.value(), 42);
  EXPECT_DOUBLE_EQ(msg.cost.value(), 0.35);
  EXPECT_FALSE(msg.hasCLI);
  EXPECT_FALSE(msg.sellerId.has_value());

  for (auto param : {"id", "from_number", "to_number", "buyer_id"}) {
    dynamic bad = sample;
    bad.erase(param);
    EXPECT_PARSE_ERROR("VAL4005", param);
  }

  dynamic bad;
#define CORRUPT(param, val)                     \
  bad = sample; bad[param] = val;               \
  EXPECT_PARSE_ERROR("VAL4005", param);

  CORRUPT("id", "");
  CORRUPT("from_number", "call me maybe");
  CORRUPT("to_number", dynamic::array("12155551212"));
  CORRUPT("direction", "sideways");
  CORRUPT("duration", -5);
  CORRUPT("duration", "long");
  CORRUPT("has_cli", dynamic::object);
#undef CORRUPT
}

TEST(EntityJson, Bid) {
  using Ops = EntityJson<Bid>;

  dynamic sample = dynamic::object
    ("id", "bid-1")
    ("buyer_id", "buyer-1")
    ("amount", 12.5)
    ("call_id", "call-1")
    ("quality", 4.5)
    ("placed_at", 1700000000000000)
    ("auction_start", 1699999999000000)
    ("countries", dynamic::array("US", "CA"));

  Bid msg = Ops::fromJson(sample).value();
  EXPECT_DOUBLE_EQ(msg.amount, 12.5);
  EXPECT_EQ(msg.callId, "call-1");
  ASSERT_TRUE(msg.auctionStart.has_value());
  EXPECT_EQ(msg.placedAt - *msg.auctionStart, std::chrono::seconds(1));
  EXPECT_THAT(msg.countries, ElementsAre("US", "CA"));

  dynamic bad = sample;
  bad.erase("amount");
  EXPECT_PARSE_ERROR("VAL4005", "amount");

#define CORRUPT(param, val)                     \
  bad = sample; bad[param] = val;               \
  EXPECT_PARSE_ERROR("VAL4005", param);

  CORRUPT("amount", -1);
  CORRUPT("amount", std::nan(""));
  CORRUPT("countries", "US");
#undef CORRUPT
}

TEST(EntityJson, Account) {
  using Ops = EntityJson<Account>;

  dynamic sample = dynamic::object
    ("id", "acct-1")
    ("email", "ops@example.com")
    ("phone_number", "+14844249683")
    ("type", "seller")
    ("status", "active")
    ("quality_score", 77)
    ("created_at", 1690000000000000)
    ("country", "US")
    ("failed_payments", 2)
    ("dispute_count", 1);

  Account msg = Ops::fromJson(sample).value();
  EXPECT_EQ(msg.type, AccountType::SELLER);
  EXPECT_DOUBLE_EQ(msg.qualityScore, 77);
  EXPECT_EQ(msg.failedPayments, 2);
  EXPECT_EQ(msg.disputeCount, 1);

  // JSON text is accepted too
  EXPECT_TRUE(Ops::fromJson(dynamic(R"({"id": "acct-2", "email": "a@b.c"})")).hasValue());

  dynamic bad;
#define CORRUPT(param, val)                     \
  bad = sample; bad[param] = val;               \
  EXPECT_PARSE_ERROR("VAL4005", param);

  CORRUPT("type", "superuser");
  CORRUPT("quality_score", 101);
  CORRUPT("failed_payments", 1e12);
#undef CORRUPT

  bad = dynamic("{\"id\": ");
  EXPECT_PARSE_ERROR("VAL4006", "invalid JSON body");
}

TEST(EntityJson, FraudReport) {
  using Ops = EntityJson<FraudReport>;

  dynamic sample = dynamic::object
    ("entity_id", "acct-1")
    ("entity_type", "account")
    ("reported_by", "trust-team")
    ("fraud_type", "chargeback")
    ("evidence", dynamic::object("case", 17));

  FraudReport msg = Ops::fromJson(sample).value();
  EXPECT_EQ(msg.entityKind, EntityKind::ACCOUNT);
  EXPECT_EQ(msg.fraudType, "chargeback");
  EXPECT_EQ(msg.evidence["case"].asInt(), 17);

  dynamic bad;
#define CORRUPT(param, val)                     \
  bad = sample; bad[param] = val;               \
  EXPECT_PARSE_ERROR("VAL4005", param);

  CORRUPT("entity_type", "carrier");
  CORRUPT("entity_id", "");
  CORRUPT("fraud_type", "");
#undef CORRUPT
}
