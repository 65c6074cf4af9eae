#include <callrisk/AuditLog.h>
#include <callrisk/MemoryStores.h>

#include <cstdio>
#include <stdexcept>
#include <folly/FileUtil.h>
#include <folly/String.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/portability/GMock.h>
#include <folly/portability/GTest.h>
#include <folly/testing/TestUtil.h>

using namespace testing;
using folly::dynamic;

static std::vector<dynamic> readLines(const std::string &path) {
  std::string text;
  EXPECT_TRUE(folly::readFile(path.c_str(), text));
  std::vector<folly::StringPiece> lines;
  folly::split('\n', folly::trimWhitespace(text), lines);

  std::vector<dynamic> out;
  for (auto line : lines)
    out.push_back(folly::parseJson(line));
  return out;
}

TEST(AuditLogStore, AppendsAndForwards) {
  folly::test::TemporaryDirectory dir;
  const std::string path = (dir.path() / "audit.log").string();
  auto upstream = std::make_shared<InMemoryFraudStore>();

  {
    AuditLogStore audit(upstream, path);
    FraudCheckResult result;
    result.id = "r-1";
    result.entityId = "call-1";
    result.riskScore = 0.4;
    audit.saveCheckResult(result);

    FraudReport report;
    report.id = "f-1";
    report.entityId = "acct-1";
    report.fraudType = "chargeback";
    audit.saveFraudReport(report);
    audit.flush();

    ASSERT_THAT(audit.getCheckHistory("call-1", 10), SizeIs(1));
  }

  auto lines = readLines(path);
  ASSERT_THAT(lines, SizeIs(2));
  EXPECT_EQ(lines[0]["kind"].asString(), "check_result");
  EXPECT_EQ(lines[0]["result"]["id"].asString(), "r-1");
  EXPECT_DOUBLE_EQ(lines[0]["result"]["risk_score"].asDouble(), 0.4);
  EXPECT_EQ(lines[1]["kind"].asString(), "fraud_report");
  EXPECT_EQ(lines[1]["report"]["fraud_type"].asString(), "chargeback");
  EXPECT_THAT(upstream->reports(), SizeIs(1));
}

TEST(AuditLogStore, Rotate) {
  folly::test::TemporaryDirectory dir;
  const std::string path = (dir.path() / "audit.log").string();
  const std::string moved = (dir.path() / "audit.log.1").string();
  AuditLogStore audit(nullptr, path);

  FraudCheckResult result;
  result.entityId = "call-1";
  audit.saveCheckResult(result);
  audit.flush();

  ASSERT_EQ(::rename(path.c_str(), moved.c_str()), 0);
  audit.rotate();
  result.entityId = "call-2";
  audit.saveCheckResult(result);
  audit.flush();

  EXPECT_THAT(readLines(moved), SizeIs(1));
  auto lines = readLines(path);
  ASSERT_THAT(lines, SizeIs(1));
  EXPECT_EQ(lines[0]["result"]["entity_id"].asString(), "call-2");
}

TEST(AuditLogStore, UnwritablePath) {
  folly::test::TemporaryDirectory dir;
  const std::string path = (dir.path() / "missing" / "audit.log").string();
  auto upstream = std::make_shared<InMemoryFraudStore>();
  AuditLogStore audit(upstream, path);

  FraudCheckResult result;
  result.entityId = "call-1";
  EXPECT_THROW(audit.saveCheckResult(result), std::runtime_error);
  EXPECT_THAT(upstream->getCheckHistory("call-1", 10), IsEmpty());
}

TEST(AuditLogStore, Disabled) {
  auto upstream = std::make_shared<InMemoryFraudStore>();
  AuditLogStore audit(upstream, "");

  FraudCheckResult result;
  result.entityId = "call-1";
  audit.saveCheckResult(result);
  EXPECT_THAT(upstream->getCheckHistory("call-1", 10), SizeIs(1));
}
