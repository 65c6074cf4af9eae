#include "Replay.h"
#include "EntityJson.h"
#include "FraudDetector.h"
#include "MemoryStores.h"

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <sstream>
#include <glog/logging.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/stop_watch.h>
#include <folly/String.h>

using folly::StringPiece;
using folly::dynamic;

static constexpr auto reportInterval = std::chrono::seconds(30);

static StringPiece osBasename(StringPiece path) {
  auto idx = path.rfind('/');
  if (idx == StringPiece::npos) {
    return path;
  }
  return path.subpiece(idx + 1);
}

std::unique_ptr<FraudRules> loadRulesFile(const std::string &path) {
  std::ifstream in;
  std::ostringstream text;

  try {
    in.exceptions(std::ios_base::failbit | std::ios_base::badbit);
    in.open(path);
    text << in.rdbuf();
    in.close();
  } catch (const std::exception &e) {
    LOG(ERROR) << osBasename(path) << ": " << e.what();
    return nullptr;
  }

  auto rules = LiveRules::fromJson(dynamic(text.str()));
  if (!rules) {
    LOG(ERROR) << osBasename(path) << ": " << rules.error().message();
    return nullptr;
  }

  LOG(INFO) << "Loaded fraud rules from " << osBasename(path)
            << " (" << rules->velocityLimits.size() << " velocity limits)";
  return std::make_unique<FraudRules>(std::move(rules.value()));
}

bool loadDenylistFile(const std::string &path, InMemoryDenylist &denylist) {
  std::ifstream in;
  size_t line = 0;

  try {
    in.exceptions(std::ios_base::badbit);
    in.open(path);
    if (!in.is_open())
      throw std::runtime_error("could not open file");
    denylist.fromCSV(in, line);
  } catch (const std::exception &e) {
    LOG(ERROR) << osBasename(path) << ':' << line << ": " << e.what();
    return false;
  }

  LOG(INFO) << "Loaded denylist (" << line << " rows, "
            << denylist.size() << " entries)";
  return true;
}

static dynamic failure(const FraudError &err) {
  return dynamic::object("error", err.toJson());
}

template<class M, class F>
static dynamic withEntity(const dynamic &json, F &&check) {
  auto entity = EntityJson<M>::fromJson(json);
  if (!entity)
    return failure(entity.error());
  return check(entity.value());
}

EventReplayer::EventReplayer(FraudDetector &detector)
  : detector_(detector)
{
}

dynamic EventReplayer::handle(const dynamic &event) {
  if (!event.isObject()) {
    FraudError err = FRAUD_VAL_FAILED_TO_PARSE;
    err.putVariable("event should be a JSON object");
    return failure(err);
  }

  const dynamic *type = event.get_ptr("type");
  const std::string kind = (type && type->isString()) ? type->getString() : "";
  auto outcome = [](const FraudDetector::CheckOutcome &r) -> dynamic {
    if (!r)
      return failure(r.error());
    return dynamic::object("result", toJson(r.value()));
  };

  if (kind == "call") {
    return withEntity<Call>(event, [&](const Call &call) -> dynamic {
      return outcome(detector_.checkCall(&call));
    });
  } else if (kind == "bid") {
    const dynamic *buyerJson = event.get_ptr("buyer");
    if (!buyerJson) {
      FraudError err = FRAUD_VAL_INVALID_PARAMETER;
      err.putVariable("buyer");
      err.putVariable("missing mandatory parameter");
      return failure(err);
    }
    auto buyer = EntityJson<Account>::fromJson(*buyerJson);
    if (!buyer)
      return failure(buyer.error());
    return withEntity<Bid>(event, [&](const Bid &bid) -> dynamic {
      return outcome(detector_.checkBid(&bid, &buyer.value()));
    });
  } else if (kind == "account") {
    return withEntity<Account>(event, [&](const Account &account) -> dynamic {
      return outcome(detector_.checkAccount(&account));
    });
  } else if (kind == "report") {
    return withEntity<FraudReport>(event, [&](const FraudReport &report) -> dynamic {
      auto recorded = detector_.reportFraud(&report);
      if (!recorded)
        return failure(recorded.error());
      return dynamic::object("report", toJson(recorded.value()));
    });
  } else if (kind == "score") {
    const std::string id = event.getDefault("entity_id", "").asString();
    auto entityKind = parseEntityKind(event.getDefault("entity_type", "account").asString());
    auto score = detector_.getRiskScore(id, entityKind.value_or(EntityKind::ACCOUNT));
    if (!score)
      return failure(score.error());
    return dynamic::object("entity_id", id)("risk_score", score.value());
  } else if (kind == "rules") {
    auto rules = LiveRules::fromJson(event.getDefault("rules", dynamic::object()));
    if (!rules)
      return failure(rules.error());
    auto version = detector_.updateRules(std::make_unique<FraudRules>(std::move(rules.value())));
    if (!version)
      return failure(version.error());
    return dynamic::object("rules_version", static_cast<int64_t>(version.value()));
  }

  FraudError err = FRAUD_VAL_INVALID_PARAMETER;
  err.putVariable("type");
  err.putVariable("expected call, bid, account, report, score or rules");
  return failure(err);
}

size_t EventReplayer::replay(std::istream &in, std::ostream &out) {
  std::string linebuf;
  folly::stop_watch<> watch;
  size_t line = 0;
  size_t failed = 0;

  while (std::getline(in, linebuf)) {
    ++line;
    if (folly::trimWhitespace(linebuf).empty())
      continue;

    dynamic answer;
    try {
      answer = handle(folly::parseJson(linebuf));
    } catch (const std::exception &e) {
      FraudError err = FRAUD_VAL_FAILED_TO_PARSE;
      err.putVariable(e.what());
      answer = failure(err);
    }

    if (answer.count("error"))
      ++failed;
    answer["line"] = static_cast<int64_t>(line);
    out << folly::toJson(answer) << '\n';

    if (watch.lap(reportInterval))
      LOG(INFO) << line << " events replayed";
  }

  LOG_IF(WARNING, failed != 0) << failed << " of " << line << " events failed";
  return failed;
}
