#include "EntityJson.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <folly/Conv.h>
#include <folly/DynamicConverter.h>
#include <folly/dynamic.h>
#include <folly/json.h>

using folly::dynamic;
using folly::StringPiece;

template<class Message>
struct FromJsonVisitor {
  Message msg;
  const char* param = nullptr;

  void visit(const dynamic &d);

  const dynamic& required(const dynamic &d, const char *name) {
    param = name;
    return d[name];
  }

  const dynamic* optional(const dynamic &d, const char *name) {
    param = name;
    const dynamic *v = d.get_ptr(name);
    return (v && !v->isNull()) ? v : nullptr;
  }

  SystemTimePoint time(const dynamic &d, const char *name) {
    const dynamic *v = optional(d, name);
    return v ? fromMicros(v->asInt()) : SystemTimePoint{};
  }
};

template<class M> folly::Expected<M, FraudError>
EntityJson<M>::fromJson(const dynamic &d) {
  FromJsonVisitor<M> visitor;
  FraudError err;

  try {
    if (d.isString()) {
      dynamic json = folly::parseJson(d.stringPiece());
      visitor.visit(json);
    } else {
      visitor.visit(d);
    }
    if ((err = validate(visitor.msg)))
      return folly::makeUnexpected(std::move(err));
    return std::move(visitor.msg);
  } catch (const folly::json::parse_error &e) {
    err = FRAUD_VAL_FAILED_TO_PARSE;
    err.putVariable("invalid JSON body");
  } catch (const std::out_of_range &ex) {
    err = FRAUD_VAL_INVALID_PARAMETER;
    err.putVariable(visitor.param ? visitor.param : "body");
    err.putVariable("missing mandatory parameter");
  } catch (const folly::TypeError &ex) {
    err = FRAUD_VAL_INVALID_PARAMETER;
    err.putVariable(visitor.param ? visitor.param : "body");
    err.putVariable(ex.what());
  } catch (const folly::ConversionError &ex) {
    err = FRAUD_VAL_INVALID_PARAMETER;
    err.putVariable(visitor.param ? visitor.param : "body");
    err.putVariable(ex.what());
  } catch (const std::invalid_argument &ex) {
    err = FRAUD_VAL_INVALID_PARAMETER;
    err.putVariable(visitor.param ? visitor.param : "body");
    err.putVariable(ex.what());
  }
  return folly::makeUnexpected(std::move(err));
}

static bool validateTN(const std::string &tn) {
  static const char* acceptedChars = "0123456789*#+.-() ";
  auto pred = [](char c) { return !!strchr(acceptedChars, c); };
  return std::all_of(tn.begin(), tn.end(), pred);
}

template<> void FromJsonVisitor<Call>::visit(const dynamic &d) {
  msg.id = required(d, "id").asString();
  msg.fromNumber = required(d, "from_number").asString();
  msg.toNumber = required(d, "to_number").asString();
  msg.buyerId = required(d, "buyer_id").asString();
  if (auto v = optional(d, "seller_id"))
    msg.sellerId = v->asString();
  if (auto v = optional(d, "direction")) {
    if (v->asString() == "outbound")
      msg.direction = CallDirection::OUTBOUND;
    else if (v->asString() != "inbound")
      throw std::invalid_argument("expected 'inbound' or 'outbound'");
  }
  msg.startTime = time(d, "start_time");
  if (auto v = optional(d, "duration"))
    msg.durationSec = v->asInt();
  if (auto v = optional(d, "cost"))
    msg.cost = v->asDouble();
  if (auto v = optional(d, "source_country"))
    msg.sourceCountry = v->asString();
  if (auto v = optional(d, "dest_country"))
    msg.destCountry = v->asString();
  if (auto v = optional(d, "has_cli"))
    msg.hasCLI = v->asBool();
  if (auto v = optional(d, "cli_validated"))
    msg.cliValidated = v->asBool();
  if (auto v = optional(d, "ip_address"))
    msg.ipAddress = v->asString();
}

template<> FraudError EntityJson<Call>::validate(const Call &m) {
  FraudError err = FRAUD_VAL_INVALID_PARAMETER;
  if (m.id.empty()) {
    err.putVariable("id");
    err.putVariable("should not be empty");
  } else if (!validateTN(m.fromNumber)) {
    err.putVariable("from_number");
    err.putVariable("Only [0-9*#+.-() ] characters allowed for TN");
  } else if (!validateTN(m.toNumber)) {
    err.putVariable("to_number");
    err.putVariable("Only [0-9*#+.-() ] characters allowed for TN");
  } else if (m.durationSec && *m.durationSec < 0) {
    err.putVariable("duration");
    err.putVariable("should not be negative");
  } else {
    return {};
  }
  return err;
}

template<> void FromJsonVisitor<Bid>::visit(const dynamic &d) {
  msg.id = required(d, "id").asString();
  msg.buyerId = required(d, "buyer_id").asString();
  msg.amount = required(d, "amount").asDouble();
  if (auto v = optional(d, "call_id"))
    msg.callId = v->asString();
  if (auto v = optional(d, "seller_id"))
    msg.sellerId = v->asString();
  if (auto v = optional(d, "quality"))
    msg.historicalRating = v->asDouble();
  msg.placedAt = time(d, "placed_at");
  if (auto v = optional(d, "auction_start"))
    msg.auctionStart = fromMicros(v->asInt());
  if (auto v = optional(d, "countries"))
    msg.countries = folly::convertTo<std::vector<std::string>>(*v);
}

template<> FraudError EntityJson<Bid>::validate(const Bid &m) {
  FraudError err = FRAUD_VAL_INVALID_PARAMETER;
  if (m.id.empty()) {
    err.putVariable("id");
    err.putVariable("should not be empty");
  } else if (!std::isfinite(m.amount) || m.amount < 0) {
    err.putVariable("amount");
    err.putVariable("should be a non-negative number");
  } else {
    return {};
  }
  return err;
}

template<> void FromJsonVisitor<Account>::visit(const dynamic &d) {
  msg.id = required(d, "id").asString();
  msg.email = required(d, "email").asString();
  if (auto v = optional(d, "phone_number"))
    msg.phoneNumber = v->asString();
  if (auto v = optional(d, "type")) {
    const std::string &type = v->asString();
    if (type == "buyer")
      msg.type = AccountType::BUYER;
    else if (type == "seller")
      msg.type = AccountType::SELLER;
    else if (type == "admin")
      msg.type = AccountType::ADMIN;
    else
      throw std::invalid_argument("expected 'buyer', 'seller' or 'admin'");
  }
  if (auto v = optional(d, "status"))
    msg.status = v->asString();
  if (auto v = optional(d, "quality_score"))
    msg.qualityScore = v->asDouble();
  msg.createdAt = time(d, "created_at");
  if (auto v = optional(d, "country"))
    msg.country = v->asString();
  if (auto v = optional(d, "failed_payments"))
    msg.failedPayments = folly::to<int>(v->asInt());
  if (auto v = optional(d, "dispute_count"))
    msg.disputeCount = folly::to<int>(v->asInt());
}

template<> FraudError EntityJson<Account>::validate(const Account &m) {
  FraudError err = FRAUD_VAL_INVALID_PARAMETER;
  if (m.id.empty()) {
    err.putVariable("id");
    err.putVariable("should not be empty");
  } else if (m.qualityScore < 0 || m.qualityScore > 100) {
    err.putVariable("quality_score");
    err.putVariable("must be within [0, 100]");
  } else {
    return {};
  }
  return err;
}

template<> void FromJsonVisitor<FraudReport>::visit(const dynamic &d) {
  msg.entityId = required(d, "entity_id").asString();
  const std::string &kind = required(d, "entity_type").asString();
  if (auto parsed = parseEntityKind(kind))
    msg.entityKind = *parsed;
  else
    throw std::invalid_argument("expected 'call', 'bid' or 'account'");
  if (auto v = optional(d, "reported_by"))
    msg.reportedBy = v->asString();
  msg.fraudType = required(d, "fraud_type").asString();
  if (auto v = optional(d, "description"))
    msg.description = v->asString();
  if (auto v = optional(d, "evidence"))
    msg.evidence = *v;
  if (auto v = optional(d, "action_taken"))
    msg.actionTaken = v->asString();
}

template<> FraudError EntityJson<FraudReport>::validate(const FraudReport &m) {
  FraudError err = FRAUD_VAL_INVALID_PARAMETER;
  if (m.entityId.empty()) {
    err.putVariable("entity_id");
    err.putVariable("should not be empty");
  } else if (m.fraudType.empty()) {
    err.putVariable("fraud_type");
    err.putVariable("should not be empty");
  } else {
    return {};
  }
  return err;
}

template struct EntityJson<Call>;
template struct EntityJson<Bid>;
template struct EntityJson<Account>;
template struct EntityJson<FraudReport>;
