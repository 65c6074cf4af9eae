#include "RuleConfig.h"

#include <glog/logging.h>
#include <folly/Conv.h>
#include <folly/dynamic.h>
#include <folly/json.h>

using folly::dynamic;

LiveRules::LiveRules(FraudRules initial)
{
  if (FraudError err = validate(initial)) {
    LOG(ERROR) << "Initial fraud rules rejected, using defaults: " << err.message();
    initial = FraudRules::defaults();
  }
  state_.wlock()->rules = std::make_shared<const FraudRules>(std::move(initial));
}

static bool isScore(double v) {
  return v >= 0.0 && v <= 1.0;
}

FraudError LiveRules::validate(const FraudRules &rules) {
  FraudError err = FRAUD_VAL_INVALID_PARAMETER;

  if (!isScore(rules.requireMFAScore)) {
    err.putVariable("require_mfa_score");
    err.putVariable("must be within [0, 1]");
  } else if (!isScore(rules.autoBlockScore)) {
    err.putVariable("auto_block_score");
    err.putVariable("must be within [0, 1]");
  } else if (rules.requireMFAScore > rules.autoBlockScore) {
    err.putVariable("require_mfa_score");
    err.putVariable("must not exceed auto_block_score");
  } else {
    for (const auto& kv : rules.riskThresholds) {
      if (!isScore(kv.second)) {
        err.putVariable("risk_thresholds." + kv.first);
        err.putVariable("must be within [0, 1]");
        return err;
      }
    }
    for (const auto& kv : rules.velocityLimits) {
      if (kv.second.maxCount <= 0 || kv.second.window.count() <= 0) {
        err.putVariable("velocity_limits." + kv.first);
        err.putVariable("max_count and window_sec must be positive");
        return err;
      }
    }
    return {};
  }
  return err;
}

folly::Expected<uint64_t, FraudError>
LiveRules::replace(std::unique_ptr<FraudRules> rules) {
  if (!rules)
    return folly::makeUnexpected(FraudError(FRAUD_VAL_MISSING_RULES));
  if (FraudError err = validate(*rules))
    return folly::makeUnexpected(std::move(err));

  std::shared_ptr<const FraudRules> recruit(std::move(rules));
  uint64_t version;
  {
    auto locked = state_.wlock();
    locked->rules = std::move(recruit);
    version = ++locked->version;
  }
  LOG(INFO) << "Fraud rules replaced (version " << version << ")";
  return version;
}

RuleSnapshot LiveRules::snapshot() const {
  auto locked = state_.rlock();
  RuleSnapshot snap;
  snap.rules = locked->rules;
  snap.mlEnabled = locked->rules->mlEnabled;
  snap.rulesEnabled = locked->rules->rulesEnabled;
  snap.requireMFAScore = locked->rules->requireMFAScore;
  snap.autoBlockScore = locked->rules->autoBlockScore;
  snap.version = locked->version;
  return snap;
}

std::shared_ptr<const FraudRules> LiveRules::current() const {
  return state_.rlock()->rules;
}

folly::Expected<FraudRules, FraudError> LiveRules::fromJson(const dynamic &d) {
  FraudRules rules = FraudRules::defaults();
  const char *param = nullptr;
  FraudError err;

  try {
    dynamic parsed;
    if (d.isString())
      parsed = folly::parseJson(d.stringPiece());
    const dynamic &json = d.isString() ? parsed : d;
    if (!json.isObject())
      throw folly::TypeError("object", json.type());

    if (const dynamic *limits = json.get_ptr("velocity_limits")) {
      param = "velocity_limits";
      for (const auto& kv : limits->items()) {
        VelocityLimit limit;
        limit.action = kv.first.asString();
        limit.maxCount = kv.second["max_count"].asInt();
        limit.window = std::chrono::seconds(kv.second["window_sec"].asInt());
        rules.velocityLimits[limit.action] = std::move(limit);
      }
    }
    if (const dynamic *tiers = json.get_ptr("risk_thresholds")) {
      param = "risk_thresholds";
      rules.riskThresholds.clear();
      for (const auto& kv : tiers->items())
        rules.riskThresholds[kv.first.asString()] = kv.second.asDouble();
    }
    param = "ml_enabled";
    rules.mlEnabled = json.getDefault(param, rules.mlEnabled).asBool();
    param = "rules_enabled";
    rules.rulesEnabled = json.getDefault(param, rules.rulesEnabled).asBool();
    param = "require_mfa_score";
    rules.requireMFAScore = json.getDefault(param, rules.requireMFAScore).asDouble();
    param = "auto_block_score";
    rules.autoBlockScore = json.getDefault(param, rules.autoBlockScore).asDouble();

    if ((err = validate(rules)))
      return folly::makeUnexpected(std::move(err));
    return rules;
  } catch (const folly::json::parse_error &e) {
    err = FRAUD_VAL_FAILED_TO_PARSE;
    err.putVariable("invalid JSON rules");
  } catch (const std::out_of_range &e) {
    err = FRAUD_VAL_INVALID_PARAMETER;
    err.putVariable(param ? param : "rules");
    err.putVariable("missing field");
  } catch (const folly::TypeError &e) {
    err = FRAUD_VAL_INVALID_PARAMETER;
    err.putVariable(param ? param : "rules");
    err.putVariable(e.what());
  } catch (const folly::ConversionError &e) {
    err = FRAUD_VAL_INVALID_PARAMETER;
    err.putVariable(param ? param : "rules");
    err.putVariable(e.what());
  }
  return folly::makeUnexpected(std::move(err));
}
