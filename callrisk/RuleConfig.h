#ifndef CALLRISK_RULE_CONFIG_H
#define CALLRISK_RULE_CONFIG_H

#include <cstdint>
#include <memory>
#include <folly/Expected.h>
#include <folly/SharedMutex.h>
#include <folly/Synchronized.h>

#include "FraudError.h"
#include "FraudTypes.h"

namespace folly { struct dynamic; }

/* What an evaluation needs, copied out once under the shared lock. */
struct RuleSnapshot {
  std::shared_ptr<const FraudRules> rules;
  bool mlEnabled = true;
  bool rulesEnabled = true;
  double requireMFAScore = 0.7;
  double autoBlockScore = 0.9;
  uint64_t version = 0;
};

/*
 * Process-wide fraud rules. Replacement is whole-object: a validated
 * FraudRules is swapped in under the exclusive lock and gets the next
 * version number. Evaluations that already took a snapshot keep it.
 */
class LiveRules {
 public:
  explicit LiveRules(FraudRules initial = FraudRules::defaults());

  /** Validate and swap. Returns the new version. */
  folly::Expected<uint64_t, FraudError> replace(std::unique_ptr<FraudRules> rules);

  RuleSnapshot snapshot() const;
  /** Full rules object; for tier labels and diagnostics. */
  std::shared_ptr<const FraudRules> current() const;

  static FraudError validate(const FraudRules &rules);
  /** Parse rules JSON on top of the defaults and validate it. */
  static folly::Expected<FraudRules, FraudError> fromJson(const folly::dynamic &json);

 private:
  struct State {
    std::shared_ptr<const FraudRules> rules;
    uint64_t version = 0;
  };
  folly::Synchronized<State, folly::SharedMutex> state_;
};

#endif // CALLRISK_RULE_CONFIG_H
