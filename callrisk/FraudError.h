#ifndef CALLRISK_FRAUD_ERROR_H
#define CALLRISK_FRAUD_ERROR_H

#include <string>
#include <folly/FBString.h>
#include <folly/Range.h>

namespace folly {
  struct dynamic;
}

enum FraudErrorCode {
  FRAUD_VAL_MISSING_ENTITY = 0,
  FRAUD_VAL_MISSING_ENTITY_ID,
  FRAUD_VAL_MISSING_BUYER,
  FRAUD_VAL_MISSING_REPORT,
  FRAUD_VAL_MISSING_RULES,
  FRAUD_VAL_INVALID_PARAMETER,
  FRAUD_VAL_FAILED_TO_PARSE,
  FRAUD_NF_RISK_PROFILE,
  FRAUD_INT_STORE_FAILURE,
  FRAUD_ERROR_MAX,
};

enum class FraudErrorKind {
  VALIDATION,
  NOT_FOUND,
  INTERNAL,
};

class FraudErrorClass;
class FraudError {
 public:
  FraudError() noexcept = default;
  /* implicit */ FraudError(FraudErrorCode code) noexcept;

  void putVariable(folly::StringPiece value);
  folly::dynamic toJson() const;

  operator bool() const noexcept { return kind_ != nullptr; }
  const char* id() const noexcept;
  const char* reflect() const noexcept;
  FraudErrorKind kind() const noexcept;

  /** Message template with %N placeholders substituted. */
  std::string message() const;

 private:
  const FraudErrorClass *kind_ = nullptr;
  folly::fbstring vars_;
};

const char* toString(FraudErrorKind kind) noexcept;

#endif // CALLRISK_FRAUD_ERROR_H
