#include "FraudError.h"

#include <vector>
#include <folly/dynamic.h>
#include <folly/String.h>
#include <folly/Conv.h>

using folly::dynamic;
using folly::StringPiece;

struct FraudErrorClass {
  const char *id;
  const char *reflect;
  const char *text;
  FraudErrorKind kind;
};

static FraudErrorClass fraudError[] = {
  { "VAL4000", "FRAUD_VAL_MISSING_ENTITY", "Missing entity to check", FraudErrorKind::VALIDATION },
  { "VAL4001", "FRAUD_VAL_MISSING_ENTITY_ID", "Missing mandatory entity id for ‘%1’", FraudErrorKind::VALIDATION },
  { "VAL4002", "FRAUD_VAL_MISSING_BUYER", "Bid ‘%1’ has no buyer account", FraudErrorKind::VALIDATION },
  { "VAL4003", "FRAUD_VAL_MISSING_REPORT", "Fraud report cannot be empty", FraudErrorKind::VALIDATION },
  { "VAL4004", "FRAUD_VAL_MISSING_RULES", "Fraud rules cannot be empty", FraudErrorKind::VALIDATION },
  { "VAL4005", "FRAUD_VAL_INVALID_PARAMETER", "Invalid ‘%1’ parameter value: %2", FraudErrorKind::VALIDATION },
  { "VAL4006", "FRAUD_VAL_FAILED_TO_PARSE", "Failed to parse input: %1", FraudErrorKind::VALIDATION },
  { "NFD4040", "FRAUD_NF_RISK_PROFILE", "Risk profile for ‘%1’ was not found", FraudErrorKind::NOT_FOUND },
  { "INT5000", "FRAUD_INT_STORE_FAILURE", "Store operation ‘%1’ failed: %2", FraudErrorKind::INTERNAL },
};

static_assert(sizeof(fraudError) / sizeof(fraudError[0]) == FRAUD_ERROR_MAX,
              "error table out of sync with FraudErrorCode");

FraudError::FraudError(FraudErrorCode code) noexcept
  : kind_(&fraudError[code])
{
}

const char* FraudError::id() const noexcept {
  return kind_->id;
}

const char* FraudError::reflect() const noexcept {
  return kind_->reflect;
}

FraudErrorKind FraudError::kind() const noexcept {
  return kind_->kind;
}

void FraudError::putVariable(StringPiece value) {
  if (!vars_.empty())
    vars_ += '\t';
  vars_.append(value.data(), value.size());
}

std::string FraudError::message() const {
  std::vector<StringPiece> vars;
  if (!vars_.empty())
    folly::split('\t', vars_, vars);

  std::string out;
  for (const char *p = kind_->text; *p; ++p) {
    if (p[0] == '%' && p[1] >= '1' && p[1] <= '9') {
      size_t index = p[1] - '1';
      if (index < vars.size())
        out.append(vars[index].data(), vars[index].size());
      ++p;
    } else {
      out += *p;
    }
  }
  return out;
}

dynamic FraudError::toJson() const {
  dynamic vars = dynamic::array;
  if (!vars_.empty()) {
    folly::splitTo<StringPiece>('\t', vars_, std::back_inserter(vars));
  }

  return dynamic::object
    ("messageId", kind_->id)
    ("kind", toString(kind_->kind))
    ("text", message())
    ("variables", std::move(vars));
}

const char* toString(FraudErrorKind kind) noexcept {
  switch (kind) {
  case FraudErrorKind::VALIDATION:
    return "validation";
  case FraudErrorKind::NOT_FOUND:
    return "not_found";
  case FraudErrorKind::INTERNAL:
    return "internal";
  }
  return "unknown";
}
