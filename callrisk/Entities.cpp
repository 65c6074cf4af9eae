#include "Entities.h"

using folly::StringPiece;

const char* toString(EntityKind kind) noexcept {
  switch (kind) {
  case EntityKind::CALL:
    return "call";
  case EntityKind::BID:
    return "bid";
  case EntityKind::ACCOUNT:
    return "account";
  }
  return "unknown";
}

folly::Optional<EntityKind> parseEntityKind(StringPiece s) {
  if (s == "call")
    return EntityKind::CALL;
  if (s == "bid")
    return EntityKind::BID;
  if (s == "account")
    return EntityKind::ACCOUNT;
  return folly::none;
}

const char* toString(CallDirection direction) noexcept {
  switch (direction) {
  case CallDirection::INBOUND:
    return "inbound";
  case CallDirection::OUTBOUND:
    return "outbound";
  }
  return "unknown";
}

const char* toString(AccountType type) noexcept {
  switch (type) {
  case AccountType::BUYER:
    return "buyer";
  case AccountType::SELLER:
    return "seller";
  case AccountType::ADMIN:
    return "admin";
  }
  return "unknown";
}
