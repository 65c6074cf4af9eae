#ifndef CALLRISK_ENTITY_JSON_H
#define CALLRISK_ENTITY_JSON_H

#include <folly/Expected.h>

#include "Entities.h"
#include "FraudError.h"
#include "FraudTypes.h"

namespace folly {
  struct dynamic;
}

/*
 * JSON decoding of engine inputs. Timestamps are microseconds since
 * epoch. A failure names the offending parameter.
 */
template<class M>
struct EntityJson {
  static FraudError validate(const M &msg);
  static folly::Expected<M, FraudError> fromJson(const folly::dynamic &json);
};

extern template struct EntityJson<Call>;
extern template struct EntityJson<Bid>;
extern template struct EntityJson<Account>;
extern template struct EntityJson<FraudReport>;

#endif // CALLRISK_ENTITY_JSON_H
