#ifndef CALLRISK_HEURISTICS_H
#define CALLRISK_HEURISTICS_H

#include <cstdint>
#include <limits>
#include <folly/Range.h>

class PhoneNumber {
public:
  static constexpr uint64_t NONE =
    std::numeric_limits<uint64_t>::max();
  /** Parse a NANP number into its 10 digits, NONE if it isn't one. */
  static uint64_t fromString(folly::StringPiece s);
  /** Three digit area code of a parsed number. */
  static unsigned areaCode(uint64_t pn) noexcept { return unsigned(pn / 10000000); }
};

/* Email belongs to a throwaway mail provider (substring match). */
bool isSuspiciousEmailDomain(folly::StringPiece email);

/* Leading '+' followed by 10 to 15 digits; other punctuation is ignored. */
bool isValidPhoneFormat(folly::StringPiece phone);

/* Well-known test amounts and repeated-digit cents such as 22.22 */
bool isSuspiciousBidAmount(double amount);

#endif // CALLRISK_HEURISTICS_H
