#include "Heuristics.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <string>
#include <folly/String.h>

using folly::StringPiece;

static const char* suspiciousDomains[] = {
  "tempmail.com",
  "guerrillamail.com",
  "mailinator.com",
  "10minutemail.com",
  "throwaway.email",
};

static const int64_t testAmountCents[] = {
  100, 1, 999, 9999, 10000, 100000,
};

uint64_t PhoneNumber::fromString(StringPiece s) {
  s = folly::trimWhitespace(s);
  const bool international = s.startsWith('+');
  if (international)
    s.advance(1);

  uint64_t pn = 0;
  unsigned ndigits = 0;
  for (char c : s) {
    if (c >= '0' && c <= '9') {
      if (++ndigits > 11)
        return NONE;
      pn = pn * 10 + unsigned(c - '0');
    } else if (!strchr(" -().", c)) {
      return NONE;
    }
  }

  // Only the NANP country code is accepted
  if (ndigits == 11 && pn / 10000000000 == 1)
    return pn % 10000000000;
  if (ndigits == 10 && !international)
    return pn;
  return NONE;
}

bool isSuspiciousEmailDomain(StringPiece email) {
  std::string lower = email.str();
  folly::toLowerAscii(lower);
  StringPiece haystack(lower);
  return std::any_of(std::begin(suspiciousDomains), std::end(suspiciousDomains),
                     [&](const char *domain) { return haystack.find(domain) != StringPiece::npos; });
}

bool isValidPhoneFormat(StringPiece phone) {
  if (!phone.startsWith('+'))
    return false;

  phone.advance(1);
  auto digits = std::count_if(phone.begin(), phone.end(),
                              [](char c) { return c >= '0' && c <= '9'; });
  return digits >= 10 && digits <= 15;
}

bool isSuspiciousBidAmount(double amount) {
  if (!std::isfinite(amount))
    return false;

  int64_t cents = std::llround(amount * 100);
  if (std::find(std::begin(testAmountCents), std::end(testAmountCents), cents)
      != std::end(testAmountCents))
    return true;

  // Repeating digits (11.11, 22.22)
  int64_t fraction = std::abs(cents % 100);
  return fraction > 0 && fraction % 11 == 0;
}
