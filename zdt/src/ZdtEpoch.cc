//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// exact decimal codec for seconds / milliseconds since the epoch

#include <zdt/ZdtEpoch.hh>

#include <limits>

namespace {

// nanoseconds per unit, and per unit of the last fractional digit
constexpr int128_t unitNanos(int unit) {
  return unit == ZdtEpoch::Seconds ? 1000000000 : 1000000;
}
constexpr int128_t fracNanos(int unit) {
  return unit == ZdtEpoch::Seconds ? 1000 : 1;
}

constexpr int128_t pow10(unsigned n) {
  int128_t v = 1;
  while (n--) v *= 10;
  return v;
}

} // namespace

bool ZdtEpoch::parse(
    int unit, std::string_view s, ZdtInstant &t, unsigned &fracDigits)
{
  constexpr uint128_t max = std::numeric_limits<int64_t>::max();

  unsigned n = s.length(), i = 0;
  bool negative = false;
  uint128_t integer = 0, frac = 0;
  unsigned digits = 0;

  if (i < n && s[i] == '-') negative = true, ++i;
  if (i >= n) goto invalid;
  while (i < n && s[i] >= '0' && s[i] <= '9') {
    integer = integer * 10 + (s[i++] - '0');
    if (ZdtUnlikely(integer > max)) goto invalid;
    ++digits;
  }
  if (!digits) goto invalid;
  digits = 0;
  if (i < n) {
    if (s[i++] != '.') goto invalid;
    while (i < n && s[i] >= '0' && s[i] <= '9') {
      if (++digits > MaxFracDigits) goto invalid;
      frac = frac * 10 + (s[i++] - '0');
    }
    if (!digits || i < n) goto invalid;
  }

  {
    int128_t nanos =
      int128_t(integer) * unitNanos(unit) +
      int128_t(frac) * pow10(MaxFracDigits - digits) * fracNanos(unit);
    if (negative) nanos = -nanos;
    t = ZdtInstant{ZdtInstant::Nano{nanos}};
  }
  fracDigits = digits;
  return true;

invalid:
  return false;
}

void ZdtEpoch::print(int unit, std::string &s, const ZdtInstant &t)
{
  constexpr uint128_t max = std::numeric_limits<int64_t>::max();

  int128_t nanos = t.nanosecs();
  bool negative = nanos < 0;
  uint128_t m = negative ? uint128_t(-nanos) : uint128_t(nanos);
  uint128_t integer = m / uint128_t(unitNanos(unit));
  uint64_t frac = uint64_t(
      (m % uint128_t(unitNanos(unit))) / uint128_t(fracNanos(unit)));

  if (ZdtUnlikely(integer > max)) integer = max, frac = 0;

  if (!integer && !frac) { s += '0'; return; }

  char buf[24];
  unsigned i = sizeof(buf);

  if (negative) s += '-';
  uint64_t v = uint64_t(integer);
  do { buf[--i] = '0' + v % 10; v /= 10; } while (v);
  s.append(buf + i, sizeof(buf) - i);

  if (frac) {
    char digits[MaxFracDigits];
    for (int j = MaxFracDigits - 1; j >= 0; j--)
      digits[j] = '0' + frac % 10, frac /= 10;
    unsigned l = MaxFracDigits;
    while (digits[l - 1] == '0') --l;
    s += '.';
    s.append(digits, l);
  }
}

ZdtInstant ZdtEpoch::roundup(int unit, const ZdtInstant &t, unsigned fracDigits)
{
  // nano-of-second digits given
  unsigned given = unit == Seconds ? fracDigits : fracDigits + 3;
  if (given >= 9) return t;
  return ZdtInstant{ZdtInstant::Nano{
    t.nanosecs() + ZdtInstant::roundupNanos(given)}};
}
