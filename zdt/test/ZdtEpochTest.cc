//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <zdt/ZdtLib.hh>

#include <stdlib.h>

#include <iostream>
#include <limits>

#include <zdt/ZdtEpoch.hh>

void fail() { exit(1); }

void out(const char *s) {
  std::cout << s << '\n' << std::flush;
}

#define CHECK(x) ((x) ? (out("OK  " #x), void()) : (out("NOK " #x), fail()))

static bool parse(int unit, const char *s, int64_t sec, int32_t nsec)
{
  ZdtInstant t;
  unsigned fracDigits;
  if (!ZdtEpoch::parse(unit, s, t, fracDigits)) return false;
  return t.sec() == sec && t.nsec() == nsec;
}

static bool invalid(int unit, const char *s)
{
  ZdtInstant t;
  unsigned fracDigits;
  return !ZdtEpoch::parse(unit, s, t, fracDigits);
}

static std::string print(int unit, const ZdtInstant &t)
{
  std::string s;
  ZdtEpoch::print(unit, s, t);
  return s;
}

int main()
{
  using namespace ZdtEpoch;

  CHECK(parse(Millis, "0", 0, 0));
  CHECK(parse(Millis, "1539215999999", 1539215999, 999000000));
  CHECK(parse(Millis, "-1", -1, 999000000));
  CHECK(parse(Millis, "-123000.123456", -124, 999876544));
  CHECK(parse(Millis, "-0.12345", -1, 999876550));
  CHECK(parse(Millis, "0.000001", 0, 1));
  CHECK(parse(Seconds, "1", 1, 0));
  CHECK(parse(Seconds, "-1.5", -2, 500000000));
  CHECK(parse(Seconds, "1234567890.123456", 1234567890, 123456000));
  CHECK(parse(Seconds, "-0.000001", -1, 999999000));

  CHECK(invalid(Millis, ""));
  CHECK(invalid(Millis, "-"));
  CHECK(invalid(Millis, "1."));
  CHECK(invalid(Millis, ".5"));
  CHECK(invalid(Millis, "+1"));
  CHECK(invalid(Millis, "1.1234567"));
  CHECK(invalid(Millis, "1e5"));
  CHECK(invalid(Millis, "12 "));
  CHECK(invalid(Millis, "9223372036854775808"));
  CHECK(!invalid(Millis, "9223372036854775807"));
  CHECK(!invalid(Seconds, "-9223372036854775807"));

  {
    ZdtInstant t;
    unsigned fracDigits = 99;
    CHECK(ZdtEpoch::parse(Millis, "12.345", t, fracDigits));
    CHECK(fracDigits == 3);
    CHECK(ZdtEpoch::parse(Millis, "12", t, fracDigits));
    CHECK(fracDigits == 0);
  }

  CHECK(print(Millis, ZdtInstant{}) == "0");
  CHECK(print(Millis, ZdtInstant{1539215999, 999000000}) == "1539215999999");
  CHECK(print(Millis, ZdtInstant{-124, 999876544}) == "-123000.123456");
  CHECK(print(Millis, ZdtInstant{-1, 999999999}) == "-0.000001");
  CHECK(print(Seconds, ZdtInstant{-2, 500000000}) == "-1.5");
  CHECK(print(Seconds, ZdtInstant{1, 123456789}) == "1.123456");
  CHECK(print(Seconds, ZdtInstant{42, 0}) == "42");
  CHECK(print(Millis, ZdtInstant::ofEpochMilli(
	  std::numeric_limits<int64_t>::min())) == "-9223372036854775807");
  CHECK(print(Millis, ZdtInstant::ofEpochMilli(
	  std::numeric_limits<int64_t>::max())) == "9223372036854775807");

  {
    ZdtInstant t = roundup(Millis, ZdtInstant{1539215999, 999000000}, 0);
    CHECK(t.sec() == 1539215999 && t.nsec() == 999999999);
    t = roundup(Millis, ZdtInstant{0, 123456000}, 6);
    CHECK(t.sec() == 0 && t.nsec() == 123456000);
    t = roundup(Seconds, ZdtInstant{1, 0}, 0);
    CHECK(t.sec() == 1 && t.nsec() == 999999999);
    t = roundup(Seconds, ZdtInstant{1, 500000000}, 1);
    CHECK(t.sec() == 1 && t.nsec() == 500999999);
    t = roundup(Seconds, ZdtInstant{1, 120000000}, 2);
    CHECK(t.sec() == 1 && t.nsec() == 120999999);
    t = roundup(Seconds, ZdtInstant{1, 123400000}, 4);
    CHECK(t.sec() == 1 && t.nsec() == 123499999);
    t = roundup(Seconds, ZdtInstant{-2, 500000000}, 1);
    CHECK(t.sec() == -2 && t.nsec() == 500999999);
  }
}
