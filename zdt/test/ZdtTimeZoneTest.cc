//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <zdt/ZdtLib.hh>

#include <stdlib.h>

#include <iostream>
#include <sstream>
#include <string>

#include <zdt/ZdtTimeZone.hh>
#include <zdt/ZdtDateTime.hh>
#include <zdt/ZdtError.hh>

void fail() { exit(1); }

void out(const char *s) {
  std::cout << s << '\n' << std::flush;
}

#define CHECK(x) ((x) ? (out("OK  " #x), void()) : (out("NOK " #x), fail()))

static bool invalid(const char *id)
{
  try {
    ZdtZone::parse(id);
  } catch (const ZdtInvalidFormatSpec &e) {
    std::cout << e << '\n';
    return true;
  }
  return false;
}

int main()
{
  {
    ZdtZone z;
    CHECK(!z);
    CHECK(z.type() == ZdtZone::Unset);
    CHECK(z.offset(ZdtInstant{}) == 0);
    std::ostringstream s;
    s << z;
    CHECK(s.str() == "null");
  }

  CHECK(ZdtZone::parse("Z") == ZdtZone::utc());
  CHECK(ZdtZone::parse("UTC") == ZdtZone::utc());
  CHECK(ZdtZone::parse("GMT").id() == "Z");
  CHECK(ZdtZone::parse("+00:00") == ZdtZone::utc());
  CHECK(ZdtZone::parse("+05:30").type() == ZdtZone::Fixed);
  CHECK(ZdtZone::parse("+05:30").id() == "+05:30");
  CHECK(ZdtZone::parse("+0530").id() == "+05:30");
  CHECK(ZdtZone::parse("-08").offset(ZdtInstant{}) == -8 * 3600);
  CHECK(ZdtZone::parse("UTC+01:00").localOffset(0) == 3600);
  CHECK(ZdtZone::parse("GMT-0330").offset(ZdtInstant{}) == -(3 * 3600 + 1800));
  CHECK(ZdtZone::fixed(3600) == ZdtZone::parse("+01"));
  CHECK(ZdtZone::fixed(3600).hash() == ZdtZone::parse("+01").hash());
  CHECK(!(ZdtZone::fixed(3600) == ZdtZone::fixed(-3600)));

  CHECK(ZdtZone::parse("Europe/London").type() == ZdtZone::Region);
  CHECK(ZdtZone::parse("America/Argentina/Buenos_Aires").id() ==
      "America/Argentina/Buenos_Aires");

  CHECK(invalid(""));
  CHECK(invalid("+25:00"));
  CHECK(invalid("+01:60"));
  CHECK(invalid("+1"));
  CHECK(invalid("UTC+"));
  CHECK(invalid("Europe/Lon don"));
  CHECK(invalid("/London"));

  {
    int32_t offset = 0;
    CHECK(ZdtZone::scanOffset("+01:00Z", offset) == 6 && offset == 3600);
    CHECK(ZdtZone::scanOffset("-0130", offset) == 5 && offset == -5400);
    CHECK(ZdtZone::scanOffset("+02", offset) == 3 && offset == 7200);
    CHECK(!ZdtZone::scanOffset("02:00", offset));
  }

  // region offsets from the system zone database
  {
    auto london = ZdtZone::parse("Europe/London");
    ZdtInstant winter = ZdtDateTime{2018, 1, 15, 12, 0, 0, 0}.instant();
    ZdtInstant summer = ZdtDateTime{2018, 7, 15, 12, 0, 0, 0}.instant();
    CHECK(london.offset(winter) == 0);
    CHECK(london.offset(summer) == 3600);
    int64_t local = ZdtDateTime{2018, 7, 15, 12, 0, 0, 0}.instant().sec();
    CHECK(london.localOffset(local) == 3600);
    auto kolkata = ZdtZone::parse("Asia/Kolkata");
    CHECK(kolkata.offset(summer) == 19800);

    // either side of the 2018-03-25 01:00 UTC change to BST
    local = ZdtDateTime{2018, 3, 25, 0, 30, 0, 0}.instant().sec();
    CHECK(london.localOffset(local) == 0);
    local = ZdtDateTime{2018, 3, 25, 3, 30, 0, 0}.instant().sec();
    CHECK(london.localOffset(local) == 3600);
  }

  // lookups leave the process TZ as they found it
  {
    auto tokyo = ZdtZone::parse("Asia/Tokyo");
    ZdtInstant t = ZdtDateTime{2018, 7, 15, 12, 0, 0, 0}.instant();
    setenv("TZ", "America/New_York", 1);
    CHECK(tokyo.offset(t) == 9 * 3600);
    CHECK(getenv("TZ") && std::string{getenv("TZ")} == "America/New_York");
    unsetenv("TZ");
    CHECK(tokyo.localOffset(t.sec()) == 9 * 3600);
    CHECK(!getenv("TZ"));
  }
}
