//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <zdt/ZdtLib.hh>

#include <stdlib.h>

#include <iostream>

#include <zdt/ZdtDateTime.hh>

void fail() { exit(1); }

void out(const char *s) {
  std::cout << s << '\n' << std::flush;
}

#define CHECK(x) ((x) ? (out("OK  " #x), void()) : (out("NOK " #x), fail()))

static bool ymd(const ZdtDateTime &d, int64_t year, int month, int day)
{
  int64_t year_;
  int month_, day_;
  d.ymd(year_, month_, day_);
  return year_ == year && month_ == month && day_ == day;
}

static bool ywd(const ZdtDateTime &d, int64_t wkYear, int week, int wkDay)
{
  int64_t wkYear_;
  int week_, wkDay_;
  d.ywdISO(wkYear_, week_, wkDay_);
  return wkYear_ == wkYear && week_ == week && wkDay_ == wkDay;
}

int main()
{
  CHECK(ZdtDateTime::julian(1970, 1, 1) == ZdtDateTime::EpochJulian);
  CHECK(ymd(ZdtDateTime{}, 1970, 1, 1));
  CHECK(ZdtDateTime{}.wkDay() == 4);

  // round trip over a wide range of years, including negative years
  {
    static const int64_t years[] = {
      -999999999, -1000000, -5000, -4713, -4712, -1, 0, 1, 1582, 1600,
      1900, 1970, 2000, 2016, 9999, 10000, 999999999
    };
    bool ok = true;
    for (auto year : years)
      for (int month = 1; month <= 12; month++)
	for (int day = 1; day <= ZdtDateTime::daysInMonth(year, month); day++)
	  if (!ymd(ZdtDateTime{year, month, day}, year, month, day)) {
	    std::cout << year << '-' << month << '-' << day << '\n';
	    ok = false;
	  }
    CHECK(ok);
  }
  CHECK(ZdtDateTime::julian(0, 12, 31) + 1 == ZdtDateTime::julian(1, 1, 1));
  CHECK(ZdtDateTime::julian(-1, 12, 31) + 1 == ZdtDateTime::julian(0, 1, 1));

  CHECK(ZdtDateTime::leapYear(2000));
  CHECK(!ZdtDateTime::leapYear(1900));
  CHECK(ZdtDateTime::leapYear(2016));
  CHECK(ZdtDateTime::leapYear(0));
  CHECK(ZdtDateTime::leapYear(-4));
  CHECK(!ZdtDateTime::leapYear(-100));
  CHECK(ZdtDateTime::daysInMonth(2016, 2) == 29);
  CHECK(ZdtDateTime::daysInMonth(2015, 2) == 28);
  CHECK(ZdtDateTime::daysInMonth(2015, 13) == 0);
  CHECK(ZdtDateTime::daysInYear(2016) == 366);

  CHECK(ZdtDateTime(2016, 12, 31).days() == 366);
  CHECK(ZdtDateTime(2015, 3, 1).days() == 60);

  CHECK(ZdtDateTime::weeksInYear(2015) == 53);
  CHECK(ZdtDateTime::weeksInYear(2016) == 52);
  CHECK(ZdtDateTime::weeksInYear(2020) == 53);
  CHECK(ywd(ZdtDateTime{2016, 1, 4}, 2016, 1, 1));
  CHECK(ywd(ZdtDateTime{2016, 1, 3}, 2015, 53, 7));
  CHECK(ywd(ZdtDateTime{2014, 12, 29}, 2015, 1, 1));
  CHECK(ywd(ZdtDateTime{2018, 5, 15}, 2018, 20, 2));
  CHECK(ZdtDateTime::julianISO(2015, 1, 1) ==
      ZdtDateTime::julian(2014, 12, 29));
  CHECK(ZdtDateTime::julianISO(2016, 1, 1) ==
      ZdtDateTime::julian(2016, 1, 4));

  {
    ZdtDateTime d{ZdtInstant{86399, 5}, 3600};
    int hour, minute, sec;
    d.hms(hour, minute, sec);
    CHECK(ymd(d, 1970, 1, 2));
    CHECK(hour == 0 && minute == 59 && sec == 59);
    CHECK(d.nsec() == 5);
    CHECK(d.instant(3600) == (ZdtInstant{86399, 5}));
  }
  {
    ZdtDateTime d{ZdtInstant{-1, 0}};
    int hour, minute, sec;
    d.hms(hour, minute, sec);
    CHECK(ymd(d, 1969, 12, 31));
    CHECK(hour == 23 && minute == 59 && sec == 59);
  }
  {
    ZdtDateTime d{2018, 5, 15, 17, 14, 56, 123000000};
    CHECK(d.instant() == (ZdtInstant{1526404496, 123000000}));
  }

  CHECK(ZdtDateTime::dayShortName(1) == "Mon");
  CHECK(ZdtDateTime::dayLongName(7) == "Sunday");
  CHECK(ZdtDateTime::monthShortName(9) == "Sep");
  CHECK(ZdtDateTime::monthLongName(12) == "December");
}
