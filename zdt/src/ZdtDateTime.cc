//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Julian date based date/time class, proleptic Gregorian calendar

#include <zdt/ZdtDateTime.hh>

// the Fliegel / Van Flandern formulae below require non-negative julian
// days; earlier dates are shifted forward by whole 400 year cycles
// (146097 days) and shifted back afterwards
namespace {
  enum { Cycle = 146097, CycleYears = 400, MinYear = -4700 };
}

void ZdtDateTime::ymd(int64_t &year, int &month, int &day) const
{
  int64_t julian = m_julian, shift = 0;

  if (ZdtUnlikely(julian < 0)) {
    shift = (-julian) / Cycle + 1;
    julian += shift * Cycle;
  }

  int64_t i, j, l, n;

  l = julian + 68569;
  n = (l<<2) / 146097;
  l = l - ((146097 * n + 3)>>2);
  i = (4000 * (l + 1)) / 1461001;
  l = l - ((1461 * i)>>2) + 31;
  j = (80 * l) / 2447;
  day = int(l - (2447 * j) / 80);
  l = j / 11;
  month = int(j + 2 - 12 * l);
  year = 100 * (n - 49) + i + l - shift * CycleYears;
}

int64_t ZdtDateTime::julian(int64_t year, int month, int day)
{
  int64_t shift = 0;

  if (ZdtUnlikely(year < MinYear)) {
    shift = (MinYear - year) / CycleYears + 1;
    year += shift * CycleYears;
  }

  int64_t o = (month <= 2 ? -1 : 0);

  return ((1461 * (year + 4800 + o))>>2) +
    (367 * (month - 2 - 12 * o)) / 12 -
    ((3 * ((year + 4900 + o) / 100))>>2) +
    day - 32075 - shift * Cycle;
}

int ZdtDateTime::days() const
{
  int64_t year;
  int month, day;
  ymd(year, month, day);
  return int(m_julian - julian(year, 1, 1)) + 1;
}

void ZdtDateTime::ywdISO(int64_t &wkYear, int &week, int &wkDay) const
{
  wkDay = this->wkDay();
  // the Thursday of this week determines the week-based year
  ZdtDateTime thursday;
  thursday.m_julian = m_julian - wkDay + 4;
  int month, day;
  thursday.ymd(wkYear, month, day);
  week = int((thursday.m_julian - julian(wkYear, 1, 1)) / 7) + 1;
}

int64_t ZdtDateTime::julianISO(int64_t wkYear, int week, int wkDay)
{
  // Jan 4th is always in week 1
  ZdtDateTime jan4{wkYear, 1, 4};
  int64_t monday = jan4.m_julian - jan4.wkDay() + 1;
  return monday + int64_t(week - 1) * 7 + (wkDay - 1);
}

int ZdtDateTime::daysInMonth(int64_t year, int month)
{
  static const int days[] =
    { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
  if (month < 1 || month > 12) return 0;
  if (month == 2 && leapYear(year)) return 29;
  return days[month - 1];
}

int ZdtDateTime::weeksInYear(int64_t wkYear)
{
  // Dec 28th is always in the last week
  int64_t wkYear_;
  int week, wkDay;
  ZdtDateTime{wkYear, 12, 28}.ywdISO(wkYear_, week, wkDay);
  return week;
}

std::string_view ZdtDateTime::dayShortName(int i)
{
  static const char *s[] =
    { "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun" };
  if (--i < 0 || i >= 7) return {"???", 3};
  return {s[i], 3};
}

std::string_view ZdtDateTime::dayLongName(int i)
{
  static const char *s[] =
    { "Monday", "Tuesday", "Wednesday", "Thursday",
      "Friday", "Saturday", "Sunday" };
  static uint8_t l[] = { 6, 7, 9, 8, 6, 8, 6 };
  if (--i < 0 || i >= 7) return {"???", 3};
  return {s[i], l[i]};
}

std::string_view ZdtDateTime::monthShortName(int i)
{
  static const char *s[] =
    { "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep",
      "Oct", "Nov", "Dec" };
  if (--i < 0 || i >= 12) return {"???", 3};
  return {s[i], 3};
}

std::string_view ZdtDateTime::monthLongName(int i)
{
  static const char *s[] =
    { "January", "February", "March", "April", "May", "June", "July",
      "August", "September", "October", "November", "December" };
  static uint8_t l[] = { 7, 8, 5, 5, 3, 4, 4, 6, 9, 7, 8, 8  };
  if (--i < 0 || i >= 12) return {"???", 3};
  return {s[i], l[i]};
}
