//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// calendar fields

#include <zdt/ZdtField.hh>

#include <zdt/ZdtDateTime.hh>

namespace {
  struct Info {
    int64_t	minimum;
    int64_t	maximum;
  };

  const Info info[ZdtField::N] = {
    { 0, 1 },		// Era
    { 0, 9999999 },	// CenturyOfEra
    { 1, 999999999 },	// YearOfEra
    { -999999999, 999999999 },	// Year
    { -999999999, 999999999 },	// WeekBasedYear
    { 1, 12 },		// MonthOfYear
    { 1, 53 },		// WeekOfWeekBasedYear
    { 1, 366 },		// DayOfYear
    { 1, 31 },		// DayOfMonth
    { 1, 7 },		// DayOfWeek
    { 0, 1 },		// AmPmOfDay
    { 0, 11 },		// HourOfAmPm
    { 1, 12 },		// ClockHourOfAmPm
    { 0, 23 },		// HourOfDay
    { 1, 24 },		// ClockHourOfDay
    { 0, 59 },		// MinuteOfHour
    { 0, 59 },		// SecondOfMinute
    { 0, 999999999 }	// NanoOfSecond
  };
}

int64_t ZdtField::minimum(int i) { return info[i].minimum; }
int64_t ZdtField::maximum(int i) { return info[i].maximum; }

ZdtFields::ZdtFields(const ZdtInstant &t, const ZdtZone &zone_)
{
  offset = zone_.offset(t);
  zone = !zone_ ? std::string{"Z"} : zone_.id();
  ZdtDateTime d{t, offset};
  d.ymd(year, month, day);
  d.hms(hour, minute, second);
  nano = d.nsec();
  dayOfYear = d.days();
  d.ywdISO(wkYear, week, wkDay);
}

int64_t ZdtFields::get(int field) const
{
  using namespace ZdtField;

  switch (field) {
    case Era: return year > 0 ? 1 : 0;
    case CenturyOfEra: return (year > 0 ? year : 1 - year) / 100;
    case YearOfEra: return year > 0 ? year : 1 - year;
    case Year: return year;
    case WeekBasedYear: return wkYear;
    case MonthOfYear: return month;
    case WeekOfWeekBasedYear: return week;
    case DayOfYear: return dayOfYear;
    case DayOfMonth: return day;
    case DayOfWeek: return wkDay;
    case AmPm: return hour >= 12;
    case HourOfAmPm: return hour % 12;
    case ClockHourOfAmPm: return hour % 12 ? hour % 12 : 12;
    case HourOfDay: return hour;
    case ClockHourOfDay: return hour ? hour : 24;
    case MinuteOfHour: return minute;
    case SecondOfMinute: return second;
    case NanoOfSecond: return nano;
  }
  return 0;
}
