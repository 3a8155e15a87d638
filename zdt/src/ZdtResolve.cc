//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// resolution of parsed fields to an instant

#include <zdt/ZdtResolve.hh>

#include <limits>

#include <zdt/ZdtDateTime.hh>

namespace {

// field significance, most significant first
enum { YearLevel = 0, MonthLevel, DayLevel, HourLevel,
  MinuteLevel, SecondLevel, NanoLevel };

int level(int field)
{
  using namespace ZdtField;

  switch (field) {
    case Era:
    case CenturyOfEra:
    case YearOfEra:
    case Year:
    case WeekBasedYear:
      return YearLevel;
    case MonthOfYear:
    case WeekOfWeekBasedYear:
      return MonthLevel;
    case DayOfYear:
    case DayOfMonth:
    case DayOfWeek:
      return DayLevel;
    case AmPm:
    case HourOfAmPm:
    case ClockHourOfAmPm:
    case HourOfDay:
    case ClockHourOfDay:
      return HourLevel;
    case MinuteOfHour:
      return MinuteLevel;
    case SecondOfMinute:
      return SecondLevel;
  }
  return NanoLevel;
}

} // namespace

bool Zdt::resolve(
    const ZdtParsed &parsed, const ZdtZone &zone, bool roundup,
    ZdtInstant &t)
{
  using namespace ZdtField;

  int lowest = -1;

  for (int i = 0; i < ZdtField::N; i++) {
    if (!parsed.has(i)) continue;
    int64_t v = parsed.get(i);
    if (v < ZdtField::minimum(i) || v > ZdtField::maximum(i)) return false;
    int l = level(i);
    if (l > lowest) lowest = l;
  }

  // absent fields below the least significant field given are
  // maximized when rounding up
  auto max = [roundup, lowest](int l) { return roundup && l > lowest; };

  // year
  bool hasYear = false;
  int64_t year = 1970;
  if (parsed.has(Year)) {
    year = parsed.get(Year);
    hasYear = true;
  }
  if (parsed.has(YearOfEra) || parsed.has(CenturyOfEra)) {
    int64_t yoe = parsed.has(YearOfEra) ? parsed.get(YearOfEra) : 0;
    if (parsed.has(CenturyOfEra))
      yoe = parsed.get(CenturyOfEra) * 100 + yoe % 100;
    int64_t era = parsed.has(Era) ? parsed.get(Era) : 1;
    int64_t y = era ? yoe : 1 - yoe;
    if (hasYear && y != year) return false;
    year = y;
    hasYear = true;
  }

  // date
  int64_t julian;
  if (parsed.has(WeekBasedYear) || parsed.has(WeekOfWeekBasedYear)) {
    int64_t wkYear =
      parsed.has(WeekBasedYear) ? parsed.get(WeekBasedYear) : year;
    int weeks = ZdtDateTime::weeksInYear(wkYear);
    int week = parsed.has(WeekOfWeekBasedYear) ?
      int(parsed.get(WeekOfWeekBasedYear)) :
      (max(MonthLevel) ? weeks : 1);
    if (week > weeks) return false;
    int wkDay = parsed.has(DayOfWeek) ?
      int(parsed.get(DayOfWeek)) : (max(DayLevel) ? 7 : 1);
    julian = ZdtDateTime::julianISO(wkYear, week, wkDay);
  } else if (parsed.has(DayOfYear)) {
    int doy = int(parsed.get(DayOfYear));
    if (doy > ZdtDateTime::daysInYear(year)) return false;
    julian = ZdtDateTime::julian(year, 1, 1) + doy - 1;
    if (parsed.has(MonthOfYear) || parsed.has(DayOfMonth)) {
      int64_t year_;
      int month, day;
      ZdtDateTime{ZdtInstant{
	(julian - ZdtDateTime::EpochJulian) * 86400, 0}}.ymd(year_, month, day);
      if (parsed.has(MonthOfYear) && parsed.get(MonthOfYear) != month)
	return false;
      if (parsed.has(DayOfMonth) && parsed.get(DayOfMonth) != day)
	return false;
    }
  } else {
    int month = parsed.has(MonthOfYear) ?
      int(parsed.get(MonthOfYear)) : (max(MonthLevel) ? 12 : 1);
    int days = ZdtDateTime::daysInMonth(year, month);
    int day = parsed.has(DayOfMonth) ?
      int(parsed.get(DayOfMonth)) : (max(DayLevel) ? days : 1);
    if (day > days) return false;
    julian = ZdtDateTime::julian(year, month, day);
  }
  if (parsed.has(DayOfWeek) && !parsed.has(WeekOfWeekBasedYear) &&
      !parsed.has(WeekBasedYear)) {
    int wkDay = int(julian % 7);
    if (wkDay < 0) wkDay += 7;
    if (wkDay + 1 != parsed.get(DayOfWeek)) return false;
  }

  // time of day
  int hour;
  if (parsed.has(HourOfDay)) {
    hour = int(parsed.get(HourOfDay));
  } else if (parsed.has(ClockHourOfDay)) {
    hour = int(parsed.get(ClockHourOfDay)) % 24;
  } else if (parsed.has(HourOfAmPm) || parsed.has(ClockHourOfAmPm)) {
    int hour_ = parsed.has(HourOfAmPm) ?
      int(parsed.get(HourOfAmPm)) : int(parsed.get(ClockHourOfAmPm)) % 12;
    int pm = parsed.has(AmPm) ?
      int(parsed.get(AmPm)) : (max(HourLevel) ? 1 : 0);
    hour = pm * 12 + hour_;
  } else if (parsed.has(AmPm)) {
    hour = parsed.get(AmPm) ? (roundup ? 23 : 12) : (roundup ? 11 : 0);
  } else {
    hour = max(HourLevel) ? 23 : 0;
  }
  if (parsed.has(HourOfDay) && parsed.has(AmPm) &&
      (hour >= 12) != bool(parsed.get(AmPm))) return false;
  int minute = parsed.has(MinuteOfHour) ?
    int(parsed.get(MinuteOfHour)) : (max(MinuteLevel) ? 59 : 0);
  int second = parsed.has(SecondOfMinute) ?
    int(parsed.get(SecondOfMinute)) : (max(SecondLevel) ? 59 : 0);
  int32_t nano;
  if (parsed.has(NanoOfSecond)) {
    nano = int32_t(parsed.get(NanoOfSecond));
    if (roundup && parsed.fracDigits < 9)
      nano += ZdtInstant::roundupNanos(parsed.fracDigits);
  } else {
    nano = max(NanoLevel) ? 999999999 : 0;
  }

  // local time - offset = UTC
  int128_t local =
    int128_t(julian - ZdtDateTime::EpochJulian) * 86400 +
    hour * 3600 + minute * 60 + second;
  if (local > std::numeric_limits<int64_t>::max() ||
      local < std::numeric_limits<int64_t>::min()) return false;
  int32_t offset;
  if (parsed.hasOffset)
    offset = parsed.offset;
  else if (!parsed.zone.empty())
    offset = ZdtZone::parse(parsed.zone).localOffset(int64_t(local));
  else
    offset = zone.localOffset(int64_t(local));

  int128_t sec = local - offset;
  if (sec > std::numeric_limits<int64_t>::max() ||
      sec < std::numeric_limits<int64_t>::min()) return false;

  t = ZdtInstant{int64_t(sec), nano};
  if (parsed.hasOffset) t.offset(parsed.offset);
  if (!parsed.zone.empty()) t.zone(parsed.zone);
  return true;
}
