//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// calendar fields
// - ZdtParsed - fields recovered from text by a pattern
// - ZdtFields - fields of an instant in a zone, for printing

#ifndef ZdtField_HH
#define ZdtField_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>

#include <zdt/ZdtInstant.hh>
#include <zdt/ZdtTimeZone.hh>

namespace ZdtField {
  enum {
    Era = 0,		// 0 BCE, 1 CE
    CenturyOfEra,
    YearOfEra,
    Year,		// proleptic
    WeekBasedYear,	// ISO
    MonthOfYear,
    WeekOfWeekBasedYear,
    DayOfYear,
    DayOfMonth,
    DayOfWeek,		// 1 Monday .. 7 Sunday
    AmPm,		// 0 AM, 1 PM
    HourOfAmPm,		// 0-11
    ClockHourOfAmPm,	// 1-12
    HourOfDay,		// 0-23
    ClockHourOfDay,	// 1-24
    MinuteOfHour,
    SecondOfMinute,
    NanoOfSecond,
    N
  };

  // minimum and maximum legal values (maximum is the upper bound
  // for any year / month)
  ZdtExtern int64_t minimum(int);
  ZdtExtern int64_t maximum(int);
}

struct ZdtParsed {
  int64_t	value[ZdtField::N] = { 0 };
  uint32_t	present = 0;	// bitmask of ZdtField
  unsigned	fracDigits = 0;	// digits of fraction explicitly given
  int32_t	offset = 0;	// seconds east of UTC
  bool		hasOffset = false;
  std::string	zone;		// parsed zone id

  bool has(int field) const { return present & (1U<<field); }
  int64_t get(int field) const { return value[field]; }

  // fails if the field was already set to a different value
  bool set(int field, int64_t v) {
    if (has(field)) return value[field] == v;
    value[field] = v;
    present |= (1U<<field);
    return true;
  }
};

struct ZdtFields {
  int64_t	year = 1970;	// proleptic
  int		month = 1;
  int		day = 1;
  int		dayOfYear = 1;
  int64_t	wkYear = 1970;
  int		week = 1;
  int		wkDay = 4;
  int		hour = 0;
  int		minute = 0;
  int		second = 0;
  int32_t	nano = 0;
  int32_t	offset = 0;
  std::string	zone;		// zone id, "Z" if UTC

  ZdtFields() = default;
  ZdtFields(const ZdtInstant &t, const ZdtZone &zone);

  int64_t get(int field) const;
};

#endif /* ZdtField_HH */
