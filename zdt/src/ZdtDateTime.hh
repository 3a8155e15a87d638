//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Julian date based date/time class, proleptic Gregorian calendar

// julian day 0 is Monday Nov 24th 4714BC (proleptic Gregorian)
// julian day 2440588 is Jan 1st 1970 (the epoch)
// years are astronomical - 1BC is year 0, 2BC is year -1, etc.

#ifndef ZdtDateTime_HH
#define ZdtDateTime_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string_view>

#include <zdt/ZdtInstant.hh>

class ZdtAPI ZdtDateTime {
public:
  enum { EpochJulian = 2440588 };

  ZdtDateTime() = default;

  // UTC date/time of an instant, shifted by offset seconds
  ZdtDateTime(const ZdtInstant &t, int32_t offset = 0) {
    int128_t sec = int128_t(t.sec()) + offset;
    int128_t days = sec / 86400;
    int128_t secs = sec % 86400;
    if (secs < 0) --days, secs += 86400;
    m_julian = int64_t(days) + EpochJulian;
    m_sec = int32_t(secs);
    m_nsec = t.nsec();
  }

  ZdtDateTime(int64_t year, int month, int day) :
    m_julian{julian(year, month, day)} { }

  ZdtDateTime(
      int64_t year, int month, int day,
      int hour, int minute, int sec, int32_t nsec) :
    m_julian{julian(year, month, day)},
    m_sec{hour * 3600 + minute * 60 + sec}, m_nsec{nsec} { }

  int64_t julian() const { return m_julian; }
  int32_t sec() const { return m_sec; }
  int32_t nsec() const { return m_nsec; }

  // local time - offset = UTC instant
  ZdtInstant instant(int32_t offset = 0) const {
    return ZdtInstant{ZdtInstant::Nano{
      (int128_t(m_julian - EpochJulian) * 86400 + m_sec - offset) *
	1000000000 + m_nsec}};
  }

  void ymd(int64_t &year, int &month, int &day) const;
  void ymd(int &year, int &month, int &day) const {
    int64_t year_;
    ymd(year_, month, day);
    year = int(year_);
  }
  void hms(int &hour, int &minute, int &sec) const {
    int sec_ = m_sec;
    hour = sec_ / 3600, sec_ %= 3600,
    minute = sec_ / 60, sec = sec_ % 60;
  }

  // day of year (1-366)
  int days() const;

  // day of week (1-7), Monday is 1
  int wkDay() const {
    int wkDay_ = int(m_julian % 7);
    if (wkDay_ < 0) wkDay_ += 7;
    return wkDay_ + 1;
  }

  // ISO 8601 week-based year, week (1-53), day of week (1-7)
  // week 1 is the week containing the year's first Thursday
  void ywdISO(int64_t &wkYear, int &week, int &wkDay) const;

  static int64_t julian(int64_t year, int month, int day);
  // julian day of an ISO week date
  static int64_t julianISO(int64_t wkYear, int week, int wkDay);

  static bool leapYear(int64_t year) {
    return !(year & 3) && ((year % 100) || !(year % 400));
  }
  static int daysInMonth(int64_t year, int month);
  static int daysInYear(int64_t year) { return leapYear(year) ? 366 : 365; }
  static int weeksInYear(int64_t wkYear);

  static std::string_view dayShortName(int i);	// 1-7
  static std::string_view dayLongName(int i);	// 1-7
  static std::string_view monthShortName(int i);	// 1-12
  static std::string_view monthLongName(int i);	// 1-12

private:
  int64_t	m_julian = EpochJulian;
  int32_t	m_sec = 0;
  int32_t	m_nsec = 0;
};

#endif /* ZdtDateTime_HH */
