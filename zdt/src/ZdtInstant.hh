//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// instant in time - seconds since epoch + nanoseconds [0, 1000000000)
// - optionally annotated with the offset / zone recovered from parsed text
// - comparison and hashing consider only the point in time

#ifndef ZdtInstant_HH
#define ZdtInstant_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <limits>
#include <string>
#include <ostream>
#include <compare>

class ZdtAPI ZdtInstant {
public:
  struct Nano { int128_t v; };

  constexpr ZdtInstant() = default;
  constexpr ZdtInstant(int64_t sec, int32_t nsec) :
    tv_sec{sec}, tv_nsec{nsec} { }

  // floor semantics - nano.v < 0 yields tv_nsec in [0, 1000000000)
  constexpr ZdtInstant(Nano nano) {
    int128_t sec = nano.v / 1000000000;
    int128_t nsec = nano.v % 1000000000;
    if (nsec < 0) --sec, nsec += 1000000000;
    tv_sec = int64_t(sec), tv_nsec = int32_t(nsec);
  }

  static constexpr ZdtInstant ofEpochMilli(int64_t ms) {
    return ZdtInstant{Nano{int128_t(ms) * 1000000}};
  }

  constexpr int64_t sec() const { return tv_sec; }
  constexpr int32_t nsec() const { return tv_nsec; }

  constexpr int128_t nanosecs() const {
    return int128_t(tv_sec) * 1000000000 + tv_nsec;
  }

  // floor(nanosecs / 1000000), saturating at the int64_t limits
  int64_t toEpochMilli() const;

  // nanoseconds to add when rounding up a time whose nano-of-second was
  // given to n digits: the digits given are kept, a fraction coarser
  // than a millisecond extends to the end of that millisecond
  static constexpr int32_t roundupNanos(unsigned n) {
    if (!n) return 999999999;
    if (n < 3) n = 3;
    int32_t fill = 1;
    for (; n < 9; n++) fill *= 10;
    return fill - 1;
  }

  // parsed offset (seconds east of UTC), if any
  constexpr bool hasOffset() const { return m_hasOffset; }
  constexpr int32_t offset() const { return m_offset; }
  void offset(int32_t v) { m_hasOffset = true, m_offset = v; }

  // parsed zone id, if any
  const std::string &zone() const { return m_zone; }
  void zone(std::string v) { m_zone = std::move(v); }

  constexpr bool equals(const ZdtInstant &t) const {
    return tv_sec == t.tv_sec && tv_nsec == t.tv_nsec;
  }
  constexpr int cmp(const ZdtInstant &t) const {
    if (tv_sec != t.tv_sec) return tv_sec < t.tv_sec ? -1 : 1;
    if (tv_nsec != t.tv_nsec) return tv_nsec < t.tv_nsec ? -1 : 1;
    return 0;
  }
  friend constexpr bool operator ==(const ZdtInstant &l, const ZdtInstant &r) {
    return l.equals(r);
  }
  friend constexpr std::strong_ordering operator <=>(
      const ZdtInstant &l, const ZdtInstant &r) {
    return l.cmp(r) <=> 0;
  }

  uint32_t hash() const {
    return uint32_t(tv_sec) ^ uint32_t(tv_sec >> 32) ^ uint32_t(tv_nsec);
  }

  // sec.nnnnnnnnn[+offset][zone]
  void print(std::ostream &s) const;

  friend std::ostream &operator <<(std::ostream &s, const ZdtInstant &t) {
    t.print(s);
    return s;
  }

private:
  int64_t	tv_sec = 0;
  int32_t	tv_nsec = 0;
  int32_t	m_offset = 0;
  bool		m_hasOffset = false;
  std::string	m_zone;
};

#endif /* ZdtInstant_HH */
