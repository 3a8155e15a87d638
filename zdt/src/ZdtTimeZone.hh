//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// time zones - unset, UTC, fixed offset or region (e.g. "Europe/London")

// region offsets are obtained from the host's tz database via the C
// library; lookups are serialized under a global lock since they
// temporarily modify the TZ environment variable, and tzset() is not
// thread-safe in any case

#ifndef ZdtTimeZone_HH
#define ZdtTimeZone_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>
#include <string_view>
#include <ostream>

#include <zdt/ZdtInstant.hh>

namespace Zdt {

// offset (seconds east of UTC) in effect at a UTC time in region tz
ZdtExtern int32_t tzOffset(int64_t utc, const char *tz);

// offset in effect at a local time in region tz (2-pass)
ZdtExtern int32_t tzLocalOffset(int64_t local, const char *tz);

} // Zdt

class ZdtAPI ZdtZone {
public:
  enum { Unset = 0, UTC, Fixed, Region };

  ZdtZone() = default;

  static ZdtZone utc() { return ZdtZone{UTC, 0, "Z"}; }
  static ZdtZone fixed(int32_t offset);
  static ZdtZone region(std::string id) {
    return ZdtZone{Region, 0, std::move(id)};
  }

  // Z, UTC, GMT, UT, +HH, +HHMM, +HH:MM, UTC+HH:MM, GMT+HH, Area/City, ...
  // - throws ZdtInvalidFormatSpec if malformed
  static ZdtZone parse(std::string_view id);

  // scans a fixed offset [+-]HH[[:]MM], returns length or 0 if invalid
  static unsigned scanOffset(std::string_view s, int32_t &offset);

  int type() const { return m_type; }
  bool operator !() const { return m_type == Unset; }

  const std::string &id() const { return m_id; }

  // offset at a UTC instant
  int32_t offset(const ZdtInstant &t) const;
  // offset for local time expressed as seconds since epoch
  int32_t localOffset(int64_t local) const;

  bool equals(const ZdtZone &z) const {
    return m_type == z.m_type && m_id == z.m_id;
  }
  friend bool operator ==(const ZdtZone &l, const ZdtZone &r) {
    return l.equals(r);
  }

  uint32_t hash() const;

  friend std::ostream &operator <<(std::ostream &s, const ZdtZone &z) {
    return s << (z.m_type == Unset ? "null" : z.m_id.c_str());
  }

private:
  ZdtZone(int type, int32_t offset, std::string id) :
    m_type{type}, m_offset{offset}, m_id{std::move(id)} { }

  int		m_type = Unset;
  int32_t	m_offset = 0;
  std::string	m_id;
};

#endif /* ZdtTimeZone_HH */
