//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <zdt/ZdtTimeZone.hh>

#include <stdio.h>
#include <stdlib.h>
#include <time.h>

#include <string>

#include <zdt/ZdtLock.hh>
#include <zdt/ZdtError.hh>

namespace {

ZdtPLock *tzLock()
{
  static ZdtPLock lock;
  return &lock;
}

// TZ is process-wide; a region is queried by pointing TZ at it for the
// lifetime of the lookup, with other lookups excluded by tzLock()
class RegionLookup {
public:
  RegionLookup(const char *tz) : m_guard{*tzLock()} {
    if (const char *prev = ::getenv("TZ")) m_prev = prev, m_hadPrev = true;
    ::setenv("TZ", tz, 1);
    ::tzset();
  }
  ~RegionLookup() {
    if (m_hadPrev)
      ::setenv("TZ", m_prev.c_str(), 1);
    else
      ::unsetenv("TZ");
    ::tzset();
  }

  int32_t offset(int64_t utc) const {
    time_t t = utc;
    struct tm tm_;
    if (ZdtUnlikely(!localtime_r(&t, &tm_))) return int32_t(-timezone);
    return int32_t(tm_.tm_gmtoff);
  }

  // 1st pass treats local as UTC, 2nd pass corrects across DST changes
  int32_t localOffset(int64_t local) const {
    return offset(local - offset(local));
  }

private:
  ZdtGuard<ZdtPLock>	m_guard;
  std::string		m_prev;
  bool			m_hadPrev = false;
};

} // namespace

int32_t Zdt::tzOffset(int64_t utc, const char *tz)
{
  return RegionLookup{tz}.offset(utc);
}

int32_t Zdt::tzLocalOffset(int64_t local, const char *tz)
{
  return RegionLookup{tz}.localOffset(local);
}

ZdtZone ZdtZone::fixed(int32_t offset)
{
  if (!offset) return utc();
  char buf[16];
  int32_t o = offset;
  char sign = '+';
  if (o < 0) sign = '-', o = -o;
  if (o % 60)
    snprintf(buf, sizeof(buf), "%c%02d:%02d:%02d", sign,
	static_cast<int>(o / 3600), static_cast<int>((o / 60) % 60),
	static_cast<int>(o % 60));
  else
    snprintf(buf, sizeof(buf), "%c%02d:%02d", sign,
	static_cast<int>(o / 3600), static_cast<int>((o / 60) % 60));
  return ZdtZone{Fixed, offset, buf};
}

unsigned ZdtZone::scanOffset(std::string_view s, int32_t &offset)
{
  unsigned n = s.length(), i = 0;
  int sign, hours, minutes = 0;
  auto digit = [&s](unsigned i) { return s[i] >= '0' && s[i] <= '9'; };

  if (n < 3) goto invalid;
  if (s[0] == '+') sign = 1;
  else if (s[0] == '-') sign = -1;
  else goto invalid;
  if (!digit(1) || !digit(2)) goto invalid;
  hours = (s[1] - '0') * 10 + (s[2] - '0');
  i = 3;
  if (i < n) {
    unsigned j = i;
    if (s[j] == ':') ++j;
    if (j + 2 <= n && digit(j) && digit(j + 1)) {
      minutes = (s[j] - '0') * 10 + (s[j + 1] - '0');
      i = j + 2;
    }
  }
  if (hours > 18 || minutes > 59) goto invalid;
  offset = sign * (hours * 3600 + minutes * 60);
  return i;

invalid:
  return 0;
}

ZdtZone ZdtZone::parse(std::string_view id)
{
  if (id == "Z" || id == "UTC" || id == "GMT" || id == "UT") return utc();

  std::string_view s = id;
  if (s.substr(0, 3) == "UTC" || s.substr(0, 3) == "GMT") s.remove_prefix(3);
  else if (s.substr(0, 2) == "UT") s.remove_prefix(2);

  if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
    int32_t offset;
    unsigned n = scanOffset(s, offset);
    if (!n || n != s.length())
      throw ZdtInvalidFormatSpec{id, "invalid zone offset"};
    return fixed(offset);
  }

  // region id - Area/Location or abbreviation
  if (id.empty() ||
      !((id[0] >= 'A' && id[0] <= 'Z') || (id[0] >= 'a' && id[0] <= 'z')))
    throw ZdtInvalidFormatSpec{id, "invalid zone id"};
  for (char c : id)
    if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
	  (c >= '0' && c <= '9') ||
	  c == '/' || c == '_' || c == '-' || c == '+'))
      throw ZdtInvalidFormatSpec{id, "invalid zone id"};
  return region(std::string{id});
}

int32_t ZdtZone::offset(const ZdtInstant &t) const
{
  switch (m_type) {
    case Fixed: return m_offset;
    case Region: return Zdt::tzOffset(t.sec(), m_id.c_str());
    default: return 0;
  }
}

int32_t ZdtZone::localOffset(int64_t local) const
{
  switch (m_type) {
    case Fixed: return m_offset;
    case Region: return Zdt::tzLocalOffset(local, m_id.c_str());
    default: return 0;
  }
}

uint32_t ZdtZone::hash() const
{
  // FNV-1a
  uint32_t h = 0x811c9dc5 ^ uint32_t(m_type);
  for (unsigned char c : m_id) h = (h ^ c) * 0x01000193;
  return h;
}
