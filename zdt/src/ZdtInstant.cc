//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// instant in time

#include <zdt/ZdtInstant.hh>

#include <stdio.h>

int64_t ZdtInstant::toEpochMilli() const
{
  int128_t ms = int128_t(tv_sec) * 1000 + tv_nsec / 1000000;
  if (ZdtUnlikely(ms > std::numeric_limits<int64_t>::max()))
    return std::numeric_limits<int64_t>::max();
  if (ZdtUnlikely(ms < std::numeric_limits<int64_t>::min()))
    return std::numeric_limits<int64_t>::min();
  return int64_t(ms);
}

void ZdtInstant::print(std::ostream &s) const
{
  char buf[16];
  snprintf(buf, sizeof(buf), "%09d", static_cast<int>(tv_nsec));
  s << tv_sec << '.' << buf;
  if (m_hasOffset) {
    int32_t o = m_offset;
    char sign = '+';
    if (o < 0) sign = '-', o = -o;
    snprintf(buf, sizeof(buf), "%c%02d:%02d",
	sign, static_cast<int>(o / 3600), static_cast<int>((o / 60) % 60));
    s << buf;
  }
  if (!m_zone.empty()) s << '[' << m_zone << ']';
}
