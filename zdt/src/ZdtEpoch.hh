//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// exact decimal codec for seconds / milliseconds since the epoch

// text is [-]digits[.digits], with at most 6 fractional digits; the
// value is converted to seconds + nanoseconds with floor semantics, e.g.
// "-123000.123456" (millis) is -124s + 999876544ns

// printing is the inverse; the integer part saturates at the int64_t
// limits, the fraction is printed only if non-zero, with trailing zeros
// trimmed

#ifndef ZdtEpoch_HH
#define ZdtEpoch_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>
#include <string_view>

#include <zdt/ZdtInstant.hh>

namespace ZdtEpoch {

enum { Seconds = 0, Millis };
enum { MaxFracDigits = 6 };

// returns false if s is malformed or out of range; fracDigits is the
// number of fractional digits given
ZdtExtern bool parse(
    int unit, std::string_view s, ZdtInstant &t, unsigned &fracDigits);

ZdtExtern void print(int unit, std::string &s, const ZdtInstant &t);

// latest instant denoted by the digits given - integer seconds round up
// to the end of the second, anything finer to the end of its millisecond
// or, below that, by filling the digits not given with 9s
ZdtExtern ZdtInstant roundup(int unit, const ZdtInstant &t, unsigned fracDigits);

} // ZdtEpoch

#endif /* ZdtEpoch_HH */
