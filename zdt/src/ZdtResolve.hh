//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// resolution of parsed fields to an instant

// - a parsed offset takes precedence over a parsed zone id, which takes
//   precedence over the default zone; UTC applies if none is available
// - fields above the least significant field given take their minimum
//   (the date defaults to 1970-01-01); fields below it take their
//   minimum, or their maximum when rounding up, e.g. "2018-10-10"
//   rounds up to 2018-10-10T23:59:59.999999999
// - a fraction keeps its digits when rounding up; sub-millisecond
//   digits not given are filled with 9s, e.g. ".1" rounds up to
//   .100999999 and ".1234" to .123499999
// - out of range or inconsistent fields fail resolution

#ifndef ZdtResolve_HH
#define ZdtResolve_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <zdt/ZdtField.hh>
#include <zdt/ZdtInstant.hh>
#include <zdt/ZdtTimeZone.hh>

namespace Zdt {

ZdtExtern bool resolve(
    const ZdtParsed &parsed, const ZdtZone &zone, bool roundup,
    ZdtInstant &t);

} // Zdt

#endif /* ZdtResolve_HH */
