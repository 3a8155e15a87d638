//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Zdt library main header

#ifndef ZdtLib_HH
#define ZdtLib_HH

#ifdef _MSC_VER
#pragma once
#endif

#include <stddef.h>
#include <stdint.h>

#ifdef _WIN32

#ifdef ZDT_EXPORTS
#define ZdtAPI __declspec(dllexport)
#define ZdtExplicit
#else
#define ZdtAPI __declspec(dllimport)
#define ZdtExplicit extern
#endif
#define ZdtExtern extern ZdtAPI

#else /* _WIN32 */

#define ZdtAPI
#define ZdtExplicit
#define ZdtExtern extern

#endif /* _WIN32 */

#ifdef __GNUC__
#define ZdtLikely(x) __builtin_expect(!!(x), 1)
#define ZdtUnlikely(x) __builtin_expect(!!(x), 0)
#define ZdtInline inline __attribute__((always_inline))
#define ZdtNoInline __attribute__((noinline))
#else
#define ZdtLikely(x) (x)
#define ZdtUnlikely(x) (x)
#define ZdtInline inline
#define ZdtNoInline
#endif

// 128bit integers, used for exact nanosecond arithmetic
using int128_t = __int128_t;
using uint128_t = __uint128_t;

extern "C" {
  ZdtExtern const char *Zdt_version();
  ZdtExtern int Zdt_vernum();
}

#endif /* ZdtLib_HH */
