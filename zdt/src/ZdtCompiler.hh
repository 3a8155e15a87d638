//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// pattern compiler - pattern string to format chain

// a pattern is one or more segments joined by "||" (not within quoted
// literal text); each segment is a format name or a custom pattern

// custom patterns are compiled using one of two letter tables - modern
// (u is the proleptic year, y the year of era, [ ] delimits optional
// sections) or legacy (y is the proleptic year, Y the year of era,
// brackets are literals); a pattern prefixed by the legacy marker '8'
// compiles all its custom segments in the legacy dialect; a subsequent
// segment prefixed by the marker is always a legacy custom pattern

#ifndef ZdtCompiler_HH
#define ZdtCompiler_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>
#include <string_view>
#include <vector>

#include <zdt/ZdtRef.hh>
#include <zdt/ZdtPattern.hh>
#include <zdt/ZdtRegistry.hh>

namespace ZdtDialect {
  enum { Modern = 0, Legacy };
}

struct ZdtSegment {
  std::string		text;		// as given, including any marker
  int			dialect = ZdtDialect::Modern;
  const ZdtFormatName	*name = nullptr;	// null if custom
  ZdtFormatDef		custom;

  const ZdtFormatDef &def() const { return name ? *name->def : custom; }
};

class ZdtAPI ZdtFormatChain : public ZdtObject {
friend class ZdtCompiler;

public:
  const std::string &pattern() const { return m_pattern; }
  const std::vector<ZdtSegment> &segments() const { return m_segments; }
  const std::vector<std::string> &advisories() const { return m_advisories; }

  // true if every segment is a format name
  bool named() const;

private:
  std::string			m_pattern;
  std::vector<ZdtSegment>	m_segments;
  std::vector<std::string>	m_advisories;
};

class ZdtAPI ZdtCompiler {
public:
  enum { LegacyMarker = '8' };

  // throws ZdtInvalidFormatSpec
  static ZdtRef<ZdtFormatChain> compile(
      std::string_view pattern, bool legacyCompatible = false);

  // splits on "||" outside quoted text; throws ZdtInvalidFormatSpec
  // on an empty segment
  static std::vector<std::string_view> split(std::string_view pattern);

  // compiles a custom pattern; throws ZdtInvalidFormatSpec
  static ZdtPattern custom(std::string_view pattern, int dialect);
};

#endif /* ZdtCompiler_HH */
