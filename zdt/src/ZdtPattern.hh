//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// compiled date/time pattern - a program of tokens, each of which both
// prints a field of an instant and parses it back from text

// ZdtPattern p = ZdtPatternBuilder{}.
//   number(ZdtField::Year, 4, 10, ZdtSign::ExceedsPad).literal("-").
//   number(ZdtField::MonthOfYear, 2, 2).build();

// parsing is greedy and left-to-right; an optional section is parsed
// if possible, skipped otherwise; a variable-width number immediately
// followed by fixed-width numbers leaves room for them (e.g. "yyyyMMdd")

#ifndef ZdtPattern_HH
#define ZdtPattern_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>
#include <string_view>
#include <vector>

#include <zdt/ZdtField.hh>

namespace ZdtTokenType {
  enum {
    Literal = 0,
    Number,
    Reduced,	// two digit year
    Fraction,	// fraction of second
    Text,	// month / day of week / era / am-pm names
    Offset,	// zone offset
    ZoneId,	// zone id
    Optional	// optional section start
  };
}

namespace ZdtSign {
  enum {
    Never = 0,	// no sign
    Normal,	// '-' if negative
    ExceedsPad	// '-' if negative, '+' if wider than the minimum width
  };
}

namespace ZdtTextStyle {
  enum { Short = 0, Full };
}

namespace ZdtOffsetStyle {
  enum {
    HH = 0,	// +HH
    HHmm,	// +HH, +HHMM if minutes are non-zero
    HHMM,	// +HHMM
    HH_MM,	// +HH:MM
    Lenient,	// prints +HH:MM, parses +HH, +HHMM or +HH:MM
    LenientBasic, // prints +HHMM, parses +HH, +HHMM or +HH:MM
    Rfc3339	// +HH:MM, rejects -00:00
  };
}

struct ZdtToken {
  int		type = ZdtTokenType::Literal;
  int		field = -1;
  unsigned	minWidth = 0;	// Number / Fraction - parse
  unsigned	maxWidth = 0;
  unsigned	printMin = 0;	// Number / Fraction - print
  unsigned	printMax = 0;
  unsigned	reserve = 0;	// Number - digits left for adjacent numbers
  int		sign = ZdtSign::Never;
  int		style = 0;	// ZdtTextStyle / ZdtOffsetStyle
  bool		caseless = false;
  std::string	text;		// literal / separators / zero offset text
  int64_t	base = 0;	// Reduced - base year
  unsigned	end = 0;	// Optional - index past the section
};

class ZdtAPI ZdtPattern {
friend class ZdtPatternBuilder;

public:
  ZdtPattern() = default;

  // the whole of s must be consumed
  bool parse(std::string_view s, ZdtParsed &parsed) const;

  void print(std::string &s, const ZdtFields &fields) const;

  const std::vector<ZdtToken> &tokens() const { return m_tokens; }
  bool operator !() const { return m_tokens.empty(); }

  // true if any token handles field / offset / zone
  bool hasField(int field) const;
  bool hasOffset() const;

private:
  bool parse_(
      unsigned begin, unsigned end,
      std::string_view s, unsigned &pos, ZdtParsed &parsed) const;
  bool parseToken(
      const ZdtToken &token,
      std::string_view s, unsigned &pos, ZdtParsed &parsed) const;

  void printToken(
      const ZdtToken &token, std::string &s, const ZdtFields &fields) const;

  std::vector<ZdtToken>	m_tokens;
};

class ZdtAPI ZdtPatternBuilder {
public:
  ZdtPatternBuilder &literal(std::string_view text, bool caseless = false);
  // printWidth (zero padding) defaults to minWidth
  ZdtPatternBuilder &number(
      int field, unsigned minWidth, unsigned maxWidth,
      int sign = ZdtSign::Never, unsigned printWidth = 0);
  ZdtPatternBuilder &reduced(int field, int64_t base);
  // fraction of second - parses minDigits..maxDigits digits, prints
  // printMin..printMax digits; if separators is non-empty, the fraction
  // is introduced by one of them and omitted entirely when zero
  ZdtPatternBuilder &fraction(
      unsigned minDigits, unsigned maxDigits,
      unsigned printMin, unsigned printMax,
      std::string_view separators = {});
  ZdtPatternBuilder &text(int field, int style);
  ZdtPatternBuilder &offset(
      int style, std::string_view zeroText = {}, bool caseless = false);
  ZdtPatternBuilder &zoneId();
  ZdtPatternBuilder &optionalStart();
  ZdtPatternBuilder &optionalEnd();
  ZdtPatternBuilder &append(const ZdtPattern &pattern);

  unsigned depth() const { return m_optional.size(); }

  // closes any open optional sections
  ZdtPattern build();

private:
  std::vector<ZdtToken>	m_tokens;
  std::vector<unsigned>	m_optional;	// open optional sections
};

#endif /* ZdtPattern_HH */
