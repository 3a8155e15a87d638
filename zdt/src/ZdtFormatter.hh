//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// date/time formatter - immutable, reference-counted, thread-safe

// auto fmt = ZdtFormatter::forPattern("strict_date_optional_time||epoch_millis");
// ZdtInstant t = fmt->parse("2018-05-15T17:14:56Z");
// std::string s = fmt->format(t);

// parse() tries each segment of the chain in turn, the first success
// wins; format() always uses the first segment

// the roundup variant resolves fields absent from the input to their
// largest values (e.g. "2018-10-10" is 2018-10-10T23:59:59.999999999)

// formatters whose chain consists entirely of format names are cached
// process-wide, keyed by the pattern string as given

#ifndef ZdtFormatter_HH
#define ZdtFormatter_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>
#include <string_view>
#include <vector>

#include <zdt/ZdtAtomic.hh>
#include <zdt/ZdtRef.hh>
#include <zdt/ZdtInstant.hh>
#include <zdt/ZdtTimeZone.hh>
#include <zdt/ZdtCompiler.hh>

class ZdtCf;

struct ZdtAPI ZdtOptions {
  bool		legacyCompatible = false;
  std::string	locale;		// empty - root
  ZdtZone	zone;		// unset - offsets default to UTC

  // keys legacyCompatible, locale, zone
  // - throws ZdtCfError::BadBool, ZdtInvalidFormatSpec
  static ZdtOptions fromCf(const ZdtCf &cf);
};

class ZdtFormatter;
using ZdtFormatterRef = ZdtRef<const ZdtFormatter>;

class ZdtAPI ZdtFormatter : public ZdtObject {
  ZdtFormatter(
      ZdtRef<ZdtFormatChain> chain, std::string locale, ZdtZone zone,
      bool roundup);

public:
  ~ZdtFormatter();

  // throws ZdtInvalidFormatSpec
  static ZdtFormatterRef forPattern(
      std::string_view pattern, const ZdtOptions &options = {});

  // throws ZdtDateParseError
  ZdtInstant parse(std::string_view s) const;
  // returns false instead of throwing
  bool parse(std::string_view s, ZdtInstant &t) const;

  std::string format(const ZdtInstant &t) const;
  void format(std::string &s, const ZdtInstant &t) const;

  const std::string &pattern() const { return m_chain->pattern(); }
  const std::string &locale() const { return m_locale; }
  const ZdtZone &zone() const { return m_zone; }
  bool isRoundup() const { return m_roundup; }
  const std::vector<std::string> &advisories() const {
    return m_chain->advisories();
  }
  const ZdtFormatChain *chain() const { return m_chain.ptr(); }

  // return this formatter if unchanged
  ZdtFormatterRef withLocale(std::string_view locale) const;
  ZdtFormatterRef withZone(const ZdtZone &zone) const;

  // memoized; the roundup formatter is its own roundup formatter
  ZdtFormatterRef roundupFormatter() const;

  bool equals(const ZdtFormatter &f) const;
  friend bool operator ==(const ZdtFormatter &l, const ZdtFormatter &r) {
    return l.equals(r);
  }
  uint32_t hash() const;

  template <typename S> void print(S &s) const {
    s << m_chain->pattern() << " locale=" << m_locale <<
      " zone=" << m_zone;
    if (m_roundup) s << " roundup";
  }
  friend std::ostream &operator <<(std::ostream &s, const ZdtFormatter &f) {
    f.print(s);
    return s;
  }

private:
  ZdtRef<ZdtFormatChain>	m_chain;
  std::string			m_locale;
  ZdtZone			m_zone;
  bool				m_roundup;
  mutable ZdtAtomic<const ZdtFormatter *>	m_roundupFmt;
};

#endif /* ZdtFormatter_HH */
