//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Perl compatible regular expressions (pcre)

#ifndef ZdtRegex_HH
#define ZdtRegex_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <pcre.h>

#include <string_view>
#include <vector>

#include <zdt/ZdtError.hh>

class ZdtAPI ZdtRegexError : public ZdtError {
public:
  ZdtRegexError(const char *message, int code, int offset) :
      m_message{message}, m_code{code}, m_offset{offset} { }

  int code() const { return m_code; }

  static const char *strerror(int);

  void print_(std::ostream &s) const {
    if (m_message)
      s << "ZdtRegex Error \"" << m_message << "\" (" << m_code << ")"
	" at offset " << m_offset;
    else
      s << "ZdtRegex pcre_exec() Error: " << strerror(m_code);
  }

private:
  const char	*m_message;
  int		m_code;
  int		m_offset;
};

class ZdtAPI ZdtRegex {
  ZdtRegex(const ZdtRegex &) = delete;
  ZdtRegex &operator =(const ZdtRegex &) = delete;

public:
  using Capture = std::string_view;
  using Captures = std::vector<Capture>;

  // pcre_compile() options; throws ZdtRegexError
  ZdtRegex(const char *pattern, int options = PCRE_UTF8);

  ZdtRegex(ZdtRegex &&r) :
      m_regex{r.m_regex}, m_captureCount{r.m_captureCount} {
    r.m_regex = nullptr;
    r.m_captureCount = 0;
  }
  ZdtRegex &operator =(ZdtRegex &&r) {
    if (this == &r) return *this;
    if (m_regex) (pcre_free)(m_regex);
    m_regex = r.m_regex;
    m_captureCount = r.m_captureCount;
    r.m_regex = nullptr;
    r.m_captureCount = 0;
    return *this;
  }

  ~ZdtRegex();

  unsigned captureCount() const { return m_captureCount; }

  // options below are pcre_exec() options

  // captures[0] is $`, captures[1] is $&, captures[2] is $1, ...
  // captures[n - 1] is $'
  // returns the number of captures excluding $` and $', 0 for no match
  unsigned m(std::string_view s, unsigned offset = 0, int options = 0) const {
    std::vector<int> ovector;
    return exec(s, offset, options, ovector);
  }
  unsigned m(std::string_view s,
      Captures &captures, unsigned offset = 0, int options = 0) const {
    std::vector<int> ovector;
    unsigned i = exec(s, offset, options, ovector);
    if (i) capture(s, ovector, captures);
    return i;
  }

private:
  unsigned exec(std::string_view s,
      unsigned offset, int options, std::vector<int> &ovector) const;
  void capture(std::string_view s,
      const std::vector<int> &ovector, Captures &captures) const;

  pcre		*m_regex;
  unsigned	m_captureCount;
};

// quote the pattern using the pre-processor to avoid having to double
// backslash the RE, then strip the leading/trailing double-quotes;
// compiled once, on first use

#define ZdtREGEX(pattern_, ...) ([]() -> const ZdtRegex & { \
  static const ZdtRegex regex{[]() -> const char * { \
    static char pattern[] = #pattern_; \
    static_assert(sizeof(pattern) >= 2); \
    pattern[sizeof(pattern) - 2] = 0; \
    return &pattern[1]; \
  }() __VA_OPT__(,) __VA_ARGS__}; \
  return regex; \
}())

#endif /* ZdtRegex_HH */
