//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Perl compatible regular expressions (pcre)

#include <zdt/ZdtRegex.hh>

ZdtRegex::ZdtRegex(const char *pattern, int options)
{
  const char *message = nullptr;
  int code = 0, offset = 0;

  m_regex = pcre_compile2(pattern, options, &code, &message, &offset, 0);

  if (!m_regex) throw ZdtRegexError{message, code, offset};

  int n;
  if (!pcre_fullinfo(m_regex, 0, PCRE_INFO_CAPTURECOUNT, &n))
    m_captureCount = n + 1;
  else
    m_captureCount = 1;
}

ZdtRegex::~ZdtRegex()
{
  if (m_regex) (pcre_free)(m_regex);
}

unsigned ZdtRegex::exec(
    std::string_view s, unsigned offset,
    int options, std::vector<int> &ovector) const
{
  unsigned slength = s.length();

  if (slength < offset) return 0;

  ovector.resize(m_captureCount * 3);

  int c = pcre_exec(
      m_regex, nullptr, s.data(), slength,
      offset, options, ovector.data(), ovector.size());

  if (c >= 0) return c;

  if (c == PCRE_ERROR_NOMATCH) return 0;

  throw ZdtRegexError{nullptr, c, -1};
}

void ZdtRegex::capture(
    std::string_view s, const std::vector<int> &ovector,
    Captures &captures) const
{
  unsigned n = m_captureCount;

  captures.clear();
  captures.reserve(n + 2);
  captures.emplace_back(s.data(), ovector[0]); // $`
  for (unsigned i = 0; i < n; i++) {
    int offset = ovector[i<<1];
    if (offset < 0)
      captures.emplace_back();
    else
      captures.emplace_back(s.data() + offset, ovector[(i<<1) + 1] - offset);
  }
  captures.emplace_back(s.data() + ovector[1], s.length() - ovector[1]); // $'
}

static const char *exec_errors[] = {
  "NOMATCH",
  "NULL",
  "BADOPTION",
  "BADMAGIC",
  "UNKNOWN_OPCODE",
  "NOMEMORY",
  "NOSUBSTRING",
  "MATCHLIMIT",
  "CALLOUT",
  "BADUTF",
  "BADUTF_OFFSET",
  "PARTIAL",
  "BADPARTIAL",
  "INTERNAL",
  "BADCOUNT"
};

const char *ZdtRegexError::strerror(int i)
{
  enum { N = sizeof(exec_errors) / sizeof(exec_errors[0]) };
  i = -i - 1;
  if (i < 0 || i >= N) return "UNKNOWN";
  return exec_errors[i];
}
