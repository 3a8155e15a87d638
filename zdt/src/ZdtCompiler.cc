//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// pattern compiler

#include <zdt/ZdtCompiler.hh>

#include <zdt/ZdtError.hh>

bool ZdtFormatChain::named() const
{
  for (const auto &segment : m_segments) if (!segment.name) return false;
  return true;
}

namespace {

using Builder = ZdtPatternBuilder;

// letter handler - count is the run length, adjacent is true if the run
// is immediately followed by a numeric letter
typedef void (*Handler)(
    Builder &, std::string_view pattern, char letter,
    unsigned count, bool adjacent);

struct Letter {
  char		letter;
  bool		numeric;	// numeric for adjacency purposes
  Handler	fn;
};

[[noreturn]] void invalidCount(std::string_view pattern, char c, unsigned n)
{
  throw ZdtInvalidFormatSpec{pattern,
    std::string{"Too many pattern letters: "} + std::string(n, c)};
}

// modern dialect

void mYear(int field, Builder &b, unsigned count)
{
  if (count == 2)
    b.reduced(field, 2000);
  else if (count < 4)
    b.number(field, count, 10, ZdtSign::Normal);
  else
    b.number(field, count, 10, ZdtSign::ExceedsPad);
}

void mEra(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n > 4) invalidCount(p, c, n);
  b.text(ZdtField::Era, n == 4 ? ZdtTextStyle::Full : ZdtTextStyle::Short);
}
void mProleptic(Builder &b, std::string_view, char, unsigned n, bool)
{
  mYear(ZdtField::Year, b, n);
}
void mYearOfEra(Builder &b, std::string_view, char, unsigned n, bool)
{
  mYear(ZdtField::YearOfEra, b, n);
}
void mWeekYear(Builder &b, std::string_view, char, unsigned n, bool)
{
  mYear(ZdtField::WeekBasedYear, b, n);
}
void mDayOfYear(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n > 3) invalidCount(p, c, n);
  b.number(ZdtField::DayOfYear, n, 3);
}
void mMonth(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  switch (n) {
    case 1: b.number(ZdtField::MonthOfYear, 1, 2); break;
    case 2: b.number(ZdtField::MonthOfYear, 2, 2); break;
    case 3: b.text(ZdtField::MonthOfYear, ZdtTextStyle::Short); break;
    case 4: b.text(ZdtField::MonthOfYear, ZdtTextStyle::Full); break;
    default: invalidCount(p, c, n);
  }
}
// fields printed with one or two digits
void mTwoDigit(int field, Builder &b, std::string_view p, char c, unsigned n)
{
  if (n > 2) invalidCount(p, c, n);
  b.number(field, n, 2);
}
void mDayOfMonth(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::DayOfMonth, b, p, c, n);
}
void mWeek(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::WeekOfWeekBasedYear, b, p, c, n);
}
void mHourOfAmPm(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::HourOfAmPm, b, p, c, n);
}
void mClockHourOfAmPm(
    Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::ClockHourOfAmPm, b, p, c, n);
}
void mHourOfDay(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::HourOfDay, b, p, c, n);
}
void mClockHourOfDay(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::ClockHourOfDay, b, p, c, n);
}
void mMinute(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::MinuteOfHour, b, p, c, n);
}
void mSecond(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  mTwoDigit(ZdtField::SecondOfMinute, b, p, c, n);
}
void mDayName(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n > 4) invalidCount(p, c, n);
  b.text(ZdtField::DayOfWeek,
      n == 4 ? ZdtTextStyle::Full : ZdtTextStyle::Short);
}
void mDayOfWeek(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n <= 2) { b.number(ZdtField::DayOfWeek, n, n); return; }
  mDayName(b, p, c, n, false);
}
void mAmPm(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n > 1) invalidCount(p, c, n);
  b.text(ZdtField::AmPm, ZdtTextStyle::Short);
}
void mFraction(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n > 9) invalidCount(p, c, n);
  b.fraction(n, n, n, n);
}
void mNano(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n > 9) invalidCount(p, c, n);
  b.number(ZdtField::NanoOfSecond, n, 9);
}
void mZoneId(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n != 2)
    throw ZdtInvalidFormatSpec{p, "Pattern letter count must be 2: V"};
  b.zoneId();
}
void mZoneName(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n > 4) invalidCount(p, c, n);
  b.zoneId();
}
// X - "Z" for zero, x - numeric zero
void mOffset(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  static const int styles[] = {
    ZdtOffsetStyle::HHmm, ZdtOffsetStyle::HHMM, ZdtOffsetStyle::HH_MM,
    ZdtOffsetStyle::HHMM, ZdtOffsetStyle::HH_MM
  };
  if (n > 5) invalidCount(p, c, n);
  b.offset(styles[n - 1], c == 'X' ? "Z" : "");
}
void mOffsetZ(Builder &b, std::string_view p, char c, unsigned n, bool)
{
  if (n <= 3) { b.offset(ZdtOffsetStyle::HHMM); return; }
  if (n == 5) { b.offset(ZdtOffsetStyle::HH_MM, "Z"); return; }
  invalidCount(p, c, n);
}

const Letter modern[] = {
  { 'G', false, mEra },
  { 'u', true, mProleptic },
  { 'y', true, mYearOfEra },
  { 'Y', true, mWeekYear },
  { 'D', true, mDayOfYear },
  { 'M', true, mMonth },
  { 'L', true, mMonth },
  { 'd', true, mDayOfMonth },
  { 'w', true, mWeek },
  { 'E', false, mDayName },
  { 'e', true, mDayOfWeek },
  { 'c', true, mDayOfWeek },
  { 'a', false, mAmPm },
  { 'h', true, mClockHourOfAmPm },
  { 'K', true, mHourOfAmPm },
  { 'k', true, mClockHourOfDay },
  { 'H', true, mHourOfDay },
  { 'm', true, mMinute },
  { 's', true, mSecond },
  { 'S', true, mFraction },
  { 'n', true, mNano },
  { 'V', false, mZoneId },
  { 'z', false, mZoneName },
  { 'X', false, mOffset },
  { 'x', false, mOffset },
  { 'Z', false, mOffsetZ },
  { 0, false, nullptr }
};

// legacy dialect - numbers print padded to the letter count and parse
// one or more digits, unless followed by another number in which case
// exactly count digits are parsed

void lNumber(int field, Builder &b, unsigned n, bool adjacent,
    unsigned max, int sign = ZdtSign::Never)
{
  if (n > max) max = n;
  if (adjacent)
    b.number(field, n, n, sign);
  else
    b.number(field, 1, max, sign, n);
}
void lYear(int field, Builder &b, unsigned n, bool adjacent)
{
  if (n == 2)
    b.reduced(field, 1950);
  else
    lNumber(field, b, n, adjacent, 9, ZdtSign::Normal);
}

void lEra(Builder &b, std::string_view, char, unsigned, bool)
{
  b.text(ZdtField::Era, ZdtTextStyle::Short);
}
void lCentury(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::CenturyOfEra, b, n, adj, 7);
}
void lYearOfEra(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lYear(ZdtField::YearOfEra, b, n, adj);
}
void lWeekYear(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lYear(ZdtField::WeekBasedYear, b, n, adj);
}
void lProleptic(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lYear(ZdtField::Year, b, n, adj);
}
void lWeek(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::WeekOfWeekBasedYear, b, n, adj, 2);
}
void lDayOfWeek(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::DayOfWeek, b, n, adj, 1);
}
void lDayName(Builder &b, std::string_view, char, unsigned n, bool)
{
  b.text(ZdtField::DayOfWeek,
      n >= 4 ? ZdtTextStyle::Full : ZdtTextStyle::Short);
}
void lDayOfYear(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::DayOfYear, b, n, adj, 3);
}
void lMonth(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  if (n >= 3)
    b.text(ZdtField::MonthOfYear,
	n >= 4 ? ZdtTextStyle::Full : ZdtTextStyle::Short);
  else
    lNumber(ZdtField::MonthOfYear, b, n, adj, 2);
}
void lDayOfMonth(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::DayOfMonth, b, n, adj, 2);
}
void lAmPm(Builder &b, std::string_view, char, unsigned, bool)
{
  b.text(ZdtField::AmPm, ZdtTextStyle::Short);
}
void lHourOfAmPm(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::HourOfAmPm, b, n, adj, 2);
}
void lClockHourOfAmPm(
    Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::ClockHourOfAmPm, b, n, adj, 2);
}
void lHourOfDay(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::HourOfDay, b, n, adj, 2);
}
void lClockHourOfDay(
    Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::ClockHourOfDay, b, n, adj, 2);
}
void lMinute(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::MinuteOfHour, b, n, adj, 2);
}
void lSecond(Builder &b, std::string_view, char, unsigned n, bool adj)
{
  lNumber(ZdtField::SecondOfMinute, b, n, adj, 2);
}
// prints count digits (truncated), parses up to nine
void lFraction(Builder &b, std::string_view p, char c, unsigned n, bool adj)
{
  if (n > 9) invalidCount(p, c, n);
  if (adj)
    b.fraction(n, n, n, n);
  else
    b.fraction(1, 9, n, n);
}
void lZoneName(Builder &b, std::string_view, char, unsigned, bool)
{
  b.zoneId();
}
void lOffset(Builder &b, std::string_view, char, unsigned n, bool)
{
  switch (n) {
    case 1: b.offset(ZdtOffsetStyle::HHMM); break;
    case 2: b.offset(ZdtOffsetStyle::HH_MM); break;
    default: b.zoneId(); break;
  }
}

const Letter legacy[] = {
  { 'G', false, lEra },
  { 'C', true, lCentury },
  { 'Y', true, lYearOfEra },
  { 'x', true, lWeekYear },
  { 'w', true, lWeek },
  { 'e', true, lDayOfWeek },
  { 'E', false, lDayName },
  { 'y', true, lProleptic },
  { 'D', true, lDayOfYear },
  { 'M', true, lMonth },
  { 'd', true, lDayOfMonth },
  { 'a', false, lAmPm },
  { 'K', true, lHourOfAmPm },
  { 'h', true, lClockHourOfAmPm },
  { 'H', true, lHourOfDay },
  { 'k', true, lClockHourOfDay },
  { 'm', true, lMinute },
  { 's', true, lSecond },
  { 'S', true, lFraction },
  { 'z', false, lZoneName },
  { 'Z', false, lOffset },
  { 0, false, nullptr }
};

const Letter *lookup(const Letter *table, char c)
{
  for (; table->letter; ++table) if (table->letter == c) return table;
  return nullptr;
}

bool isAlpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

// appends quoted text starting after the opening quote; returns the
// index past the closing quote
unsigned quoted(
    std::string_view pattern, unsigned i, std::string &literal)
{
  unsigned n = pattern.size();
  for (;;) {
    if (i >= n)
      throw ZdtInvalidFormatSpec{pattern, "Pattern ends with an incomplete string literal"};
    char c = pattern[i++];
    if (c == '\'') {
      if (i < n && pattern[i] == '\'') { literal += '\''; ++i; continue; }
      return i;
    }
    literal += c;
  }
}

} // namespace

ZdtPattern ZdtCompiler::custom(std::string_view pattern, int dialect)
{
  const Letter *table = dialect == ZdtDialect::Legacy ? legacy : modern;
  bool sections = dialect == ZdtDialect::Modern;
  ZdtPatternBuilder b;
  std::string literal;
  auto flush = [&b, &literal]() {
    if (!literal.empty()) { b.literal(literal); literal.clear(); }
  };
  unsigned n = pattern.size();
  unsigned i = 0;
  while (i < n) {
    char c = pattern[i];
    if (isAlpha(c)) {
      unsigned j = i + 1;
      while (j < n && pattern[j] == c) ++j;
      const Letter *letter = lookup(table, c);
      if (!letter)
	throw ZdtInvalidFormatSpec{pattern,
	  std::string{"Unknown pattern letter: "} + c};
      bool adjacent = false;
      if (j < n && isAlpha(pattern[j]))
	if (auto next = lookup(table, pattern[j]))
	  adjacent = next->numeric;
      flush();
      letter->fn(b, pattern, c, j - i, adjacent);
      i = j;
      continue;
    }
    ++i;
    if (c == '\'') {
      if (i < n && pattern[i] == '\'') { literal += '\''; ++i; continue; }
      i = quoted(pattern, i, literal);
      continue;
    }
    if (sections) {
      if (c == '[') { flush(); b.optionalStart(); continue; }
      if (c == ']') {
	if (!b.depth())
	  throw ZdtInvalidFormatSpec{pattern,
	    "Pattern invalid as it contains ] without previous ["};
	flush();
	b.optionalEnd();
	continue;
      }
      if (c == '{' || c == '}' || c == '#')
	throw ZdtInvalidFormatSpec{pattern,
	  std::string{"Pattern includes reserved character: '"} + c + '\''};
    }
    literal += c;
  }
  flush();
  ZdtPattern compiled = b.build();
  if (!compiled)
    throw ZdtInvalidFormatSpec{pattern, "empty pattern"};
  return compiled;
}

std::vector<std::string_view> ZdtCompiler::split(std::string_view pattern)
{
  std::vector<std::string_view> segments;
  unsigned n = pattern.size();
  unsigned begin = 0;
  bool quote = false;
  for (unsigned i = 0; i < n; i++) {
    char c = pattern[i];
    if (c == '\'') { quote = !quote; continue; }
    if (!quote && c == '|' && i + 1 < n && pattern[i + 1] == '|') {
      segments.push_back(pattern.substr(begin, i - begin));
      begin = ++i + 1;
    }
  }
  segments.push_back(pattern.substr(begin));
  for (const auto &segment : segments)
    if (segment.empty())
      throw ZdtInvalidFormatSpec{pattern, "empty format segment"};
  return segments;
}

ZdtRef<ZdtFormatChain> ZdtCompiler::compile(
    std::string_view pattern, bool legacyCompatible)
{
  if (pattern.empty())
    throw ZdtInvalidFormatSpec{pattern, "No date pattern provided"};

  ZdtRef<ZdtFormatChain> chain = new ZdtFormatChain{};
  chain->m_pattern = pattern;

  // a leading marker applies to the whole pattern
  bool legacyAll = legacyCompatible;
  std::string_view body = pattern;
  if (body[0] == LegacyMarker) {
    legacyAll = true;
    body.remove_prefix(1);
    if (body.empty())
      throw ZdtInvalidFormatSpec{pattern, "No date pattern provided"};
  }

  auto registry = ZdtRegistry::instance();
  auto segments = split(body);
  chain->m_segments.reserve(segments.size());
  bool first = true;
  for (auto text : segments) {
    ZdtSegment segment;
    segment.text = text;
    bool forced = false;
    if (!first && text[0] == LegacyMarker && text.size() > 1) {
      forced = true;
      text.remove_prefix(1);
    }
    first = false;
    if (!forced) {
      int deprecation;
      if (auto name = registry->resolve(text, deprecation)) {
	segment.name = name;
	if (deprecation != ZdtDeprecation::None)
	  chain->m_advisories.push_back(
	      ZdtRegistry::advisory(text, *name, deprecation));
	chain->m_segments.push_back(std::move(segment));
	continue;
      }
    }
    segment.dialect = (legacyAll || forced) ?
      ZdtDialect::Legacy : ZdtDialect::Modern;
    try {
      segment.custom.printer = custom(text, segment.dialect);
    } catch (const ZdtInvalidFormatSpec &e) {
      throw ZdtInvalidFormatSpec{pattern, e.reason()};
    }
    segment.custom.parsers.push_back(segment.custom.printer);
    chain->m_segments.push_back(std::move(segment));
  }
  return chain;
}
