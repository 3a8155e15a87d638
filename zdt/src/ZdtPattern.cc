//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// compiled date/time pattern

#include <zdt/ZdtPattern.hh>

#include <zdt/ZdtDateTime.hh>
#include <zdt/ZdtError.hh>

namespace {

inline bool isDigit(char c) { return c >= '0' && c <= '9'; }

inline char lower(char c) {
  return (c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c;
}

bool matchCaseless(std::string_view s, unsigned pos, std::string_view t)
{
  if (s.length() - pos < t.length()) return false;
  for (unsigned i = 0, n = t.length(); i < n; i++)
    if (lower(s[pos + i]) != lower(t[i])) return false;
  return true;
}

const std::string_view eraShort[] = { "BC", "AD" };
const std::string_view eraFull[] = { "Before Christ", "Anno Domini" };
const std::string_view amPm[] = { "AM", "PM" };

// text for a field value
std::string_view fieldText(int field, int style, int64_t v)
{
  bool full = style == ZdtTextStyle::Full;
  switch (field) {
    case ZdtField::MonthOfYear:
      return full ?
	ZdtDateTime::monthLongName(int(v)) :
	ZdtDateTime::monthShortName(int(v));
    case ZdtField::DayOfWeek:
      return full ?
	ZdtDateTime::dayLongName(int(v)) :
	ZdtDateTime::dayShortName(int(v));
    case ZdtField::Era:
      return full ? eraFull[v ? 1 : 0] : eraShort[v ? 1 : 0];
    case ZdtField::AmPm:
      return amPm[v ? 1 : 0];
  }
  return {};
}

void printDigits(std::string &s, uint64_t v, unsigned width)
{
  char buf[24];
  unsigned n = 0;
  do { buf[n++] = '0' + v % 10; v /= 10; } while (v);
  while (n < width) buf[n++] = '0';
  while (n) s += buf[--n];
}

void printOffset(std::string &s, int32_t offset, int style)
{
  char sign = '+';
  if (offset < 0) sign = '-', offset = -offset;
  int hours = offset / 3600, minutes = (offset / 60) % 60;
  s += sign;
  printDigits(s, hours, 2);
  switch (style) {
    case ZdtOffsetStyle::HH:
      break;
    case ZdtOffsetStyle::HHmm:
      if (minutes) printDigits(s, minutes, 2);
      break;
    case ZdtOffsetStyle::HHMM:
    case ZdtOffsetStyle::LenientBasic:
      printDigits(s, minutes, 2);
      break;
    default:
      s += ':';
      printDigits(s, minutes, 2);
      break;
  }
}

// [+-]HH, returns hours * sign or fails
bool scanHH(std::string_view s, unsigned &pos, int &sign, int &hours)
{
  if (s.length() - pos < 3) return false;
  if (s[pos] == '+') sign = 1;
  else if (s[pos] == '-') sign = -1;
  else return false;
  if (!isDigit(s[pos + 1]) || !isDigit(s[pos + 2])) return false;
  hours = (s[pos + 1] - '0') * 10 + (s[pos + 2] - '0');
  pos += 3;
  return true;
}

bool scanMM(std::string_view s, unsigned &pos, int &minutes)
{
  if (s.length() - pos < 2) return false;
  if (!isDigit(s[pos]) || !isDigit(s[pos + 1])) return false;
  minutes = (s[pos] - '0') * 10 + (s[pos + 1] - '0');
  pos += 2;
  return true;
}

bool scanOffset(std::string_view s, unsigned &pos, int style, int32_t &offset)
{
  unsigned pos_ = pos;
  int sign, hours, minutes = 0;

  if (!scanHH(s, pos_, sign, hours)) return false;
  switch (style) {
    case ZdtOffsetStyle::HH:
      break;
    case ZdtOffsetStyle::HHmm:
      scanMM(s, pos_, minutes);
      break;
    case ZdtOffsetStyle::HHMM:
      if (!scanMM(s, pos_, minutes)) return false;
      break;
    case ZdtOffsetStyle::HH_MM:
    case ZdtOffsetStyle::Rfc3339:
      if (pos_ >= s.length() || s[pos_] != ':') return false;
      ++pos_;
      if (!scanMM(s, pos_, minutes)) return false;
      if (style == ZdtOffsetStyle::Rfc3339 &&
	  sign < 0 && !hours && !minutes) return false;
      break;
    default: {
      unsigned colon = pos_;
      if (colon < s.length() && s[colon] == ':') ++colon;
      if (scanMM(s, colon, minutes)) pos_ = colon;
    } break;
  }
  if (hours > 18 || minutes > 59) return false;
  offset = sign * (hours * 3600 + minutes * 60);
  pos = pos_;
  return true;
}

bool isZoneChar(char c)
{
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
    isDigit(c) || c == '/' || c == '_' || c == '-' || c == '+' || c == ':';
}

} // namespace

bool ZdtPattern::parse(std::string_view s, ZdtParsed &parsed) const
{
  unsigned pos = 0;
  if (!parse_(0, m_tokens.size(), s, pos, parsed)) return false;
  return pos == s.length();
}

bool ZdtPattern::parse_(
    unsigned begin, unsigned end,
    std::string_view s, unsigned &pos, ZdtParsed &parsed) const
{
  for (unsigned i = begin; i < end; ) {
    const auto &token = m_tokens[i];
    if (token.type == ZdtTokenType::Optional) {
      ZdtParsed parsed_ = parsed;
      unsigned pos_ = pos;
      if (parse_(i + 1, token.end, s, pos_, parsed_)) {
	parsed = std::move(parsed_);
	pos = pos_;
      }
      i = token.end;
      continue;
    }
    if (!parseToken(token, s, pos, parsed)) return false;
    ++i;
  }
  return true;
}

bool ZdtPattern::parseToken(
    const ZdtToken &token,
    std::string_view s, unsigned &pos, ZdtParsed &parsed) const
{
  unsigned n = s.length();

  switch (token.type) {
    case ZdtTokenType::Literal: {
      const auto &t = token.text;
      if (token.caseless) {
	if (!matchCaseless(s, pos, t)) return false;
      } else {
	if (s.substr(pos, t.length()) != t) return false;
      }
      pos += t.length();
    } return true;

    case ZdtTokenType::Number: {
      unsigned pos_ = pos;
      bool negative = false, sign = false;
      if (token.sign != ZdtSign::Never && pos_ < n) {
	if (s[pos_] == '-')
	  negative = sign = true, ++pos_;
	else if (s[pos_] == '+' && token.sign == ZdtSign::ExceedsPad)
	  sign = true, ++pos_;
      }
      unsigned avail = 0;
      while (pos_ + avail < n && isDigit(s[pos_ + avail])) ++avail;
      unsigned width = avail;
      if (width > token.maxWidth) width = token.maxWidth;
      if (token.reserve && avail > token.reserve &&
	  width > avail - token.reserve)
	width = avail - token.reserve;
      if (width < token.minWidth || !width) return false;
      // values wider than the minimum must be signed
      if (token.sign == ZdtSign::ExceedsPad && !sign &&
	  width > token.minWidth) return false;
      int64_t v = 0;
      for (unsigned i = 0; i < width; i++) v = v * 10 + (s[pos_ + i] - '0');
      if (negative) v = -v;
      if (!parsed.set(token.field, v)) return false;
      if (token.field == ZdtField::NanoOfSecond) parsed.fracDigits = 9;
      pos = pos_ + width;
    } return true;

    case ZdtTokenType::Reduced: {
      if (n - pos < 2 || !isDigit(s[pos]) || !isDigit(s[pos + 1]))
	return false;
      int64_t v = (s[pos] - '0') * 10 + (s[pos + 1] - '0');
      int64_t base = token.base;
      v = base + (v - (base % 100) + 100) % 100;
      if (!parsed.set(token.field, v)) return false;
      pos += 2;
    } return true;

    case ZdtTokenType::Fraction: {
      unsigned pos_ = pos;
      if (!token.text.empty()) {
	if (pos_ >= n || token.text.find(s[pos_]) == std::string::npos)
	  return !token.minWidth;
	++pos_;
      }
      unsigned digits = 0;
      while (digits < token.maxWidth &&
	  pos_ + digits < n && isDigit(s[pos_ + digits])) ++digits;
      if (digits < token.minWidth) return false;
      if (!token.text.empty() && !digits) return false;
      int64_t v = 0;
      for (unsigned i = 0; i < digits; i++) v = v * 10 + (s[pos_ + i] - '0');
      for (unsigned i = digits; i < 9; i++) v *= 10;
      if (!parsed.set(ZdtField::NanoOfSecond, v)) return false;
      parsed.fracDigits = digits;
      pos = pos_ + digits;
    } return true;

    case ZdtTokenType::Text: {
      // longest match first, case-insensitively
      int64_t min = ZdtField::minimum(token.field);
      int64_t max = ZdtField::maximum(token.field);
      int64_t found = -1;
      unsigned length = 0;
      for (int64_t v = min; v <= max; v++) {
	auto t = fieldText(token.field, token.style, v);
	if (t.length() > length && matchCaseless(s, pos, t))
	  found = v, length = t.length();
      }
      if (found < 0 || !parsed.set(token.field, found)) return false;
      pos += length;
    } return true;

    case ZdtTokenType::Offset: {
      int32_t offset;
      const auto &z = token.text;
      if (!z.empty() && (token.caseless ?
	    matchCaseless(s, pos, z) : s.substr(pos, z.length()) == z)) {
	offset = 0;
	pos += z.length();
      } else if (!scanOffset(s, pos, token.style, offset))
	return false;
      if (parsed.hasOffset && parsed.offset != offset) return false;
      parsed.offset = offset;
      parsed.hasOffset = true;
    } return true;

    case ZdtTokenType::ZoneId: {
      unsigned length = 0;
      while (pos + length < n && isZoneChar(s[pos + length])) ++length;
      if (!length) return false;
      auto id = s.substr(pos, length);
      try {
	ZdtZone::parse(id);
      } catch (const ZdtInvalidFormatSpec &) {
	return false;
      }
      parsed.zone = std::string{id};
      pos += length;
    } return true;
  }
  return false;
}

void ZdtPattern::print(std::string &s, const ZdtFields &fields) const
{
  for (const auto &token : m_tokens) printToken(token, s, fields);
}

void ZdtPattern::printToken(
    const ZdtToken &token, std::string &s, const ZdtFields &fields) const
{
  switch (token.type) {
    case ZdtTokenType::Literal:
      s += token.text;
      break;

    case ZdtTokenType::Number: {
      int64_t v = fields.get(token.field);
      uint64_t u = v < 0 ? uint64_t(-(v + 1)) + 1 : uint64_t(v);
      if (v < 0) {
	if (token.sign != ZdtSign::Never) s += '-';
      } else if (token.sign == ZdtSign::ExceedsPad) {
	uint64_t limit = 1;
	for (unsigned i = 0; i < token.printMin; i++) limit *= 10;
	if (token.printMin && u >= limit) s += '+';
      }
      printDigits(s, u, token.printMin);
    } break;

    case ZdtTokenType::Reduced: {
      int64_t v = fields.get(token.field) % 100;
      if (v < 0) v += 100;
      printDigits(s, v, 2);
    } break;

    case ZdtTokenType::Fraction: {
      int32_t nano = fields.nano;
      char digits[9];
      for (int i = 8; i >= 0; i--) digits[i] = '0' + nano % 10, nano /= 10;
      unsigned n = token.printMax;
      while (n > token.printMin && digits[n - 1] == '0') --n;
      if (!n) break;
      if (!token.text.empty()) s += token.text[0];
      s.append(digits, n);
    } break;

    case ZdtTokenType::Text:
      s += fieldText(token.field, token.style, fields.get(token.field));
      break;

    case ZdtTokenType::Offset:
      if (!fields.offset && !token.text.empty())
	s += token.text;
      else
	printOffset(s, fields.offset, token.style);
      break;

    case ZdtTokenType::ZoneId:
      s += fields.zone;
      break;

    case ZdtTokenType::Optional:
      break;
  }
}

bool ZdtPattern::hasField(int field) const
{
  for (const auto &token : m_tokens)
    if (token.field == field) return true;
  return false;
}

bool ZdtPattern::hasOffset() const
{
  for (const auto &token : m_tokens)
    if (token.type == ZdtTokenType::Offset ||
	token.type == ZdtTokenType::ZoneId) return true;
  return false;
}

ZdtPatternBuilder &ZdtPatternBuilder::literal(
    std::string_view text, bool caseless)
{
  // coalesce adjacent literals
  if (!m_tokens.empty()) {
    auto &last = m_tokens.back();
    if (last.type == ZdtTokenType::Literal && last.caseless == caseless) {
      last.text += text;
      return *this;
    }
  }
  ZdtToken token;
  token.type = ZdtTokenType::Literal;
  token.text = text;
  token.caseless = caseless;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::number(
    int field, unsigned minWidth, unsigned maxWidth, int sign,
    unsigned printWidth)
{
  ZdtToken token;
  token.type = ZdtTokenType::Number;
  token.field = field;
  token.minWidth = minWidth;
  token.printMin = printWidth ? printWidth : minWidth;
  token.maxWidth = maxWidth < minWidth ? minWidth : maxWidth;
  token.sign = sign;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::reduced(int field, int64_t base)
{
  ZdtToken token;
  token.type = ZdtTokenType::Reduced;
  token.field = field;
  token.minWidth = token.maxWidth = 2;
  token.base = base;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::fraction(
    unsigned minDigits, unsigned maxDigits,
    unsigned printMin, unsigned printMax,
    std::string_view separators)
{
  ZdtToken token;
  token.type = ZdtTokenType::Fraction;
  token.field = ZdtField::NanoOfSecond;
  token.minWidth = minDigits;
  token.maxWidth = maxDigits;
  token.printMin = printMin;
  token.printMax = printMax;
  token.text = separators;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::text(int field, int style)
{
  ZdtToken token;
  token.type = ZdtTokenType::Text;
  token.field = field;
  token.style = style;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::offset(
    int style, std::string_view zeroText, bool caseless)
{
  ZdtToken token;
  token.type = ZdtTokenType::Offset;
  token.style = style;
  token.text = zeroText;
  token.caseless = caseless;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::zoneId()
{
  ZdtToken token;
  token.type = ZdtTokenType::ZoneId;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::optionalStart()
{
  m_optional.push_back(m_tokens.size());
  ZdtToken token;
  token.type = ZdtTokenType::Optional;
  m_tokens.push_back(std::move(token));
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::optionalEnd()
{
  if (m_optional.empty())
    throw ZdtInvalidFormatSpec{"]", "unmatched optional section end"};
  m_tokens[m_optional.back()].end = m_tokens.size();
  m_optional.pop_back();
  return *this;
}

ZdtPatternBuilder &ZdtPatternBuilder::append(const ZdtPattern &pattern)
{
  unsigned offset = m_tokens.size();
  for (auto token : pattern.m_tokens) {
    if (token.type == ZdtTokenType::Optional) token.end += offset;
    token.reserve = 0;
    m_tokens.push_back(std::move(token));
  }
  return *this;
}

ZdtPattern ZdtPatternBuilder::build()
{
  while (!m_optional.empty()) optionalEnd();

  // adjacent value parsing - a variable-width number leaves room for
  // the fixed-width numbers that immediately follow it
  for (unsigned i = 0, n = m_tokens.size(); i < n; i++) {
    auto &token = m_tokens[i];
    if (token.type != ZdtTokenType::Number) continue;
    if (token.minWidth == token.maxWidth) continue;
    unsigned reserve = 0;
    for (unsigned j = i + 1; j < n; j++) {
      const auto &next = m_tokens[j];
      bool fixed =
	(next.type == ZdtTokenType::Number ||
	 next.type == ZdtTokenType::Reduced ||
	 (next.type == ZdtTokenType::Fraction && next.text.empty())) &&
	next.minWidth == next.maxWidth;
      if (!fixed) break;
      reserve += next.minWidth;
    }
    token.reserve = reserve;
  }

  ZdtPattern pattern;
  pattern.m_tokens = std::move(m_tokens);
  m_tokens.clear();
  return pattern;
}
