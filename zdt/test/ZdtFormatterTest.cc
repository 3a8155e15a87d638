//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <zdt/ZdtLib.hh>

#include <stdlib.h>

#include <iostream>
#include <vector>

#include <zdt/ZdtFormatter.hh>
#include <zdt/ZdtDateTime.hh>
#include <zdt/ZdtLog.hh>
#include <zdt/ZdtError.hh>

void fail() { exit(1); }

void out(const char *s) {
  std::cout << s << '\n' << std::flush;
}

#define CHECK(x) ((x) ? (out("OK  " #x), void()) : (out("NOK " #x), fail()))

static ZdtInstant instant(
    int64_t year, int month, int day,
    int hour = 0, int minute = 0, int sec = 0, int32_t nsec = 0,
    int32_t offset = 0)
{
  return ZdtDateTime{year, month, day, hour, minute, sec, nsec}.
    instant(offset);
}

static bool parses(
    const ZdtFormatterRef &fmt, const char *s, const ZdtInstant &t)
{
  ZdtInstant t_;
  if (!fmt->parse(s, t_)) {
    std::cout << fmt->pattern() << ": failed to parse " << s << '\n';
    return false;
  }
  if (t_ == t) return true;
  std::cout << "parsed " << t_ << " expected " << t << '\n';
  return false;
}

static bool parses(const char *pattern, const char *s, const ZdtInstant &t)
{
  return parses(ZdtFormatter::forPattern(pattern), s, t);
}

static bool fails(const char *pattern, const char *s)
{
  ZdtInstant t;
  return !ZdtFormatter::forPattern(pattern)->parse(s, t);
}

static bool invalid(const char *pattern, ZdtOptions options = {})
{
  try {
    ZdtFormatter::forPattern(pattern, options);
  } catch (const ZdtInvalidFormatSpec &e) {
    std::cout << e << '\n';
    return e.pattern() == pattern;
  }
  return false;
}

static std::string format(const char *pattern, const ZdtInstant &t)
{
  return ZdtFormatter::forPattern(pattern)->format(t);
}

int main()
{
  auto t = instant(2018, 5, 15, 17, 14, 56, 123456789);

  // chains
  {
    auto fmt = ZdtFormatter::forPattern(
	"strict_date_optional_time||epoch_millis");
    CHECK(parses(fmt, "2018-05-15T17:14:56Z", instant(2018, 5, 15, 17, 14, 56)));
    CHECK(parses(fmt, "2018-05-15", instant(2018, 5, 15)));
    CHECK(parses(fmt, "1526404496123",
	  instant(2018, 5, 15, 17, 14, 56, 123000000)));
    CHECK(parses(fmt, "123", ZdtInstant::ofEpochMilli(123)));
    CHECK(parses(fmt, "-1", ZdtInstant::ofEpochMilli(-1)));
    CHECK(fmt->format(t) == "2018-05-15T17:14:56.123Z");
    try {
      fmt->parse("garbage");
      CHECK(false);
    } catch (const ZdtDateParseError &e) {
      CHECK(e.message() == "failed to parse date field [garbage] with "
	  "format [strict_date_optional_time||epoch_millis]");
      CHECK(e.input() == "garbage");
    }
  }
  {
    auto fmt = ZdtFormatter::forPattern("epoch_millis||date_optional_time");
    CHECK(fmt->format(t) == "1526404496123.456789");
    CHECK(parses(fmt, "2018-05-15T17:14:56Z", instant(2018, 5, 15, 17, 14, 56)));
  }
  CHECK(format("epoch_second", t) == "1526404496.123456");
  {
    auto fmt = ZdtFormatter::forPattern("epoch_second");
    CHECK(parses(fmt, "1.123456", ZdtInstant{1, 123456000}));
    try {
      fmt->parse("1.1234567890");
      CHECK(false);
    } catch (const ZdtDateParseError &e) {
      CHECK(e.input() == "1.1234567890");
    }
  }
  {
    ZdtOptions en, de;
    en.locale = "en-US";
    de.locale = "de-DE";
    auto a = ZdtFormatter::forPattern("date_optional_time", en);
    auto b = ZdtFormatter::forPattern("date_optional_time", de);
    CHECK(a.ptr() != b.ptr());
    CHECK(!(*a == *b));
    CHECK(a->pattern() == b->pattern());
    CHECK(ZdtFormatter::forPattern("date_optional_time").ptr() ==
	ZdtFormatter::forPattern("date_optional_time").ptr());
  }
  CHECK(parses("epoch_second", "1526404496.5",
	instant(2018, 5, 15, 17, 14, 56, 500000000)));
  CHECK(fails("epoch_second", "2018-05-15"));

  // named formats
  CHECK(parses("date_optional_time", "2018-5-7", instant(2018, 5, 7)));
  CHECK(fails("strict_date_optional_time", "2018-5-7"));
  CHECK(parses("date_optional_time", "2018-05-15T17:14:56.123456789+01:00",
	instant(2018, 5, 15, 17, 14, 56, 123456789, 3600)));
  CHECK(parses("date_optional_time", "2018-05-15T17:14:56,5Z",
	instant(2018, 5, 15, 17, 14, 56, 500000000)));
  CHECK(parses("date_optional_time", "2018-05", instant(2018, 5, 1)));
  CHECK(parses("date_optional_time", "2018", instant(2018, 1, 1)));
  CHECK(fails("date_optional_time", "2018-05-15T17"));
  CHECK(parses("iso8601", "2018-05-15T17", instant(2018, 5, 15, 17)));
  CHECK(parses("iso8601", "2018-05-15T17:14+0130",
	instant(2018, 5, 15, 17, 14, 0, 0, 5400)));
  CHECK(parses("strict_date_optional_time", "2018-05-15T17:14:56+01",
	instant(2018, 5, 15, 17, 14, 56, 0, 3600)));
  CHECK(format("strict_date_optional_time_nanos", t) ==
      "2018-05-15T17:14:56.123456789Z");
  CHECK(format("date", t) == "2018-05-15");
  CHECK(format("basic_date_time", t) == "20180515T171456.123Z");
  CHECK(format("basic_week_date", t) == "2018W202");
  CHECK(format("week_date", t) == "2018-W20-2");
  CHECK(format("ordinal_date_time_no_millis", t) == "2018-135T17:14:56Z");
  CHECK(format("t_time", t) == "T17:14:56.123Z");
  CHECK(format("hour_minute", t) == "17:14");
  CHECK(parses("basic_date", "20180515", instant(2018, 5, 15)));
  CHECK(parses("basic_week_date", "2015W011", instant(2014, 12, 29)));
  CHECK(parses("week_date", "2015-W1-1", instant(2014, 12, 29)));
  CHECK(fails("strict_week_date", "2015-W1-1"));
  CHECK(parses("time", "17:14:56.123+0100",
	instant(1970, 1, 1, 17, 14, 56, 123000000, 3600)));
  CHECK(parses("year_month", "2018-05", instant(2018, 5, 1)));
  CHECK(parses("weekyear_week", "2016-W01", instant(2016, 1, 4)));

  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14:56Z",
	instant(2018, 5, 15, 17, 14, 56)));
  CHECK(parses("rfc3339_lenient", "2018-05-15t17:14:56.1z",
	instant(2018, 5, 15, 17, 14, 56, 100000000)));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14:56+05:30",
	instant(2018, 5, 15, 17, 14, 56, 0, 19800)));
  CHECK(parses("rfc3339_lenient", "2018-05", instant(2018, 5, 1)));
  CHECK(fails("rfc3339_lenient", "2018-05-15T17:14:56-00:00"));
  CHECK(fails("rfc3339_lenient", "2018-05-15T17:14:56"));
  CHECK(fails("rfc3339_lenient", "2018-05-15T17:14:56.Z"));
  CHECK(fails("rfc3339_lenient", "2018-05-15T17:14:56.1234567891Z"));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14Z",
	instant(2018, 5, 15, 17, 14)));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14z",
	instant(2018, 5, 15, 17, 14)));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14+01:00",
	instant(2018, 5, 15, 17, 14, 0, 0, 3600)));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14-01:00",
	instant(2018, 5, 15, 17, 14, 0, 0, -3600)));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14:56,123Z",
	instant(2018, 5, 15, 17, 14, 56, 123000000)));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14:56,123456-01:00",
	instant(2018, 5, 15, 17, 14, 56, 123456000, -3600)));
  CHECK(parses("rfc3339_lenient", "2018-05-15T17:14:56,123456789z",
	instant(2018, 5, 15, 17, 14, 56, 123456789)));
  CHECK(parses("rfc3339_lenient", "1994-11-05T08:15:30-05:00",
	instant(1994, 11, 5, 13, 15, 30)));
  CHECK(fails("rfc3339_lenient", "2018-05-15T17:14:56.+00:00"));
  CHECK(fails("rfc3339_lenient", "2018-05-15T17:14:56_00:00"));
  CHECK(fails("rfc3339_lenient", "2018-05-15T17:14"));
  CHECK(fails("rfc3339_lenient", "201805-15T17:14:56.123456+0000"));

  // format then parse reproduces the text for every named format
  {
    bool ok = true;
    for (const auto &name : ZdtRegistry::instance()->names()) {
      auto fmt = ZdtFormatter::forPattern(name.canonical);
      std::string s = fmt->format(t);
      ZdtInstant t_;
      if (!fmt->parse(s, t_) || fmt->format(t_) != s) {
	std::cout << name.canonical << ": " << s << '\n';
	ok = false;
      }
    }
    CHECK(ok);
  }

  // invalid patterns
  CHECK(invalid(""));
  CHECK(invalid("date||"));
  CHECK(invalid("||date"));
  CHECK(invalid("date||||epoch_millis"));
  CHECK(invalid("unknown_name"));
  CHECK(invalid("date||yyyy-MM-dd'T"));
  CHECK(invalid("8"));
  CHECK(invalid("date||8date"));

  // quoted || is literal text
  CHECK(parses("yyyy'||'MM", "2018||05", instant(2018, 5, 1)));

  // legacy dialect
  CHECK(parses("8yyyy-MM-dd", "2018-5-7", instant(2018, 5, 7)));
  CHECK(fails("yyyy-MM-dd", "2018-5-7"));
  CHECK(parses("8date_optional_time", "2018-05-15", instant(2018, 5, 15)));
  CHECK(parses("strict_date||8yyyy-M-d", "2018-5-7", instant(2018, 5, 7)));
  {
    auto fmt = ZdtFormatter::forPattern("8yyyy-MM-dd||date");
    const auto &segments = fmt->chain()->segments();
    CHECK(segments.size() == 2);
    CHECK(segments[0].dialect == ZdtDialect::Legacy && !segments[0].name);
    CHECK(segments[1].name && segments[1].name->canonical == "date");
    CHECK(fmt->pattern() == "8yyyy-MM-dd||date");
  }
  {
    ZdtOptions options;
    options.legacyCompatible = true;
    auto fmt = ZdtFormatter::forPattern("yyyy-MM-dd", options);
    CHECK(parses(fmt, "2018-5-7", instant(2018, 5, 7)));
    CHECK(fmt->pattern() == "yyyy-MM-dd");
  }

  // zone and locale
  {
    ZdtOptions options;
    options.zone = ZdtZone::parse("+01:00");
    auto fmt = ZdtFormatter::forPattern("yyyy-MM-dd HH:mm", options);
    CHECK(fmt->zone() == ZdtZone::fixed(3600));
    CHECK(parses(fmt, "2018-05-15 10:20", instant(2018, 5, 15, 9, 20)));
    CHECK(fmt->format(instant(2018, 5, 15, 9, 20)) == "2018-05-15 10:20");
  }
  {
    auto fmt = ZdtFormatter::forPattern("strict_date_optional_time");
    CHECK(fmt->locale() == "root");
    CHECK(!fmt->zone());
    CHECK(!fmt->isRoundup());
    CHECK(fmt->withLocale("root").ptr() == fmt.ptr());
    CHECK(fmt->withLocale("").ptr() == fmt.ptr());
    CHECK(fmt->withZone(ZdtZone{}).ptr() == fmt.ptr());
    auto fr = fmt->withLocale("fr-FR");
    CHECK(fr.ptr() != fmt.ptr());
    CHECK(fr->locale() == "fr-FR");
    CHECK(!(*fr == *fmt));
    CHECK(fr->withLocale("fr-FR").ptr() == fr.ptr());
    auto utc = fmt->withZone(ZdtZone::utc());
    CHECK(utc->zone() == ZdtZone::utc());
    CHECK(!(*utc == *fmt));
    CHECK(utc->pattern() == fmt->pattern());
    CHECK(utc->format(t) == fmt->format(t));
    auto tokyo = fmt->withZone(ZdtZone::fixed(9 * 3600));
    CHECK(tokyo->format(t) == "2018-05-16T02:14:56.123+09:00");
    CHECK(parses(tokyo, "2018-05-16T02:14:56.123",
	  instant(2018, 5, 15, 17, 14, 56, 123000000)));
    CHECK(parses(tokyo, "2018-05-16T02:14:56.123Z",
	  instant(2018, 5, 16, 2, 14, 56, 123000000)));
  }

  // equality and caching
  {
    auto a = ZdtFormatter::forPattern("yyyy-MM-dd");
    auto b = ZdtFormatter::forPattern("yyyy-MM-dd");
    CHECK(a.ptr() != b.ptr());
    CHECK(*a == *b);
    CHECK(a->hash() == b->hash());
    auto c = ZdtFormatter::forPattern("date||epoch_millis");
    auto d = ZdtFormatter::forPattern("date||epoch_millis");
    CHECK(c.ptr() == d.ptr());
    CHECK(!(*a == *c));
    CHECK(!(*ZdtFormatter::forPattern("date") ==
	  *ZdtFormatter::forPattern("strict_date")));
  }

  // deprecation advisories are logged on every use
  {
    std::vector<std::string> warnings;
    ZdtLog::sink(ZdtLog::lambdaSink(
	  [&warnings](const ZdtEventInfo &info, std::string_view msg) {
	    if (info.severity == Zdt::Warning)
	      warnings.emplace_back(msg);
	  }));
    auto a = ZdtFormatter::forPattern("strictDateOptionalTime");
    auto b = ZdtFormatter::forPattern("strictDateOptionalTime");
    CHECK(a.ptr() == b.ptr());
    CHECK(warnings.size() == 2);
    CHECK(a->advisories().size() == 1);
    CHECK(warnings[0] ==
	"Camel case format name strictDateOptionalTime is deprecated and "
	"will be removed in a future version. Use snake case name "
	"strict_date_optional_time instead.");
    warnings.clear();
    auto c = ZdtFormatter::forPattern("week_year||dateOptionalTime");
    CHECK(warnings.size() == 2);
    CHECK(c->advisories().size() == 2);
    CHECK(warnings[0] ==
	"Format name \"week_year\" is deprecated and will be removed in a "
	"future version. Use \"weekyear\" format instead");
    warnings.clear();
    ZdtFormatter::forPattern("strict_date_optional_time");
    CHECK(warnings.empty());
    ZdtLog::sink(ZdtLog::fileSink());
  }
}
