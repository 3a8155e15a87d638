//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// named format registry

#include <zdt/ZdtRegistry.hh>

#include <functional>

namespace {

using namespace ZdtField;

// element vocabulary shared by the named formats; strict formats use
// fixed widths, lenient formats accept 1-2 digit fields and 1-9 digit
// years; the printer of a lenient format is its strict counterpart
class Elems {
public:
  Elems(bool strict) : m_strict{strict} { }

  bool strict() const { return m_strict; }

  Elems &lit(std::string_view s) { m_b.literal(s); return *this; }

  Elems &year() {
    if (m_strict)
      m_b.number(Year, 4, 10, ZdtSign::ExceedsPad);
    else
      m_b.number(Year, 1, 9, ZdtSign::Normal);
    return *this;
  }
  Elems &weekyear() {
    if (m_strict)
      m_b.number(WeekBasedYear, 4, 10, ZdtSign::ExceedsPad);
    else
      m_b.number(WeekBasedYear, 1, 9, ZdtSign::Normal);
    return *this;
  }
  Elems &two(int field) {
    m_b.number(field, m_strict ? 2 : 1, 2);
    return *this;
  }
  Elems &month() { return two(MonthOfYear); }
  Elems &day() { return two(DayOfMonth); }
  Elems &week() { return two(WeekOfWeekBasedYear); }
  Elems &hour() { return two(HourOfDay); }
  Elems &minute() { return two(MinuteOfHour); }
  Elems &second() { return two(SecondOfMinute); }
  Elems &dayOfYear() {
    m_b.number(DayOfYear, m_strict ? 3 : 1, 3);
    return *this;
  }
  Elems &dayOfWeek() { m_b.number(DayOfWeek, 1, 1); return *this; }

  // basic (compact) elements are fixed-width regardless
  Elems &basicYear() {
    m_b.number(Year, 4, 4, ZdtSign::Normal);
    return *this;
  }
  Elems &basicWeekyear() {
    m_b.number(WeekBasedYear, 4, 4, ZdtSign::Normal);
    return *this;
  }
  Elems &fixed(int field, unsigned width) {
    m_b.number(field, width, width);
    return *this;
  }

  // fraction - parses 1..maxDigits, prints 3 (millis) .. printMax
  Elems &fraction(
      unsigned maxDigits = 9, unsigned printMax = 3,
      std::string_view separators = ".") {
    m_b.fraction(1, maxDigits, 3, printMax, separators);
    return *this;
  }
  Elems &offset() {
    m_b.offset(ZdtOffsetStyle::Lenient, "Z");
    return *this;
  }
  Elems &basicOffset() {
    m_b.offset(ZdtOffsetStyle::LenientBasic, "Z");
    return *this;
  }

  Elems &opt() { m_b.optionalStart(); return *this; }
  Elems &end() { m_b.optionalEnd(); return *this; }

  ZdtPatternBuilder &builder() { return m_b; }

  ZdtPattern build() { return m_b.build(); }

private:
  bool			m_strict;
  ZdtPatternBuilder	m_b;
};

using Gen = std::function<void(Elems &)>;

// composite element groups
void date(Elems &e) { e.year().lit("-").month().lit("-").day(); }
void ordinalDate(Elems &e) { e.year().lit("-").dayOfYear(); }
void weekDate(Elems &e) {
  e.weekyear().lit("-W").week().lit("-").dayOfWeek();
}
void hms(Elems &e) { e.hour().lit(":").minute().lit(":").second(); }
void isoTime(Elems &e) { hms(e); e.fraction().offset(); }
void isoTimeNoMillis(Elems &e) { hms(e); e.offset(); }

void basicDate(Elems &e) {
  e.basicYear().fixed(MonthOfYear, 2).fixed(DayOfMonth, 2);
}
void basicOrdinalDate(Elems &e) { e.basicYear().fixed(DayOfYear, 3); }
void basicWeekDate(Elems &e) {
  e.basicWeekyear().lit("W").fixed(WeekOfWeekBasedYear, 2).
    fixed(DayOfWeek, 1);
}
void basicHms(Elems &e) {
  e.fixed(HourOfDay, 2).fixed(MinuteOfHour, 2).fixed(SecondOfMinute, 2);
}
void basicTime(Elems &e) { basicHms(e); e.fraction().basicOffset(); }
void basicTimeNoMillis(Elems &e) { basicHms(e); e.basicOffset(); }

// year[-month[-day]][T[hour[:minute[:second[.fraction]]]][offset]]
void optionalTime(Elems &e, bool hourOnly)
{
  e.year().opt().lit("-").month().opt().lit("-").day().
    opt().lit("T");
  if (hourOnly) {
    e.opt().hour().
      opt().lit(":").minute().
	opt().lit(":").second().
	  opt().fraction(9, 3, ".,").end().
	end().
      end().
    end();
  } else {
    e.opt().hour().lit(":").minute().
      opt().lit(":").second().
	opt().fraction(9, 3, ".,").end().
      end().
    end();
  }
  e.opt().offset().end().
    end().end().end();
}

// printer of the date/time formats with optional parts
void optionalTimePrinter(Elems &e, unsigned printMax)
{
  date(e);
  e.lit("T");
  hms(e);
  e.fraction(9, printMax).offset();
}

// yyyy[-MM[-dd[Thh:mm[:ss[.fraction]]offset]]], T / Z case-insensitive,
// the fraction separator is '.' or ','
void rfc3339(Elems &e)
{
  auto &b = e.builder();
  e.year().opt().lit("-").month().opt().lit("-").day().opt();
  b.literal("T", true);
  e.hour().lit(":").minute().
    opt().lit(":").second().
      opt().fraction(9, 3, ".,").end().
    end();
  b.offset(ZdtOffsetStyle::Rfc3339, "Z", true);
  e.end().end().end();
}

} // namespace

ZdtRegistry::ZdtRegistry()
{
  // lenient + strict_ variants
  auto both = [this](const char *name, Gen gen) {
    ZdtFormatDef def;
    {
      Elems e{true};
      gen(e);
      def.printer = e.build();
    }
    ZdtFormatDef strictDef = def;
    {
      Elems e{false};
      gen(e);
      def.parsers.push_back(e.build());
    }
    strictDef.parsers.push_back(strictDef.printer);
    m_defs.push_back(std::move(def));
    add(name, &m_defs.back());
    m_defs.push_back(std::move(strictDef));
    add(std::string{"strict_"} + name, &m_defs.back());
  };

  // basic formats are fixed-width, strict_ is identical
  auto basic = [this](const char *name, Gen gen) {
    ZdtFormatDef def;
    Elems e{true};
    gen(e);
    def.printer = e.build();
    def.parsers.push_back(def.printer);
    m_defs.push_back(std::move(def));
    add(name, &m_defs.back());
    add(std::string{"strict_"} + name, &m_defs.back());
  };

  auto T = [](Gen gen) {
    return [gen](Elems &e) { e.lit("T"); gen(e); };
  };
  auto dateT = [](Gen gen) {
    return [gen](Elems &e) { date(e); e.lit("T"); gen(e); };
  };

  basic("basic_date", basicDate);
  basic("basic_date_time", [](Elems &e) {
    basicDate(e); e.lit("T"); basicTime(e);
  });
  basic("basic_date_time_no_millis", [](Elems &e) {
    basicDate(e); e.lit("T"); basicTimeNoMillis(e);
  });
  basic("basic_ordinal_date", basicOrdinalDate);
  basic("basic_ordinal_date_time", [](Elems &e) {
    basicOrdinalDate(e); e.lit("T"); basicTime(e);
  });
  basic("basic_ordinal_date_time_no_millis", [](Elems &e) {
    basicOrdinalDate(e); e.lit("T"); basicTimeNoMillis(e);
  });
  basic("basic_time", basicTime);
  basic("basic_time_no_millis", basicTimeNoMillis);
  basic("basic_t_time", T(basicTime));
  basic("basic_t_time_no_millis", T(basicTimeNoMillis));
  basic("basic_week_date", basicWeekDate);
  basic("basic_week_date_time", [](Elems &e) {
    basicWeekDate(e); e.lit("T"); basicTime(e);
  });
  basic("basic_week_date_time_no_millis", [](Elems &e) {
    basicWeekDate(e); e.lit("T"); basicTimeNoMillis(e);
  });

  both("date", date);
  both("date_hour", dateT([](Elems &e) { e.hour(); }));
  both("date_hour_minute", dateT([](Elems &e) {
    e.hour().lit(":").minute();
  }));
  both("date_hour_minute_second", dateT(hms));
  both("date_hour_minute_second_fraction", dateT([](Elems &e) {
    hms(e); e.fraction();
  }));
  both("date_hour_minute_second_millis", dateT([](Elems &e) {
    hms(e); e.fraction(3);
  }));
  both("date_time", dateT(isoTime));
  both("date_time_no_millis", dateT(isoTimeNoMillis));
  both("hour", [](Elems &e) { e.hour(); });
  both("hour_minute", [](Elems &e) { e.hour().lit(":").minute(); });
  both("hour_minute_second", hms);
  both("hour_minute_second_fraction", [](Elems &e) {
    hms(e); e.fraction();
  });
  both("hour_minute_second_millis", [](Elems &e) {
    hms(e); e.fraction(3);
  });
  both("ordinal_date", ordinalDate);
  both("ordinal_date_time", [](Elems &e) {
    ordinalDate(e); e.lit("T"); isoTime(e);
  });
  both("ordinal_date_time_no_millis", [](Elems &e) {
    ordinalDate(e); e.lit("T"); isoTimeNoMillis(e);
  });
  both("time", isoTime);
  both("time_no_millis", isoTimeNoMillis);
  both("t_time", T(isoTime));
  both("t_time_no_millis", T(isoTimeNoMillis));
  both("week_date", weekDate);
  both("week_date_time", [](Elems &e) {
    weekDate(e); e.lit("T"); isoTime(e);
  });
  both("week_date_time_no_millis", [](Elems &e) {
    weekDate(e); e.lit("T"); isoTimeNoMillis(e);
  });
  both("weekyear", [](Elems &e) { e.weekyear(); });
  both("weekyear_week", [](Elems &e) { e.weekyear().lit("-W").week(); });
  both("weekyear_week_day", weekDate);
  both("year", [](Elems &e) { e.year(); });
  both("year_month", [](Elems &e) { e.year().lit("-").month(); });
  both("year_month_day", date);

  // superseded by weekyear
  add("week_year", resolve("weekyear")->def, "weekyear");

  // date[Ttime][offset], lenient and strict
  auto optional = [this](
      const char *name, bool strict, bool hourOnly, unsigned printMax) {
    ZdtFormatDef def;
    {
      Elems e{true};
      optionalTimePrinter(e, printMax);
      def.printer = e.build();
    }
    {
      Elems e{strict};
      optionalTime(e, hourOnly);
      def.parsers.push_back(e.build());
    }
    m_defs.push_back(std::move(def));
    add(name, &m_defs.back());
  };
  optional("date_optional_time", false, false, 3);
  optional("strict_date_optional_time", true, false, 3);
  optional("strict_date_optional_time_nanos", true, false, 9);
  optional("iso8601", true, true, 3);

  {
    ZdtFormatDef def;
    Elems printer{true};
    optionalTimePrinter(printer, 3);
    def.printer = printer.build();
    Elems parser{true};
    rfc3339(parser);
    def.parsers.push_back(parser.build());
    m_defs.push_back(std::move(def));
    add("rfc3339_lenient", &m_defs.back());
  }

  {
    ZdtFormatDef def;
    def.kind = ZdtFormatKind::EpochSecond;
    m_defs.push_back(std::move(def));
    add("epoch_second", &m_defs.back());
  }
  {
    ZdtFormatDef def;
    def.kind = ZdtFormatKind::EpochMillis;
    m_defs.push_back(std::move(def));
    add("epoch_millis", &m_defs.back());
  }
}

void ZdtRegistry::add(
    std::string canonical, const ZdtFormatDef *def, std::string replacement)
{
  ZdtFormatName name;
  name.canonical = std::move(canonical);
  name.replacement = std::move(replacement);
  name.def = def;

  // camelCase alias for multi-word names, other than the epoch formats
  // and the fully deprecated and RFC 3339 names
  if (name.replacement.empty() &&
      name.canonical.find('_') != std::string::npos &&
      name.canonical.compare(0, 6, "epoch_") &&
      name.canonical != "rfc3339_lenient") {
    bool upper = false;
    for (char c : name.canonical) {
      if (c == '_') { upper = true; continue; }
      if (upper && c >= 'a' && c <= 'z') c = c - 'a' + 'A';
      upper = false;
      name.camelCase += c;
    }
  }

  unsigned i = m_names.size();
  m_canonical.emplace(name.canonical, i);
  if (!name.camelCase.empty()) m_camelCase.emplace(name.camelCase, i);
  m_names.push_back(std::move(name));
}

const ZdtRegistry *ZdtRegistry::instance()
{
  static ZdtRegistry registry;
  return &registry;
}

const ZdtFormatName *ZdtRegistry::resolve(
    std::string_view id, int &deprecation) const
{
  std::string id_{id};
  {
    auto i = m_canonical.find(id_);
    if (i != m_canonical.end()) {
      const auto &name = m_names[i->second];
      deprecation = name.replacement.empty() ?
	ZdtDeprecation::None : ZdtDeprecation::Replaced;
      return &name;
    }
  }
  {
    auto i = m_camelCase.find(id_);
    if (i != m_camelCase.end()) {
      deprecation = ZdtDeprecation::CamelCase;
      return &m_names[i->second];
    }
  }
  deprecation = ZdtDeprecation::None;
  return nullptr;
}

std::string ZdtRegistry::advisory(
    std::string_view id, const ZdtFormatName &name, int deprecation)
{
  std::string s;
  switch (deprecation) {
    case ZdtDeprecation::CamelCase:
      s = "Camel case format name ";
      s += id;
      s += " is deprecated and will be removed in a future version. "
	"Use snake case name ";
      s += name.canonical;
      s += " instead.";
      break;
    case ZdtDeprecation::Replaced:
      s = "Format name \"";
      s += name.canonical;
      s += "\" is deprecated and will be removed in a future version. "
	"Use \"";
      s += name.replacement;
      s += "\" format instead";
      break;
  }
  return s;
}
