//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

#include <zdt/ZdtLib.hh>

#include <stdlib.h>

#include <iostream>

#include <zdt/ZdtRegistry.hh>

void fail() { exit(1); }

void out(const char *s) {
  std::cout << s << '\n' << std::flush;
}

#define CHECK(x) ((x) ? (out("OK  " #x), void()) : (out("NOK " #x), fail()))

int main()
{
  auto registry = ZdtRegistry::instance();
  int deprecation;

  static const char *names[] = {
    "basic_date", "basic_date_time", "basic_date_time_no_millis",
    "basic_ordinal_date", "basic_ordinal_date_time",
    "basic_ordinal_date_time_no_millis", "basic_time",
    "basic_time_no_millis", "basic_t_time", "basic_t_time_no_millis",
    "basic_week_date", "basic_week_date_time",
    "basic_week_date_time_no_millis", "date", "date_hour",
    "date_hour_minute", "date_hour_minute_second",
    "date_hour_minute_second_fraction", "date_hour_minute_second_millis",
    "date_optional_time", "date_time", "date_time_no_millis",
    "epoch_millis", "epoch_second", "hour", "hour_minute",
    "hour_minute_second", "hour_minute_second_fraction",
    "hour_minute_second_millis", "iso8601", "ordinal_date",
    "ordinal_date_time", "ordinal_date_time_no_millis", "rfc3339_lenient",
    "strict_date_optional_time", "strict_date_optional_time_nanos",
    "time", "time_no_millis", "t_time", "t_time_no_millis", "week_date",
    "week_date_time", "week_date_time_no_millis", "weekyear",
    "weekyear_week", "weekyear_week_day", "year", "year_month",
    "year_month_day", "strict_basic_week_date", "strict_date",
    "strict_date_hour_minute_second_millis", "strict_hour",
    "strict_ordinal_date_time_no_millis", "strict_t_time",
    "strict_week_date_time", "strict_weekyear_week_day",
    "strict_year_month_day", nullptr
  };
  {
    bool ok = true;
    for (const char **name = names; *name; ++name) {
      auto resolved = registry->resolve(*name, deprecation);
      if (!resolved || deprecation != ZdtDeprecation::None ||
	  resolved->canonical != *name || !resolved->def) {
	std::cout << *name << '\n';
	ok = false;
      }
    }
    CHECK(ok);
  }

  // every definition has a printer and at least one parser
  {
    bool ok = true;
    for (const auto &name : registry->names()) {
      const auto &def = *name.def;
      if (def.kind == ZdtFormatKind::Calendar &&
	  (!def.printer || def.parsers.empty())) {
	std::cout << name.canonical << '\n';
	ok = false;
      }
    }
    CHECK(ok);
  }

  CHECK(!registry->resolve("Date"));
  CHECK(!registry->resolve("strictdate"));
  CHECK(!registry->resolve("yyyy-MM-dd"));
  CHECK(!registry->resolve(""));
  CHECK(!registry->resolve("epochMillis"));
  CHECK(!registry->resolve("epochSecond"));
  CHECK(!registry->resolve("rfc3339Lenient"));
  CHECK(!registry->resolve("weekYear"));

  {
    auto name = registry->resolve("strictDateOptionalTime", deprecation);
    CHECK(name && name->canonical == "strict_date_optional_time");
    CHECK(deprecation == ZdtDeprecation::CamelCase);
    CHECK(ZdtRegistry::advisory("strictDateOptionalTime", *name, deprecation) ==
	"Camel case format name strictDateOptionalTime is deprecated and "
	"will be removed in a future version. Use snake case name "
	"strict_date_optional_time instead.");
  }
  {
    auto name = registry->resolve("basicTTimeNoMillis", deprecation);
    CHECK(name && name->canonical == "basic_t_time_no_millis");
    CHECK(deprecation == ZdtDeprecation::CamelCase);
  }
  {
    auto name = registry->resolve("week_year", deprecation);
    CHECK(name && name->canonical == "week_year");
    CHECK(deprecation == ZdtDeprecation::Replaced);
    CHECK(name->def == registry->resolve("weekyear")->def);
    CHECK(ZdtRegistry::advisory("week_year", *name, deprecation) ==
	"Format name \"week_year\" is deprecated and will be removed in a "
	"future version. Use \"weekyear\" format instead");
  }

  // strict and basic variants of basic formats share a definition
  CHECK(registry->resolve("basic_date")->def ==
      registry->resolve("strict_basic_date")->def);
  CHECK(registry->resolve("date")->def !=
      registry->resolve("strict_date")->def);

  CHECK(registry->resolve("epoch_millis")->def->kind ==
      ZdtFormatKind::EpochMillis);
  CHECK(registry->resolve("epoch_second")->def->kind ==
      ZdtFormatKind::EpochSecond);
}
