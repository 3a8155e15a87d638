//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// date/time format command line tool

#include <stdlib.h>
#include <stdio.h>

#include <iostream>

#include <zdt/ZdtLog.hh>
#include <zdt/ZdtCf.hh>
#include <zdt/ZdtEpoch.hh>
#include <zdt/ZdtFormatter.hh>

void usage()
{
  std::cerr <<
    "Usage: zdtfmt [OPTION]... parse|format PATTERN VALUE...\n"
    "  parse VALUE... using PATTERN, printing seconds.nanoseconds and\n"
    "  epoch milliseconds, or format VALUE... (epoch milliseconds)\n\n"
    "Options:\n"
    "  -l, --legacy\t\tcompile custom patterns in the legacy dialect\n"
    "  -L, --locale=TAG\tlocale (default root)\n"
    "  -z, --zone=ZONE\tdefault zone e.g. UTC, +05:30, Europe/London\n"
    "  -r, --roundup\t\tround absent fields up when parsing\n"
    "  -v, --verbose\t\tlog formatter details to stderr\n"
    "      --help\t\tthis help\n"
    << std::flush;
  exit(1);
}

int main(int argc, char **argv)
{
  static ZdtOpt opts[] = {
    { 'l', "legacy", ZdtOptType::Flag, "legacyCompatible" },
    { 'L', "locale", ZdtOptType::Param, "locale" },
    { 'z', "zone", ZdtOptType::Param, "zone" },
    { 'r', "roundup", ZdtOptType::Flag, "roundup" },
    { 'v', "verbose", ZdtOptType::Flag, "verbose" },
    { 0, "help", ZdtOptType::Flag, "help" },
    { 0 }
  };

  ZdtCf cf;
  ZdtOptions options;
  unsigned n = 0;

  try {
    n = cf.fromArgs(opts, argc, argv);
    if (cf.getBool("help")) usage();
    options = ZdtOptions::fromCf(cf);
  } catch (const ZdtError &e) {
    std::cerr << e << '\n' << std::flush;
    usage();
  }
  if (n < 4) usage();

  ZdtLog::init("zdtfmt");
  ZdtLog::level(cf.getBool("verbose") ? Zdt::Debug : Zdt::Warning);

  std::string_view cmd = cf.get("1");
  bool parse = false;
  if (cmd == "parse")
    parse = true;
  else if (cmd == "format")
    parse = false;
  else
    usage();

  ZdtFormatterRef fmt;
  try {
    fmt = ZdtFormatter::forPattern(cf.get("2"), options);
    if (cf.getBool("roundup")) fmt = fmt->roundupFormatter();
  } catch (const ZdtError &e) {
    std::cerr << e << '\n' << std::flush;
    return 1;
  }
  ZdtLOG(Info, [&fmt](auto &s) { s << "formatter: "; fmt->print(s); });

  int status = 0;
  for (unsigned i = 3; i < n; i++) {
    auto value = cf.get(std::to_string(i));
    if (parse) {
      try {
	ZdtInstant t = fmt->parse(value);
	char nsec[12];
	snprintf(nsec, sizeof(nsec), "%09d", int(t.nsec()));
	std::cout << t.sec() << '.' << nsec << ' ' << t.toEpochMilli() << '\n';
      } catch (const ZdtError &e) {
	std::cerr << e << '\n' << std::flush;
	status = 1;
      }
    } else {
      ZdtInstant t;
      unsigned fracDigits;
      if (!ZdtEpoch::parse(ZdtEpoch::Millis, value, t, fracDigits)) {
	std::cerr << '"' << value << "\": invalid epoch milliseconds\n" <<
	  std::flush;
	status = 1;
	continue;
      }
      std::cout << fmt->format(t) << '\n';
    }
  }
  std::cout << std::flush;
  return status;
}
