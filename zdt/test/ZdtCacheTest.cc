//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// concurrent formatter construction, caching and use

#include <zdt/ZdtLib.hh>

#include <stdlib.h>

#include <iostream>
#include <thread>
#include <vector>

#include <zdt/ZdtFormatter.hh>
#include <zdt/ZdtDateTime.hh>

void fail() { exit(1); }

void out(const char *s) {
  std::cout << s << '\n' << std::flush;
}

#define CHECK(x) ((x) ? (out("OK  " #x), void()) : (out("NOK " #x), fail()))

int main(int argc, char **argv)
{
  unsigned n = argc > 1 ? atoi(argv[1]) : 1000;
  if (!n) n = 1000;

  static const char *patterns[] = {
    "date_optional_time",
    "strict_date_optional_time||epoch_millis",
    "basic_date_time",
    "epoch_second",
    "week_date||ordinal_date",
    "yyyy-MM-dd HH:mm:ss",		// custom - not cached
    "8yyyy-MM-dd||date"
  };
  enum { NPatterns = sizeof(patterns) / sizeof(patterns[0]) };
  enum { NThreads = 8 };

  // midnight - every pattern above represents it exactly
  ZdtInstant t = ZdtDateTime{2018, 5, 15}.instant();

  const ZdtFormatter *first[NThreads][NPatterns];
  bool ok[NThreads];

  std::vector<std::thread> threads;
  for (unsigned i = 0; i < NThreads; i++)
    threads.emplace_back([&, i]() {
      ok[i] = true;
      for (unsigned j = 0; j < NPatterns; j++) first[i][j] = nullptr;
      for (unsigned k = 0; k < n; k++) {
	unsigned j = (i + k) % NPatterns;
	auto fmt = ZdtFormatter::forPattern(patterns[j]);
	if (!first[i][j]) first[i][j] = fmt.ptr();
	std::string s = fmt->format(t);
	ZdtInstant t_;
	if (!fmt->parse(s, t_) || t_ != t) ok[i] = false;
	if (k & 1) fmt = fmt->roundupFormatter();
	if (!fmt->parse(s, t_) || t_ < t) ok[i] = false;
      }
    });
  for (auto &thread : threads) thread.join();

  bool allOK = true;
  for (unsigned i = 0; i < NThreads; i++) if (!ok[i]) allOK = false;
  CHECK(allOK);

  // every thread saw the same cached formatter for named chains
  bool same = true;
  for (unsigned j = 0; j < NPatterns; j++) {
    auto fmt = ZdtFormatter::forPattern(patterns[j]);
    if (!fmt->chain()->named()) continue;
    for (unsigned i = 0; i < NThreads; i++)
      if (first[i][j] != fmt.ptr()) same = false;
  }
  CHECK(same);

  CHECK(!ZdtFormatter::forPattern("yyyy-MM-dd HH:mm:ss")->chain()->named());
  CHECK(!ZdtFormatter::forPattern("8yyyy-MM-dd||date")->chain()->named());
  CHECK(ZdtFormatter::forPattern("week_date||ordinal_date")->chain()->named());
}
