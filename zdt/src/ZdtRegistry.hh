//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// named format registry - closed, process-wide, built on first use

// each name maps to a format definition - a printer and one or more
// parsers, or one of the two epoch codecs; a name may additionally be
// reachable via a deprecated camelCase alias, or be deprecated itself
// in favor of a replacement name

#ifndef ZdtRegistry_HH
#define ZdtRegistry_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>
#include <string_view>
#include <vector>
#include <deque>
#include <unordered_map>

#include <zdt/ZdtPattern.hh>

namespace ZdtFormatKind {
  enum { Calendar = 0, EpochSecond, EpochMillis };
}

namespace ZdtDeprecation {
  enum {
    None = 0,
    CamelCase,	// camelCase alias of a current name
    Replaced	// the name itself is superseded by another
  };
}

struct ZdtFormatDef {
  int				kind = ZdtFormatKind::Calendar;
  ZdtPattern			printer;
  std::vector<ZdtPattern>	parsers;	// tried in order
};

struct ZdtFormatName {
  std::string		canonical;
  std::string		camelCase;	// deprecated alias, empty if none
  std::string		replacement;	// empty unless Replaced
  const ZdtFormatDef	*def = nullptr;
};

class ZdtAPI ZdtRegistry {
  ZdtRegistry(const ZdtRegistry &);
  ZdtRegistry &operator =(const ZdtRegistry &);	// prevent mis-use

  ZdtRegistry();

public:
  static const ZdtRegistry *instance();

  // exact, case-sensitive; returns nullptr if unknown
  const ZdtFormatName *resolve(std::string_view id, int &deprecation) const;
  const ZdtFormatName *resolve(std::string_view id) const {
    int deprecation;
    return resolve(id, deprecation);
  }

  // advisory message for use of a deprecated identifier
  static std::string advisory(
      std::string_view id, const ZdtFormatName &name, int deprecation);

  const std::vector<ZdtFormatName> &names() const { return m_names; }

private:
  void add(
      std::string canonical, const ZdtFormatDef *def,
      std::string replacement = {});

  std::deque<ZdtFormatDef>	m_defs;	// stable addresses
  std::vector<ZdtFormatName>	m_names;
  std::unordered_map<std::string, unsigned>	m_canonical;
  std::unordered_map<std::string, unsigned>	m_camelCase;
};

#endif /* ZdtRegistry_HH */
