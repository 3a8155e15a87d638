//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// flat key/value configuration

// sources:
//   command line options - fromArgs()
//   text - fromString() - "key value" lines, '#' comments, values
//   optionally "quoted"

// command line usage:
//   static ZdtOpt opts[] = {
//     { 'l', "legacy", ZdtOptType::Flag, "legacyCompatible" },
//     { 'z', "zone", ZdtOptType::Param, "zone" },
//     { 0 }
//   };
//   ZdtCf cf;
//   unsigned n = cf.fromArgs(opts, argc, argv);
// positional arguments are stored under keys "0", "1", ...
// ("0" is the program name) and their count under "#"

#ifndef ZdtCf_HH
#define ZdtCf_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <map>
#include <string>
#include <string_view>

#include <zdt/ZdtError.hh>

namespace ZdtOptType {
  enum { Flag = 0, Param };
}

struct ZdtOpt {
  char		short_;
  const char	*long_;
  int		type;		// ZdtOptType
  const char	*key;
};

namespace ZdtCfError {

// thrown by get<true>() and getBool<true>() for missing values
class Required : public ZdtError {
public:
  Required(std::string_view key) : m_key{key} { }

  const std::string &key() const { return m_key; }

  void print_(std::ostream &s) const {
    s << '"' << m_key << "\" missing";
  }

private:
  std::string	m_key;
};

// thrown by getBool() on error
class BadBool : public ZdtError {
public:
  BadBool(std::string_view key, std::string_view value) :
      m_key{key}, m_value{value} { }

  void print_(std::ostream &s) const {
    s << '"' << m_key << "\": invalid bool value \"" << m_value << '"';
  }

private:
  std::string	m_key;
  std::string	m_value;
};

// thrown by fromArgs() on error
class Usage : public ZdtError {
public:
  Usage(std::string_view cmd, std::string_view option) :
      m_cmd{cmd}, m_option{option} { }

  const std::string &option() const { return m_option; }

  void print_(std::ostream &s) const {
    s << '"' << m_cmd << "\": invalid option \"" << m_option << '"';
  }

private:
  std::string	m_cmd;
  std::string	m_option;
};

// thrown by fromString() on error
class Syntax : public ZdtError {
public:
  Syntax(unsigned line, std::string_view text) :
      m_line{line}, m_text{text} { }

  unsigned line() const { return m_line; }

  void print_(std::ostream &s) const {
    s << "\"" << m_text << "\" - syntax error at line " << m_line;
  }

private:
  unsigned	m_line;
  std::string	m_text;
};

} // ZdtCfError

class ZdtAPI ZdtCf {
public:
  // returns the number of positional arguments, including argv[0]
  unsigned fromArgs(const ZdtOpt *options, int argc, const char *const *argv);

  void fromString(std::string_view text);

  void set(std::string_view key, std::string_view value);
  bool exists(std::string_view key) const;

  // empty if missing, unless Required_
  template <bool Required_ = false>
  std::string_view get(std::string_view key) const {
    auto i = m_values.find(key);
    if (i == m_values.end()) {
      if constexpr (Required_) throw ZdtCfError::Required{key};
      return {};
    }
    return i->second;
  }

  template <bool Required_ = false>
  bool getBool(std::string_view key, bool deflt = false) const {
    if (!exists(key)) {
      if constexpr (Required_) throw ZdtCfError::Required{key};
      return deflt;
    }
    return scanBool(key, get(key));
  }

  unsigned count() const { return m_values.size(); }

  template <typename S> void print(S &s) const {
    for (const auto &[key, value] : m_values)
      s << key << ' ' << '"' << value << "\"\n";
  }
  friend std::ostream &operator <<(std::ostream &s, const ZdtCf &cf) {
    cf.print(s);
    return s;
  }

private:
  // throws BadBool
  static bool scanBool(std::string_view key, std::string_view value);

  std::map<std::string, std::string, std::less<>>	m_values;
};

#endif /* ZdtCf_HH */
