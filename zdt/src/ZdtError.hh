//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// Zdt error exceptions

#ifndef ZdtError_HH
#define ZdtError_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <string>
#include <string_view>
#include <sstream>
#include <ostream>

class ZdtAPI ZdtError {
public:
  virtual ~ZdtError() { }

  virtual void print_(std::ostream &) const = 0;

  template <typename S> void print(S &s) const { print_(s); }

  std::string message() const {
    std::ostringstream s;
    print_(s);
    return std::move(s).str();
  }

  friend std::ostream &operator <<(std::ostream &s, const ZdtError &e) {
    e.print_(s);
    return s;
  }
};

// pattern could not be compiled - unknown name, bad custom pattern, etc.
class ZdtAPI ZdtInvalidFormatSpec : public ZdtError {
public:
  ZdtInvalidFormatSpec(std::string_view pattern, std::string reason) :
    m_pattern{pattern}, m_reason{std::move(reason)} { }

  const std::string &pattern() const { return m_pattern; }
  const std::string &reason() const { return m_reason; }

  void print_(std::ostream &s) const {
    s << "Invalid format: [" << m_pattern << "]: " << m_reason;
  }

private:
  std::string	m_pattern;
  std::string	m_reason;
};

// no chain segment could parse the input
class ZdtAPI ZdtDateParseError : public ZdtError {
public:
  ZdtDateParseError(std::string_view input, std::string_view pattern) :
    m_input{input}, m_pattern{pattern} { }

  const std::string &input() const { return m_input; }
  const std::string &pattern() const { return m_pattern; }

  void print_(std::ostream &s) const {
    s << "failed to parse date field [" << m_input <<
      "] with format [" << m_pattern << ']';
  }

private:
  std::string	m_input;
  std::string	m_pattern;
};

#endif /* ZdtError_HH */
