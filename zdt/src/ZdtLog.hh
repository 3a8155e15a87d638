//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// singleton logger

// ZdtLog::init("program", "daemon");	// for LOG_DAEMON
// ZdtLog::sink(ZdtLog::sysSink());	// sysSink() is syslog
// ZdtLOG(Debug, "debug message");	// ZdtLOG() is macro
// ZdtLOG(Warning, [&](auto &s) { s << "pattern " << pattern; });

// if no sink is registered, the default sink is stderr

#ifndef ZdtLog_HH
#define ZdtLog_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <stdio.h>
#include <time.h>

#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

#include <zdt/ZdtRef.hh>
#include <zdt/ZdtLock.hh>

namespace Zdt {
  enum { Debug = 0, Info, Warning, Error, Fatal };

  ZdtExtern const char *severity(int);
  // strips the directory from __FILE__
  ZdtExtern const char *file(const char *);
}

// event time, severity, file name, line number, function
struct ZdtEventInfo {
  struct timespec	time;
  int			severity;	// Zdt:: Debug, Info, Warning, ...
  const char		*file;
  int			line;
  const char		*function;

  ZdtEventInfo(
      int severity_,
      const char *file_, int line_,
      const char *function_) :
    severity{severity_},
    file{file_}, line{line_},
    function{function_} {
    clock_gettime(CLOCK_REALTIME, &time);
  }
};

// event enriched with a message - either printable, or a lambda
// [...](auto &s) { s << ... }
template <typename L>
struct ZdtEvent : public ZdtEventInfo {
  L	l;

  template <typename L_>
  ZdtEvent(
      int severity_,
      const char *file_, int line_,
      const char *function_, L_ &&l_) :
    ZdtEventInfo(severity_, file_, line_, function_),
    l{std::forward<L_>(l_)} { }

  template <typename S> void print(S &s) const {
    if constexpr (std::is_invocable_v<const L &, S &>)
      l(s);
    else
      s << l;
  }
};

template <typename L_>
ZdtEvent(int, const char *, int, const char *, L_ &&) ->
  ZdtEvent<std::decay_t<L_>>;

namespace ZdtSinkType {
  enum { File = 0, System, Lambda };
}

struct ZdtSink : public ZdtObject {
  int	type;	// ZdtSinkType

  ZdtSink(int type_) : type(type_) { }

  virtual void write(const ZdtEventInfo &, std::string_view msg) = 0;
};

class ZdtAPI ZdtFileSink : public ZdtSink {
  using Lock = ZdtPLock;
  using Guard = ZdtGuard<Lock>;

public:
  ZdtFileSink();			// stderr
  ZdtFileSink(std::string path);
  ~ZdtFileSink();

  void write(const ZdtEventInfo &, std::string_view msg);

private:
  std::string	m_path;
  FILE		*m_file = nullptr;
  Lock		m_lock;
};

struct ZdtAPI ZdtSysSink : public ZdtSink {
  ZdtSysSink() : ZdtSink{ZdtSinkType::System} { }

  void write(const ZdtEventInfo &, std::string_view msg);
};

template <typename L>
struct ZdtLambdaSink : public ZdtSink {
  L	l;

  ZdtLambdaSink(L l_) : ZdtSink{ZdtSinkType::Lambda}, l{std::move(l_)} { }

  void write(const ZdtEventInfo &info, std::string_view msg) {
    l(info, msg);
  }
};

class ZdtAPI ZdtLog {
  ZdtLog(const ZdtLog &);
  ZdtLog &operator =(const ZdtLog &);		// prevent mis-use

  using Lock = ZdtPLock;
  using Guard = ZdtGuard<Lock>;

  ZdtLog();

public:
  static ZdtLog *instance();

  static ZdtRef<ZdtSink> fileSink() { return new ZdtFileSink(); }
  static ZdtRef<ZdtSink> fileSink(std::string path) {
    return new ZdtFileSink(std::move(path));
  }
  static ZdtRef<ZdtSink> sysSink() { return new ZdtSysSink(); }
  template <typename L>
  static ZdtRef<ZdtSink> lambdaSink(L l) {
    return new ZdtLambdaSink<L>(std::move(l));
  }

  static void init(const char *program) {
    instance()->init_(program, nullptr);
  }
  static void init(const char *program, const char *facility) {
    instance()->init_(program, facility);
  }

  static const std::string &program() { return instance()->m_program; }

  static int level() { return instance()->m_level; }
  static void level(int l) { instance()->m_level = l; }

  static ZdtRef<ZdtSink> sink() { return instance()->sink_(); }
  static void sink(ZdtRef<ZdtSink> sink) { instance()->sink_(std::move(sink)); }

  template <typename L>
  static void log(const ZdtEvent<L> &e) { instance()->log_(e); }

  template <typename L>
  void log_(const ZdtEvent<L> &e) {
    if (e.severity < m_level) return;
    std::ostringstream s;
    e.print(s);
    auto sink = sink_();
    sink->write(e, s.view());
  }

private:
  void init_(const char *program, const char *facility);

  ZdtRef<ZdtSink> sink_();
  void sink_(ZdtRef<ZdtSink> sink);

private:
  std::string		m_program;
  std::string		m_facility;
  int			m_level = Zdt::Info;

  Lock			m_lock;
    ZdtRef<ZdtSink>	  m_sink;
};

#define ZdtEVENT_(sev, msg) ZdtEvent(sev, __FILE__, __LINE__, __func__, msg)

#ifndef ZDEBUG

#define ZdtLOG_(sev, msg) \
  ((sev > Zdt::Debug) ? ZdtLog::log(ZdtEVENT_(sev, msg)) : void())

#else /* !ZDEBUG */

#define ZdtLOG_(sev, msg) ZdtLog::log(ZdtEVENT_(sev, msg))

#endif /* !ZDEBUG */

#define ZdtLOG(sev, msg) ZdtLOG_(Zdt:: sev, msg)

#endif /* ZdtLog_HH */
