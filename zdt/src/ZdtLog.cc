//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// singleton logger

#include <zdt/ZdtLog.hh>

#include <string.h>
#include <syslog.h>

#include <zdt/ZdtDateTime.hh>

const char *Zdt::severity(int i)
{
  static const char *names[] =
    { "DEBUG", "INFO", "WARNING", "ERROR", "FATAL" };
  if (i < 0 || i > Fatal) return "UNKNOWN";
  return names[i];
}

const char *Zdt::file(const char *path)
{
  if (const char *s = strrchr(path, '/')) return s + 1;
  return path;
}

ZdtFileSink::ZdtFileSink() :
    ZdtSink{ZdtSinkType::File}, m_file{stderr} { }

ZdtFileSink::ZdtFileSink(std::string path) :
    ZdtSink{ZdtSinkType::File}, m_path{std::move(path)}
{
  if (!(m_file = fopen(m_path.c_str(), "a"))) m_file = stderr;
}

ZdtFileSink::~ZdtFileSink()
{
  if (m_file && m_file != stderr) fclose(m_file);
}

void ZdtFileSink::write(const ZdtEventInfo &info, std::string_view msg)
{
  std::ostringstream buf;
  ZdtDateTime d{ZdtInstant{
      int64_t(info.time.tv_sec), int32_t(info.time.tv_nsec)}};
  {
    char s[32];
    int year, month, day, hour, minute, sec;
    d.ymd(year, month, day);
    d.hms(hour, minute, sec);
    snprintf(s, sizeof(s), "%04d/%02d/%02d %02d:%02d:%02d.%06d",
	year, month, day, hour, minute, sec,
	static_cast<int>(info.time.tv_nsec / 1000));
    buf << s;
  }
  buf << ' ' << Zdt::severity(info.severity) << ' ';
  if (info.severity == Zdt::Debug || info.severity == Zdt::Fatal)
    buf << '\"' << Zdt::file(info.file) << "\":" << info.line << ' ';
  buf << info.function << "() " << msg << '\n';
  auto s = buf.view();

  Guard guard(m_lock);
  fwrite(s.data(), 1, s.length(), m_file);
  if (info.severity > Zdt::Debug) fflush(m_file);
}

void ZdtSysSink::write(const ZdtEventInfo &info, std::string_view msg)
{
  static int pri[] = { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERR, LOG_CRIT };
  int sev = info.severity;
  if (sev < Zdt::Debug) sev = Zdt::Debug;
  if (sev > Zdt::Fatal) sev = Zdt::Fatal;
  syslog(pri[sev], "%s() %.*s",
      info.function, static_cast<int>(msg.length()), msg.data());
}

ZdtLog::ZdtLog() { }

ZdtLog *ZdtLog::instance()
{
  static ZdtLog log;
  return &log;
}

void ZdtLog::init_(const char *program, const char *facility)
{
  static const struct { const char *name; int facility; } facilities[] = {
    { "daemon", LOG_DAEMON },
    { "user", LOG_USER },
    { "local0", LOG_LOCAL0 },
    { "local1", LOG_LOCAL1 },
    { "local2", LOG_LOCAL2 },
    { "local3", LOG_LOCAL3 },
    { "local4", LOG_LOCAL4 },
    { "local5", LOG_LOCAL5 },
    { "local6", LOG_LOCAL6 },
    { "local7", LOG_LOCAL7 }
  };

  Guard guard(m_lock);
  m_program = program ? program : "";
  m_facility = facility ? facility : "user";
  int facility_ = LOG_USER;
  for (const auto &f : facilities)
    if (m_facility == f.name) { facility_ = f.facility; break; }
  openlog(m_program.c_str(), LOG_PID, facility_);
}

ZdtRef<ZdtSink> ZdtLog::sink_()
{
  Guard guard(m_lock);
  if (!m_sink) m_sink = fileSink();
  return m_sink;
}

void ZdtLog::sink_(ZdtRef<ZdtSink> sink)
{
  Guard guard(m_lock);
  m_sink = std::move(sink);
}
