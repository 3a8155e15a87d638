//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// flat key/value configuration

#include <zdt/ZdtCf.hh>

#include <zdt/ZdtRegex.hh>

#include <string.h>
#include <strings.h>

namespace {

const ZdtOpt *findShort(const ZdtOpt *options, char c)
{
  if (options)
    for (; options->short_ || options->long_; ++options)
      if (options->short_ == c) return options;
  return nullptr;
}

const ZdtOpt *findLong(const ZdtOpt *options, std::string_view name)
{
  if (options)
    for (; options->short_ || options->long_; ++options)
      if (options->long_ && name == options->long_) return options;
  return nullptr;
}

} // namespace

void ZdtCf::set(std::string_view key, std::string_view value)
{
  auto i = m_values.find(key);
  if (i != m_values.end())
    i->second = value;
  else
    m_values.emplace(std::string{key}, std::string{value});
}

bool ZdtCf::exists(std::string_view key) const
{
  return m_values.find(key) != m_values.end();
}

unsigned ZdtCf::fromArgs(
    const ZdtOpt *options, int argc, const char *const *argv)
{
  const auto &argShort = ZdtREGEX("^-([a-zA-Z]+)$");	// -a, -abc
  const auto &argLongFlag = ZdtREGEX("^--([\w\-]+)$");	// --arg
  const auto &argLongValue = ZdtREGEX("^--([\w\-]+)=");	// --arg=val
  ZdtRegex::Captures c;

  std::string_view cmd = argc > 0 ? argv[0] : "";
  unsigned p = 0;
  int i, n;
  for (i = 0; i < argc; i = n) {
    n = i + 1;
    std::string_view arg = argv[i];
    if (!i) {
      set(std::to_string(p++), arg);
    } else if (argShort.m(arg, c)) {
      std::string_view letters = c[2];
      for (unsigned j = 0; j < letters.length(); j++) {
	auto shortOpt = letters.substr(j, 1);
	const ZdtOpt *option = findShort(options, letters[j]);
	if (!option) throw ZdtCfError::Usage{cmd, shortOpt};
	if (option->type == ZdtOptType::Flag) {
	  set(option->key, "1");
	} else {
	  if (n == argc) throw ZdtCfError::Usage{cmd, shortOpt};
	  std::string_view value = argv[n++];
	  // "\-" escapes a leading '-'
	  if (value.length() > 1 && value[0] == '\\' && value[1] == '-')
	    value.remove_prefix(1);
	  set(option->key, value);
	}
      }
    } else if (argLongFlag.m(arg, c)) {
      std::string_view longOpt = c[2];
      const ZdtOpt *option = findLong(options, longOpt);
      if (!option || option->type != ZdtOptType::Flag)
	throw ZdtCfError::Usage{cmd, longOpt};
      set(option->key, "1");
    } else if (argLongValue.m(arg, c)) {
      std::string_view longOpt = c[2];
      const ZdtOpt *option = findLong(options, longOpt);
      if (!option || option->type == ZdtOptType::Flag)
	throw ZdtCfError::Usage{cmd, longOpt};
      set(option->key, c[3]);
    } else {
      // includes negative numbers, e.g. -42000
      set(std::to_string(p++), arg);
    }
  }
  set("#", std::to_string(p));
  return p;
}

void ZdtCf::fromString(std::string_view text)
{
  const auto &space = ZdtREGEX("\G[ \t\r]+");
  const auto &eol = ZdtREGEX("\G(?:#.*)?$");
  const auto &key = ZdtREGEX("\G[^\s#\"]+");
  const auto &unquoted = ZdtREGEX("\G[^#\"]*[^\s#\"]");
  const auto &dblQuote = ZdtREGEX("\G\"");
  const auto &dblUnquoted = ZdtREGEX("\G[^\"\\]+");
  const auto &quoted = ZdtREGEX("\G\\(.)");
  ZdtRegex::Captures c;

  unsigned line = 0;
  while (!text.empty()) {
    ++line;
    auto end = text.find('\n');
    std::string_view l = text.substr(0, end);
    text.remove_prefix(end == std::string_view::npos ? text.size() : end + 1);

    unsigned off = 0;
    if (space.m(l, c, off)) off += c[1].length();
    if (eol.m(l, off)) continue;
    if (!key.m(l, c, off)) throw ZdtCfError::Syntax{line, l};
    std::string_view k = c[1];
    off += k.length();
    if (!space.m(l, c, off)) throw ZdtCfError::Syntax{line, l};
    off += c[1].length();

    std::string value;
    if (dblQuote.m(l, c, off)) {
      off += c[1].length();
      for (;;) {
	if (dblUnquoted.m(l, c, off)) {
	  off += c[1].length();
	  value += c[1];
	  continue;
	}
	if (quoted.m(l, c, off)) {
	  off += c[1].length();
	  value += c[2];
	  continue;
	}
	if (dblQuote.m(l, c, off)) {
	  off += c[1].length();
	  break;
	}
	throw ZdtCfError::Syntax{line, l};
      }
    } else if (unquoted.m(l, c, off)) {
      off += c[1].length();
      value = c[1];
    } else
      throw ZdtCfError::Syntax{line, l};

    if (space.m(l, c, off)) off += c[1].length();
    if (!eol.m(l, off)) throw ZdtCfError::Syntax{line, l};
    set(k, value);
  }
}

bool ZdtCf::scanBool(std::string_view key, std::string_view value)
{
  static const char *true_[] = { "1", "y", "yes", "true", "on", nullptr };
  static const char *false_[] = { "0", "n", "no", "false", "off", nullptr };
  for (const char **s = true_; *s; ++s)
    if (value.size() == strlen(*s) &&
	!strncasecmp(value.data(), *s, value.size()))
      return true;
  for (const char **s = false_; *s; ++s)
    if (value.size() == strlen(*s) &&
	!strncasecmp(value.data(), *s, value.size()))
      return false;
  throw ZdtCfError::BadBool{key, value};
}
