//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// date/time formatter

#include <zdt/ZdtFormatter.hh>

#include <unordered_map>

#include <zdt/ZdtLock.hh>
#include <zdt/ZdtLog.hh>
#include <zdt/ZdtError.hh>
#include <zdt/ZdtCf.hh>
#include <zdt/ZdtEpoch.hh>
#include <zdt/ZdtField.hh>
#include <zdt/ZdtResolve.hh>

namespace {

constexpr const char *RootLocale = "root";

// process-wide cache of formatters built from format names only
class Cache {
  Cache(const Cache &);
  Cache &operator =(const Cache &);	// prevent mis-use

  using Lock = ZdtPRWLock;
  using Guard = ZdtGuard<Lock>;
  using ReadGuard = ZdtReadGuard<Lock>;

  Cache() { }

public:
  static Cache *instance() {
    static Cache cache;
    return &cache;
  }

  ZdtFormatterRef find(std::string_view pattern) const {
    ReadGuard guard(m_lock);
    auto i = m_map.find(std::string{pattern});
    if (i == m_map.end()) return {};
    return i->second;
  }

  // first writer wins
  ZdtFormatterRef add(std::string_view pattern, ZdtFormatterRef fmt) {
    Guard guard(m_lock);
    auto i = m_map.emplace(std::string{pattern}, std::move(fmt)).first;
    return i->second;
  }

private:
  Lock						m_lock;
  std::unordered_map<std::string, ZdtFormatterRef>	m_map;
};

int epochUnit(int kind)
{
  return kind == ZdtFormatKind::EpochSecond ?
    ZdtEpoch::Seconds : ZdtEpoch::Millis;
}

} // namespace

ZdtOptions ZdtOptions::fromCf(const ZdtCf &cf)
{
  ZdtOptions options;
  options.legacyCompatible = cf.getBool("legacyCompatible", false);
  options.locale = cf.get("locale");
  auto zone = cf.get("zone");
  if (!zone.empty()) options.zone = ZdtZone::parse(zone);
  return options;
}

ZdtFormatter::ZdtFormatter(
    ZdtRef<ZdtFormatChain> chain, std::string locale, ZdtZone zone,
    bool roundup) :
  m_chain{std::move(chain)},
  m_locale{locale.empty() ? std::string{RootLocale} : std::move(locale)},
  m_zone{std::move(zone)},
  m_roundup{roundup} { }

ZdtFormatter::~ZdtFormatter()
{
  if (auto fmt = m_roundupFmt.load_())
    if (fmt->deref()) delete fmt;
}

ZdtFormatterRef ZdtFormatter::forPattern(
    std::string_view pattern, const ZdtOptions &options)
{
  ZdtFormatterRef fmt = Cache::instance()->find(pattern);
  if (!fmt) {
    auto chain = ZdtCompiler::compile(pattern, options.legacyCompatible);
    fmt = new ZdtFormatter{chain, {}, {}, false};
    if (chain->named()) fmt = Cache::instance()->add(pattern, fmt);
  }
  for (const auto &advisory : fmt->advisories())
    ZdtLOG(Warning, advisory);
  if (!options.locale.empty()) fmt = fmt->withLocale(options.locale);
  if (!!options.zone) fmt = fmt->withZone(options.zone);
  return fmt;
}

bool ZdtFormatter::parse(std::string_view s, ZdtInstant &t) const
{
  for (const auto &segment : m_chain->segments()) {
    const auto &def = segment.def();
    if (def.kind != ZdtFormatKind::Calendar) {
      int unit = epochUnit(def.kind);
      unsigned fracDigits;
      if (!ZdtEpoch::parse(unit, s, t, fracDigits)) continue;
      if (m_roundup) t = ZdtEpoch::roundup(unit, t, fracDigits);
      return true;
    }
    for (const auto &parser : def.parsers) {
      ZdtParsed parsed;
      if (parser.parse(s, parsed) && Zdt::resolve(parsed, m_zone, m_roundup, t))
	return true;
    }
  }
  return false;
}

ZdtInstant ZdtFormatter::parse(std::string_view s) const
{
  ZdtInstant t;
  if (!parse(s, t)) throw ZdtDateParseError{s, m_chain->pattern()};
  return t;
}

void ZdtFormatter::format(std::string &s, const ZdtInstant &t) const
{
  const auto &def = m_chain->segments()[0].def();
  if (def.kind != ZdtFormatKind::Calendar) {
    ZdtEpoch::print(epochUnit(def.kind), s, t);
    return;
  }
  def.printer.print(s, ZdtFields{t, m_zone});
}

std::string ZdtFormatter::format(const ZdtInstant &t) const
{
  std::string s;
  format(s, t);
  return s;
}

ZdtFormatterRef ZdtFormatter::withLocale(std::string_view locale) const
{
  if (locale.empty()) locale = RootLocale;
  if (locale == m_locale) return this;
  return new ZdtFormatter{m_chain, std::string{locale}, m_zone, m_roundup};
}

ZdtFormatterRef ZdtFormatter::withZone(const ZdtZone &zone) const
{
  if (zone == m_zone) return this;
  return new ZdtFormatter{m_chain, m_locale, zone, m_roundup};
}

ZdtFormatterRef ZdtFormatter::roundupFormatter() const
{
  if (m_roundup) return this;
  if (const ZdtFormatter *fmt = m_roundupFmt) return fmt;
  auto fmt = new ZdtFormatter{m_chain, m_locale, m_zone, true};
  fmt->ref();
  if (auto prev = m_roundupFmt.cmpXch(fmt, nullptr)) {
    fmt->deref();
    delete fmt;
    return prev;
  }
  return fmt;
}

bool ZdtFormatter::equals(const ZdtFormatter &f) const
{
  return m_roundup == f.m_roundup &&
    m_chain->pattern() == f.m_chain->pattern() &&
    m_locale == f.m_locale && m_zone == f.m_zone;
}

uint32_t ZdtFormatter::hash() const
{
  // FNV-1a
  uint32_t h = 0x811c9dc5 ^ uint32_t(m_roundup);
  for (unsigned char c : m_chain->pattern()) h = (h ^ c) * 0x01000193;
  for (unsigned char c : m_locale) h = (h ^ c) * 0x01000193;
  return h ^ m_zone.hash();
}
