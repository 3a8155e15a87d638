//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// intrusively reference-counted objects and the smart pointer to them

// class Foo : public ZdtObject { ... };
// ZdtRef<Foo> foo = new Foo(...);	// deleted with the last reference

#ifndef ZdtRef_HH
#define ZdtRef_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <utility>

#include <zdt/ZdtAtomic.hh>

class ZdtObject {
  ZdtObject(const ZdtObject &) = delete;
  ZdtObject &operator =(const ZdtObject &) = delete;

public:
  ZdtObject() : m_refCount{0} { }
  virtual ~ZdtObject() { }

  void ref() const { ++m_refCount; }
  bool deref() const { return !--m_refCount; }

private:
  mutable ZdtAtomic<int>	m_refCount;
};

template <typename T_> class ZdtRef {
public:
  using T = T_;

  ZdtRef() = default;
  ZdtRef(const ZdtRef &r) : m_object{r.m_object} {
    if (T *o = m_object) o->ref();
  }
  ZdtRef(ZdtRef &&r) noexcept : m_object{r.m_object} {
    r.m_object = nullptr;
  }
  ZdtRef(T *o) : m_object{o} {
    if (o) o->ref();
  }
  ~ZdtRef() {
    if (T *o = m_object) if (o->deref()) delete o;
  }

  void swap(ZdtRef &r) noexcept { std::swap(m_object, r.m_object); }
  friend void swap(ZdtRef &r1, ZdtRef &r2) noexcept { r1.swap(r2); }

  ZdtRef &operator =(ZdtRef r) noexcept {
    swap(r);
    return *this;
  }
  ZdtRef &operator =(T *n) {
    if (m_object != n) {
      if (n) n->ref();
      T *o = m_object;
      m_object = n;
      if (o) if (o->deref()) delete o;
    }
    return *this;
  }

  operator T *() const { return m_object; }
  T *operator ->() const { return m_object; }
  T *ptr() const { return m_object; }

  bool operator !() const { return !m_object; }

private:
  T	*m_object = nullptr;
};

#endif /* ZdtRef_HH */
