//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// atomic integers and pointers
// - load() is acquire, store() is release, *_() variants are relaxed
// - cmpXch(val, cmp) returns the previous value

#ifndef ZdtAtomic_HH
#define ZdtAtomic_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

template <typename T> struct ZdtAtomicOps {
  ZdtInline static T load(const T *ptr) {
    return __atomic_load_n(ptr, __ATOMIC_ACQUIRE);
  }
  ZdtInline static T load_(const T *ptr) {
    return __atomic_load_n(ptr, __ATOMIC_RELAXED);
  }
  ZdtInline static void store(T *ptr, T value) {
    __atomic_store_n(ptr, value, __ATOMIC_RELEASE);
  }
  ZdtInline static void store_(T *ptr, T value) {
    __atomic_store_n(ptr, value, __ATOMIC_RELAXED);
  }
  ZdtInline static T atomicXch(T *ptr, T value) {
    return __atomic_exchange_n(ptr, value, __ATOMIC_ACQ_REL);
  }
  ZdtInline static T atomicCmpXch(T *ptr, T value, T cmp) {
    return __sync_val_compare_and_swap(ptr, cmp, value);
  }
};

template <typename T> class ZdtAtomic {
  using Ops = ZdtAtomicOps<T>;

public:
  ZdtAtomic() : m_val{0} { };

  ZdtAtomic(const ZdtAtomic &a) { Ops::store_(&m_val, Ops::load(&a.m_val)); }
  ZdtAtomic(T val) { Ops::store_(&m_val, val); }

  ZdtAtomic &operator =(const ZdtAtomic &a) {
    Ops::store(&m_val, Ops::load(&a.m_val));
    return *this;
  }
  ZdtAtomic &operator =(T val) {
    Ops::store(&m_val, val);
    return *this;
  }

  void store_(T val) { Ops::store_(&m_val, val); }

  operator T() const { return Ops::load(&m_val); }
  T load_() const { return Ops::load_(&m_val); }

  T xch(T val) { return Ops::atomicXch(&m_val, val); }
  T cmpXch(T val, T cmp) { return Ops::atomicCmpXch(&m_val, val, cmp); }

  T operator ++() { return __atomic_add_fetch(&m_val, 1, __ATOMIC_ACQ_REL); }
  T operator --() { return __atomic_sub_fetch(&m_val, 1, __ATOMIC_ACQ_REL); }

private:
  T	m_val;
};

template <typename T> class ZdtAtomic<T *> {
  using Ops = ZdtAtomicOps<T *>;

public:
  ZdtAtomic() : m_val{nullptr} { };

  ZdtAtomic(const ZdtAtomic &) = delete;
  ZdtAtomic &operator =(const ZdtAtomic &) = delete;

  ZdtAtomic(T *val) { Ops::store_(&m_val, val); }
  ZdtAtomic &operator =(T *val) {
    Ops::store(&m_val, val);
    return *this;
  }

  operator T *() const { return Ops::load(&m_val); }
  T *operator ->() const { return Ops::load(&m_val); }
  T *load_() const { return Ops::load_(&m_val); }

  T *xch(T *val) { return Ops::atomicXch(&m_val, val); }
  T *cmpXch(T *val, T *cmp) { return Ops::atomicCmpXch(&m_val, val, cmp); }

private:
  T	*m_val;
};

#endif /* ZdtAtomic_HH */
