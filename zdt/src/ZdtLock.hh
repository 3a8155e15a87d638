//  -*- mode:c++; indent-tabs-mode:t; tab-width:8; c-basic-offset:2; -*-
//  vi: noet ts=8 sw=2 cino=+0,(s,l1,m1,g0,N-s,j1,U1,W2,i2

// (c) Copyright 2024 Psi Labs
// This code is licensed by the MIT license (see LICENSE for details)

// locks and guards
// - ZdtPLock - non-recursive mutex
// - ZdtPRWLock - non-recursive phase-fair R/W lock (Concurrency Kit)
// - ZdtGuard / ZdtReadGuard - scoped lock / readlock

#ifndef ZdtLock_HH
#define ZdtLock_HH

#ifdef _MSC_VER
#pragma once
#endif

#ifndef ZdtLib_HH
#include <zdt/ZdtLib.hh>
#endif

#include <pthread.h>

#include <ck_pflock.h>

class ZdtPLock {
  ZdtPLock(const ZdtPLock &);
  ZdtPLock &operator =(const ZdtPLock &);	// prevent mis-use

public:
  ZdtPLock() { pthread_mutex_init(&m_lock, nullptr); }
  ~ZdtPLock() { pthread_mutex_destroy(&m_lock); }

  ZdtInline void lock() { pthread_mutex_lock(&m_lock); }
  ZdtInline void unlock() { pthread_mutex_unlock(&m_lock); }

  // readers are serialized
  ZdtInline void readlock() { lock(); }
  ZdtInline void readunlock() { unlock(); }

private:
  pthread_mutex_t	m_lock;
};

class ZdtPRWLock {
  ZdtPRWLock(const ZdtPRWLock &);
  ZdtPRWLock &operator =(const ZdtPRWLock &);	// prevent mis-use

public:
  ZdtInline ZdtPRWLock() { ck_pflock_init(&m_lock); }

  ZdtInline void lock() { ck_pflock_write_lock(&m_lock); }
  ZdtInline void unlock() { ck_pflock_write_unlock(&m_lock); }
  ZdtInline void readlock() { ck_pflock_read_lock(&m_lock); }
  ZdtInline void readunlock() { ck_pflock_read_unlock(&m_lock); }

  template <typename S> void print(S &s) const {
    s << "rin=" << m_lock.rin <<
      " rout=" << m_lock.rout <<
      " win=" << m_lock.win <<
      " wout=" << m_lock.wout;
  }

private:
  ck_pflock_t	m_lock;
};

template <class Lock> class ZdtGuard {
public:
  ZdtGuard() : m_lock{nullptr} { }
  ZdtGuard(Lock &l) : m_lock(&l) { l.lock(); }
  ZdtGuard(ZdtGuard &&guard) : m_lock(guard.m_lock) {
    guard.m_lock = nullptr;
  }
  ZdtGuard &operator =(ZdtGuard &&guard) {
    if (ZdtLikely(this != &guard)) {
      if (m_lock) m_lock->unlock();
      m_lock = guard.m_lock;
      guard.m_lock = nullptr;
    }
    return *this;
  }
  ~ZdtGuard() { if (m_lock) m_lock->unlock(); }

  void unlock() {
    if (m_lock) { m_lock->unlock(); m_lock = nullptr; }
  }

private:
  Lock		*m_lock;
};

template <typename Lock> ZdtGuard(Lock &) -> ZdtGuard<Lock>;

template <class Lock> class ZdtReadGuard {
public:
  ZdtReadGuard(const Lock &l) : m_lock(&(const_cast<Lock &>(l))) {
    m_lock->readlock();
  }
  ZdtReadGuard(ZdtReadGuard &&guard) : m_lock(guard.m_lock) {
    guard.m_lock = nullptr;
  }
  ~ZdtReadGuard() { if (m_lock) m_lock->readunlock(); }

  void unlock() {
    if (m_lock) { m_lock->readunlock(); m_lock = nullptr; }
  }

  ZdtReadGuard &operator =(ZdtReadGuard &&guard) {
    if (ZdtLikely(this != &guard)) {
      if (m_lock) m_lock->readunlock();
      m_lock = guard.m_lock;
      guard.m_lock = nullptr;
    }
    return *this;
  }

private:
  Lock		*m_lock;
};

template <typename Lock> ZdtReadGuard(const Lock &) -> ZdtReadGuard<Lock>;

#endif /* ZdtLock_HH */
