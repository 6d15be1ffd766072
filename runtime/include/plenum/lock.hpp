/*
 * This file is part of the Plenum Kernel Memory Core
 *
 * Copyright (c) 2024, The Constellation Project
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#pragma once

#include <pthread.h>
#include <atomic>
#include <plenum/utils.h>

namespace plenum {

  // Each allocator instance owns exactly one of these, and every public operation holds it
  // for its whole duration. None of the algorithms behind the lock (multi-frame scans,
  // split/coalesce) are attempted lock-free.
  class mutex final {
   public:
    mutex(void) { pthread_mutex_init(&m_mutex, NULL); }
    ~mutex(void) { pthread_mutex_destroy(&m_mutex); }

    mutex(const mutex &) = delete;
    mutex &operator=(const mutex &) = delete;

    void lock(void) {
      pthread_mutex_lock(&m_mutex);
      m_owner.store(pthread_self(), std::memory_order_relaxed);
      m_locked.store(true, std::memory_order_release);
    }

    void unlock(void) {
      m_locked.store(false, std::memory_order_release);
      pthread_mutex_unlock(&m_mutex);
    }

    bool try_lock(void) {
      if (pthread_mutex_trylock(&m_mutex) != 0) return false;
      m_owner.store(pthread_self(), std::memory_order_relaxed);
      m_locked.store(true, std::memory_order_release);
      return true;
    }

    // Does the calling thread hold this lock? Safe to ask from any thread, but the answer is
    // only stable for the holder: for anyone else it can change as soon as it is returned.
    bool is_locked(void) const {
      if (!m_locked.load(std::memory_order_acquire)) return false;
      return pthread_equal(m_owner.load(std::memory_order_relaxed), pthread_self());
    }

   private:
    pthread_mutex_t m_mutex;
    std::atomic<pthread_t> m_owner{};
    std::atomic<bool> m_locked{false};
  };


  class scoped_lock final {
    plenum::mutex &lck;
    bool locked = false;

   public:
    inline explicit scoped_lock(plenum::mutex &lck)
        : lck(lck) {
      lck.lock();
      locked = true;
    }

    inline ~scoped_lock(void) { unlock(); }

    scoped_lock(const scoped_lock &) = delete;
    scoped_lock &operator=(const scoped_lock &) = delete;

    inline void unlock(void) {
      if (locked) {
        locked = false;
        lck.unlock();
      }
    }
  };
}  // namespace plenum
